// Top-level sequencing of a generation run.
#pragma once

#include "model.hpp"
#include "syntax_backend.hpp"

#include <string>
#include <vector>

namespace fixturegen::codegen {

// Generate the integration fixtures, then every fixture of `table` in order.
// A fixture with a round-trip source is preceded by the porting pass that
// fills its source directory; `backend` may be null, in which case porting is
// skipped with a note. Prints the report header, one line per fixture and a
// totals line. Stops at the first failure. Returns 0 on success, 1 on failure
// or, in check mode, when any generated file is out of date.
int run_generation(const GeneratorOptions &options, const std::vector<FixtureSpec> &table, SyntaxBackend *backend);

// Print fixture name, source directory and target file for every fixture.
int list_fixtures(const GeneratorOptions &options, const std::vector<FixtureSpec> &table);

} // namespace fixturegen::codegen
