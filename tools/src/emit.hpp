// Fixture generation: discovery, rendering and emission for one FixtureSpec.
#pragma once

#include "model.hpp"
#include "render.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fixturegen::codegen {

// Resolved locations and templates shared by every generator call of a run.
struct GenerationContext {
    GeneratorOptions      options;
    std::filesystem::path root;           // absolute repository root
    std::filesystem::path testcases_root; // absolute
    std::filesystem::path output_root;    // absolute
    FixtureTemplates      templates;
};

// Resolve option paths against the root and load templates.
GenerationContext make_context(const GeneratorOptions &options);

// List regular files directly under `dir` whose name ends with `extension`.
// Enumeration order unless `sorted`. Returns nullopt (after logging) when the
// directory cannot be read.
auto list_test_cases(const std::filesystem::path &dir, std::string_view extension, bool sorted)
    -> std::optional<std::vector<std::filesystem::path>>;

// Render the complete fixture source for `spec` without touching the target.
auto render_fixture(const FixtureSpec &spec, const GenerationContext &ctx, GenerationReport &report) -> std::optional<std::string>;

// Generate the fixture for `spec`: ensure its source directory, render every
// test case and overwrite the target file, then print one report line.
// In check mode the target is compared instead of written; a stale target
// sets `report.out_of_date` and is not an error. Returns 0 on success.
int generate_fixture(const FixtureSpec &spec, const GenerationContext &ctx, GenerationReport &report);

std::string format_report_header();
std::string format_report_line(const GenerationReport &report);

} // namespace fixturegen::codegen
