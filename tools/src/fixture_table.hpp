// The fixed list of generated fixtures.
#pragma once

#include "model.hpp"

#include <vector>

namespace fixturegen::codegen {

// Fixture definitions in generation order. Source directories are relative to
// the test-cases root, target files to the output directory. A fixture whose
// round-trip source is set consumes files created by the round-trip porter.
std::vector<FixtureSpec> default_fixture_table();

} // namespace fixturegen::codegen
