// Discovery of per-directory integration fixtures.
#pragma once

#include "model.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fixturegen::codegen {

inline constexpr std::string_view kIntegrationFixtureSuffix = "IntegrationTestFixture";

// Directory holding one subdirectory per integration fixture, relative to the
// test-cases root.
inline constexpr std::string_view kIntegrationDir = "integration";

// "my-feature" -> "MyFeatureIntegrationTestFixture"
std::string integration_fixture_name(std::string_view directory_name);

// Grouping label of an integration fixture: its name without the suffix.
std::string integration_label(std::string_view fixture_name);

// True when `relative_path` contains a version-control metadata directory
// anywhere (.svn, .git, .hg, .bzr), by substring match.
bool is_version_control_path(std::string_view relative_path);

// One FixtureSpec per subdirectory of `testcases_root`/integration, sorted by
// directory name. Returns an empty list when the integration root does not
// exist and nullopt when it cannot be listed.
auto discover_integration_fixtures(const std::filesystem::path &testcases_root) -> std::optional<std::vector<FixtureSpec>>;

} // namespace fixturegen::codegen
