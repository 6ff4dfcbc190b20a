// Implementation of integration fixture discovery

#include "integration.hpp"

#include "log.hpp"
#include "path_utils.hpp"
#include "render.hpp"
#include "templates.hpp"

#include <algorithm>
#include <cctype>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Regex.h>
#include <utility>

namespace fixturegen::codegen {

std::string integration_fixture_name(std::string_view directory_name) {
    std::string name;
    name.reserve(directory_name.size() + kIntegrationFixtureSuffix.size());
    std::size_t start = 0;
    while (start <= directory_name.size()) {
        const std::size_t dash    = directory_name.find('-', start);
        const auto        segment = directory_name.substr(start, dash == std::string_view::npos ? std::string_view::npos : dash - start);
        if (!segment.empty()) {
            name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(segment.front()))));
            name.append(segment.substr(1));
        }
        if (dash == std::string_view::npos) {
            break;
        }
        start = dash + 1;
    }
    name.append(kIntegrationFixtureSuffix);
    return name;
}

std::string integration_label(std::string_view fixture_name) {
    if (fixture_name.size() >= kIntegrationFixtureSuffix.size() &&
        fixture_name.substr(fixture_name.size() - kIntegrationFixtureSuffix.size()) == kIntegrationFixtureSuffix) {
        fixture_name.remove_suffix(kIntegrationFixtureSuffix.size());
    }
    return std::string(fixture_name);
}

bool is_version_control_path(std::string_view relative_path) {
    static const llvm::Regex pattern("\\.(svn|git|hg|bzr)");
    return pattern.match(llvm::StringRef(relative_path.data(), relative_path.size()));
}

auto discover_integration_fixtures(const fs::path &testcases_root) -> std::optional<std::vector<FixtureSpec>> {
    const fs::path integration_root = testcases_root / kIntegrationDir;

    std::vector<FixtureSpec> specs;
    std::error_code          ec;
    if (!fs::exists(integration_root, ec)) {
        return specs;
    }

    std::vector<fs::path>  directories;
    fs::directory_iterator it(integration_root, ec);
    for (const fs::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_directory(type_ec) || type_ec) {
            continue;
        }
        const auto relative = normalize_slashes(it->path().lexically_relative(integration_root).generic_string());
        if (is_version_control_path(relative)) {
            continue;
        }
        directories.push_back(it->path());
    }
    if (ec) {
        log_err("failed to list '{}': {}", integration_root.string(), ec.message());
        return std::nullopt;
    }
    std::sort(directories.begin(), directories.end());

    specs.reserve(directories.size());
    for (const auto &dir : directories) {
        const std::string dir_name = dir.filename().string();
        FixtureSpec       spec;
        spec.name        = integration_fixture_name(dir_name);
        spec.source_dir  = fs::path(kIntegrationDir) / dir_name;
        spec.target_file = spec.name + ".cs";
        spec.header      = std::string(tpl::integration_header);
        render::replace_all(spec.header, "{{FIXTURE_NAME}}", spec.name);
        render::replace_all(spec.header, "{{LABEL}}", integration_label(spec.name));
        specs.push_back(std::move(spec));
    }
    return specs;
}

} // namespace fixturegen::codegen
