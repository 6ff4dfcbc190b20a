// Rendering helpers for fixture templates and test entries.
#pragma once

#include "model.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fixturegen::codegen {

// Templates used for one generation run. The entry template may come from
// --entry-template; the footer is always built in.
struct FixtureTemplates {
    std::string entry;
    std::string footer;
};

// Built-in templates, with the entry template replaced by the file at
// `entry_template_path` when it is set, readable and well-formed. Falls back to
// the built-in entry template with a note otherwise.
FixtureTemplates load_templates(const std::filesystem::path &entry_template_path);

// Read a test case and derive its stem, identifier and first-line annotation.
// Returns nullopt when the file cannot be read.
auto load_test_case(const std::filesystem::path &path) -> std::optional<TestCaseFile>;

// Render one test entry: annotation prefix, a test named after the sanitized
// identifier, invoking the fixture's runner with the file name relative to
// `source_dir`.
RenderedEntry render_test_case(const TestCaseFile &test_case, const FixtureSpec &spec, const std::filesystem::path &source_dir,
                               const FixtureTemplates &templates);

// Header text as emitted: reindented, with one leading newline dropped.
std::string render_header(std::string_view header);

// Closing block naming the fixture's test-case directory.
std::string render_footer(std::string_view relative_source_dir, const FixtureTemplates &templates);

namespace render {

// Optional support to read a template from disk if provided via CLI.
std::string read_template_file(const std::filesystem::path &path);

// Utility for escaping string literals in generated C#.
std::string escape_string(std::string_view value);

void replace_all(std::string &inout, std::string_view needle, std::string_view replacement);

} // namespace render

} // namespace fixturegen::codegen
