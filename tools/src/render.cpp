// Implementation of rendering helpers for templates

#include "render.hpp"

#include "identifier.hpp"
#include "log.hpp"
#include "metadata.hpp"
#include "path_utils.hpp"
#include "reindent.hpp"
#include "templates.hpp"

#include <fmt/core.h>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>

namespace fixturegen::codegen {

namespace render {

std::string read_template_file(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        return {};
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string escape_string(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (const char ch : value) {
        switch (ch) {
        case '\\': escaped += "\\\\"; break;
        case '\"': escaped += "\\\""; break;
        case '\n': escaped += "\\n"; break;
        case '\r': escaped += "\\r"; break;
        case '\t': escaped += "\\t"; break;
        default: escaped.push_back(ch); break;
        }
    }
    return escaped;
}

void replace_all(std::string &inout, std::string_view needle, std::string_view replacement) {
    if (needle.empty()) {
        return;
    }
    std::size_t pos = 0;
    while ((pos = inout.find(needle, pos)) != std::string::npos) {
        inout.replace(pos, needle.size(), replacement);
        pos += replacement.size();
    }
}

} // namespace render

namespace {

std::string format_entry(const std::string &tpl, std::string_view annotation, std::string_view name, std::string_view runner,
                         std::string_view file) {
    return fmt::format(fmt::runtime(tpl), fmt::arg("annotation", annotation), fmt::arg("name", name), fmt::arg("runner", runner),
                       fmt::arg("file", file));
}

} // namespace

FixtureTemplates load_templates(const std::filesystem::path &entry_template_path) {
    FixtureTemplates templates{std::string(tpl::test_entry), std::string(tpl::fixture_footer)};
    if (entry_template_path.empty()) {
        return templates;
    }
    std::string content = render::read_template_file(entry_template_path);
    if (content.empty()) {
        log_note("failed to load entry template '{}', using built-in template", entry_template_path.string());
        return templates;
    }
    try {
        (void)format_entry(content, "", "probe", "Run", "probe.boo");
    } catch (const fmt::format_error &err) {
        log_note("entry template '{}' is malformed ({}), using built-in template", entry_template_path.string(), err.what());
        return templates;
    }
    templates.entry = std::move(content);
    return templates;
}

auto load_test_case(const std::filesystem::path &path) -> std::optional<TestCaseFile> {
    auto annotation = read_annotation(path);
    if (!annotation) {
        return std::nullopt;
    }
    TestCaseFile test_case;
    test_case.path       = path;
    test_case.stem       = path.stem().string();
    test_case.identifier = sanitize_identifier(test_case.stem);
    test_case.annotation = std::move(*annotation);
    return test_case;
}

RenderedEntry render_test_case(const TestCaseFile &test_case, const FixtureSpec &spec, const std::filesystem::path &source_dir,
                               const FixtureTemplates &templates) {
    RenderedEntry entry;
    entry.ignored = test_case.annotation.kind == AnnotationKind::Ignore;
    entry.text    = format_entry(templates.entry, annotation_prefix(test_case.annotation), test_case.identifier, spec.runner,
                                 render::escape_string(embedded_path(test_case.path, source_dir)));
    return entry;
}

std::string render_header(std::string_view header) {
    std::string out = reindent(header);
    if (!out.empty() && out.front() == '\n') {
        out.erase(0, 1);
    }
    return out;
}

std::string render_footer(std::string_view relative_source_dir, const FixtureTemplates &templates) {
    return fmt::format(fmt::runtime(templates.footer), fmt::arg("path", render::escape_string(relative_source_dir)));
}

} // namespace fixturegen::codegen
