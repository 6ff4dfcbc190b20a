// Implementation of fixture discovery and emission

#include "emit.hpp"

#include "log.hpp"
#include "path_utils.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace fixturegen::codegen {
namespace {

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

int write_file(const fs::path &out_path, const std::string &content) {
    if (out_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(out_path.parent_path(), ec);
        if (ec) {
            log_err("failed to create directory '{}': {}", out_path.parent_path().string(), ec.message());
            return 1;
        }
    }

    std::ofstream file(out_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        log_err("failed to open output file '{}'", out_path.string());
        return 1;
    }
    file << content;
    file.close();
    if (!file) {
        log_err("failed to write output file '{}'", out_path.string());
        return 1;
    }
    return 0;
}

} // namespace

GenerationContext make_context(const GeneratorOptions &options) {
    GenerationContext ctx;
    ctx.options        = options;
    ctx.root           = normalize_path(options.root);
    ctx.testcases_root = normalize_path(resolve_against(ctx.root, options.testcases_dir));
    ctx.output_root    = normalize_path(resolve_against(ctx.root, options.output_dir));
    ctx.templates      = load_templates(options.entry_template_path.empty()
                                            ? options.entry_template_path
                                            : resolve_against(ctx.root, options.entry_template_path));
    return ctx;
}

auto list_test_cases(const fs::path &dir, std::string_view extension, bool sorted) -> std::optional<std::vector<fs::path>> {
    std::vector<fs::path> files;
    std::error_code       ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        log_err("failed to list '{}': {}", dir.string(), ec.message());
        return std::nullopt;
    }
    for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || type_ec) {
            continue;
        }
        if (ends_with(it->path().filename().string(), extension)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        log_err("failed to list '{}': {}", dir.string(), ec.message());
        return std::nullopt;
    }
    if (sorted) {
        std::sort(files.begin(), files.end(),
                  [](const fs::path &lhs, const fs::path &rhs) { return lhs.filename().string() < rhs.filename().string(); });
    }
    return files;
}

auto render_fixture(const FixtureSpec &spec, const GenerationContext &ctx, GenerationReport &report) -> std::optional<std::string> {
    const fs::path source_dir = resolve_against(ctx.testcases_root, spec.source_dir);
    report.label              = embedded_path(source_dir, ctx.root);

    std::vector<fs::path> files;
    std::error_code       ec;
    if (fs::exists(source_dir, ec) || !ctx.options.check_only) {
        auto listed = list_test_cases(source_dir, ctx.options.extension, spec.sorted);
        if (!listed) {
            return std::nullopt;
        }
        files = std::move(*listed);
    }

    std::string entries;
    entries.reserve(files.size() * 160);
    for (const auto &path : files) {
        auto test_case = load_test_case(path);
        if (!test_case) {
            return std::nullopt;
        }
        const auto entry = render_test_case(*test_case, spec, source_dir, ctx.templates);
        entries += entry.text;
        ++report.entry_count;
        if (entry.ignored) {
            ++report.ignored_count;
        }
    }

    std::string output = render_header(spec.header);
    output += entries;
    output += render_footer(embedded_path(source_dir, ctx.testcases_root), ctx.templates);
    return output;
}

int generate_fixture(const FixtureSpec &spec, const GenerationContext &ctx, GenerationReport &report) {
    const fs::path source_dir = resolve_against(ctx.testcases_root, spec.source_dir);
    if (!ctx.options.check_only) {
        std::error_code ec;
        fs::create_directories(source_dir, ec);
        if (ec) {
            log_err("failed to create directory '{}': {}", source_dir.string(), ec.message());
            return 1;
        }
    }

    const auto content = render_fixture(spec, ctx, report);
    if (!content) {
        return 1;
    }

    const fs::path target = resolve_against(ctx.output_root, spec.target_file);
    if (ctx.options.check_only) {
        std::ifstream     existing(target, std::ios::binary);
        const bool        present = static_cast<bool>(existing);
        const std::string current =
            present ? std::string(std::istreambuf_iterator<char>(existing), std::istreambuf_iterator<char>()) : std::string{};
        report.out_of_date = !present || current != *content;
        if (report.out_of_date) {
            log_err("'{}' is out of date", embedded_path(target, ctx.root));
        }
    } else if (write_file(target, *content) != 0) {
        return 1;
    }

    fmt::print("{}\n", format_report_line(report));
    return 0;
}

std::string format_report_header() { return fmt::format("{:>7} {:>7}  {}", "entries", "ignored", "directory"); }

std::string format_report_line(const GenerationReport &report) {
    return fmt::format("{:>7} {:>7}  {}", report.entry_count, report.ignored_count, report.label);
}

} // namespace fixturegen::codegen
