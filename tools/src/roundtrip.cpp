// Implementation of round-trip porting

#include "roundtrip.hpp"

#include "emit.hpp"
#include "log.hpp"
#include "path_utils.hpp"

#include <fmt/core.h>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace fixturegen::codegen {
namespace {

constexpr std::string_view kDocstringDelimiter = R"(""")";

// The delimiter must fill the whole line; only the line terminator is dropped.
bool is_delimiter_line(std::string_view line) {
    if (!line.empty() && line.back() == '\n') {
        line.remove_suffix(1);
    }
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line == kDocstringDelimiter;
}

std::optional<std::string> read_source(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return std::nullopt;
    }
    return content;
}

int port_one(const fs::path &source, const fs::path &destination, SyntaxBackend &backend) {
    const auto content = read_source(source);
    if (!content) {
        log_err("failed to read round-trip source '{}'", source.string());
        return 1;
    }
    const auto split = split_docstring(*content);

    std::string error;
    const auto  module = backend.parse(source, split.remainder, error);
    if (!module) {
        log_err("failed to parse '{}': {}", source.string(), error);
        return 1;
    }
    const auto printed = backend.print(*module, SyntaxVariant::WhitespaceSignificant, error);
    if (!printed) {
        log_err("failed to print '{}': {}", source.string(), error);
        return 1;
    }

    std::string output = split.docstring;
    if (!output.empty() && output.back() != '\n' && !printed->empty()) {
        output.push_back('\n');
    }
    output += *printed;

    std::ofstream file(destination, std::ios::binary | std::ios::trunc);
    if (!file) {
        log_err("failed to open output file '{}'", destination.string());
        return 1;
    }
    file << output;
    file.close();
    if (!file) {
        log_err("failed to write output file '{}'", destination.string());
        return 1;
    }
    return 0;
}

} // namespace

auto split_docstring(std::string_view source) -> DocstringSplit {
    DocstringSplit split;
    std::size_t    pos        = 0;
    int            delimiters = 0;
    while (pos < source.size() && delimiters < 2) {
        const std::size_t newline = source.find('\n', pos);
        const std::size_t end     = newline == std::string_view::npos ? source.size() : newline + 1;
        const auto        line    = source.substr(pos, end - pos);
        if (is_delimiter_line(line)) {
            ++delimiters;
        }
        split.docstring.append(line);
        pos = end;
    }
    split.remainder.assign(source.substr(pos));
    return split;
}

int port_roundtrip_cases(const fs::path &source_dir, const fs::path &dest_dir, std::string_view extension, SyntaxBackend &backend) {
    std::error_code ec;
    if (!fs::exists(source_dir, ec)) {
        return 0;
    }
    const auto sources = list_test_cases(source_dir, extension, /*sorted=*/true);
    if (!sources) {
        return 1;
    }

    fs::create_directories(dest_dir, ec);
    if (ec) {
        log_err("failed to create directory '{}': {}", dest_dir.string(), ec.message());
        return 1;
    }

    for (const auto &source : *sources) {
        const fs::path destination = dest_dir / source.filename();
        if (fs::exists(destination, ec)) {
            continue;
        }
        if (ec) {
            log_err("failed to inspect '{}': {}", destination.string(), ec.message());
            return 1;
        }
        if (port_one(source, destination, backend) != 0) {
            return 1;
        }
        fmt::print("ported {}\n", source.filename().string());
    }
    return 0;
}

} // namespace fixturegen::codegen
