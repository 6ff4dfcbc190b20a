#include "reindent.hpp"

#include <vector>

namespace fixturegen::codegen {
namespace {

constexpr std::string_view kWhitespace = " \t";

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t                   start = 0;
    while (true) {
        const std::size_t end  = text.find('\n', start);
        std::string_view  line = text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return lines;
}

std::string_view leading_whitespace(std::string_view line) {
    const std::size_t first = line.find_first_not_of(kWhitespace);
    return first == std::string_view::npos ? line : line.substr(0, first);
}

bool is_blank(std::string_view line) { return line.find_first_not_of(kWhitespace) == std::string_view::npos; }

} // namespace

std::string reindent(std::string_view text) {
    const auto lines = split_lines(text);

    std::string_view indentation;
    for (const auto line : lines) {
        if (!is_blank(line)) {
            indentation = leading_whitespace(line);
            break;
        }
    }
    if (indentation.empty()) {
        return std::string(text);
    }

    std::string out;
    out.reserve(text.size());
    for (std::size_t idx = 0; idx < lines.size(); ++idx) {
        std::string_view line = lines[idx];
        if (line.substr(0, indentation.size()) == indentation) {
            line.remove_prefix(indentation.size());
        }
        if (idx != 0) {
            out.push_back('\n');
        }
        out.append(line);
    }
    return out;
}

} // namespace fixturegen::codegen
