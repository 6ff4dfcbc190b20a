// Implementation of first-line metadata classification

#include "metadata.hpp"

#include "log.hpp"
#include "render.hpp"

#include <fmt/core.h>
#include <fstream>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Regex.h>
#include <string>
#include <utility>
#include <vector>

namespace fixturegen::codegen {
namespace {

struct MarkerMatcher {
    AnnotationKind kind;
    llvm::Regex    pattern;
};

// Group 2 holds the marker's argument text.
const std::vector<MarkerMatcher> &marker_matchers() {
    static const std::vector<MarkerMatcher> matchers = [] {
        std::vector<MarkerMatcher> table;
        table.push_back(MarkerMatcher{AnnotationKind::Ignore, llvm::Regex("^[[:space:]]*#[[:space:]]*ignore([[:space:]](.*))?$")});
        table.push_back(MarkerMatcher{AnnotationKind::Category, llvm::Regex("^[[:space:]]*#[[:space:]]*category([[:space:]](.*))?$")});
        return table;
    }();
    return matchers;
}

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

} // namespace

auto classify_first_line(std::string_view line) -> Annotation {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    for (const auto &matcher : marker_matchers()) {
        llvm::SmallVector<llvm::StringRef, 3> groups;
        if (!matcher.pattern.match(llvm::StringRef(line.data(), line.size()), &groups)) {
            continue;
        }
        Annotation annotation;
        annotation.kind = matcher.kind;
        if (groups.size() > 2) {
            annotation.text = groups[2].trim().str();
        }
        return annotation;
    }
    return {};
}

std::string annotation_prefix(const Annotation &annotation) {
    switch (annotation.kind) {
    case AnnotationKind::Ignore: return fmt::format("[Ignore(\"{}\")]", render::escape_string(annotation.text));
    case AnnotationKind::Category: return fmt::format("[Category(\"{}\")]", render::escape_string(annotation.text));
    case AnnotationKind::None: break;
    }
    return {};
}

auto read_annotation(const std::filesystem::path &path) -> std::optional<Annotation> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        log_err("failed to open test case '{}'", path.string());
        return std::nullopt;
    }
    std::string first_line;
    if (!std::getline(file, first_line)) {
        if (file.bad()) {
            log_err("failed to read test case '{}'", path.string());
            return std::nullopt;
        }
        return Annotation{};
    }
    std::string_view line = first_line;
    if (line.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        line.remove_prefix(kUtf8Bom.size());
    }
    return classify_first_line(line);
}

} // namespace fixturegen::codegen
