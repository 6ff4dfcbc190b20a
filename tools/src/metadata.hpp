// First-line metadata of test-case files.
#pragma once

#include "model.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fixturegen::codegen {

// Classify the first line of a test case. Recognized markers, checked in this
// order with the first match winning:
//   # ignore <reason>   -> Ignore(reason)
//   # category <name>   -> Category(name)
// Leading whitespace is tolerated; the captured text is trimmed. Any other
// content, including an empty line, yields AnnotationKind::None.
auto classify_first_line(std::string_view line) -> Annotation;

// Attribute text emitted in front of a test entry: [Ignore("...")],
// [Category("...")] or an empty string.
std::string annotation_prefix(const Annotation &annotation);

// Read the first line of `path` and classify it. Only the first line is ever
// inspected. Returns nullopt (after logging) when the file cannot be read.
auto read_annotation(const std::filesystem::path &path) -> std::optional<Annotation>;

} // namespace fixturegen::codegen
