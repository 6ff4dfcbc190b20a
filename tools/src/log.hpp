// stderr logging for fixturegen.
#pragma once

#include <fmt/format.h>
#include <llvm/Support/raw_ostream.h>

#include <iterator>
#include <string_view>
#include <utility>

namespace fixturegen::codegen {

namespace detail {

template <typename... Args>
void write_prefixed(std::string_view prefix, fmt::format_string<Args...> format_string, Args &&...args) {
    fmt::memory_buffer buffer;
    buffer.reserve(256);
    fmt::format_to(std::back_inserter(buffer), "fixturegen: {}", prefix);
    fmt::format_to(std::back_inserter(buffer), format_string, std::forward<Args>(args)...);
    buffer.push_back('\n');
    llvm::errs() << fmt::to_string(buffer);
}

} // namespace detail

template <typename... Args>
void log_err(fmt::format_string<Args...> format_string, Args &&...args) {
    detail::write_prefixed("error: ", format_string, std::forward<Args>(args)...);
}

template <typename... Args>
void log_note(fmt::format_string<Args...> format_string, Args &&...args) {
    detail::write_prefixed("note: ", format_string, std::forward<Args>(args)...);
}

} // namespace fixturegen::codegen
