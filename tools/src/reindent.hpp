// Dedent helper for template text written at natural indentation.
#pragma once

#include <string>
#include <string_view>

namespace fixturegen::codegen {

// Strip the leading whitespace of the first non-blank line from every line
// that starts with it. Returns `text` unchanged when that line is not
// indented. Lines are rejoined with '\n'. Mixing tabs and spaces between
// lines is not reconciled.
std::string reindent(std::string_view text);

} // namespace fixturegen::codegen
