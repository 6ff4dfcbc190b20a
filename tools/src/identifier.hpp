// Identifier derivation from test-case file names.
#pragma once

#include <string>
#include <string_view>

namespace fixturegen::codegen {

// Replace every character that is not an ASCII letter or digit with '_'.
// The result has the same length as `stem`; no case folding, no collapsing of
// repeated underscores and no uniqueness check across directories.
std::string sanitize_identifier(std::string_view stem);

} // namespace fixturegen::codegen
