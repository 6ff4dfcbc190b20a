// Round-trip porting of parser test cases into an alternate syntax.
#pragma once

#include "syntax_backend.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace fixturegen::codegen {

// Leading docstring of a test case and the module text that follows it.
// `docstring` runs up to and including the second line consisting only of
// `"""`; when there is no such line it holds the whole file.
struct DocstringSplit {
    std::string docstring;
    std::string remainder;
};

auto split_docstring(std::string_view source) -> DocstringSplit;

// Port every test case in `source_dir` (sorted by name) that has no file of
// the same name in `dest_dir` yet: the docstring is copied verbatim and the
// remainder is parsed and printed in SyntaxVariant::WhitespaceSignificant.
// Existing destination files are never rewritten. Each ported file is
// reported on stdout. Returns 0 on success; the first parse, print or I/O
// failure aborts the pass.
int port_roundtrip_cases(const std::filesystem::path &source_dir, const std::filesystem::path &dest_dir, std::string_view extension,
                         SyntaxBackend &backend);

} // namespace fixturegen::codegen
