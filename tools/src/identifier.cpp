#include "identifier.hpp"

#include <cctype>

namespace fixturegen::codegen {

std::string sanitize_identifier(std::string_view stem) {
    std::string out;
    out.reserve(stem.size());
    for (const char ch : stem) {
        const auto uch = static_cast<unsigned char>(ch);
        out.push_back(uch < 0x80 && std::isalnum(uch) != 0 ? ch : '_');
    }
    return out;
}

} // namespace fixturegen::codegen
