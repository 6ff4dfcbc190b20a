// Common filesystem/path helpers for fixturegen.
#pragma once

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>

namespace fixturegen::codegen {

namespace fs = std::filesystem;

// Backslashes are separators in every path we embed, whatever the host is.
inline std::string normalize_slashes(std::string_view text) {
    std::string out(text);
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

// Absolute and lexically normal; symlinks are not resolved.
inline fs::path normalize_path(const fs::path &path) {
    std::error_code ec;
    fs::path        out = path;
    if (!out.is_absolute()) {
        out = fs::absolute(out, ec);
        if (ec) {
            return path;
        }
    }
    out = out.lexically_normal();
    if (!out.has_filename() && out.has_relative_path()) {
        out = out.parent_path();
    }
    return out;
}

inline fs::path resolve_against(const fs::path &base, const fs::path &path) {
    return path.is_absolute() ? path : base / path;
}

// Forward-slash spelling of `path` relative to `base`, used wherever a path is
// written into generated text.
inline std::string embedded_path(const fs::path &path, const fs::path &base) {
    const fs::path full = normalize_path(path);
    const fs::path rel  = full.lexically_relative(normalize_path(base));
    if (rel.empty() || *rel.begin() == "..") {
        return normalize_slashes(full.generic_string());
    }
    return normalize_slashes(rel.generic_string());
}

} // namespace fixturegen::codegen
