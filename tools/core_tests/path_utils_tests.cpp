#include "path_utils.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

using fixturegen::codegen::embedded_path;
using fixturegen::codegen::normalize_path;
using fixturegen::codegen::normalize_slashes;

struct Run {
    int failures = 0;
    void expect(bool ok, std::string_view msg) {
        if (!ok) {
            ++failures;
            std::cerr << "FAIL: " << msg << "\n";
        }
    }
};

static void write_file(const fs::path &path, std::string_view content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

int main() {
    Run t;

    t.expect(normalize_slashes(R"(C:\x\y.boo)") == "C:/x/y.boo", "backslashes become forward slashes");
    t.expect(normalize_slashes("a/b/c.boo") == "a/b/c.boo", "forward slashes are kept");
    t.expect(normalize_slashes(R"(mixed\dir/file.boo)") == "mixed/dir/file.boo", "mixed separators are normalized");

    const fs::path root = fs::temp_directory_path() / "fixturegen_path_utils_test";
    std::error_code ec;
    fs::remove_all(root, ec);
    ec.clear();
    fs::create_directories(root / "errors", ec);
    t.expect(!ec, "create_directories succeeds");
    write_file(root / "errors" / "foo-bar.boo", "\n");

    t.expect(embedded_path(root / "errors" / "foo-bar.boo", root / "errors") == "foo-bar.boo", "file relative to its directory");
    t.expect(embedded_path(root / "errors", root) == "errors", "directory relative to root");
    t.expect(embedded_path(root / "errors" / ".." / "errors" / "foo-bar.boo", root) == "errors/foo-bar.boo",
             "dot-dot segments are resolved before relativizing");
    t.expect(embedded_path(root / "missing" / "x.boo", root) == "missing/x.boo", "paths that do not exist yet still relativize");

    const auto outside = embedded_path(root, root / "errors");
    t.expect(outside.find("..") == std::string::npos, "paths outside the base are embedded absolute");
    t.expect(outside.find('\\') == std::string::npos, "absolute fallback uses forward slashes");

    t.expect(normalize_path(root / "errors" / "") == normalize_path(root / "errors"), "trailing separator is dropped");

    fs::create_directories(root / "shared", ec);
    write_file(root / "shared" / "impl.boo", "print 1\n");
    fs::create_symlink(root / "shared" / "impl.boo", root / "errors" / "linked.boo", ec);
    t.expect(!ec, "create_symlink succeeds");
    fs::create_directory_symlink(root / "shared", root / "alias", ec);
    t.expect(!ec, "create_directory_symlink succeeds");
    t.expect(embedded_path(root / "errors" / "linked.boo", root / "errors") == "linked.boo", "symlinked file keeps its own name");
    t.expect(embedded_path(root / "alias", root) == "alias", "symlinked directory keeps its own name");

    fs::remove_all(root, ec);

    if (t.failures) {
        std::cerr << "Total failures: " << t.failures << "\n";
        return 1;
    }
    return 0;
}
