#include "emit.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

using fixturegen::codegen::FixtureSpec;
using fixturegen::codegen::generate_fixture;
using fixturegen::codegen::GenerationReport;
using fixturegen::codegen::GeneratorOptions;
using fixturegen::codegen::list_test_cases;
using fixturegen::codegen::make_context;

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

static std::string read_file(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

int main() {
    Run t;

    const fs::path root = fs::temp_directory_path() / "fixturegen_emit_test";
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root / "cases" / "errors" / "nested", ec);
    t.expect(!ec, "create_directories succeeds");

    write_file(root / "cases" / "errors" / "foo-bar.boo", "# ignore needs fix\nprint 1\n");
    write_file(root / "cases" / "errors" / "plain.boo", "print 2\n");
    write_file(root / "cases" / "errors" / "notes.txt", "# ignore not a test case\n");
    write_file(root / "cases" / "errors" / "nested" / "deep.boo", "print 3\n");

    GeneratorOptions options;
    options.root          = root;
    options.testcases_dir = "cases";
    options.output_dir    = "out";
    const auto ctx        = make_context(options);

    FixtureSpec spec;
    spec.name        = "CompilerErrors";
    spec.source_dir  = "errors";
    spec.target_file = "CompilerErrorsTestFixture.cs";
    spec.header      = R"(
        namespace BooCompiler.Tests
        {
            public class CompilerErrorsTestFixture
            {
        )";

    {
        const auto listed = list_test_cases(root / "cases" / "errors", ".boo", /*sorted=*/true);
        t.expect(listed && listed->size() == 2, "only top-level files with the extension are listed");
        t.expect(listed && listed->size() == 2 && (*listed)[0].filename() == "foo-bar.boo" && (*listed)[1].filename() == "plain.boo",
                 "sorted listing is ordered by file name");
        t.expect(!list_test_cases(root / "cases" / "absent", ".boo", false), "listing a missing directory fails");
    }

    const fs::path target = root / "out" / "CompilerErrorsTestFixture.cs";
    {
        GenerationReport report;
        t.expect(generate_fixture(spec, ctx, report) == 0, "generation succeeds");
        t.expect(report.entry_count == 2, "one entry per test case");
        t.expect(report.ignored_count == 1, "ignored entries counted");
        t.expect(report.label == "cases/errors", "report label is the source directory relative to root");

        const auto content = read_file(target);
        t.expect(content.rfind("namespace BooCompiler.Tests\n{\n    public class CompilerErrorsTestFixture\n    {\n", 0) == 0,
                 "reindented header opens the file");
        t.expect(content.find("[Test][Ignore(\"needs fix\")]\n        public void foo_bar()") != std::string::npos,
                 "ignored entry named from sanitized stem");
        t.expect(content.find("public void plain()") != std::string::npos, "plain entry present");
        t.expect(content.find("notes") == std::string::npos, "files with another extension are skipped");
        t.expect(content.find("deep") == std::string::npos, "nested directories are not scanned");
        t.expect(content.find("return \"errors\";") != std::string::npos, "footer names the source directory");
    }

    {
        const auto first = read_file(target);
        GenerationReport report;
        t.expect(generate_fixture(spec, ctx, report) == 0, "regeneration succeeds");
        t.expect(read_file(target) == first, "regeneration is byte-identical");
    }

    {
        write_file(target, "stale content that is much longer than nothing at all, and then some more text");
        GenerationReport report;
        t.expect(generate_fixture(spec, ctx, report) == 0, "generation over an existing file succeeds");
        t.expect(read_file(target).find("stale content") == std::string::npos, "target is fully overwritten");
    }

    {
        auto check_options       = options;
        check_options.check_only = true;
        const auto check_ctx     = make_context(check_options);

        GenerationReport fresh;
        t.expect(generate_fixture(spec, check_ctx, fresh) == 0, "check of an up-to-date target succeeds");
        t.expect(!fresh.out_of_date, "up-to-date target is not flagged");

        write_file(root / "cases" / "errors" / "new-case.boo", "print 4\n");
        const auto before = read_file(target);
        GenerationReport stale;
        t.expect(generate_fixture(spec, check_ctx, stale) == 0, "check of a stale target is not an error");
        t.expect(stale.out_of_date, "stale target is flagged");
        t.expect(read_file(target) == before, "check mode does not write");
    }

    {
        FixtureSpec empty_spec   = spec;
        empty_spec.source_dir    = "brand-new";
        empty_spec.target_file   = "BrandNewTestFixture.cs";
        GenerationReport report;
        t.expect(generate_fixture(empty_spec, ctx, report) == 0, "generation for a missing source directory succeeds");
        t.expect(fs::is_directory(root / "cases" / "brand-new"), "missing source directory is created");
        t.expect(report.entry_count == 0 && report.ignored_count == 0, "empty directory yields no entries");
        t.expect(fs::exists(root / "out" / "BrandNewTestFixture.cs"), "fixture written for an empty directory");
    }

    {
        fs::create_directories(root / "shared" / "impl", ec);
        write_file(root / "shared" / "impl" / "impl.boo", "# ignore shared case\nprint 5\n");
        fs::create_symlink(root / "shared" / "impl" / "impl.boo", root / "shared" / "foo-bar.boo", ec);
        t.expect(!ec, "create_symlink succeeds");
        fs::create_directory_symlink(root / "shared", root / "cases" / "linked", ec);
        t.expect(!ec, "create_directory_symlink succeeds");

        FixtureSpec linked_spec = spec;
        linked_spec.source_dir  = "linked";
        linked_spec.target_file = "LinkedTestFixture.cs";
        GenerationReport report;
        t.expect(generate_fixture(linked_spec, ctx, report) == 0, "generation through symlinks succeeds");
        t.expect(report.entry_count == 1 && report.ignored_count == 1, "symlinked test case is listed");
        t.expect(report.label == "cases/linked", "label keeps the symlinked directory name");

        const auto content = read_file(root / "out" / "LinkedTestFixture.cs");
        t.expect(content.find("public void foo_bar()") != std::string::npos, "entry named after the link");
        t.expect(content.find("RunCompilerTestCase(\"foo-bar.boo\");") != std::string::npos, "entry embeds the link name");
        t.expect(content.find("impl") == std::string::npos, "symlink targets are not embedded");
        t.expect(content.find("return \"linked\";") != std::string::npos, "footer keeps the symlinked directory name");
    }

    {
        write_file(root / "blocker", "a file where a directory is needed");
        auto bad_options       = options;
        bad_options.output_dir = "blocker/sub";
        const auto bad_ctx     = make_context(bad_options);
        GenerationReport report;
        t.expect(generate_fixture(spec, bad_ctx, report) != 0, "unwritable target fails");
    }

    fs::remove_all(root, ec);

    if (t.failures) {
        std::cerr << "Total failures: " << t.failures << "\n";
        return 1;
    }
    return 0;
}
