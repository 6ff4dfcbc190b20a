// Shared model types for fixturegen
//
// These types are passed among discovery, rendering, emission and the driver
// to describe test-case files, fixture definitions and generation results.
#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fixturegen::codegen {

// Per-entry marker derived from the first line of a test-case file.
enum class AnnotationKind { None, Ignore, Category };

// - kind: which marker was recognized (None when the line matched nothing)
// - text: trimmed reason (Ignore) or category name (Category)
struct Annotation {
    AnnotationKind kind = AnnotationKind::None;
    std::string    text;
};

// One generated fixture: where its cases live, where it is written and the
// literal header that opens the generated class.
// - name: short fixture name used by --only and in diagnostics
// - source_dir: test-case directory, relative to the test-cases root
// - target_file: generated file, relative to the output directory
// - header: header template text; reindented before emission
// - runner: method invoked by every generated test entry
// - roundtrip_source: when set, the round-trip porter fills source_dir from
//   this directory before the fixture is generated
// - sorted: list test cases sorted by file name instead of enumeration order
struct FixtureSpec {
    std::string                          name;
    std::filesystem::path                source_dir;
    std::filesystem::path                target_file;
    std::string                          header;
    std::string                          runner = "RunCompilerTestCase";
    std::optional<std::filesystem::path> roundtrip_source;
    bool                                 sorted = false;
};

// A discovered test-case file. Identity is the path; everything else is
// derived on every run.
struct TestCaseFile {
    std::filesystem::path path;
    std::string           stem;
    std::string           identifier;
    Annotation            annotation;
};

// Rendered text for a single test case.
struct RenderedEntry {
    std::string text;
    bool        ignored = false;
};

// Counts accumulated for one fixture and printed as one report line.
struct GenerationReport {
    std::size_t entry_count   = 0;
    std::size_t ignored_count = 0;
    std::string label;
    bool        out_of_date = false; // check mode only
};

// Options consumed by the generator entry point.
// - root: repository root every other path is resolved against
// - testcases_dir/output_dir: relative to root unless absolute
// - extension: test-case file extension, including the dot
// - only: fixture names to generate (empty means all)
// - entry_template_path: optional external entry template
// - printer_command: argv template for the external round-trip printer
// - check_only: compare instead of writing
struct GeneratorOptions {
    std::filesystem::path     root = ".";
    std::filesystem::path     testcases_dir = "tests/testcases";
    std::filesystem::path     output_dir    = "tests/BooCompiler.Tests";
    std::string               extension     = ".boo";
    std::vector<std::string>  only;
    std::filesystem::path     entry_template_path;
    std::vector<std::string>  printer_command;
    std::chrono::milliseconds printer_timeout{0};
    bool                      list_only  = false;
    bool                      check_only = false;
};

} // namespace fixturegen::codegen
