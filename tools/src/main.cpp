#include "driver.hpp"
#include "fixture_table.hpp"
#include "model.hpp"
#include "syntax_backend.hpp"

#include <chrono>
#include <filesystem>
#include <llvm/Support/CommandLine.h>
#include <memory>
#include <string>

using fixturegen::codegen::ExternalCommandBackend;
using fixturegen::codegen::GeneratorOptions;
using fixturegen::codegen::SyntaxBackend;

namespace {

GeneratorOptions parse_arguments(int argc, const char **argv) {
    static llvm::cl::OptionCategory   category{"fixturegen"};
    static llvm::cl::opt<std::string> root_option{"root", llvm::cl::desc("Repository root; other paths are relative to it"),
                                                  llvm::cl::init("."), llvm::cl::cat(category)};
    static llvm::cl::opt<std::string> testcases_option{"testcases", llvm::cl::desc("Directory holding the test-case categories"),
                                                       llvm::cl::init("tests/testcases"), llvm::cl::cat(category)};
    static llvm::cl::opt<std::string> output_option{"output-dir", llvm::cl::desc("Directory the generated fixtures are written to"),
                                                    llvm::cl::init("tests/BooCompiler.Tests"), llvm::cl::cat(category)};
    static llvm::cl::opt<std::string> extension_option{"extension", llvm::cl::desc("Test-case file extension"), llvm::cl::init(".boo"),
                                                       llvm::cl::cat(category)};
    static llvm::cl::list<std::string> only_option{"only", llvm::cl::desc("Generate only the named fixture (repeatable)"),
                                                   llvm::cl::cat(category)};
    static llvm::cl::opt<bool>         list_option{"list", llvm::cl::desc("List the fixtures and exit"), llvm::cl::init(false),
                                           llvm::cl::cat(category)};
    static llvm::cl::opt<bool> check_option{"check", llvm::cl::desc("Verify generated fixtures are up to date; do not write"),
                                            llvm::cl::init(false), llvm::cl::cat(category)};
    static llvm::cl::opt<std::string> template_option{"entry-template", llvm::cl::desc("Path to a template for a single test entry"),
                                                      llvm::cl::init(""), llvm::cl::cat(category)};
    static llvm::cl::list<std::string> printer_option{
        "roundtrip-printer",
        llvm::cl::desc("External printer command for round-trip porting; {syntax} and {file} are substituted"),
        llvm::cl::CommaSeparated, llvm::cl::cat(category)};
    static llvm::cl::opt<unsigned> timeout_option{"printer-timeout", llvm::cl::desc("Printer timeout in milliseconds (0 = none)"),
                                                  llvm::cl::init(0), llvm::cl::cat(category)};

    llvm::cl::HideUnrelatedOptions(category);
    llvm::cl::ParseCommandLineOptions(argc, argv, "fixturegen test-fixture generator\n");

    GeneratorOptions opts;
    opts.root          = std::filesystem::path{root_option.getValue()};
    opts.testcases_dir = std::filesystem::path{testcases_option.getValue()};
    opts.output_dir    = std::filesystem::path{output_option.getValue()};
    opts.extension     = extension_option.getValue();
    opts.only.assign(only_option.begin(), only_option.end());
    opts.list_only  = list_option.getValue();
    opts.check_only = check_option.getValue();
    if (!template_option.getValue().empty()) {
        opts.entry_template_path = std::filesystem::path{template_option.getValue()};
    }
    opts.printer_command.assign(printer_option.begin(), printer_option.end());
    opts.printer_timeout = std::chrono::milliseconds{timeout_option.getValue()};
    return opts;
}

} // namespace

int main(int argc, const char **argv) {
    const auto options = parse_arguments(argc, argv);
    const auto table   = fixturegen::codegen::default_fixture_table();

    if (options.list_only) {
        return fixturegen::codegen::list_fixtures(options, table);
    }

    std::unique_ptr<SyntaxBackend> backend;
    if (!options.printer_command.empty()) {
        backend = std::make_unique<ExternalCommandBackend>(options.printer_command, options.printer_timeout);
    }
    return fixturegen::codegen::run_generation(options, table, backend.get());
}
