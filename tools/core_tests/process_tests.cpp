#include "syntax_backend.hpp"

#include <fixturegen/process.h>

#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using fixturegen::codegen::ExternalCommandBackend;
using fixturegen::codegen::ParsedModule;
using fixturegen::codegen::SyntaxVariant;
using fixturegen::process::run_subprocess;
using fixturegen::process::SubprocessOptions;

struct Run {
    int failures = 0;
    void expect(bool ok, std::string_view msg) {
        if (!ok) {
            ++failures;
            std::cerr << "FAIL: " << msg << "\n";
        }
    }
};

int main() {
    Run t;

    {
        ExternalCommandBackend backend(std::vector<std::string>{"printer", "--syntax={syntax}", "{file}"});
        const ParsedModule module{R"(C:\cases\a.boo)", "print 1\n"};
        const auto argv = backend.expand_command(module, SyntaxVariant::WhitespaceSignificant);
        t.expect(argv.size() == 3, "argv keeps its shape");
        t.expect(argv.size() == 3 && argv[1] == "--syntax=whitespace-significant", "syntax placeholder substituted");
        t.expect(argv.size() == 3 && argv[2] == "C:/cases/a.boo", "file placeholder substituted with forward slashes");
    }

    {
        ExternalCommandBackend backend(std::vector<std::string>{});
        std::string error;
        t.expect(!backend.parse("a.boo", "print 1\n", error), "parse without a command fails");
        t.expect(!error.empty(), "missing command is reported");
    }

#if !defined(_WIN32)
    {
        SubprocessOptions options;
        options.argv       = {"/bin/sh", "-c", "tr a-z A-Z; echo warn >&2"};
        options.stdin_text = "print hello\n";
        const auto result  = run_subprocess(options);
        t.expect(result.succeeded(), "shell pipeline succeeds");
        t.expect(result.stdout_text == "PRINT HELLO\n", "stdin is fed to the child and stdout captured");
        t.expect(result.stderr_text == "warn\n", "stderr captured");
    }

    {
        SubprocessOptions options;
        options.argv      = {"/bin/sh", "-c", "exit 3"};
        const auto result = run_subprocess(options);
        t.expect(result.started && result.exit_code == 3 && !result.succeeded(), "exit status reported");
    }

    {
        SubprocessOptions options;
        options.argv      = {"/bin/sh", "-c", "exec sleep 5"};
        options.timeout   = std::chrono::milliseconds{100};
        const auto result = run_subprocess(options);
        t.expect(result.timed_out && !result.succeeded(), "timeout kills the child");
    }

    {
        SubprocessOptions options;
        options.argv       = {"/bin/sh", "-c", "sleep 5; echo late"};
        options.timeout    = std::chrono::milliseconds{100};
        const auto started = std::chrono::steady_clock::now();
        const auto result  = run_subprocess(options);
        const auto elapsed = std::chrono::steady_clock::now() - started;
        t.expect(result.timed_out && !result.succeeded(), "timeout kills a forking wrapper");
        t.expect(elapsed < std::chrono::seconds{3}, "forked grandchildren do not outlive the timeout");
        t.expect(result.stdout_text.empty(), "killed wrapper produces no output");
    }

    {
        SubprocessOptions options;
        options.argv      = {"/nonexistent/fixturegen-printer"};
        const auto result = run_subprocess(options);
        t.expect(result.exit_code == 127 && !result.succeeded(), "missing program reports exit 127");
    }

    {
        SubprocessOptions options;
        options.argv       = {"/bin/sh", "-c", "exit 0"};
        options.stdin_text = std::string(1 << 20, 'x');
        const auto result  = run_subprocess(options);
        t.expect(result.started && result.exit_code == 0, "child ignoring stdin does not break the parent");
    }

    {
        ExternalCommandBackend backend(std::vector<std::string>{"/bin/sh", "-c", "echo \"# {syntax}\"; cat"});
        std::string error;
        const auto  module = backend.parse("a.boo", "print 1\n", error);
        t.expect(module.has_value(), "module packaged");
        if (module) {
            const auto printed = backend.print(*module, SyntaxVariant::WhitespaceSignificant, error);
            t.expect(printed && *printed == "# whitespace-significant\nprint 1\n", "printer output returned");
        }
    }

    {
        ExternalCommandBackend backend(std::vector<std::string>{"/bin/sh", "-c", "echo 'unexpected token' >&2; exit 1"});
        std::string error;
        const auto  module  = backend.parse("bad.boo", "print (\n", error);
        const auto  printed = module ? backend.print(*module, SyntaxVariant::WhitespaceSignificant, error) : std::nullopt;
        t.expect(!printed, "failing printer yields no output");
        t.expect(error.find("exited with status 1") != std::string::npos, "exit status in error");
        t.expect(error.find("unexpected token") != std::string::npos, "stderr in error");
    }
#endif

    if (t.failures) {
        std::cerr << "Total failures: " << t.failures << "\n";
        return 1;
    }
    return 0;
}
