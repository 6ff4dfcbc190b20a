#include "syntax_backend.hpp"

#include "path_utils.hpp"
#include "render.hpp"

#include <fixturegen/process.h>
#include <fmt/core.h>
#include <utility>

namespace fixturegen::codegen {

std::string_view syntax_variant_name(SyntaxVariant variant) {
    switch (variant) {
    case SyntaxVariant::Default: return "default";
    case SyntaxVariant::WhitespaceSignificant: return "whitespace-significant";
    }
    return "default";
}

ExternalCommandBackend::ExternalCommandBackend(std::vector<std::string> command, std::chrono::milliseconds timeout)
    : command_(std::move(command)), timeout_(timeout) {}

auto ExternalCommandBackend::parse(const std::filesystem::path &origin, std::string_view source, std::string &error)
    -> std::optional<ParsedModule> {
    if (command_.empty()) {
        error = "no printer command configured";
        return std::nullopt;
    }
    return ParsedModule{origin, std::string(source)};
}

std::vector<std::string> ExternalCommandBackend::expand_command(const ParsedModule &module, SyntaxVariant variant) const {
    std::vector<std::string> argv;
    argv.reserve(command_.size());
    const std::string file = normalize_slashes(module.origin.generic_string());
    for (std::string arg : command_) {
        render::replace_all(arg, "{syntax}", syntax_variant_name(variant));
        render::replace_all(arg, "{file}", file);
        argv.push_back(std::move(arg));
    }
    return argv;
}

auto ExternalCommandBackend::print(const ParsedModule &module, SyntaxVariant variant, std::string &error) -> std::optional<std::string> {
    if (command_.empty()) {
        error = "no printer command configured";
        return std::nullopt;
    }
    process::SubprocessOptions options;
    options.argv       = expand_command(module, variant);
    options.stdin_text = module.source;
    options.timeout    = timeout_;

    auto result = process::run_subprocess(options);
    if (result.succeeded()) {
        return std::move(result.stdout_text);
    }
    if (!result.error.empty()) {
        error = fmt::format("'{}': {}", options.argv.front(), result.error);
    } else if (result.timed_out) {
        error = fmt::format("'{}' timed out after {} ms", options.argv.front(), timeout_.count());
    } else if (result.signaled) {
        error = fmt::format("'{}' terminated by signal {}", options.argv.front(), result.signal);
    } else {
        error = fmt::format("'{}' exited with status {}", options.argv.front(), result.exit_code);
    }
    if (!result.stderr_text.empty()) {
        error += fmt::format(":\n{}", result.stderr_text);
    }
    return std::nullopt;
}

} // namespace fixturegen::codegen
