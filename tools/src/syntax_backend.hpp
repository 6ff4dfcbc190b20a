// Parse/print capability used by the round-trip porter.
#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fixturegen::codegen {

// Concrete syntaxes a module can be printed in.
enum class SyntaxVariant { Default, WhitespaceSignificant };

std::string_view syntax_variant_name(SyntaxVariant variant);

// A module produced by SyntaxBackend::parse. Only the backend that produced it
// interprets `source`.
struct ParsedModule {
    std::filesystem::path origin;
    std::string           source;
};

// External parser and pretty-printer. Implementations report failures through
// `error` and an empty result.
class SyntaxBackend {
  public:
    virtual ~SyntaxBackend() = default;

    // Parse the module text read from `origin`.
    virtual auto parse(const std::filesystem::path &origin, std::string_view source, std::string &error)
        -> std::optional<ParsedModule> = 0;

    // Print a parsed module in `variant`.
    virtual auto print(const ParsedModule &module, SyntaxVariant variant, std::string &error) -> std::optional<std::string> = 0;
};

// Backend driving an external printer command. Each argument may contain the
// placeholders {syntax} (variant name) and {file} (module origin). The module
// source is written to the command's stdin and the printed module is read from
// its stdout. Syntax errors surface when printing, as a failing exit status.
class ExternalCommandBackend final : public SyntaxBackend {
  public:
    explicit ExternalCommandBackend(std::vector<std::string> command, std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    auto parse(const std::filesystem::path &origin, std::string_view source, std::string &error) -> std::optional<ParsedModule> override;
    auto print(const ParsedModule &module, SyntaxVariant variant, std::string &error) -> std::optional<std::string> override;

    // argv for one invocation, placeholders substituted.
    [[nodiscard]] std::vector<std::string> expand_command(const ParsedModule &module, SyntaxVariant variant) const;

  private:
    std::vector<std::string>  command_;
    std::chrono::milliseconds timeout_;
};

} // namespace fixturegen::codegen
