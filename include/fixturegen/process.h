#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace fixturegen::process {

// - argv: program and arguments; argv[0] is looked up on PATH
// - stdin_text: written to the child's stdin, which is then closed
// - timeout: zero waits indefinitely; on expiry the child's process group is killed
struct SubprocessOptions {
    std::vector<std::string>  argv;
    std::string               stdin_text;
    std::chrono::milliseconds timeout{0};
};

struct SubprocessResult {
    int         exit_code = -1;
    bool        started   = false;
    bool        timed_out = false;
    bool        signaled  = false;
    int         signal    = 0;
    std::string stdout_text;
    std::string stderr_text;
    std::string error;

    [[nodiscard]] bool succeeded() const { return started && !timed_out && !signaled && exit_code == 0 && error.empty(); }
};

auto run_subprocess(const SubprocessOptions &options) -> SubprocessResult;

} // namespace fixturegen::process
