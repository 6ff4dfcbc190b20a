#include "fixturegen/process.h"

#include <chrono>
#include <functional>
#include <thread>

#ifndef _WIN32
#  include <cerrno>
#  include <csignal>
#  include <cstring>
#  include <fcntl.h>
#  include <sys/types.h>
#  include <sys/wait.h>
#  include <unistd.h>
#endif

namespace fixturegen::process {
#ifndef _WIN32
namespace {

void read_fd(int fd, std::string &out) {
    constexpr size_t kBufferSize = 4096;
    char buffer[kBufferSize];
    while (true) {
        const ssize_t bytes_read = read(fd, buffer, kBufferSize);
        if (bytes_read > 0) {
            out.append(buffer, buffer + bytes_read);
            continue;
        }
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    close(fd);
}

// A child that exits without draining stdin must not kill us with SIGPIPE;
// the short write is reported through the exit status instead.
void write_fd(int fd, const std::string &text) {
    struct sigaction ignore{};
    struct sigaction previous{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, &previous);

    size_t offset = 0;
    while (offset < text.size()) {
        const ssize_t written = write(fd, text.data() + offset, text.size() - offset);
        if (written > 0) {
            offset += static_cast<size_t>(written);
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    close(fd);
    sigaction(SIGPIPE, &previous, nullptr);
}

void close_pipe(int (&fds)[2]) {
    for (int &fd : fds) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

} // namespace
#endif

SubprocessResult run_subprocess(const SubprocessOptions &options) {
    SubprocessResult result;
    if (options.argv.empty()) {
        result.error = "argv is empty";
        return result;
    }

#ifdef _WIN32
    result.error = "subprocesses are not supported on this platform";
#else
    int stdin_pipe[2]  = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) != 0) {
        result.error = "pipe stdin failed";
        return result;
    }
    if (pipe(stdout_pipe) != 0) {
        close_pipe(stdin_pipe);
        result.error = "pipe stdout failed";
        return result;
    }
    if (pipe(stderr_pipe) != 0) {
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        result.error = "pipe stderr failed";
        return result;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        result.error = "fork failed";
        return result;
    }

    if (pid == 0) {
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);

        // Own process group; a timeout kills the whole group.
        if (setpgid(0, 0) != 0) {
            _exit(127);
        }

        std::vector<char *> argv_c;
        argv_c.reserve(options.argv.size() + 1);
        for (const auto &arg : options.argv) {
            argv_c.push_back(const_cast<char *>(arg.c_str()));
        }
        argv_c.push_back(nullptr);
        execvp(argv_c[0], argv_c.data());
        _exit(127);
    }

    result.started = true;
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    std::thread stdout_thread(read_fd, stdout_pipe[0], std::ref(result.stdout_text));
    std::thread stderr_thread(read_fd, stderr_pipe[0], std::ref(result.stderr_text));
    std::thread stdin_thread(write_fd, stdin_pipe[1], std::cref(options.stdin_text));

    int        status      = 0;
    const bool has_timeout = options.timeout.count() > 0;
    const auto deadline    = std::chrono::steady_clock::now() + options.timeout;

    while (true) {
        const pid_t wait_result = waitpid(pid, &status, has_timeout ? WNOHANG : 0);
        if (wait_result == pid) {
            break;
        }
        if (wait_result == 0) {
            if (std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                if (kill(-pid, SIGKILL) != 0) {
                    kill(pid, SIGKILL);
                }
                waitpid(pid, &status, 0);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (wait_result < 0 && errno == EINTR) {
            continue;
        }
        result.error = std::string("waitpid failed: ") + std::strerror(errno);
        break;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled  = true;
        result.signal    = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    }

    stdin_thread.join();
    stdout_thread.join();
    stderr_thread.join();
#endif

    return result;
}

} // namespace fixturegen::process
