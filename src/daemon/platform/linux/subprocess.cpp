#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <cstdlib>
#include <csignal>
#include <cstring>
#include <string_view>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

[[noreturn]] void exec_child(const std::vector<std::string>& argv, int in_fd, int out_fd) {
    // The daemon blocks SIGINT/SIGTERM for its signalfd and ignores SIGPIPE;
    // neither should leak into the tools it runs.
    sigset_t all;
    sigemptyset(&all);
    sigprocmask(SIG_SETMASK, &all, nullptr);
    std::signal(SIGPIPE, SIG_DFL);

    ::dup2(in_fd, STDIN_FILENO);
    ::dup2(out_fd, STDOUT_FILENO);
    int devnull = ::open("/dev/null", O_WRONLY);
    if (devnull >= 0) ::dup2(devnull, STDERR_FILENO);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    ::execvp(args[0], args.data());
    ::_exit(127);
}

} // namespace

std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv,
                                                      const RunOptions& options) {
    if (argv.empty()) return std::unexpected("empty command");

    int in_pipe[2];
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) return std::unexpected(errno_message("pipe()"));

    int out_pipe[2] = {-1, -1};
    if (options.capture_output) {
        if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
            ::close(in_pipe[0]);
            ::close(in_pipe[1]);
            return std::unexpected(errno_message("pipe()"));
        }
    } else {
        out_pipe[1] = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = errno_message("fork()");
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1]}) {
            if (fd >= 0) ::close(fd);
        }
        return std::unexpected(err);
    }

    if (pid == 0) {
        exec_child(argv, in_pipe[0], out_pipe[1]);
    }

    ::close(in_pipe[0]);
    if (out_pipe[1] >= 0) ::close(out_pipe[1]);

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::now() + options.timeout;
    auto expired = [&] {
        if (options.stop.stop_requested()) {
            result.cancelled = true;
            return true;
        }
        if (options.timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            return true;
        }
        return false;
    };

    size_t written = 0;
    while (written < options.input.size()) {
        ssize_t n = ::write(in_pipe[1], options.input.data() + written, options.input.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            break; // child went away; its exit status says why
        }
        written += static_cast<size_t>(n);
    }
    ::close(in_pipe[1]);

    bool killed = false;
    if (out_pipe[0] >= 0) {
        char buf[65536];
        while (true) {
            if (expired()) {
                ::kill(pid, SIGKILL);
                killed = true;
                break;
            }
            pollfd pfd{.fd = out_pipe[0], .events = POLLIN, .revents = 0};
            int ready = ::poll(&pfd, 1, 50);
            if (ready < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (ready == 0) continue;

            ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (n == 0) break;
            result.output.append(buf, static_cast<size_t>(n));
        }
        ::close(out_pipe[0]);
    }

    int status = 0;
    while (true) {
        pid_t r = ::waitpid(pid, &status, killed ? 0 : WNOHANG);
        if (r == pid) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_message("waitpid()"));
        }
        if (!killed && expired()) {
            ::kill(pid, SIGKILL);
            killed = true;
            continue;
        }
        ::usleep(5000);
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    return result;
}

bool find_program(const std::string& program) {
    const char* path = std::getenv("PATH");
    if (!path) return false;

    std::string_view dirs(path);
    while (!dirs.empty()) {
        auto sep = dirs.find(':');
        auto dir = dirs.substr(0, sep);
        if (!dir.empty()) {
            auto candidate = std::string(dir) + "/" + program;
            if (::access(candidate.c_str(), X_OK) == 0) return true;
        }
        if (sep == std::string_view::npos) break;
        dirs.remove_prefix(sep + 1);
    }
    return false;
}

} // namespace platform
