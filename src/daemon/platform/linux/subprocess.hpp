#pragma once

#include <chrono>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

namespace platform {

struct ProcessResult {
    int exit_code = -1;
    std::string output; // stdout, when captured
    bool timed_out = false;
    bool cancelled = false;

    bool ok() const { return exit_code == 0 && !timed_out && !cancelled; }
};

struct RunOptions {
    std::string input;                      // written to stdin, then closed
    std::chrono::milliseconds timeout{0};   // 0: no limit
    std::stop_token stop;
    // Tools that fork a background server (wl-copy, xclip) keep stdout open;
    // leave this off for them or the read never sees EOF.
    bool capture_output = false;
};

// fork/exec with stdin and stdout pipes. The child is SIGKILLed when the
// timeout expires or stop is requested. Errors only for fork/pipe failures;
// a missing program shows up as exit code 127.
std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv,
                                                      const RunOptions& options = {});

// True if `program` resolves to an executable in $PATH.
bool find_program(const std::string& program);

} // namespace platform
