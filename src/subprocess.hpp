#pragma once
#include <chrono>
#include <string>
#include <vector>

class CancellationToken;

struct SubprocessOptions {
    std::vector<std::string> argv;              // argv[0] is looked up on PATH
    std::string stdin_data;                     // piped to the child when stdin_path is empty
    std::string stdin_path;                     // file attached as the child's stdin
    std::chrono::milliseconds timeout{0};       // 0 disables the deadline
    size_t output_limit = 0;                    // cap on stdout + stderr bytes, 0 disables
};

struct SubprocessResult {
    bool started = false;
    int exit_code = -1;                         // valid when the child exited normally
    int term_signal = 0;                        // set when the child died from a signal
    bool timed_out = false;                     // killed by our own deadline
    bool cancelled = false;                     // killed through the cancellation token
    bool output_limit_exceeded = false;
    std::string out;
    std::string err;
    std::string error;                          // why the child could not be started
    double ms = 0.0;

    bool ok() const {
        return started && exit_code == 0 && !timed_out && !cancelled && !output_limit_exceeded;
    }
    std::string describe() const;
};

// Runs argv as a child process in its own process group and captures its
// output. The whole group is killed with SIGKILL when the deadline passes,
// the output cap is exceeded, or the token is cancelled.
SubprocessResult run_subprocess(const SubprocessOptions& opts, CancellationToken* cancel = nullptr);

// True when cmd names an executable file, either directly or through PATH.
bool executable_available(const std::string& cmd);
