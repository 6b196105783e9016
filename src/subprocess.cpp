#include "subprocess.hpp"
#include "cancellation.hpp"
#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>

namespace {

struct Pipe {
    int fds[2] = {-1, -1};
    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
    int& read_end() { return fds[0]; }
    int& write_end() { return fds[1]; }
};

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// The child is reaped only after `alive` is cleared under the lock, so a
// concurrent kill can never hit a recycled pid.
struct ChildState {
    std::mutex mtx;
    pid_t pid = -1;
    bool alive = false;

    void kill_group() {
        std::lock_guard<std::mutex> lock(mtx);
        if (alive) ::kill(-pid, SIGKILL);
    }
};

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

} // namespace

std::string SubprocessResult::describe() const {
    if (!started) return error.empty() ? "process was not started" : error;
    if (timed_out) return "process timed out";
    if (cancelled) return "process was cancelled";
    if (output_limit_exceeded) return "output limit exceeded";
    if (term_signal != 0) return "process killed by signal " + std::to_string(term_signal);
    if (exit_code != 0) return "process exited with code " + std::to_string(exit_code);
    return "process exited normally";
}

SubprocessResult run_subprocess(const SubprocessOptions& opts, CancellationToken* cancel) {
    SubprocessResult r;
    if (opts.argv.empty()) {
        r.error = "empty command line";
        return r;
    }
    ignore_sigpipe();

    const bool feed_stdin = opts.stdin_path.empty();
    int stdin_file = -1;
    if (!feed_stdin) {
        stdin_file = ::open(opts.stdin_path.c_str(), O_RDONLY | O_CLOEXEC);
        if (stdin_file < 0) {
            r.error = "failed to open " + opts.stdin_path + ": " + std::strerror(errno);
            return r;
        }
    }

    Pipe in, out, err;
    if ((feed_stdin && !in.open()) || !out.open() || !err.open()) {
        r.error = std::string("failed to create pipes: ") + std::strerror(errno);
        close_fd(stdin_file);
        close_fd(in.read_end()); close_fd(in.write_end());
        close_fd(out.read_end()); close_fd(out.write_end());
        close_fd(err.read_end()); close_fd(err.write_end());
        return r;
    }

    std::vector<char*> argv;
    for (auto& a : opts.argv) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    auto t0 = std::chrono::steady_clock::now();
    ChildState child;

    pid_t pid = fork();
    if (pid == 0) {
        setpgid(0, 0);
        dup2(feed_stdin ? in.read_end() : stdin_file, STDIN_FILENO);
        dup2(out.write_end(), STDOUT_FILENO);
        dup2(err.write_end(), STDERR_FILENO);
        execvp(argv[0], argv.data());
        // No stdio here: another thread may have held its lock at fork time.
        static const char msg[] = "execvp failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }
    if (pid < 0) {
        r.error = std::string("fork failed: ") + std::strerror(errno);
        close_fd(stdin_file);
        close_fd(in.read_end()); close_fd(in.write_end());
        close_fd(out.read_end()); close_fd(out.write_end());
        close_fd(err.read_end()); close_fd(err.write_end());
        return r;
    }

    // Also from the parent side, so kill(-pid) works before the child runs.
    setpgid(pid, pid);
    {
        std::lock_guard<std::mutex> lock(child.mtx);
        child.pid = pid;
        child.alive = true;
    }
    r.started = true;

    close_fd(stdin_file);
    close_fd(in.read_end());
    close_fd(out.write_end());
    close_fd(err.write_end());

    std::optional<CancelSubscription> subscription;
    if (cancel) {
        subscription.emplace(*cancel, [&child] { child.kill_group(); });
    }

    int& stdin_fd = in.write_end();
    int& stdout_fd = out.read_end();
    int& stderr_fd = err.read_end();
    if (stdin_fd >= 0) {
        set_nonblocking(stdin_fd);
        if (opts.stdin_data.empty()) close_fd(stdin_fd);
    }
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);

    const bool has_deadline = opts.timeout.count() > 0;
    const auto deadline = t0 + opts.timeout;
    size_t stdin_written = 0;
    char buf[4096];

    while (stdout_fd >= 0 || stderr_fd >= 0) {
        if (cancel && cancel->cancelled()) {
            r.cancelled = true;
            child.kill_group();
            break;
        }

        int wait_ms = 100;
        if (has_deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                r.timed_out = true;
                child.kill_group();
                break;
            }
            if (left < wait_ms) wait_ms = static_cast<int>(left);
        }

        pollfd fds[3];
        nfds_t n = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (stdout_fd >= 0) { out_idx = n; fds[n++] = {stdout_fd, POLLIN, 0}; }
        if (stderr_fd >= 0) { err_idx = n; fds[n++] = {stderr_fd, POLLIN, 0}; }
        if (stdin_fd >= 0) { in_idx = n; fds[n++] = {stdin_fd, POLLOUT, 0}; }

        int rc = ::poll(fds, n, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            r.error = std::string("poll failed: ") + std::strerror(errno);
            child.kill_group();
            break;
        }
        if (rc == 0) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t w = ::write(stdin_fd, opts.stdin_data.data() + stdin_written,
                                opts.stdin_data.size() - stdin_written);
            if (w > 0) stdin_written += static_cast<size_t>(w);
            if (w < 0 && errno != EAGAIN && errno != EINTR) {
                // Child stopped reading; whatever it produced is still collected.
                close_fd(stdin_fd);
            } else if (stdin_written >= opts.stdin_data.size()) {
                close_fd(stdin_fd);
            }
        }

        auto drain = [&](int idx, int& fd, std::string& sink) {
            if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLERR | POLLHUP))) return;
            ssize_t got = ::read(fd, buf, sizeof(buf));
            if (got > 0) {
                sink.append(buf, static_cast<size_t>(got));
            } else if (got == 0 || (errno != EAGAIN && errno != EINTR)) {
                close_fd(fd);
            }
        };
        drain(out_idx, stdout_fd, r.out);
        drain(err_idx, stderr_fd, r.err);

        if (opts.output_limit > 0 && r.out.size() + r.err.size() > opts.output_limit) {
            r.output_limit_exceeded = true;
            child.kill_group();
            break;
        }
    }

    close_fd(stdin_fd);
    close_fd(stdout_fd);
    close_fd(stderr_fd);

    // Wait without reaping, retire the pid, then reap. The child may have
    // closed its output early, so the deadline still applies here.
    for (;;) {
        siginfo_t info{};
        int rc = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
        if (rc < 0 && errno == EINTR) continue;
        if (rc < 0 || info.si_pid == pid) break;
        if (cancel && cancel->cancelled()) {
            r.cancelled = true;
            child.kill_group();
        } else if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
            r.timed_out = true;
            child.kill_group();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    {
        std::lock_guard<std::mutex> lock(child.mtx);
        child.alive = false;
    }
    subscription.reset();

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    auto t1 = std::chrono::steady_clock::now();
    r.ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    if (WIFEXITED(status)) {
        r.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        r.term_signal = WTERMSIG(status);
        // Killed from the cancel callback while the loop above was blocked.
        if (r.term_signal == SIGKILL && cancel && cancel->cancelled() && !r.timed_out) r.cancelled = true;
    }
    return r;
}

bool executable_available(const std::string& cmd) {
    namespace fs = std::filesystem;
    if (cmd.empty()) return false;

    auto is_exec = [](const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    };

    if (cmd.find('/') != std::string::npos) return is_exec(cmd);

    const char* path = std::getenv("PATH");
    if (!path) return false;
    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        if (is_exec(fs::path(dir) / cmd)) return true;
    }
    return false;
}
