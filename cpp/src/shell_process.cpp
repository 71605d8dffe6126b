#include "../include/shell_process.hpp"
#include "../include/dev_debug.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace actionstream {
namespace core {

ShellProcess::ShellProcess(ProcessConfig config)
    : config_(std::move(config))
{
}

ShellProcess::~ShellProcess() {
    terminate(/*graceMs=*/0);
    close_pipes_();
}

bool ShellProcess::start() {
    if (running_) return true;
    if (!create_pipes_()) return false;
    if (!spawn_child_()) {
        close_pipes_();
        return false;
    }
    running_ = true;
    ASTREAM_DBG("CHANNEL", "shell started pid=%d path=%s", static_cast<int>(child_pid_), config_.shell_path.c_str());
    return true;
}

bool ShellProcess::create_pipes_() {
    if (pipe(stdin_pipe_) == -1 || pipe(stdout_pipe_) == -1) {
        close_pipes_();
        return false;
    }

    // Parent ends must not leak into later children.
    auto set_cloexec = [](int fd){
        int f = fcntl(fd, F_GETFD, 0);
        if (f != -1) fcntl(fd, F_SETFD, f | FD_CLOEXEC);
    };
    set_cloexec(stdin_pipe_[1]);
    set_cloexec(stdout_pipe_[0]);
    return true;
}

bool ShellProcess::spawn_child_() {
    std::vector<std::string> args;
    args.push_back(config_.shell_path);
    args.insert(args.end(), config_.additional_arguments.begin(), config_.additional_arguments.end());
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    child_pid_ = fork();
    if (child_pid_ == -1) {
        return false;
    }

    if (child_pid_ == 0) {
        // --- Child process context ---
        setpgid(0, 0); // own group: abort signals the whole job tree

        // stdin from our pipe; stdout and stderr share one stream.
        dup2(stdin_pipe_[0],  STDIN_FILENO);
        dup2(stdout_pipe_[1], STDOUT_FILENO);
        dup2(stdout_pipe_[1], STDERR_FILENO);

        close(stdin_pipe_[0]);  close(stdin_pipe_[1]);
        close(stdout_pipe_[0]); close(stdout_pipe_[1]);

        if (!config_.working_directory.empty()) {
            if (chdir(config_.working_directory.c_str()) != 0) {
                perror("chdir");
            }
        }
        for (const auto& [k,v] : config_.environment) {
            setenv(k.c_str(), v.c_str(), 1); // Overwrite existing entries.
        }

        execvp(argv[0], argv.data());
        perror("execvp shell");
        _exit(127);
    }

    // --- Parent process context ---
    setpgid(child_pid_, child_pid_); // both sides set it to avoid racing the child
    close(stdin_pipe_[0]);  stdin_pipe_[0]  = -1;
    close(stdout_pipe_[1]); stdout_pipe_[1] = -1;

    // A shell that cannot exec exits right away.
    int status = 0;
    for (int i = 0; i < 5; ++i) {
        pid_t r = waitpid(child_pid_, &status, WNOHANG);
        if (r == child_pid_) {
            ASTREAM_DBG("CHANNEL", "shell exited during startup status=%d", status);
            child_pid_ = -1;
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

void ShellProcess::close_pipes_() noexcept {
    // Idempotent close; FDs may already be -1.
    for (int* fd : {&stdin_pipe_[0], &stdin_pipe_[1], &stdout_pipe_[0], &stdout_pipe_[1]}) {
        if (*fd != -1) { close(*fd); *fd = -1; }
    }
}

void ShellProcess::terminate(int graceMs) {
    {
        std::lock_guard<std::mutex> lk(stdin_mutex_);
        if (stdin_pipe_[1] != -1) { close(stdin_pipe_[1]); stdin_pipe_[1] = -1; } // EOF ends the shell
    }
    if (child_pid_ <= 0) { running_ = false; return; }

    if (!wait_exit_(graceMs)) {
        // Try polite SIGTERM first, then fallback to SIGKILL if still alive.
        signal_group_(SIGTERM);
        if (!wait_exit_(200)) {
            signal_group_(SIGKILL);
            std::lock_guard<std::mutex> lk(pid_mutex_);
            if (child_pid_ > 0) { int st = 0; waitpid(child_pid_, &st, 0); }
        }
    }

    std::lock_guard<std::mutex> lk(pid_mutex_);
    ASTREAM_DBG("CHANNEL", "shell terminated pid=%d", static_cast<int>(child_pid_));
    child_pid_ = -1;
    running_ = false;
}

void ShellProcess::kill_group() {
    if (child_pid_ <= 0) return;
    ASTREAM_DBG("CHANNEL", "abort: signalling group %d", static_cast<int>(child_pid_));
    signal_group_(SIGTERM);
    if (!wait_exit_(100)) {
        signal_group_(SIGKILL);
        (void)wait_exit_(1000);
    }
}

void ShellProcess::signal_group_(int sig) noexcept {
    if (child_pid_ <= 0) return;
    if (::kill(-child_pid_, sig) == -1) ::kill(child_pid_, sig);
}

bool ShellProcess::wait_exit_(int timeoutMs) {
    auto endTime = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

    while (true) {
        {
            std::lock_guard<std::mutex> lk(pid_mutex_);
            if (child_pid_ <= 0 || !running_) return true;
            int status = 0;
            pid_t result = waitpid(child_pid_, &status, WNOHANG);
            if (result == child_pid_ || result == -1) {
                // Exited, or waitpid error (e.g., ECHILD). Treat as not running.
                running_ = false;
                return true;
            }
        }
        if (std::chrono::steady_clock::now() >= endTime) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool ShellProcess::is_alive() const noexcept {
    if (!running_) return false;
    std::lock_guard<std::mutex> lk(pid_mutex_);
    if (child_pid_ <= 0) return false;
    int status = 0;
    pid_t result = waitpid(child_pid_, &status, WNOHANG);
    if (result != 0) running_ = false;
    return result == 0; // 0 means still running
}

bool ShellProcess::write(std::string_view data) {
    std::lock_guard<std::mutex> lk(stdin_mutex_);
    int fd = stdin_pipe_[1];
    if (fd == -1) return false;
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n > 0) { p += n; left -= static_cast<size_t>(n); continue; }
        if (n == -1 && (errno == EINTR)) continue; // retry on signal
        if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // Small pause for backpressure; avoids tight spinning when pipe is full.
            std::this_thread::sleep_for(std::chrono::microseconds(200));
            continue;
        }
        ASTREAM_DBG("IO", "write failed errno=%d", errno);
        return false; // fatal error (e.g., EPIPE if peer closed)
    }
    return true;
}

ReadResult ShellProcess::read(int timeoutMs) {
    ReadResult r;
    const int fd = stdout_pipe_[0];
    if (fd == -1) { r.status = ReadResult::Status::Eof; return r; }

    struct pollfd pfd { fd, POLLIN, 0 };
    int rc = ::poll(&pfd, 1, timeoutMs);
    if (rc == 0) return r; // Idle
    if (rc < 0) {
        if (errno != EINTR) r.status = ReadResult::Status::Eof;
        return r;
    }
    if (!(pfd.revents & (POLLIN | POLLHUP))) {
        r.status = ReadResult::Status::Eof;
        return r;
    }

    constexpr size_t BUF_SZ = 64 * 1024;
    r.data.resize(BUF_SZ);
    ssize_t n = ::read(fd, r.data.data(), r.data.size());
    if (n > 0) {
        r.data.resize(static_cast<size_t>(n));
        r.status = ReadResult::Status::Data;
    } else if (n == 0) {
        r.data.clear();
        r.status = ReadResult::Status::Eof;
    } else {
        r.data.clear();
        if (errno != EINTR && errno != EAGAIN) r.status = ReadResult::Status::Eof;
    }
    return r;
}

} // namespace core
} // namespace actionstream
