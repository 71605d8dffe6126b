#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include "remote_channel.hpp"

namespace actionstream {
namespace core {

struct ProcessConfig {
    std::string shell_path{"/bin/sh"};
    std::string working_directory{};
    std::map<std::string, std::string> environment{};
    std::vector<std::string> additional_arguments{};
};

/**
 * @brief A local shell reading commands from stdin, stdout and stderr merged.
 *
 * The child runs in its own process group so the whole job tree can be signalled.
 */
class ShellProcess final {
public:
    explicit ShellProcess(ProcessConfig config);
    ~ShellProcess();

    ShellProcess(const ShellProcess&) = delete;
    ShellProcess& operator=(const ShellProcess&) = delete;
    ShellProcess(ShellProcess&&) = delete;
    ShellProcess& operator=(ShellProcess&&) = delete;

    bool start();
    /// Closes stdin, waits up to graceMs, then SIGTERM / SIGKILL the process group.
    void terminate(int graceMs = 500);
    /// SIGTERM, short wait, SIGKILL of the process group; stdout stays readable until EOF.
    void kill_group();
    bool is_alive() const noexcept;

    bool write(std::string_view data);
    ReadResult read(int timeoutMs);

    pid_t native_pid() const noexcept { return child_pid_; }

private:
    bool create_pipes_();
    bool spawn_child_();
    void close_pipes_() noexcept;
    bool wait_exit_(int timeoutMs);
    void signal_group_(int sig) noexcept;

    ProcessConfig config_;
    mutable std::atomic<bool> running_{false};

    int stdin_pipe_[2]{-1, -1};
    int stdout_pipe_[2]{-1, -1};
    pid_t child_pid_{-1};

    mutable std::mutex pid_mutex_;   ///< Guards waitpid/reaping
    std::mutex stdin_mutex_;
};

} // namespace core
} // namespace actionstream
