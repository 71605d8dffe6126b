#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "cmd_state.hpp"
#include "command_result.hpp"
#include "config.hpp"
#include "output_window.hpp"
#include "remote_channel.hpp"
#include "sentinel_decoder.hpp"

namespace actionstream {
namespace core {

enum class SessionState { Idle, Running, Aborted };

const char* to_string(SessionState s) noexcept;

/**
 * @brief Serializes shell commands on one remote channel.
 *
 * Every executeCommand() bumps the generation. A command that is still running
 * when the next one is issued has its abort callback invoked, the channel is
 * signalled, and its result is reported as Aborted; output tagged with an older
 * generation never reaches a later result.
 *
 * Manage instances through std::shared_ptr when executeAsync() is used.
 */
class ShellSession : public std::enable_shared_from_this<ShellSession> {
public:
    using AbortCallback = std::function<void()>;
    using ResultCallback = std::function<void(const CommandResult&)>;
    using OutputListener = OutputWindow::Listener;

    ShellSession(std::string sessionId, std::shared_ptr<RemoteChannel> channel, Config config = {});
    ~ShellSession();

    ShellSession(const ShellSession&) = delete;
    ShellSession& operator=(const ShellSession&) = delete;

    /// Spawns the channel process and waits for Config::readySentinel if set.
    bool start();
    void stop();
    bool isStarted() const noexcept { return handle_.load() != kInvalidChannel; }

    /// Runs a command and waits for its exit sentinel. Cancels a running command first.
    CommandResult executeCommand(const std::string& command, AbortCallback onAbort = {});

    std::future<CommandResult> executeAsync(std::string command,
                                            AbortCallback onAbort = {},
                                            ResultCallback callback = {});

    /// Waits until the exit sentinel or the sentinel `name` arrives.
    CommandResult waitForCompletion(const std::string& name);

    /// Cancels the running command; false when nothing is running.
    bool abort();

    SessionState state() const;
    std::uint64_t generation() const noexcept { return generation_.load(); }
    const std::string& id() const noexcept { return id_; }
    const Config& config() const noexcept { return config_; }

    /// Receives output increments of the command being waited on.
    void setOutputListener(OutputListener listener);

    /// Shell text that announces `generation`, runs `command` and reports its exit status.
    static std::string buildPacket(std::uint64_t generation, std::string_view command, const Config& config);

private:
    CommandResult wait_(CmdState& st);
    bool handleToken_(CmdState& st, SentinelToken& tok);
    CommandResult finish_(CmdState& st, CommandStatus status);
    static CommandStatus completionStatus_(const CmdState& st) noexcept;
    void invokeAbort_(AbortCallback& cb);

    std::string id_;
    std::shared_ptr<RemoteChannel> channel_;
    Config config_;
    std::atomic<ChannelHandle> handle_{kInvalidChannel};

    mutable std::mutex stateMx_;           ///< Guards state_ and abortCb_
    SessionState state_{SessionState::Idle};
    AbortCallback abortCb_{};
    std::atomic<std::uint64_t> generation_{0};

    std::mutex readMx_;                     ///< One reader of the channel at a time
    SentinelDecoder decoder_;
    std::deque<SentinelToken> pending_{};   ///< Tokens decoded past the end of the last wait
    OutputWindow window_;
    std::mutex listenerMx_;                 ///< Guards the listener_ pointer, not calls through it
    std::shared_ptr<const OutputListener> listener_{};
};

} // namespace core
} // namespace actionstream
