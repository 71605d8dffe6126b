#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "config.hpp"
#include "remote_channel.hpp"
#include "shell_process.hpp"

namespace actionstream {
namespace core {

/**
 * @brief RemoteChannel backed by local shell processes.
 *
 * signalAbort() kills the process group of the running shell and replaces it with
 * a fresh one under the same handle. A read() already blocked on the old process
 * sees end-of-stream.
 */
class PosixShellChannel final : public RemoteChannel {
public:
    explicit PosixShellChannel(ProcessConfig config = {});
    explicit PosixShellChannel(const Config& config);
    ~PosixShellChannel() override;

    PosixShellChannel(const PosixShellChannel&) = delete;
    PosixShellChannel& operator=(const PosixShellChannel&) = delete;

    ChannelHandle spawn(const std::string& sessionId) override;
    bool write(ChannelHandle h, std::string_view bytes) override;
    ReadResult read(ChannelHandle h, int timeoutMs) override;
    void signalAbort(ChannelHandle h) override;
    void shutdown(ChannelHandle h) override;

    size_t processCount() const;
    pid_t pidOf(ChannelHandle h) const; ///< -1 for unknown handles
    size_t respawnCount() const noexcept { return respawns_; }

private:
    std::shared_ptr<ShellProcess> get_(ChannelHandle h) const;

    ProcessConfig config_;
    mutable std::mutex mx_;
    std::unordered_map<ChannelHandle, std::shared_ptr<ShellProcess>> procs_{};
    ChannelHandle next_{1};
    std::atomic<size_t> respawns_{0};
};

} // namespace core
} // namespace actionstream
