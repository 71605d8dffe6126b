#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace actionstream {
namespace core {

using ChannelHandle = std::uint64_t;
inline constexpr ChannelHandle kInvalidChannel = 0;

/**
 * @brief One read from a remote channel.
 */
struct ReadResult {
    enum class Status {
        Data, ///< `data` holds the next chunk
        Idle, ///< Nothing arrived within the timeout
        Eof,  ///< The stream has ended
    };
    Status status{Status::Idle};
    std::string data{};
};

/**
 * @brief Remote process channel used by ShellSession.
 *
 * Implementations must allow signalAbort() to be called from another thread
 * while a read() is in progress.
 */
class RemoteChannel {
public:
    virtual ~RemoteChannel() = default;

    /// Starts a process for the session; returns kInvalidChannel on failure.
    virtual ChannelHandle spawn(const std::string& sessionId) = 0;

    virtual bool write(ChannelHandle h, std::string_view bytes) = 0;

    /// Waits up to timeoutMs (negative = forever) for the next chunk.
    virtual ReadResult read(ChannelHandle h, int timeoutMs) = 0;

    /// Asks the remote side to stop the running command. No acknowledgement.
    virtual void signalAbort(ChannelHandle h) = 0;

    virtual void shutdown(ChannelHandle h) = 0;
};

} // namespace core
} // namespace actionstream
