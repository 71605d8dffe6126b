#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace actionstream {
namespace core {

/// Exit code reported when no exit sentinel was observed.
inline constexpr int kExitCodeUnknown = std::numeric_limits<int>::min();

enum class CommandStatus {
    Completed,   ///< Exit sentinel observed
    Checkpoint,  ///< Caller-requested sentinel observed
    Aborted,     ///< Superseded or cancelled; output discarded
    TimedOut,    ///< Config::timeoutSeconds elapsed
    StreamEnded, ///< Channel reached end-of-stream first
    NotRunning,  ///< Session not started
    WriteFailed, ///< Command could not be written to the channel
};

const char* to_string(CommandStatus s) noexcept;

/**
 * @brief Result of one shell command or wait.
 */
struct CommandResult {
    std::string   output{};                      ///< Displayable output (sentinels removed)
    int           exitCode{kExitCodeUnknown};    ///< Exit code, kExitCodeUnknown if never reported
    CommandStatus status{CommandStatus::StreamEnded};
    std::uint64_t generation{};                  ///< Generation the command ran under
    std::string   sentinel{};                    ///< Name of the sentinel that ended the wait
    double        executionTime{};               ///< Seconds
    bool          partialTail{false};            ///< Trailing output was an unfinished escape sequence (low confidence)

    bool success() const noexcept { return status == CommandStatus::Completed && exitCode == 0; }
};

} // namespace core
} // namespace actionstream
