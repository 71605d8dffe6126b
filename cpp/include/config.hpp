#pragma once

#include <map>
#include <string>
#include <vector>

namespace actionstream {
namespace core {

/**
 * @brief Settings for one shell session and the channel it runs on.
 */
struct Config {
    std::string shellPath{"/bin/sh"};                 ///< Shell executable spawned by the local channel
    std::vector<std::string> shellArgs{};             ///< Extra arguments for the shell
    std::string workingDirectory{""};                 ///< Working directory (empty = current directory)
    std::map<std::string, std::string> environment;   ///< Extra environment variables

    int         sentinelOpcode{654};                  ///< OSC opcode that carries sentinels
    std::string exitSentinel{"exit"};                 ///< Sentinel name carrying the exit code
    std::string beginSentinel{"begin"};               ///< Sentinel name announcing a command generation
    std::string readySentinel{""};                    ///< Awaited by start() when non-empty (e.g. "interactive")

    double timeoutSeconds{0.0};                       ///< Per-command timeout (0 = wait forever)
    int    pollIntervalMs{50};                        ///< Max time one channel read may block
    std::string idleNudge{""};                        ///< Written once per wait after idleNudgeMs of silence
    int    idleNudgeMs{3000};                         ///< Silence before the idle nudge is sent

    size_t maxOutputBytes{20000};                     ///< Output window size that triggers truncation
    size_t truncatedOutputBytes{10000};               ///< Bytes kept after truncation

    bool sanitizeOutput{false};                       ///< Run sanitize() on CommandResult::output
};

} // namespace core
} // namespace actionstream
