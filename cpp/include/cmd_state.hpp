#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace actionstream {
namespace core {

    /**
     * @brief Book-keeping for one wait on the shell output stream.
     */
    struct CmdState {
        std::uint64_t                         generation{};  ///< Generation the wait belongs to
        std::string                           beginValue{};  ///< Expected value of the begin sentinel
        bool                                  begun{false};  ///< True once the begin sentinel has been seen
        std::string                           untilName{};   ///< Extra sentinel name that ends the wait
        std::optional<int>                    exitCode{};    ///< Parsed exit code, if reported
        std::string                           endedBy{};     ///< Sentinel name that ended the wait
        bool                                  exited{false}; ///< Ended by the exit sentinel
        bool                                  partialTail{false}; ///< Output ends with an unfinished escape sequence
        bool                                  nudged{false}; ///< Idle nudge already written
        std::chrono::steady_clock::time_point tStart{};      ///< Start timestamp
        std::chrono::steady_clock::time_point tLastData{};   ///< Last time data arrived
        std::optional<std::chrono::steady_clock::time_point> tDeadline{}; ///< Absolute deadline for timeout
    };

}} // namespace actionstream::core
