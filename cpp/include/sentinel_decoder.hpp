#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace actionstream {
namespace core {

inline constexpr int kDefaultSentinelOpcode = 654;

/**
 * @brief One decoded piece of a shell output stream.
 */
struct SentinelToken {
    enum class Kind {
        Text,     ///< Displayable text (other escape sequences included)
        Sentinel, ///< ESC ] <opcode> ; name [=value] BEL
        Partial,  ///< Unfinished escape sequence at end-of-stream (low confidence)
    };

    Kind kind{Kind::Text};
    std::string text{};                 ///< Text / Partial bytes
    std::string name{};                 ///< Sentinel name
    std::optional<std::string> value{}; ///< Sentinel value after '='
};

const char* to_string(SentinelToken::Kind k) noexcept;

/**
 * @brief Splits a raw output stream into text runs and sentinels.
 *
 * Partial sequences are buffered across feed() calls. Only OSC sequences that
 * carry the configured opcode and end in BEL are sentinels; everything else,
 * including other escape sequences, is passed through as text.
 */
class SentinelDecoder {
public:
    static constexpr size_t kMaxSequenceLength = 256;

    explicit SentinelDecoder(int opcode = kDefaultSentinelOpcode);

    std::vector<SentinelToken> feed(std::string_view chunk);
    std::vector<SentinelToken> finalize();
    void reset();

    bool hasPartial() const noexcept { return !held_.empty(); }
    int opcode() const noexcept { return opcode_; }

private:
    enum class State : std::uint8_t { Text, Esc, Osc };

    bool consume_(char c, std::vector<SentinelToken>& out);
    void completeOsc_(std::vector<SentinelToken>& out);
    void flushText_(std::vector<SentinelToken>& out);

    int opcode_;
    std::string prefix_;   ///< "ESC ] <opcode> ;"
    State state_{State::Text};
    std::string held_{};   ///< Bytes of the sequence being recognised
    std::string text_{};
};

/// Builds "ESC ] <opcode> ; name [=value] BEL". Throws std::invalid_argument when
/// `name` is empty or contains '=', BEL or ESC, or `value` contains BEL or ESC.
std::string encode_sentinel(std::string_view name,
                            std::optional<std::string_view> value = std::nullopt,
                            int opcode = kDefaultSentinelOpcode);

/// Exit code carried by an exit sentinel value ("0", "-1", "<pid>:<code>").
/// The last colon separated field is used.
std::optional<int> exit_code_from(std::string_view value);

} // namespace core
} // namespace actionstream
