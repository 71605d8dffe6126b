#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace actionstream {
namespace core {

inline constexpr std::string_view kCDataOpen  = "<![CDATA[";
inline constexpr std::string_view kCDataClose = "]]>";

/// Decodes the small entity set used in action markup:
/// &lt; &gt; &amp; &quot; &apos; &#39; &#x27; &#x3D;. Unknown entities stay verbatim.
std::string decode_entities(std::string_view s);

/// If `s` (ignoring surrounding whitespace) is exactly one CDATA section, returns its
/// content with one leading and one trailing newline removed.
std::optional<std::string> extract_cdata(std::string_view s);

/// If `s` is a single fenced code block ("```lang\n...\n```"), returns the inner text.
std::optional<std::string> unwrap_code_fence(std::string_view s);

/// Decodes a whole body in one go (CDATA markers stripped, entities outside CDATA decoded).
std::string decode_body(std::string_view raw);

/**
 * @brief Incremental decoder for streamed action bodies.
 *
 * Produces the same text as decode_body() over the concatenation of all pushed
 * pieces, no matter how the input is split. Bytes that may still become an entity
 * or a CDATA marker are held back until they can be classified.
 */
class BodyDecoder {
public:
    std::string push(std::string_view piece);
    std::string finish();
    void reset();

    bool inCData() const noexcept { return inCData_; }
    size_t heldBytes() const noexcept { return pending_.size(); }

private:
    std::string drain_(bool final);

    std::string pending_;
    bool inCData_{false};
};

} // namespace core
} // namespace actionstream
