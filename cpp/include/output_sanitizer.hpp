#pragma once

#include <string>
#include <string_view>

namespace actionstream {
namespace core {

/**
 * @brief Normalizes shell output for display.
 *
 * Steps, in order:
 *  1. strip escape sequences (CSI, OSC, two/three byte ESC sequences)
 *  2. CRLF and lone CR become LF
 *  3. drop remaining control characters except LF and TAB
 *  4. break the line before "error:", "failed:", "warning:" (and capitalized forms)
 *     and stack frames ("at ... file:line:col") when they follow whitespace in the
 *     middle of a line, and before "npm ERR!"; text glued to a path is left alone
 *  5. trim every line
 *  6. collapse 3+ newlines to 2
 *  7. trim the whole text
 *
 * sanitize(sanitize(x)) == sanitize(x) for every x.
 */
std::string sanitize(std::string_view text);

/// Step 1 only.
std::string strip_escape_sequences(std::string_view text);

} // namespace core
} // namespace actionstream
