#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace actionstream {
namespace core {

/**
 * @brief Bounded buffer of displayable command output with a delivery checkpoint.
 *
 * The checkpoint marks how much of the buffer has been handed to the listener.
 * A screen clear drops everything up to the clear sequence; exceeding maxBytes
 * keeps only the newest keepBytes. Either way the buffer shrinks behind the
 * checkpoint, so the checkpoint restarts at zero and the listener is told to reset.
 */
class OutputWindow {
public:
    /// (increment, reset): on reset the increment is the whole current window.
    using Listener = std::function<void(std::string_view, bool)>;

    OutputWindow(size_t maxBytes = 20000, size_t keepBytes = 10000);

    void append(std::string_view text);
    void clear();

    const std::string& text() const noexcept { return buf_; }
    size_t checkpoint() const noexcept { return checkpoint_; }
    size_t resets() const noexcept { return resets_; }

    void setListener(Listener l) { listener_ = std::move(l); }

private:
    size_t maxBytes_;
    size_t keepBytes_;
    std::string buf_{};
    size_t checkpoint_{0};
    size_t resets_{0};
    Listener listener_{};
};

} // namespace core
} // namespace actionstream
