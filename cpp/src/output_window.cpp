#include "../include/output_window.hpp"
#include "../include/dev_debug.hpp"

#include <array>
#include <exception>

namespace actionstream {
namespace core {

namespace {

constexpr std::array<std::string_view, 3> kClearSequences{
    "\x1b[2J", "\x1b[3J", "\x1b" "c",
};

// Offset just past the last screen-clear sequence, or npos.
size_t last_clear_end(const std::string& s) {
    size_t best = std::string::npos;
    for (auto seq : kClearSequences) {
        size_t pos = s.rfind(seq);
        if (pos == std::string::npos) continue;
        size_t end = pos + seq.size();
        if (best == std::string::npos || end > best) best = end;
    }
    return best;
}

} // namespace

OutputWindow::OutputWindow(size_t maxBytes, size_t keepBytes)
    : maxBytes_(maxBytes)
    , keepBytes_(keepBytes < maxBytes ? keepBytes : maxBytes)
{
}

void OutputWindow::append(std::string_view text) {
    const size_t before = buf_.size() + text.size();
    buf_.append(text.data(), text.size());

    size_t cut = last_clear_end(buf_);
    if (cut != std::string::npos) {
        ASTREAM_DBG("SESSION", "screen clear: dropping %zu bytes", cut);
        buf_.erase(0, cut);
    }
    if (maxBytes_ > 0 && buf_.size() > maxBytes_) {
        ASTREAM_DBG("SESSION", "output window truncated to %zu bytes", keepBytes_);
        buf_.erase(0, buf_.size() - keepBytes_);
    }

    const bool reset = buf_.size() < before;
    if (reset) {
        checkpoint_ = 0;
        ++resets_;
    }

    std::string_view inc = std::string_view(buf_).substr(checkpoint_);
    checkpoint_ = buf_.size();
    if (!listener_ || (inc.empty() && !reset)) return;
    try {
        listener_(inc, reset);
    } catch (const std::exception& ex) {
        ASTREAM_DBG("SESSION", "output listener threw: %s", ex.what());
    }
}

void OutputWindow::clear() {
    buf_.clear();
    checkpoint_ = 0;
}

} // namespace core
} // namespace actionstream
