#pragma once

#include <string>
#include <string_view>

namespace actionstream {
namespace core {

/**
 * @brief Append-only input accumulator for one parsing session.
 *
 * `cursor()` is the absolute offset of the last processed byte; processed bytes are
 * compacted away, offsets stay absolute. The held fragment keeps a partially matched
 * marker until the scanner can resolve it.
 */
class StreamBuffer {
public:
    void append(std::string_view chunk) { data_.append(chunk.data(), chunk.size()); }

    std::string_view unprocessed() const noexcept {
        return std::string_view(data_).substr(cursor_ - base_);
    }

    void advance(size_t n) noexcept { cursor_ += n; }

    // Drops processed bytes; absolute offsets are preserved through base_.
    void compact() {
        data_.erase(0, cursor_ - base_);
        base_ = cursor_;
    }

    size_t cursor() const noexcept { return cursor_; }           ///< Absolute processed offset
    size_t size() const noexcept { return base_ + data_.size(); } ///< Absolute bytes received

    void hold(char c) { held_.push_back(c); }
    const std::string& held() const noexcept { return held_; }
    std::string releaseHeld() {
        std::string out;
        out.swap(held_);
        return out;
    }

    void clear() {
        data_.clear();
        held_.clear();
        base_ = cursor_ = 0;
    }

private:
    std::string data_{};  ///< Received but not yet compacted bytes
    std::string held_{};  ///< Partially matched opening marker
    size_t base_{0};      ///< Absolute offset of data_[0]
    size_t cursor_{0};
};

} // namespace core
} // namespace actionstream
