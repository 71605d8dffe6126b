#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

// Environment switches, read once on first use:
//   ACTIONSTREAM_DEBUG=1                 enable
//   ACTIONSTREAM_DEBUG_PATH=/tmp/as.log  log file (default actionstream_debug.log)
//   ACTIONSTREAM_DEBUG_EXCLUDE=IO,SCAN   tags to drop

namespace actionstream {
namespace dev {

inline constexpr size_t kMaxExcludedTags = 16;
inline constexpr const char* kDefaultLogPath = "actionstream_debug.log";

/**
 * @brief Process-wide debug file logger.
 *
 * Disabled by default; a disabled call site costs one relaxed atomic load.
 * The file is opened on the first message and appended to.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    /// Turns logging on or off. A non-empty `path` switches to that file.
    void enable(bool on, std::string path = {}) {
        std::lock_guard<std::mutex> lk(mx_);
        if (!on) {
            enabled_.store(false, std::memory_order_relaxed);
            closeFile_();
            return;
        }
        if (!path.empty() && path != path_) {
            closeFile_();
            path_ = std::move(path);
        }
        enabled_.store(true, std::memory_order_relaxed);
    }

    bool enabled() const { return enabled_.load(std::memory_order_relaxed); }
    const std::string& path() const { return path_; }

    /// Replaces the excluded tags with a comma separated list ("IO,SCAN").
    void exclude(const char* csv) {
        std::lock_guard<std::mutex> lk(mx_);
        parseExcluded_(csv);
    }

    void logf(const char* tag, const char* fmt, ...) {
        if (!enabled()) return;

        char msg[2048];
        va_list ap;
        va_start(ap, fmt);
        std::vsnprintf(msg, sizeof(msg), fmt, ap);
        va_end(ap);

        char ts[40];
        timestamp_(ts, sizeof(ts));
        const auto tid = static_cast<unsigned long long>(std::hash<std::thread::id>{}(std::this_thread::get_id()));

        std::lock_guard<std::mutex> lk(mx_);
        if (isExcluded_(tag) || !openFile_()) return;
        std::fprintf(fh_, "[%s] [%s] [tid=%llu] %s\n", ts, tag ? tag : "-", tid, msg);
        std::fflush(fh_);
    }

private:
    Logger() : path_(kDefaultLogPath) {
        const char* on   = std::getenv("ACTIONSTREAM_DEBUG");
        const char* path = std::getenv("ACTIONSTREAM_DEBUG_PATH");
        const char* excl = std::getenv("ACTIONSTREAM_DEBUG_EXCLUDE");
        if (path && *path) path_ = path;
        parseExcluded_(excl);

        if (on && *on == '1') {
            enabled_.store(true);
            logf("LOGGER", "debug logging enabled from environment, path=%s exclude=%s",
                 path_.c_str(), excl ? excl : "(none)");
        }
    }
    ~Logger() { closeFile_(); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // UTC, microsecond resolution.
    static void timestamp_(char* out, size_t n) {
        const auto now = std::chrono::system_clock::now();
        const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(now);
        const auto us = std::chrono::duration_cast<std::chrono::microseconds>(now - secs).count();
        const std::time_t t = std::chrono::system_clock::to_time_t(secs);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::snprintf(out, n, "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(us));
    }

    void parseExcluded_(const char* csv) {
        excludedCount_ = 0;
        if (!csv) return;
        std::string_view rest(csv);
        while (!rest.empty() && excludedCount_ < kMaxExcludedTags) {
            const size_t comma = rest.find(',');
            std::string_view tag = rest.substr(0, comma);
            if (!tag.empty()) excluded_[excludedCount_++] = std::string(tag);
            if (comma == std::string_view::npos) break;
            rest.remove_prefix(comma + 1);
        }
    }

    bool isExcluded_(const char* tag) const {
        if (!tag) return false;
        for (size_t i = 0; i < excludedCount_; ++i) {
            if (excluded_[i] == tag) return true;
        }
        return false;
    }

    bool openFile_() {
        if (fh_) return true;
        fh_ = std::fopen(path_.c_str(), "ab");
        if (!fh_) return false;
        std::fprintf(fh_, "----- actionstream debug start -----\n");
        return true;
    }

    void closeFile_() {
        if (!fh_) return;
        std::fprintf(fh_, "----- actionstream debug stop ------\n");
        std::fclose(fh_);
        fh_ = nullptr;
    }

    std::atomic<bool> enabled_{false};
    std::mutex mx_;
    std::string path_;
    std::FILE* fh_{nullptr};
    std::array<std::string, kMaxExcludedTags> excluded_{};
    size_t excludedCount_{0};
};

}} // namespace actionstream::dev

// Keeps call sites short; arguments are not evaluated while logging is off.
#define ASTREAM_DBG(TAG, FMT, ...) \
    do { if (actionstream::dev::Logger::instance().enabled()) \
        actionstream::dev::Logger::instance().logf(TAG, FMT, ##__VA_ARGS__); } while (0)
