#include "../include/shell_session.hpp"
#include "../include/dev_debug.hpp"
#include "../include/helpers.h"
#include "../include/output_sanitizer.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

using namespace _ActionStreamHelpers;

namespace actionstream {
namespace core {

namespace {

using Clock = std::chrono::steady_clock;

// Escapes control bytes so the text can be used as a printf format.
std::string printf_escape(std::string_view s) {
    std::string f;
    f.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '\x1b': f += "\\033"; break;
            case '\x07': f += "\\007"; break;
            case '%':    f += "%%";    break;
            case '\\':   f += "\\\\";  break;
            default:     f.push_back(c);
        }
    }
    return f;
}

} // namespace

const char* to_string(SessionState s) noexcept {
    switch (s) {
        case SessionState::Idle:    return "idle";
        case SessionState::Running: return "running";
        case SessionState::Aborted: return "aborted";
    }
    return "unknown";
}

const char* to_string(CommandStatus s) noexcept {
    switch (s) {
        case CommandStatus::Completed:   return "completed";
        case CommandStatus::Checkpoint:  return "checkpoint";
        case CommandStatus::Aborted:     return "aborted";
        case CommandStatus::TimedOut:    return "timed_out";
        case CommandStatus::StreamEnded: return "stream_ended";
        case CommandStatus::NotRunning:  return "not_running";
        case CommandStatus::WriteFailed: return "write_failed";
    }
    return "unknown";
}

ShellSession::ShellSession(std::string sessionId, std::shared_ptr<RemoteChannel> channel, Config config)
    : id_(std::move(sessionId))
    , channel_(std::move(channel))
    , config_(std::move(config))
    , decoder_(config_.sentinelOpcode)
    , window_(config_.maxOutputBytes, config_.truncatedOutputBytes)
{
    if (!channel_) throw std::invalid_argument("ShellSession: channel must not be null");
    // Reject sentinel names the packet could not carry.
    (void)encode_sentinel(config_.exitSentinel, std::nullopt, config_.sentinelOpcode);
    (void)encode_sentinel(config_.beginSentinel, std::nullopt, config_.sentinelOpcode);

    window_.setListener([this](std::string_view inc, bool reset) {
        std::shared_ptr<const OutputListener> listener;
        {
            std::lock_guard<std::mutex> lk(listenerMx_);
            listener = listener_;
        }
        // Called unlocked so the listener may replace itself.
        if (listener && *listener) (*listener)(inc, reset);
    });
}

ShellSession::~ShellSession() {
    stop();
}

bool ShellSession::start() {
    if (isStarted()) return true;

    const ChannelHandle h = channel_->spawn(id_);
    if (h == kInvalidChannel) {
        ASTREAM_DBG("SESSION", "[%s] spawn failed", id_.c_str());
        return false;
    }
    handle_.store(h);
    ASTREAM_DBG("SESSION", "[%s] started handle=%llu", id_.c_str(), static_cast<unsigned long long>(h));

    if (config_.readySentinel.empty()) return true;

    std::lock_guard<std::mutex> rl(readMx_);
    CmdState st;
    st.generation = generation_.load();
    st.begun = true;
    st.untilName = config_.readySentinel;
    CommandResult r = wait_(st);
    if (r.status != CommandStatus::Checkpoint) {
        ASTREAM_DBG("SESSION", "[%s] not ready: %s", id_.c_str(), to_string(r.status));
        channel_->shutdown(handle_.exchange(kInvalidChannel));
        return false;
    }
    return true;
}

void ShellSession::stop() {
    (void)abort();
    const ChannelHandle h = handle_.exchange(kInvalidChannel);
    if (h == kInvalidChannel) return;
    ASTREAM_DBG("SESSION", "[%s] stopping handle=%llu", id_.c_str(), static_cast<unsigned long long>(h));
    channel_->shutdown(h);
}

CommandResult ShellSession::executeCommand(const std::string& command, AbortCallback onAbort) {
    const ChannelHandle h = handle_.load();
    if (h == kInvalidChannel) {
        CommandResult r;
        r.status = CommandStatus::NotRunning;
        return r;
    }

    std::uint64_t gen = 0;
    bool wasRunning = false;
    AbortCallback previous;
    {
        std::lock_guard<std::mutex> lk(stateMx_);
        gen = ++generation_;
        wasRunning = state_ == SessionState::Running;
        previous = std::exchange(abortCb_, std::move(onAbort));
        state_ = SessionState::Running;
    }

    if (wasRunning) {
        // Cancel-and-replace: the previous command is told first, then the channel.
        ASTREAM_DBG("SESSION", "[%s] generation %llu supersedes a running command",
                    id_.c_str(), static_cast<unsigned long long>(gen));
        invokeAbort_(previous);
        channel_->signalAbort(h);
    }

    std::lock_guard<std::mutex> rl(readMx_);
    CmdState st;
    st.generation = gen;
    st.beginValue = std::to_string(gen);
    st.begun = false;

    if (generation_.load() != gen) return finish_(st, CommandStatus::Aborted);
    if (wasRunning) {
        decoder_.reset();
        pending_.clear();
    }

    ASTREAM_DBG("SESSION", "[%s] execute gen=%llu cmd=%s", id_.c_str(),
                static_cast<unsigned long long>(gen), command.c_str());
    if (!channel_->write(h, buildPacket(gen, command, config_))) {
        ASTREAM_DBG("SESSION", "[%s] write failed gen=%llu", id_.c_str(), static_cast<unsigned long long>(gen));
        return finish_(st, CommandStatus::WriteFailed);
    }
    return wait_(st);
}

std::future<CommandResult>
ShellSession::executeAsync(std::string command, AbortCallback onAbort, ResultCallback callback)
{
    auto prom = std::make_shared<std::promise<CommandResult>>();
    auto fut  = prom->get_future();

    // Keep 'this' alive while the detached thread runs
    auto self = shared_from_this();

    std::thread([self,
                 cmd = std::move(command),
                 onAbort = std::move(onAbort),
                 callback = std::move(callback),
                 p = std::move(prom)]() mutable
    {
        CommandResult r = self->executeCommand(cmd, std::move(onAbort));
        if (callback) {
            try {
                callback(r);
            } catch (const std::exception& ex) {
                ASTREAM_DBG("SESSION", "[%s] result callback threw: %s", self->id_.c_str(), ex.what());
            }
        }
        p->set_value(std::move(r));
    }).detach(); // Lifetime is tied to 'self' and 'p' shared_ptrs.

    return fut;
}

CommandResult ShellSession::waitForCompletion(const std::string& name) {
    if (!isStarted()) {
        CommandResult r;
        r.status = CommandStatus::NotRunning;
        return r;
    }
    std::lock_guard<std::mutex> rl(readMx_);
    CmdState st;
    st.generation = generation_.load();
    st.begun = true;
    st.untilName = name;
    return wait_(st);
}

bool ShellSession::abort() {
    AbortCallback cb;
    {
        std::lock_guard<std::mutex> lk(stateMx_);
        if (state_ != SessionState::Running) return false;
        ++generation_;
        cb = std::exchange(abortCb_, {});
        state_ = SessionState::Aborted;
    }
    ASTREAM_DBG("SESSION", "[%s] abort", id_.c_str());
    invokeAbort_(cb);
    const ChannelHandle h = handle_.load();
    if (h != kInvalidChannel) channel_->signalAbort(h);
    return true;
}

SessionState ShellSession::state() const {
    std::lock_guard<std::mutex> lk(stateMx_);
    return state_;
}

void ShellSession::setOutputListener(OutputListener listener) {
    std::shared_ptr<const OutputListener> next;
    if (listener) next = std::make_shared<const OutputListener>(std::move(listener));
    {
        std::lock_guard<std::mutex> lk(listenerMx_);
        listener_.swap(next);
    }
    // The previous listener is released here, outside the lock.
}

std::string ShellSession::buildPacket(std::uint64_t generation, std::string_view command, const Config& config) {
    const std::string begin = encode_sentinel(config.beginSentinel, std::to_string(generation), config.sentinelOpcode);
    const std::string exitFmt = "\\033]" + std::to_string(config.sentinelOpcode) + ";" +
                                printf_escape(config.exitSentinel) + "=%s\\007";

    std::string full;
    full.reserve(command.size() + begin.size() + exitFmt.size() + 48);

    // 1) begin sentinel for this generation
    full += "printf " + sh_quote(printf_escape(begin)) + "\n";

    // 2) COMMAND (may contain multiple lines; must end with newline)
    full.append(command);
    if (full.empty() || full.back() != '\n') full.push_back('\n');

    // 3) exit sentinel carrying the command's status
    full += "printf " + sh_quote(exitFmt) + " \"$?\"\n";
    return full;
}

CommandResult ShellSession::wait_(CmdState& st) {
    const auto now = Clock::now();
    st.tStart = now;
    st.tLastData = now;
    if (config_.timeoutSeconds > 0.0) {
        st.tDeadline = now + std::chrono::duration_cast<Clock::duration>(
                                 std::chrono::duration<double>(config_.timeoutSeconds));
    }
    window_.clear();

    // Tokens decoded after the end of the previous wait come first.
    while (!pending_.empty()) {
        SentinelToken tok = std::move(pending_.front());
        pending_.pop_front();
        if (handleToken_(st, tok)) {
            return finish_(st, completionStatus_(st));
        }
    }

    while (true) {
        if (generation_.load() != st.generation) return finish_(st, CommandStatus::Aborted);

        const ChannelHandle h = handle_.load();
        const auto t = Clock::now();
        int waitMs = config_.pollIntervalMs;
        if (st.tDeadline) {
            if (t >= *st.tDeadline) {
                ASTREAM_DBG("SESSION", "[%s] gen=%llu timed out", id_.c_str(),
                            static_cast<unsigned long long>(st.generation));
                if (h != kInvalidChannel) channel_->signalAbort(h);
                decoder_.reset();
                return finish_(st, CommandStatus::TimedOut);
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*st.tDeadline - t).count();
            waitMs = static_cast<int>(std::min<long long>(waitMs, std::max<long long>(left, 1)));
        }

        ReadResult rr = channel_->read(h, waitMs);

        // Anything read under a superseded generation is dropped.
        if (generation_.load() != st.generation) return finish_(st, CommandStatus::Aborted);

        if (rr.status == ReadResult::Status::Idle) {
            if (!st.nudged && !config_.idleNudge.empty() &&
                Clock::now() - st.tLastData >= std::chrono::milliseconds(config_.idleNudgeMs)) {
                st.nudged = true;
                ASTREAM_DBG("SESSION", "[%s] idle, writing nudge", id_.c_str());
                if (!channel_->write(h, config_.idleNudge)) {
                    ASTREAM_DBG("SESSION", "[%s] nudge write failed", id_.c_str());
                }
            }
            continue;
        }

        if (rr.status == ReadResult::Status::Eof) {
            ASTREAM_DBG("SESSION", "[%s] end of stream gen=%llu", id_.c_str(),
                        static_cast<unsigned long long>(st.generation));
            for (auto& tok : decoder_.finalize()) (void)handleToken_(st, tok);
            return finish_(st, CommandStatus::StreamEnded);
        }

        ASTREAM_DBG("IO", "[%s] read %zu bytes", id_.c_str(), rr.data.size());
        st.tLastData = Clock::now();
        std::vector<SentinelToken> toks = decoder_.feed(rr.data);
        for (size_t i = 0; i < toks.size(); ++i) {
            if (!handleToken_(st, toks[i])) continue;
            for (size_t j = i + 1; j < toks.size(); ++j) pending_.push_back(std::move(toks[j]));
            return finish_(st, completionStatus_(st));
        }
    }
}

bool ShellSession::handleToken_(CmdState& st, SentinelToken& tok) {
    if (tok.kind != SentinelToken::Kind::Sentinel) {
        if (!st.begun) return false;
        // Unfinished escape bytes are kept but make the tail low confidence.
        if (tok.kind == SentinelToken::Kind::Partial) st.partialTail = true;
        window_.append(tok.text);
        return false;
    }

    if (!st.begun) {
        if (tok.name == config_.beginSentinel && tok.value && *tok.value == st.beginValue) {
            st.begun = true;
        } else {
            ASTREAM_DBG("SESSION", "[%s] discarding sentinel %s before begin=%s",
                        id_.c_str(), tok.name.c_str(), st.beginValue.c_str());
        }
        return false;
    }

    if (tok.name == config_.exitSentinel) {
        if (tok.value) st.exitCode = exit_code_from(*tok.value);
        st.endedBy = tok.name;
        st.exited = true;
        return true;
    }
    if (!st.untilName.empty() && tok.name == st.untilName) {
        st.endedBy = tok.name;
        return true;
    }
    return false;
}

CommandResult ShellSession::finish_(CmdState& st, CommandStatus status) {
    CommandResult r;
    r.status = status;
    r.generation = st.generation;
    r.sentinel = st.endedBy;
    r.exitCode = st.exitCode.value_or(kExitCodeUnknown);
    r.executionTime = std::chrono::duration<double>(Clock::now() - st.tStart).count();
    r.partialTail = st.partialTail;
    if (status != CommandStatus::Aborted) {
        r.output = config_.sanitizeOutput ? sanitize(window_.text()) : window_.text();
    }
    window_.clear();

    // Only the command that still owns the current generation moves the session back to Idle.
    if (!st.beginValue.empty()) {
        std::lock_guard<std::mutex> lk(stateMx_);
        if (generation_.load() == st.generation && state_ == SessionState::Running) {
            state_ = SessionState::Idle;
            abortCb_ = {};
        }
    }

    ASTREAM_DBG("SESSION", "[%s] gen=%llu %s exit=%d bytes=%zu", id_.c_str(),
                static_cast<unsigned long long>(st.generation), to_string(status), r.exitCode, r.output.size());
    return r;
}

CommandStatus ShellSession::completionStatus_(const CmdState& st) noexcept {
    return st.exited ? CommandStatus::Completed : CommandStatus::Checkpoint;
}

void ShellSession::invokeAbort_(AbortCallback& cb) {
    if (!cb) return;
    try {
        cb();
    } catch (const std::exception& ex) {
        ASTREAM_DBG("SESSION", "[%s] abort callback threw: %s", id_.c_str(), ex.what());
    }
}

} // namespace core
} // namespace actionstream
