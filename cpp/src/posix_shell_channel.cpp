#include "../include/posix_shell_channel.hpp"
#include "../include/dev_debug.hpp"

#include <csignal>

namespace actionstream {
namespace core {

namespace {

ProcessConfig process_config_from(const Config& c) {
    ProcessConfig p;
    p.shell_path = c.shellPath;
    p.working_directory = c.workingDirectory;
    p.environment = c.environment;
    p.additional_arguments = c.shellArgs;
    return p;
}

void ignore_sigpipe_once() {
    // Writes to a shell that just died must fail with EPIPE instead of killing us.
    static std::once_flag once;
    std::call_once(once, []{ std::signal(SIGPIPE, SIG_IGN); });
}

} // namespace

PosixShellChannel::PosixShellChannel(ProcessConfig config)
    : config_(std::move(config))
{
    ignore_sigpipe_once();
}

PosixShellChannel::PosixShellChannel(const Config& config)
    : PosixShellChannel(process_config_from(config))
{
}

PosixShellChannel::~PosixShellChannel() {
    std::unordered_map<ChannelHandle, std::shared_ptr<ShellProcess>> procs;
    {
        std::lock_guard<std::mutex> lk(mx_);
        procs.swap(procs_);
    }
    for (auto& [h, p] : procs) p->terminate(/*graceMs=*/100);
}

ChannelHandle PosixShellChannel::spawn(const std::string& sessionId) {
    auto proc = std::make_shared<ShellProcess>(config_);
    if (!proc->start()) {
        ASTREAM_DBG("CHANNEL", "spawn failed for session %s", sessionId.c_str());
        return kInvalidChannel;
    }

    std::lock_guard<std::mutex> lk(mx_);
    const ChannelHandle h = next_++;
    procs_.emplace(h, std::move(proc));
    ASTREAM_DBG("CHANNEL", "spawned handle=%llu for session %s",
                static_cast<unsigned long long>(h), sessionId.c_str());
    return h;
}

bool PosixShellChannel::write(ChannelHandle h, std::string_view bytes) {
    auto proc = get_(h);
    if (!proc) return false;
    ASTREAM_DBG("IO", "write handle=%llu bytes=%zu", static_cast<unsigned long long>(h), bytes.size());
    return proc->write(bytes);
}

ReadResult PosixShellChannel::read(ChannelHandle h, int timeoutMs) {
    auto proc = get_(h);
    if (!proc) {
        ReadResult r;
        r.status = ReadResult::Status::Eof;
        return r;
    }
    // The shared_ptr keeps the descriptors open even if signalAbort() replaces the process.
    return proc->read(timeoutMs);
}

void PosixShellChannel::signalAbort(ChannelHandle h) {
    auto old = get_(h);
    if (!old) return;

    old->kill_group();

    auto fresh = std::make_shared<ShellProcess>(config_);
    if (!fresh->start()) {
        ASTREAM_DBG("CHANNEL", "respawn failed for handle=%llu", static_cast<unsigned long long>(h));
        return;
    }

    std::lock_guard<std::mutex> lk(mx_);
    auto it = procs_.find(h);
    if (it == procs_.end()) return; // shut down meanwhile; `fresh` terminates on destruction
    it->second = std::move(fresh);
    ++respawns_;
}

void PosixShellChannel::shutdown(ChannelHandle h) {
    std::shared_ptr<ShellProcess> proc;
    {
        std::lock_guard<std::mutex> lk(mx_);
        auto it = procs_.find(h);
        if (it == procs_.end()) return;
        proc = std::move(it->second);
        procs_.erase(it);
    }
    proc->terminate();
}

size_t PosixShellChannel::processCount() const {
    std::lock_guard<std::mutex> lk(mx_);
    return procs_.size();
}

pid_t PosixShellChannel::pidOf(ChannelHandle h) const {
    auto proc = get_(h);
    return proc ? proc->native_pid() : -1;
}

std::shared_ptr<ShellProcess> PosixShellChannel::get_(ChannelHandle h) const {
    std::lock_guard<std::mutex> lk(mx_);
    auto it = procs_.find(h);
    return it == procs_.end() ? nullptr : it->second;
}

} // namespace core
} // namespace actionstream
