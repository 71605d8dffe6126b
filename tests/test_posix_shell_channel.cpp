#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "posix_shell_channel.hpp"
#include "shell_session.hpp"

using namespace actionstream::core;
using namespace std::chrono_literals;

namespace {

// Reads until `needle` shows up or the stream ends; gives up after ~5s.
std::string read_until(PosixShellChannel& ch, ChannelHandle h, const std::string& needle) {
    std::string got;
    for (int i = 0; i < 100 && got.find(needle) == std::string::npos; ++i) {
        ReadResult r = ch.read(h, 50);
        if (r.status == ReadResult::Status::Eof) break;
        got += r.data;
    }
    return got;
}

Config shell_config() {
    Config cfg;
    cfg.shellPath = "/bin/sh";
    cfg.pollIntervalMs = 20;
    cfg.timeoutSeconds = 10.0;
    return cfg;
}

} // namespace

TEST(PosixShellChannel, RunsCommandsAndMergesStderr) {
    PosixShellChannel ch;
    ChannelHandle h = ch.spawn("t");
    ASSERT_NE(h, kInvalidChannel);
    EXPECT_EQ(ch.processCount(), 1u);
    EXPECT_GT(ch.pidOf(h), 0);

    ASSERT_TRUE(ch.write(h, "echo out; echo err 1>&2; echo END\n"));
    const std::string got = read_until(ch, h, "END\n");
    EXPECT_NE(got.find("out\n"), std::string::npos);
    EXPECT_NE(got.find("err\n"), std::string::npos);

    ch.shutdown(h);
    EXPECT_EQ(ch.processCount(), 0u);
    EXPECT_FALSE(ch.write(h, "echo gone\n"));
    EXPECT_EQ(ch.read(h, 10).status, ReadResult::Status::Eof);
}

TEST(PosixShellChannel, ExitingShellEndsStream) {
    PosixShellChannel ch;
    ChannelHandle h = ch.spawn("t");
    ASSERT_NE(h, kInvalidChannel);
    ASSERT_TRUE(ch.write(h, "exit 0\n"));

    bool eof = false;
    for (int i = 0; i < 100 && !eof; ++i) eof = ch.read(h, 50).status == ReadResult::Status::Eof;
    EXPECT_TRUE(eof);
}

TEST(PosixShellChannel, AbortReplacesProcess) {
    PosixShellChannel ch;
    ChannelHandle h = ch.spawn("t");
    ASSERT_NE(h, kInvalidChannel);
    const pid_t before = ch.pidOf(h);

    ASSERT_TRUE(ch.write(h, "sleep 30\n"));
    ch.signalAbort(h);
    EXPECT_EQ(ch.respawnCount(), 1u);
    EXPECT_NE(ch.pidOf(h), before);

    ASSERT_TRUE(ch.write(h, "echo alive\n"));
    EXPECT_NE(read_until(ch, h, "alive\n").find("alive\n"), std::string::npos);
}

TEST(PosixShellChannel, SpawnFailsForMissingShell) {
    ProcessConfig cfg;
    cfg.shell_path = "/nonexistent/shell";
    PosixShellChannel ch(cfg);
    EXPECT_EQ(ch.spawn("t"), kInvalidChannel);
}

TEST(ShellSessionLocal, ReportsOutputAndExitCode) {
    const Config cfg = shell_config();
    auto session = std::make_shared<ShellSession>("local", std::make_shared<PosixShellChannel>(cfg), cfg);
    ASSERT_TRUE(session->start());

    CommandResult r = session->executeCommand("echo hello; false");
    EXPECT_EQ(r.status, CommandStatus::Completed);
    EXPECT_EQ(r.output, "hello\n");
    EXPECT_EQ(r.exitCode, 1);

    r = session->executeCommand("printf 'it'\"'\"'s %s\\n' fine");
    EXPECT_EQ(r.output, "it's fine\n");
    EXPECT_TRUE(r.success());
    session->stop();
}

TEST(ShellSessionLocal, AppliesWorkingDirectoryAndEnvironment) {
    Config cfg = shell_config();
    cfg.workingDirectory = "/";
    cfg.environment["ACTIONSTREAM_TEST_VAR"] = "value-42";
    auto session = std::make_shared<ShellSession>("local", std::make_shared<PosixShellChannel>(cfg), cfg);
    ASSERT_TRUE(session->start());

    CommandResult r = session->executeCommand("pwd; echo \"$ACTIONSTREAM_TEST_VAR\"");
    EXPECT_EQ(r.output, "/\nvalue-42\n");
}

TEST(ShellSessionLocal, NewCommandCancelsLongRunningOne) {
    const Config cfg = shell_config();
    auto channel = std::make_shared<PosixShellChannel>(cfg);
    auto session = std::make_shared<ShellSession>("local", channel, cfg);
    ASSERT_TRUE(session->start());

    bool firstAborted = false;
    auto first = session->executeAsync("echo started; sleep 30", [&] { firstAborted = true; });
    std::this_thread::sleep_for(300ms);

    const auto t0 = std::chrono::steady_clock::now();
    CommandResult second = session->executeCommand("echo second");
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);

    ASSERT_EQ(first.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(first.get().status, CommandStatus::Aborted);
    EXPECT_TRUE(firstAborted);
    EXPECT_EQ(second.status, CommandStatus::Completed);
    EXPECT_EQ(second.output, "second\n");
    EXPECT_EQ(channel->respawnCount(), 1u);
}
