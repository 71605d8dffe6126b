#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "dev_debug.hpp"

using actionstream::dev::Logger;

TEST(DebugLogger, WritesTaggedLinesAndHonoursExclusions) {
    const std::string path = ::testing::TempDir() + "actionstream_logger_test.log";
    std::remove(path.c_str());

    Logger& log = Logger::instance();
    log.exclude("IO,CHANNEL");
    log.enable(true, path);
    ASTREAM_DBG("SCAN", "open %s type=%s", "m:action-0", "file");
    ASTREAM_DBG("IO", "read %zu bytes", static_cast<size_t>(12));
    log.enable(false);
    log.exclude("");

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();

    EXPECT_NE(text.find("[SCAN]"), std::string::npos);
    EXPECT_NE(text.find("open m:action-0 type=file"), std::string::npos);
    EXPECT_EQ(text.find("[IO]"), std::string::npos);
    EXPECT_EQ(log.path(), path);
    EXPECT_FALSE(log.enabled());
}
