#include <gtest/gtest.h>
#include <platform/process.hpp>

#ifndef _WIN32
TEST(Process, ExitCodes) {
    EXPECT_EQ(platform::run_command({"/bin/sh", "-c", "exit 0"}), 0);
    EXPECT_EQ(platform::run_command({"/bin/sh", "-c", "exit 3"}), 3);
}

TEST(Process, MissingProgramIs127) {
    EXPECT_EQ(platform::run_command({"/nonexistent/zklock-no-such-program"}), 127);
}

TEST(Process, EmptyArgvIs127) {
    EXPECT_EQ(platform::run_command({}), 127);
}

TEST(Process, TerminateStopsChild) {
    auto handle = platform::spawn({"sleep", "30"});
    ASSERT_TRUE(handle.valid());
    handle.terminate();
    EXPECT_FALSE(handle.valid());
    EXPECT_EQ(handle.wait(), -1);
}
#endif
