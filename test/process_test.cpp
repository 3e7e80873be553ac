#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "process.hpp"

TEST(Process, ExitStatus) {
    EXPECT_EQ(exec_command({"true"}), 0);
    EXPECT_EQ(exec_command({"false"}), 1);
    EXPECT_EQ(exec_command({"sh", "-c", "exit 7"}), 7);
}

TEST(Process, MissingProgram) {
    EXPECT_EQ(exec_command({"image-tools-no-such-program"}), 127);
}

TEST(Process, KilledBySignal) {
    EXPECT_EQ(exec_command({"sh", "-c", "kill -9 $$"}), 128 + 9);
}

TEST(Process, EmptyCommandLine) {
    EXPECT_THROW(exec_command({}), std::invalid_argument);
}

TEST(Process, CaptureStdout) {
    std::string out;
    EXPECT_EQ(capture_command({"echo", "hello", "world"}, out), 0);
    EXPECT_EQ(out, "hello world\n");

    EXPECT_EQ(capture_command({"sh", "-c", "printf partial; exit 3"}, out), 3);
    EXPECT_EQ(out, "partial");
}

TEST(Process, FindExecutable) {
    EXPECT_TRUE(find_executable("sh"));
    EXPECT_TRUE(find_executable("/bin/sh"));
    EXPECT_FALSE(find_executable("image-tools-no-such-program"));
    EXPECT_FALSE(find_executable(""));
}

TEST(Process, JoinArgs) {
    EXPECT_EQ(join_args({"fdisk", "-l", "disk.img"}), "fdisk -l disk.img");
}
