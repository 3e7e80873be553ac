#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include "tree_compare.hpp"

namespace {

class TreeCompareTest : public ::testing::Test {
protected:
    void SetUp() override {
        char dir[] = "/tmp/image-tools-tree-XXXXXX";
        ASSERT_NE(::mkdtemp(dir), nullptr);
        base_ = dir;
        src_ = base_ + "/src";
        dst_ = base_ + "/dst";
        ASSERT_EQ(::mkdir(src_.c_str(), 0755), 0);
        ASSERT_EQ(::mkdir(dst_.c_str(), 0755), 0);
    }

    void TearDown() override {
        std::string cmd = "rm -rf '" + base_ + "'";
        ASSERT_EQ(std::system(cmd.c_str()), 0);
    }

    static void write_file(const std::string &path, const std::string &content) {
        FILE *f = std::fopen(path.c_str(), "w");
        ASSERT_NE(f, nullptr);
        std::fputs(content.c_str(), f);
        std::fclose(f);
    }

    std::vector<TreeDiff> diff() {
        TreeSnapshot a, b;
        EXPECT_TRUE(a.load(src_));
        EXPECT_TRUE(b.load(dst_));
        std::vector<TreeDiff> out;
        EXPECT_TRUE(compare_trees(a, b, out));
        return out;
    }

    std::string base_;
    std::string src_;
    std::string dst_;
};

}  // namespace

TEST_F(TreeCompareTest, IdenticalTrees) {
    for (const auto &root : {src_, dst_}) {
        ASSERT_EQ(::mkdir((root + "/etc").c_str(), 0755), 0);
        write_file(root + "/etc/hostname", "raspberrypi\n");
        ASSERT_EQ(::symlink("hostname", (root + "/etc/link").c_str()), 0);
    }
    EXPECT_TRUE(diff().empty());
    EXPECT_EQ(compare_directories(src_, dst_), 0);
}

TEST_F(TreeCompareTest, ReportsEveryKindOfChange) {
    write_file(src_ + "/added", "x");
    write_file(dst_ + "/removed", "x");
    write_file(src_ + "/resized", "abc");
    write_file(dst_ + "/resized", "abcd");
    write_file(src_ + "/same-size", "abc");
    write_file(dst_ + "/same-size", "abd");
    write_file(src_ + "/retyped", "x");
    ASSERT_EQ(::mkdir((dst_ + "/retyped").c_str(), 0755), 0);
    ASSERT_EQ(::symlink("a", (src_ + "/relinked").c_str()), 0);
    ASSERT_EQ(::symlink("b", (dst_ + "/relinked").c_str()), 0);

    auto diffs = diff();
    ASSERT_EQ(diffs.size(), 6u);
    // Sorted by path.
    EXPECT_EQ(diffs[0].code, '+');
    EXPECT_EQ(diffs[0].path, "added");
    EXPECT_EQ(diffs[1].code, 'l');
    EXPECT_EQ(diffs[1].path, "relinked");
    EXPECT_EQ(diffs[2].code, '-');
    EXPECT_EQ(diffs[2].path, "removed");
    EXPECT_EQ(diffs[3].code, 'c');
    EXPECT_EQ(diffs[3].path, "resized");
    EXPECT_EQ(diffs[4].code, 't');
    EXPECT_EQ(diffs[4].path, "retyped");
    EXPECT_EQ(diffs[5].code, 'c');
    EXPECT_EQ(diffs[5].path, "same-size");
}

TEST_F(TreeCompareTest, NestedPaths) {
    ASSERT_EQ(::mkdir((src_ + "/boot").c_str(), 0755), 0);
    write_file(src_ + "/boot/config.txt", "gpu_mem=16\n");
    auto diffs = diff();
    ASSERT_EQ(diffs.size(), 2u);
    EXPECT_EQ(diffs[0].path, "boot");
    EXPECT_EQ(diffs[1].path, "boot/config.txt");
}

TEST_F(TreeCompareTest, MissingDirectory) {
    TreeSnapshot snap;
    EXPECT_FALSE(snap.load(base_ + "/nope"));
    EXPECT_EQ(compare_directories(src_, base_ + "/nope"), 1);
}

TEST(RemotePath, Detection) {
    EXPECT_TRUE(is_remote_path("host:/srv/rootfs"));
    EXPECT_TRUE(is_remote_path("user@host:backup"));
    EXPECT_FALSE(is_remote_path("/mnt/a:b"));
    EXPECT_FALSE(is_remote_path("./dir"));
    EXPECT_FALSE(is_remote_path(":relative"));
}
