/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Positional file I/O used by the file-backed table.
 */

#include <gtest/gtest.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>
#include "../../src/persistence/platform_fs.h"
#include "test_helpers.h"

using namespace pathstore::persist;

class PlatformFSTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string test_file;

    void SetUp() override {
        test_dir = test::create_temp_dir("pathstore_platform_fs_test");
        test_file = test_dir + "/test.dat";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }
};

TEST_F(PlatformFSTest, WriteReadAt) {
    intptr_t fh = -1;
    ASSERT_TRUE(PlatformFS::open_file(test_file, OpenMode::ReadWrite, &fh).ok);

    const char msg[] = "pathstore";
    ASSERT_TRUE(PlatformFS::write_at(fh, 100, msg, sizeof(msg)).ok);

    auto sz = PlatformFS::file_size(fh);
    ASSERT_TRUE(sz.first.ok);
    EXPECT_EQ(sz.second, 100 + sizeof(msg));

    char out[sizeof(msg)] = {0};
    ASSERT_TRUE(PlatformFS::read_at(fh, 100, out, sizeof(out)).ok);
    EXPECT_STREQ(out, msg);

    // The hole before the write reads back as zeros
    std::vector<uint8_t> hole(100, 0xAA);
    ASSERT_TRUE(PlatformFS::read_at(fh, 0, hole.data(), hole.size()).ok);
    EXPECT_EQ(hole, std::vector<uint8_t>(100, 0));

    EXPECT_TRUE(PlatformFS::flush_file(fh).ok);
    EXPECT_TRUE(PlatformFS::close_file(fh).ok);
}

TEST_F(PlatformFSTest, ReadPastEndFails) {
    intptr_t fh = -1;
    ASSERT_TRUE(PlatformFS::open_file(test_file, OpenMode::ReadWrite, &fh).ok);
    uint8_t b[8];
    FSResult r = PlatformFS::read_at(fh, 0, b, sizeof(b));
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, EIO);
    PlatformFS::close_file(fh);
}

TEST_F(PlatformFSTest, TruncateGrowsAndShrinks) {
    intptr_t fh = -1;
    ASSERT_TRUE(PlatformFS::open_file(test_file, OpenMode::ReadWrite, &fh).ok);
    ASSERT_TRUE(PlatformFS::truncate_file(fh, 4096).ok);
    EXPECT_EQ(PlatformFS::file_size(fh).second, 4096u);
    ASSERT_TRUE(PlatformFS::truncate_file(fh, 10).ok);
    EXPECT_EQ(PlatformFS::file_size(fh).second, 10u);
    PlatformFS::close_file(fh);

    ASSERT_TRUE(PlatformFS::open_file(test_file, OpenMode::Truncate, &fh).ok);
    EXPECT_EQ(PlatformFS::file_size(fh).second, 0u);
    PlatformFS::close_file(fh);
}

TEST_F(PlatformFSTest, OpenMissingReadOnly) {
    intptr_t fh = -1;
    FSResult r = PlatformFS::open_file(test_dir + "/missing.dat", OpenMode::ReadOnly, &fh);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ENOENT);
}

TEST_F(PlatformFSTest, Directories) {
    std::string nested = test_dir + "/a/b/c";
    EXPECT_TRUE(PlatformFS::ensure_directory(nested).ok);
    EXPECT_TRUE(std::filesystem::is_directory(nested));
    EXPECT_TRUE(PlatformFS::ensure_directory(nested).ok);
    EXPECT_TRUE(PlatformFS::fsync_directory(nested).ok);
}
