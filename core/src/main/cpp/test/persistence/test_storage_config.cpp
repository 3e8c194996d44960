/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Storage configuration presets and environment overrides.
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include "../../src/persistence/storage_config.h"

using namespace pathstore::persist;

class StorageConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        unsetenv(env::kCachePolicy);
        unsetenv(env::kChunkRows);
        unsetenv(env::kSyncOnFlush);
    }
};

TEST_F(StorageConfigTest, Defaults) {
    StorageConfig cfg = StorageConfig::defaults();
    EXPECT_EQ(cfg.cache_policy, "");
    EXPECT_EQ(cfg.chunk_rows, table::kDefaultChunkRows);
    EXPECT_TRUE(cfg.sync_on_flush);
    EXPECT_TRUE(cfg.validate());
}

TEST_F(StorageConfigTest, EnvironmentOverrides) {
    setenv(env::kCachePolicy, "analysis", 1);
    setenv(env::kChunkRows, "512", 1);
    setenv(env::kSyncOnFlush, "off", 1);

    StorageConfig cfg = StorageConfig::defaults();
    EXPECT_EQ(cfg.cache_policy, "analysis");
    EXPECT_EQ(cfg.chunk_rows, 512u);
    EXPECT_FALSE(cfg.sync_on_flush);
}

TEST_F(StorageConfigTest, BadChunkRowsIgnored) {
    setenv(env::kChunkRows, "zero", 1);
    EXPECT_EQ(StorageConfig::defaults().chunk_rows, table::kDefaultChunkRows);
}

TEST_F(StorageConfigTest, Presets) {
    EXPECT_EQ(StorageConfig::sampling().chunk_rows, 1024u);
    EXPECT_FALSE(StorageConfig::analysis().sync_on_flush);
    EXPECT_EQ(StorageConfig::low_memory().cache_policy, "minimal");
    EXPECT_TRUE(StorageConfig::sampling().validate());
    EXPECT_TRUE(StorageConfig::analysis().validate());
    EXPECT_TRUE(StorageConfig::low_memory().validate());
}

TEST_F(StorageConfigTest, Validate) {
    StorageConfig cfg;
    cfg.chunk_rows = 0;
    EXPECT_FALSE(cfg.validate());
    cfg.chunk_rows = table::kMaxChunkRows + 1;
    EXPECT_FALSE(cfg.validate());
    cfg.chunk_rows = table::kMaxChunkRows;
    EXPECT_TRUE(cfg.validate());
}
