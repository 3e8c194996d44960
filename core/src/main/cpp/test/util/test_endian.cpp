/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Little-endian encoding of table rows and file framing.
 */

#include <gtest/gtest.h>
#include "../../src/util/endian.hpp"
#include <cmath>
#include <cstring>
#include <limits>
#include <vector>

using namespace pathstore::util;

class EndianTest : public ::testing::Test {
protected:
    uint8_t buffer[16];

    void SetUp() override {
        std::memset(buffer, 0, sizeof(buffer));
    }
};

TEST_F(EndianTest, Store32BitLittleEndian) {
    store_le32(buffer, 0x12345678);
    EXPECT_EQ(buffer[0], 0x78);
    EXPECT_EQ(buffer[1], 0x56);
    EXPECT_EQ(buffer[2], 0x34);
    EXPECT_EQ(buffer[3], 0x12);
    EXPECT_EQ(load_le32(buffer), 0x12345678u);
}

TEST_F(EndianTest, Store64BitLittleEndian) {
    store_le64(buffer, 0x0102030405060708ULL);
    EXPECT_EQ(buffer[0], 0x08);
    EXPECT_EQ(buffer[7], 0x01);
    EXPECT_EQ(load_le64(buffer), 0x0102030405060708ULL);
}

TEST_F(EndianTest, SignedIndex) {
    store_le_i64(buffer, -2);
    EXPECT_EQ(buffer[0], 0xFE);
    EXPECT_EQ(buffer[7], 0xFF);
    EXPECT_EQ(load_le_i64(buffer), -2);
}

TEST_F(EndianTest, FloatBitsPreserved) {
    store_lef32(buffer, 1.0f);
    // IEEE-754 1.0f = 0x3F800000
    EXPECT_EQ(load_le32(buffer), 0x3F800000u);
    EXPECT_EQ(load_lef32(buffer), 1.0f);

    store_lef32(buffer, -0.0f);
    EXPECT_TRUE(std::signbit(load_lef32(buffer)));

    store_lef32(buffer, std::numeric_limits<float>::quiet_NaN());
    EXPECT_TRUE(std::isnan(load_lef32(buffer)));
}

TEST_F(EndianTest, FloatArray) {
    std::vector<float> in = {0.5f, -1.25f, 3.0f};
    std::vector<uint8_t> raw(in.size() * 4);
    store_lef32_array(raw.data(), in.data(), in.size());
    EXPECT_EQ(load_lef32(raw.data() + 4), -1.25f);

    std::vector<float> out(in.size());
    load_lef32_array(raw.data(), out.data(), out.size());
    EXPECT_EQ(out, in);
}
