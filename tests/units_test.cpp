#include <gtest/gtest.h>
#include "utils/units.hpp"

TEST(bytes2human, should_return_0_for_0) {
    EXPECT_EQ("0", bytes2human(0));
}

TEST(bytes2human, default_unit) {
    EXPECT_EQ("100 bytes", bytes2human(100, " bytes"));
}

TEST(bytes2human, default_chunk) {
    EXPECT_EQ("8Kb", bytes2human(8192));
}

TEST(bytes2human, _3mb) {
    EXPECT_EQ("3072Kb", bytes2human(3*1024*1024));
}

TEST(bytes2human, _4mb) {
    EXPECT_EQ("4Mb", bytes2human(4*1024*1024));
}

TEST(bytes2human, not_a_whole_unit) {
    EXPECT_EQ("8193", bytes2human(8193));
}

TEST(human2bytes, plain) {
    EXPECT_EQ(8192, human2bytes("8192"));
}

TEST(human2bytes, units) {
    EXPECT_EQ(8192, human2bytes("8k"));
    EXPECT_EQ(8192, human2bytes("8Kb"));
    EXPECT_EQ(1024*1024, human2bytes("1M"));
    EXPECT_EQ(1024*1024, human2bytes("1mb"));
    EXPECT_EQ(2ULL*1024*1024*1024, human2bytes("2G"));
    EXPECT_EQ(16, human2bytes("16b"));
}

TEST(human2bytes, hex) {
    EXPECT_EQ(0x2000, human2bytes("0x2000"));
}

TEST(human2bytes, invalid) {
    EXPECT_THROW(human2bytes(""), std::runtime_error);
    EXPECT_THROW(human2bytes("k"), std::runtime_error);
    EXPECT_THROW(human2bytes("-5"), std::runtime_error);
    EXPECT_THROW(human2bytes("8x"), std::runtime_error);
    EXPECT_THROW(human2bytes("0x20zz"), std::runtime_error);
}

TEST(human2bytes, overflow) {
    EXPECT_THROW(human2bytes("99999999999999Tb"), std::runtime_error);
}
