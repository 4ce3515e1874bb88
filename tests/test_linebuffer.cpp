/**
 * @file test_linebuffer.cpp
 * @brief LineBuffer 单元测试
 */

#include <gtest/gtest.h>
#include "lbt/linebuffer.hpp"

using namespace lbt;

class LineBufferTest : public ::testing::Test {
protected:
    void SetUp() override {
        testData = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0, 10.0};
        buf.extend(testData);
    }

    std::vector<Value> testData;
    LineBuffer buf;
};

TEST_F(LineBufferTest, CreateEmpty) {
    LineBuffer empty;
    EXPECT_EQ(empty.length(), 0u);
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.minperiod(), 1u);
    EXPECT_TRUE(std::isnan(empty[0]));
}

TEST_F(LineBufferTest, CursorStartsAtFirstValue) {
    EXPECT_EQ(buf.length(), testData.size());
    EXPECT_DOUBLE_EQ(buf[0], 1.0);
    // 游标之前没有数据
    EXPECT_TRUE(std::isnan(buf[1]));
}

TEST_F(LineBufferTest, SeekAndLookBack) {
    buf.seek(5);
    EXPECT_DOUBLE_EQ(buf[0], 6.0);
    EXPECT_DOUBLE_EQ(buf[1], 5.0);
    EXPECT_DOUBLE_EQ(buf[5], 1.0);
    EXPECT_TRUE(std::isnan(buf[6]));
}

TEST_F(LineBufferTest, FutureIsInvisible) {
    buf.seek(3);
    // 负的 ago 指向未来
    EXPECT_TRUE(std::isnan(buf[-1]));

    auto hist = buf.history();
    ASSERT_EQ(hist.size(), 4u);
    EXPECT_DOUBLE_EQ(hist.back(), 4.0);
}

TEST_F(LineBufferTest, AdvanceStopsAtEnd) {
    for (int i = 0; i < 20; ++i) buf.advance();
    EXPECT_EQ(buf.position(), 9);
    EXPECT_DOUBLE_EQ(buf.current(), 10.0);

    buf.home();
    EXPECT_DOUBLE_EQ(buf.current(), 1.0);
}

TEST_F(LineBufferTest, AbsoluteAccess) {
    EXPECT_DOUBLE_EQ(buf.at(9), 10.0);
    EXPECT_THROW(buf.at(10), std::out_of_range);
    EXPECT_THROW(buf.seek(10), std::out_of_range);
}

TEST_F(LineBufferTest, Reset) {
    buf.seek(4);
    buf.reset();
    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.position(), 0);
}
