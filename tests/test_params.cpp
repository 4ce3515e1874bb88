/**
 * @file test_params.cpp
 * @brief 参数系统单元测试
 */

#include <gtest/gtest.h>
#include "lbt/params.hpp"
#include <cstdio>
#include <fstream>

using namespace lbt;

TEST(ParamsTest, SetAndGetInt) {
    Params p;
    p.set("period", 14);
    EXPECT_EQ(p.get<int>("period"), 14);
}

TEST(ParamsTest, SetAndGetList) {
    Params p;
    p.set("levels", std::vector<double>{-0.04, -0.08});
    auto levels = p.getList("levels");
    ASSERT_EQ(levels.size(), 2u);
    EXPECT_DOUBLE_EQ(levels[1], -0.08);
}

TEST(ParamsTest, GetWithDefault) {
    Params p;
    EXPECT_EQ(p.get<int>("missing", 42), 42);
    EXPECT_DOUBLE_EQ(p.get<double>("missing", 3.14), 3.14);
}

TEST(ParamsTest, GetNonExistent) {
    Params p;
    EXPECT_THROW(p.get<int>("missing"), std::runtime_error);
}

TEST(ParamsTest, GetWrongType) {
    Params p;
    p.set("name", std::string("x"));
    EXPECT_THROW(p.get<int>("name"), std::invalid_argument);
    EXPECT_THROW(p.getNumber("name"), std::invalid_argument);
}

TEST(ParamsTest, NumericConversions) {
    Params p;
    p.set("a", 3);
    p.set("b", 4.0);
    p.set("c", 4.5);
    EXPECT_DOUBLE_EQ(p.getNumber("a"), 3.0);
    EXPECT_EQ(p.getInteger("b"), 4);
    EXPECT_THROW(p.getInteger("c"), std::invalid_argument);

    p.set("window", 3);
    p.set("negative", -1);
    EXPECT_EQ(p.getCount("window"), 3u);
    EXPECT_EQ(p.getCount("b"), 4u);
    EXPECT_THROW(p.getCount("negative"), std::invalid_argument);
    EXPECT_THROW(p.getCount("c"), std::invalid_argument);

    // 单个数值视为一个元素的列表
    auto list = p.getList("c");
    ASSERT_EQ(list.size(), 1u);
    EXPECT_DOUBLE_EQ(list[0], 4.5);
}

TEST(ParamsTest, MergeKeepsExisting) {
    Params base;
    base.set("a", 1);
    base.set("b", 2);

    Params other;
    other.set("b", 20);
    other.set("c", 30);

    base.merge(other);

    EXPECT_EQ(base.get<int>("a"), 1);
    EXPECT_EQ(base.get<int>("b"), 2);
    EXPECT_EQ(base.get<int>("c"), 30);
}

TEST(ParamsTest, Override) {
    Params base;
    base.set("a", 1);
    base.set("b", 2);

    Params other;
    other.set("b", 20);
    base.override(other);

    EXPECT_EQ(base.get<int>("a"), 1);
    EXPECT_EQ(base.get<int>("b"), 20);
}

TEST(ParamsTest, KeysAreSorted) {
    Params p;
    p.set("gamma", 3);
    p.set("alpha", 1);
    p.set("beta", 2);

    auto keys = p.keys();
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0], "alpha");
    EXPECT_EQ(keys[2], "gamma");
}

// ==================== 文本解析 ====================

TEST(ParamsParseTest, InfersTypes) {
    Params p;
    p.parseAssignment("flag=true");
    p.parseAssignment("period = 20");
    p.parseAssignment("band=1.05");
    p.parseAssignment("levels=-0.04,-0.08,-0.13");
    p.parseAssignment("policy=lenient");

    EXPECT_TRUE(p.get<bool>("flag"));
    EXPECT_EQ(p.get<int>("period"), 20);
    EXPECT_DOUBLE_EQ(p.get<double>("band"), 1.05);
    EXPECT_EQ(p.getList("levels").size(), 3u);
    EXPECT_EQ(p.get<std::string>("policy"), "lenient");
}

TEST(ParamsParseTest, RejectsMissingEquals) {
    Params p;
    EXPECT_THROW(p.parseAssignment("period"), std::invalid_argument);
    EXPECT_THROW(p.parseAssignment("=5"), std::invalid_argument);
}

TEST(ParamsParseTest, ToStringRoundTripsList) {
    ParamValue v = std::vector<double>{0.1, 0.2};
    EXPECT_EQ(toString(v), "0.1,0.2");
    EXPECT_EQ(toString(ParamValue(true)), "true");
}

TEST(ParamsParseTest, LoadFile) {
    const std::string path = ::testing::TempDir() + "lbt_params_test.cfg";
    {
        std::ofstream out(path);
        out << "# thresholds tuning\n";
        out << "ma_period=30\n\n";
        out << "sell_thresholds=0.1,0.2\n";
    }
    Params p = loadParamsFile(path);
    EXPECT_EQ(p.get<int>("ma_period"), 30);
    EXPECT_EQ(p.getList("sell_thresholds").size(), 2u);
    std::remove(path.c_str());

    EXPECT_THROW(loadParamsFile(path), std::runtime_error);
}

// ==================== schema 检查 ====================

TEST(ParamsCheckedTest, AcceptsCompatibleTypes) {
    Params schema;
    schema.set("cash", 100.0);
    schema.set("period", 20);
    schema.set("levels", std::vector<double>{0.1, 0.2});

    Params overrides;
    overrides.set("cash", 5);          // int -> double
    overrides.set("period", 30.0);     // 整数值的 double -> int
    overrides.set("levels", 0.5);      // 数值 -> 单元素列表
    schema.overrideChecked(overrides);

    EXPECT_DOUBLE_EQ(schema.get<double>("cash"), 5.0);
    EXPECT_EQ(schema.get<int>("period"), 30);
    EXPECT_EQ(schema.getList("levels").size(), 1u);
}

TEST(ParamsCheckedTest, RejectsUnknownAndIncompatible) {
    Params schema;
    schema.set("period", 20);
    schema.set("policy", std::string("strict"));

    Params unknown;
    unknown.set("perod", 10);
    EXPECT_THROW(schema.overrideChecked(unknown), std::invalid_argument);

    Params fractional;
    fractional.set("period", 2.5);
    EXPECT_THROW(schema.overrideChecked(fractional), std::invalid_argument);

    Params wrong;
    wrong.set("policy", 3);
    EXPECT_THROW(schema.overrideChecked(wrong), std::invalid_argument);
}

// 宏定义的默认参数
struct Tunable {
    LBT_PARAMS_BEGIN()
        LBT_PARAM(period, 20)
        LBT_PARAM(factor, 2.5)
    LBT_PARAMS_END()
};

TEST(ParamsTest, MacroDefinedParams) {
    Params p = Tunable::getDefaultParams();
    EXPECT_EQ(p.get<int>("period"), 20);
    EXPECT_DOUBLE_EQ(p.get<double>("factor"), 2.5);
}
