// missing_values_test.cpp — tests for carry_forward and apply_missing_value_policy

#include <gtest/gtest.h>

#include "features/missing_values.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

FeatureTable make_gappy_table() {
    FeatureTable t({100, 200, 300, 400, 500});
    t.add_column("a", {NaN, NaN, 2.0, NaN, 4.0});
    t.add_column("b", {1.0, NaN, 3.0, 4.0, 5.0});
    return t;
}

}  // namespace

// ===========================================================================
// 1. carry_forward
// ===========================================================================
class CarryForwardTest : public ::testing::Test {};

TEST_F(CarryForwardTest, FillsInteriorGapsOnly) {
    std::vector<double> v = {NaN, 1.0, NaN, NaN, 3.0};
    EXPECT_EQ(carry_forward(v), 1u);
    EXPECT_TRUE(std::isnan(v[0]));
    EXPECT_DOUBLE_EQ(v[2], 1.0);
    EXPECT_DOUBLE_EQ(v[3], 1.0);
    EXPECT_DOUBLE_EQ(v[4], 3.0);
}

TEST_F(CarryForwardTest, AllUndefinedReturnsSize) {
    std::vector<double> v = {NaN, NaN};
    EXPECT_EQ(carry_forward(v), 2u);
}

// ===========================================================================
// 2. Policies
// ===========================================================================
class MissingValuePolicyTest : public ::testing::Test {
protected:
    FeatureTable table_ = make_gappy_table();
};

TEST_F(MissingValuePolicyTest, ForwardFillSeedsLeadingRows) {
    auto out = apply_missing_value_policy(table_, ForwardFill{});
    ASSERT_EQ(out.rows(), 5u);
    EXPECT_EQ(out.column("a"), (std::vector<double>{2.0, 2.0, 2.0, 2.0, 4.0}));
    EXPECT_EQ(out.column("b"), (std::vector<double>{1.0, 1.0, 3.0, 4.0, 5.0}));
    EXPECT_EQ(out.timestamps(), table_.timestamps());
}

TEST_F(MissingValuePolicyTest, DropRemovesRowsBeforeLatestFirstValue) {
    auto out = apply_missing_value_policy(table_, DropIncomplete{});
    ASSERT_EQ(out.rows(), 3u);
    EXPECT_EQ(out.timestamps(), (std::vector<int64_t>{300, 400, 500}));
    EXPECT_EQ(out.column("a"), (std::vector<double>{2.0, 2.0, 4.0}));
    EXPECT_EQ(out.column("b"), (std::vector<double>{3.0, 4.0, 5.0}));
}

TEST_F(MissingValuePolicyTest, InputTableIsNotModified) {
    auto copy = table_.column("a");
    apply_missing_value_policy(table_, ForwardFill{});
    EXPECT_TRUE(std::isnan(table_.column("a")[0]));
    EXPECT_TRUE(std::isnan(copy[3]));
}

TEST_F(MissingValuePolicyTest, NeverDefinedColumnThrows) {
    FeatureTable t({1, 2, 3});
    t.add_column("ok", {1.0, 2.0, 3.0});
    t.add_column("dead", {NaN, NaN, NaN});
    try {
        apply_missing_value_policy(t, ForwardFill{});
        FAIL() << "expected FeaturePipelineError";
    } catch (const FeaturePipelineError& e) {
        EXPECT_NE(std::string(e.what()).find("dead"), std::string::npos);
    }
    EXPECT_THROW(apply_missing_value_policy(t, DropIncomplete{}), FeaturePipelineError);
}

TEST_F(MissingValuePolicyTest, CleanTableUnchangedByEitherPolicy) {
    FeatureTable t({1, 2});
    t.add_column("x", {5.0, 6.0});
    EXPECT_TRUE(apply_missing_value_policy(t, ForwardFill{}) == t);
    EXPECT_TRUE(apply_missing_value_policy(t, DropIncomplete{}) == t);
}
