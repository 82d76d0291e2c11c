// feature_table_test.cpp — tests for FeatureTable and LabeledTable

#include <gtest/gtest.h>

#include "features/feature_table.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

FeatureTable make_table() {
    FeatureTable t({10, 20, 30, 40});
    t.add_column("x", {1.0, 2.0, 3.0, 4.0});
    t.add_column("y", {-1.0, -2.0, -3.0, -4.0});
    return t;
}

}  // namespace

class FeatureTableTest : public ::testing::Test {
protected:
    FeatureTable table_ = make_table();
};

TEST_F(FeatureTableTest, Shape) {
    EXPECT_EQ(table_.rows(), 4u);
    EXPECT_EQ(table_.cols(), 2u);
    EXPECT_FALSE(table_.empty());
    EXPECT_TRUE(FeatureTable().empty());
}

TEST_F(FeatureTableTest, ColumnLengthMustMatch) {
    EXPECT_THROW(table_.add_column("z", {1.0, 2.0}), std::invalid_argument);
}

TEST_F(FeatureTableTest, DuplicateColumnRejected) {
    EXPECT_THROW(table_.add_column("x", {0.0, 0.0, 0.0, 0.0}), std::invalid_argument);
}

TEST_F(FeatureTableTest, LookupByNameAndIndex) {
    EXPECT_TRUE(table_.has_column("y"));
    EXPECT_FALSE(table_.has_column("z"));
    EXPECT_EQ(table_.column_index("y"), 1u);
    EXPECT_THROW(table_.column_index("z"), std::invalid_argument);
    EXPECT_DOUBLE_EQ(table_.at(2, 1), -3.0);
    EXPECT_EQ(table_.row(1), (std::vector<double>{2.0, -2.0}));
}

TEST_F(FeatureTableTest, SlicePreservesOrder) {
    auto s = table_.slice(1, 3);
    EXPECT_EQ(s.timestamps(), (std::vector<int64_t>{20, 30}));
    EXPECT_EQ(s.column("x"), (std::vector<double>{2.0, 3.0}));
    EXPECT_EQ(s.column_names(), table_.column_names());
    EXPECT_THROW(table_.slice(3, 5), std::out_of_range);
    EXPECT_THROW(table_.slice(3, 2), std::out_of_range);
}

TEST_F(FeatureTableTest, SelectReordersColumns) {
    auto s = table_.select({"y", "x"});
    EXPECT_EQ(s.column_names(), (std::vector<std::string>{"y", "x"}));
    EXPECT_EQ(s.rows(), 4u);
    EXPECT_THROW(table_.select({"nope"}), std::invalid_argument);
}

TEST_F(FeatureTableTest, NanDetectionAndEquality) {
    EXPECT_FALSE(table_.has_nan());
    FeatureTable copy = make_table();
    EXPECT_TRUE(copy == table_);
    copy.add_column("n", {0.0, std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0});
    EXPECT_TRUE(copy.has_nan());
    EXPECT_FALSE(copy == table_);
}

TEST_F(FeatureTableTest, LabeledSliceKeepsRowsAligned) {
    LabeledTable lt{table_, {LABEL_UP, LABEL_DOWN, LABEL_DOWN, LABEL_UP}};
    auto s = lt.slice(2, 4);
    EXPECT_EQ(s.rows(), 2u);
    EXPECT_EQ(s.labels, (std::vector<int>{LABEL_DOWN, LABEL_UP}));
    EXPECT_EQ(s.table.timestamps(), (std::vector<int64_t>{30, 40}));
}

TEST_F(FeatureTableTest, LabelNames) {
    EXPECT_EQ(label_name(LABEL_UP), "up");
    EXPECT_EQ(label_name(LABEL_DOWN), "down");
}
