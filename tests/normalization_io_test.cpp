// normalization_io_test.cpp — tests for normalization state persistence

#include <gtest/gtest.h>

#include "features/normalization_io.hpp"

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

NormalizationState make_state() {
    NormalizationState s;
    s.columns.push_back({"ATR", 1.2345678901234567, 0.1 + 0.2, false});
    s.columns.push_back({"RSI", 52.000000000000007, 17.5, false});
    s.columns.push_back({"Flat", 3.0, 0.0, true});
    return s;
}

}  // namespace

class NormalizationIoTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& p : temp_files_) std::filesystem::remove(p);
    }

    std::string temp_path(const std::string& name) {
        auto p = (std::filesystem::temp_directory_path() / name).string();
        temp_files_.push_back(p);
        return p;
    }

    std::vector<std::string> temp_files_;
};

TEST_F(NormalizationIoTest, HeaderAndOneLinePerColumn) {
    std::ostringstream os;
    write_normalization_state(os, make_state());
    std::istringstream is(os.str());
    std::string line;
    std::getline(is, line);
    EXPECT_EQ(line, "column,mean,std,degenerate");
    size_t rows = 0;
    while (std::getline(is, line)) ++rows;
    EXPECT_EQ(rows, 3u);
    EXPECT_NE(os.str().find("Flat,3,0,1"), std::string::npos);
}

TEST_F(NormalizationIoTest, StreamRoundTripIsExact) {
    auto state = make_state();
    std::stringstream ss;
    write_normalization_state(ss, state);
    auto back = read_normalization_state(ss);
    EXPECT_TRUE(back == state);
    EXPECT_EQ(back.degenerate_columns(), std::vector<std::string>{"Flat"});
}

TEST_F(NormalizationIoTest, FileRoundTrip) {
    auto path = temp_path("indicator_lab_normalization_io_test.csv");
    save_normalization_state(path, make_state());
    EXPECT_TRUE(load_normalization_state(path) == make_state());
}

TEST_F(NormalizationIoTest, MissingFileThrows) {
    EXPECT_THROW(load_normalization_state("/nonexistent/dir/state.csv"), std::runtime_error);
    EXPECT_THROW(save_normalization_state("/nonexistent/dir/state.csv", make_state()),
                 std::runtime_error);
}

TEST_F(NormalizationIoTest, MalformedInputRejected) {
    {
        std::istringstream is("name,mu,sigma\nA,1,2\n");
        EXPECT_THROW(read_normalization_state(is), std::runtime_error);
    }
    {
        std::istringstream is("column,mean,std,degenerate\nA,1,2\n");
        EXPECT_THROW(read_normalization_state(is), std::runtime_error);
    }
    {
        std::istringstream is("column,mean,std,degenerate\nA,one,2,0\n");
        EXPECT_THROW(read_normalization_state(is), std::runtime_error);
    }
    {
        std::istringstream is("column,mean,std,degenerate\nA,1,2,yes\n");
        EXPECT_THROW(read_normalization_state(is), std::runtime_error);
    }
    {
        std::istringstream is("column,mean,std,degenerate\nA,1,2,0\nA,3,4,0\n");
        EXPECT_THROW(read_normalization_state(is), std::runtime_error);
    }
}

TEST_F(NormalizationIoTest, EmptyBodyGivesUnfittedState) {
    std::istringstream is("column,mean,std,degenerate\n");
    EXPECT_FALSE(read_normalization_state(is).fitted());
}
