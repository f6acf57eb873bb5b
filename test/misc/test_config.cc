#include "LinCalc.hh"
#include "lc_config.hh"

#include <gtest/gtest.h>
#include <stdexcept>


class TestConfig : public ::testing::Test
{
    protected:

    virtual void SetUp() {};

    virtual void TearDown() {};

    static void parse(
        std::vector<std::string> args,
        LinCalc::CalcConfig &cfg,
        std::vector<std::string> &positional
    ) {
        std::vector<char*> argv;
        std::string prog = "lincalc";
        argv.push_back(prog.data());
        for (auto &a : args)
            argv.push_back(a.data());
        LinCalc::parse_args((int) argv.size(), argv.data(), cfg, positional);
    }
};

TEST_F(TestConfig, defaults) {
    LinCalc::CalcConfig cfg;
    std::vector<std::string> positional;
    parse({}, cfg, positional);
    EXPECT_EQ(cfg.precision, 2);
    EXPECT_DOUBLE_EQ(cfg.zero_tol, 1e-10);
    EXPECT_EQ(cfg.rand_low, -9);
    EXPECT_EQ(cfg.rand_high, 9);
    EXPECT_FALSE(cfg.verbose);
    EXPECT_FALSE(cfg.multiline);
    EXPECT_TRUE(positional.empty());
}

TEST_F(TestConfig, flags_and_positionals) {
    LinCalc::CalcConfig cfg;
    std::vector<std::string> positional;
    parse({"--precision", "4", "lincomb", "--alpha", "2.5", "1 2; 3 4", "--beta-det", "-v",
           "-1 0; 0 1", "--range", "-3", "3", "--seed", "17", "--multiline", "--tol", "1e-8", "2"}, cfg, positional);
    EXPECT_EQ(cfg.precision, 4);
    EXPECT_DOUBLE_EQ(cfg.alpha, 2.5);
    EXPECT_DOUBLE_EQ(cfg.beta, 1.0);
    EXPECT_FALSE(cfg.alpha_det);
    EXPECT_TRUE(cfg.beta_det);
    EXPECT_TRUE(cfg.verbose);
    EXPECT_TRUE(cfg.multiline);
    EXPECT_EQ(cfg.rand_low, -3);
    EXPECT_EQ(cfg.rand_high, 3);
    EXPECT_EQ(cfg.seed, (uint64_t) 17);
    EXPECT_DOUBLE_EQ(cfg.zero_tol, 1e-8);
    std::vector<std::string> expect = {"lincomb", "1 2; 3 4", "-1 0; 0 1", "2"};
    EXPECT_EQ(positional, expect);
}

TEST_F(TestConfig, negative_matrices_are_operands) {
    LinCalc::CalcConfig cfg;
    std::vector<std::string> positional;
    parse({"det", "-3 1; 2 4", "-", "--", "--not-a-flag"}, cfg, positional);
    std::vector<std::string> expect = {"det", "-3 1; 2 4", "-", "--not-a-flag"};
    EXPECT_EQ(positional, expect);
}

TEST_F(TestConfig, help) {
    LinCalc::CalcConfig cfg;
    std::vector<std::string> positional;
    parse({"-h"}, cfg, positional);
    EXPECT_TRUE(cfg.help);
}

TEST_F(TestConfig, invalid_values) {
    LinCalc::CalcConfig cfg;
    std::vector<std::string> positional;
    EXPECT_THROW(parse({"--precision"}, cfg, positional), std::invalid_argument);
    EXPECT_THROW(parse({"--precision", "x"}, cfg, positional), std::invalid_argument);
    EXPECT_THROW(parse({"--precision", "16"}, cfg, positional), std::invalid_argument);
    EXPECT_THROW(parse({"--tol", "-1"}, cfg, positional), std::invalid_argument);
    EXPECT_THROW(parse({"--alpha", "2x"}, cfg, positional), std::invalid_argument);
    EXPECT_THROW(parse({"--range", "5", "1"}, cfg, positional), std::invalid_argument);
    EXPECT_THROW(parse({"--range", "-9223372036854775807", "9223372036854775807"}, cfg, positional), std::invalid_argument);
    EXPECT_THROW(parse({"--range", "0", "4503599627370497"}, cfg, positional), std::invalid_argument);
    EXPECT_THROW(parse({"--seed", "-4"}, cfg, positional), std::invalid_argument);
    EXPECT_THROW(parse({"--frobnicate"}, cfg, positional), std::invalid_argument);
}
