#include <gtest/gtest.h>
#include "core/ConfigValidator.h"
#include "core/Config.h"

namespace pattern_harness {

class ConfigValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.command = Command::Run;
        cfg.run_all = true;
    }

    Config cfg;
    ConfigValidator validator;
};

TEST_F(ConfigValidatorTest, RunAllIsValid) {
    EXPECT_TRUE(validator.validate(cfg));
    EXPECT_TRUE(validator.error().empty());
}

TEST_F(ConfigValidatorTest, ListIsValid) {
    Config list;
    list.command = Command::List;
    EXPECT_TRUE(validator.validate(list));
}

TEST_F(ConfigValidatorTest, MissingCommand) {
    Config none;
    EXPECT_FALSE(validator.validate(none));
    EXPECT_EQ(validator.error(), "missing command (list or run)");
}

TEST_F(ConfigValidatorTest, RunNeedsExactlyOneTarget) {
    cfg.run_name = "Singleton";
    EXPECT_FALSE(validator.validate(cfg));
    EXPECT_EQ(validator.error(), "--all and --name are mutually exclusive");

    cfg.run_all = false;
    cfg.run_name.clear();
    EXPECT_FALSE(validator.validate(cfg));
    EXPECT_EQ(validator.error(), "run requires --all or --name NAME");
}

TEST_F(ConfigValidatorTest, NameRejectsFilters) {
    cfg.run_all = false;
    cfg.run_name = "Singleton";
    cfg.category = "creational";
    EXPECT_FALSE(validator.validate(cfg));
    EXPECT_EQ(validator.error(), "--name cannot be combined with --enable, --disable or --category");
}

TEST_F(ConfigValidatorTest, ListRejectsRunTargets) {
    cfg.command = Command::List;
    EXPECT_FALSE(validator.validate(cfg));
    EXPECT_EQ(validator.error(), "--all and --name only apply to run");
}

TEST_F(ConfigValidatorTest, FormatChecked) {
    cfg.format = "xml";
    EXPECT_FALSE(validator.validate(cfg));
    EXPECT_EQ(validator.error(), "Invalid --format value: xml");
    cfg.format = "ndjson";
    EXPECT_TRUE(validator.validate(cfg));
}

TEST_F(ConfigValidatorTest, CompactWinsOverPretty) {
    cfg.format = "json";
    cfg.pretty = true;
    cfg.compact = true;
    EXPECT_TRUE(validator.validate(cfg));
    EXPECT_FALSE(cfg.pretty);
    EXPECT_TRUE(cfg.compact);
}

TEST_F(ConfigValidatorTest, CategoryChecked) {
    cfg.category = "Behavioural";
    EXPECT_TRUE(validator.validate(cfg));
    cfg.category = "functional";
    EXPECT_FALSE(validator.validate(cfg));
    EXPECT_EQ(validator.error(), "Invalid --category value: functional");
}

TEST_F(ConfigValidatorTest, NegativeBudgetRejected) {
    cfg.time_budget_ms = -5;
    EXPECT_FALSE(validator.validate(cfg));
    EXPECT_EQ(validator.error(), "--time-budget-ms must not be negative");
}

TEST_F(ConfigValidatorTest, LogLevelChecked) {
    cfg.log_level = "verbose";
    EXPECT_FALSE(validator.validate(cfg));
    EXPECT_EQ(validator.error(), "Invalid --log-level value: verbose");
}

TEST_F(ConfigValidatorTest, EnableDisableOverlap) {
    cfg.enable_examples = {"Singleton", "Proxy"};
    cfg.disable_examples = {"Proxy"};
    EXPECT_FALSE(validator.validate(cfg));
    EXPECT_EQ(validator.error(), "Cannot enable and disable the same example: Proxy");
}

TEST_F(ConfigValidatorTest, NameCharacters) {
    cfg.enable_examples = {std::string("bad\x01name")};
    EXPECT_FALSE(validator.validate(cfg));
    EXPECT_EQ(validator.error(), "--enable: example name contains invalid character");

    cfg.enable_examples.clear();
    cfg.simulate_unavailable = {std::string(300, 'x')};
    EXPECT_FALSE(validator.validate(cfg));
    EXPECT_EQ(validator.error(), "--simulate-unavailable: example name too long");
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
