#include "config/Settings.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace opm::config;

namespace {

void clear_opm_env() {
    unsetenv("OPM_ENV");
    unsetenv("OPM_PRETTY_OUTPUT");
    unsetenv("OPM_STOP_ON_ERROR");
    unsetenv("OPM_VERBOSE");
    unsetenv("OPM_STATS_INTERVAL");
}

} // namespace

TEST(Settings, DefaultsAreReasonable) {
    Settings s;
    EXPECT_FALSE(s.output.pretty);
    EXPECT_FALSE(s.calculator.stop_on_error);
    EXPECT_FALSE(s.calculator.verbose);
    EXPECT_EQ(s.calculator.stats_interval, 0);
}

TEST(Settings, FromEnvironmentDefaultsToDevelopment) {
    clear_opm_env();

    auto s = Settings::from_environment();
    auto dev = Settings::development();
    EXPECT_EQ(s.output.pretty, dev.output.pretty);
    EXPECT_EQ(s.calculator.verbose, dev.calculator.verbose);
    EXPECT_EQ(s.calculator.stats_interval, dev.calculator.stats_interval);
    EXPECT_EQ(s.calculator.stop_on_error, dev.calculator.stop_on_error);
}

TEST(Settings, FromEnvironmentSelectsProductionPreset) {
    clear_opm_env();
    setenv("OPM_ENV", "production", 1);

    auto s = Settings::from_environment();
    EXPECT_TRUE(s.calculator.stop_on_error);
    EXPECT_FALSE(s.calculator.verbose);
    EXPECT_EQ(s.calculator.stats_interval, Settings::production().calculator.stats_interval);

    clear_opm_env();
}

TEST(Settings, FromEnvironmentReadsEnvVars) {
    clear_opm_env();
    setenv("OPM_PRETTY_OUTPUT", "true", 1);
    setenv("OPM_STOP_ON_ERROR", "1", 1);
    setenv("OPM_VERBOSE", "false", 1);
    setenv("OPM_STATS_INTERVAL", "25", 1);

    auto s = Settings::from_environment();
    EXPECT_TRUE(s.output.pretty);
    EXPECT_TRUE(s.calculator.stop_on_error);
    EXPECT_FALSE(s.calculator.verbose);
    EXPECT_EQ(s.calculator.stats_interval, 25);

    clear_opm_env();
}

TEST(Settings, FromEnvironmentHandlesInvalidValues) {
    clear_opm_env();
    setenv("OPM_STATS_INTERVAL", "not_a_number", 1);
    setenv("OPM_VERBOSE", "maybe", 1);

    auto s = Settings::from_environment();
    EXPECT_EQ(s.calculator.stats_interval, 100);  // Falls back to dev preset
    EXPECT_TRUE(s.calculator.verbose);

    clear_opm_env();
}

TEST(Settings, DevelopmentPreset) {
    auto s = Settings::development();
    EXPECT_TRUE(s.calculator.verbose);
    EXPECT_FALSE(s.calculator.stop_on_error);
    EXPECT_EQ(s.calculator.stats_interval, 100);
}

TEST(Settings, ProductionPreset) {
    auto s = Settings::production();
    EXPECT_FALSE(s.calculator.verbose);
    EXPECT_TRUE(s.calculator.stop_on_error);
    EXPECT_EQ(s.calculator.stats_interval, 10000);
    EXPECT_FALSE(s.output.pretty);
}
