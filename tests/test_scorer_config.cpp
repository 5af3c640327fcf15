#include "scorer_config.hpp"
#include "churn_errors.hpp"
#include <gtest/gtest.h>

TEST(ScorerConfig, DefaultsMatchTheProductionJob) {
  ScorerConfig cfg;
  EXPECT_EQ(cfg.target_col, "churned_hard90");
  EXPECT_EQ(cfg.sp_name, "sp_build_customer_churn_cadence_v1");
  EXPECT_EQ(cfg.sp_schema, "dbo");
  EXPECT_EQ(cfg.sp_ttl_hours, 24);
  EXPECT_EQ(cfg.state_path, ".state/sp_runs.json");
  EXPECT_EQ(cfg.headers, HeaderStyle::Friendly);
  EXPECT_EQ(cfg.resolvedOutputPath(), "customer_churn_predictions.csv");
}

TEST(ScorerConfig, ParsesFlagsAndValues) {
  ScorerConfig cfg = parseArgs({"--input=in.csv", "--top=50", "--headers=technical", "--as-of=2025-01-31",
                                "--keep-all-rows", "--no-attribution", "--force-sp", "--sp-ttl-hours=6",
                                "--state=/tmp/gate.json", "--quiet"},
                               ScorerConfig{});
  EXPECT_EQ(cfg.input_path, "in.csv");
  EXPECT_EQ(cfg.top, 50u);
  EXPECT_EQ(cfg.headers, HeaderStyle::Technical);
  EXPECT_EQ(cfg.as_of, "2025-01-31");
  EXPECT_TRUE(cfg.keep_all_rows);
  EXPECT_FALSE(cfg.use_attribution);
  EXPECT_TRUE(cfg.force_sp);
  EXPECT_EQ(cfg.sp_ttl_hours, 6);
  EXPECT_EQ(cfg.state_path, "/tmp/gate.json");
  EXPECT_TRUE(cfg.quiet);
  EXPECT_EQ(cfg.resolvedOutputPath(), "customer_churn_top50_predictions.csv");
}

TEST(ScorerConfig, RejectsBadInput) {
  EXPECT_THROW(parseArgs({"--bogus"}, ScorerConfig{}), InputError);
  EXPECT_THROW(parseArgs({"--headers=fancy"}, ScorerConfig{}), InputError);
  EXPECT_THROW(parseArgs({"--top=ten"}, ScorerConfig{}), InputError);
  EXPECT_THROW(parseArgs({"--sp-ttl-hours=-1"}, ScorerConfig{}), InputError);
}

TEST(ScorerConfig, TtlHoursCappedToClockRange) {
  EXPECT_THROW(parseArgs({"--sp-ttl-hours=4294967296"}, ScorerConfig{}), InputError);
  EXPECT_THROW(parseArgs({"--sp-ttl-hours=3000000"}, ScorerConfig{}), InputError);
  EXPECT_THROW(parseArgs({"--sp-ttl-hours=99999999999999999999"}, ScorerConfig{}), InputError);
  EXPECT_EQ(parseArgs({"--sp-ttl-hours=2000000"}, ScorerConfig{}).sp_ttl_hours, 2000000);
}

TEST(ScorerConfig, GateTargetRequiredUnlessSkipped) {
  ScorerConfig cfg;
  EXPECT_THROW(validateConfig(cfg), InputError);
  cfg.skip_sp = true;
  EXPECT_NO_THROW(validateConfig(cfg));

  cfg.skip_sp = false;
  cfg.server = "sql01";
  cfg.database = "sales";
  EXPECT_NO_THROW(validateConfig(cfg));
  cfg.today = "2025-02-30";
  EXPECT_THROW(validateConfig(cfg), InputError);
}
