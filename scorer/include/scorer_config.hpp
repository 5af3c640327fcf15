#pragma once
#include <cstddef>
#include <string>
#include <vector>

enum class HeaderStyle { Friendly, Technical };

struct ScorerConfig {
  std::string input_path = "data/customers.csv";
  std::string output_path;            // empty: derived from top
  std::size_t top = 0;                // 0 = all rows
  std::string target_col = "churned_hard90";
  HeaderStyle headers = HeaderStyle::Friendly;
  std::string as_of;                  // YYYY-MM-DD filter, empty = none
  bool keep_all_rows = false;
  std::string today;                  // business-rule reference date, empty = local today
  bool use_attribution = true;

  // refresh gate
  std::string server;
  std::string database;
  std::string sp_name = "sp_build_customer_churn_cadence_v1";
  std::string sp_schema = "dbo";
  int sp_ttl_hours = 24;
  bool force_sp = false;
  bool skip_sp = false;
  std::string state_path = ".state/sp_runs.json";
  std::string refresh_cmd;

  std::string log_dir = "./logs";
  bool quiet = false;
  bool help = false;

  std::string resolvedOutputPath() const;
};

// Defaults from CHURN_* environment variables.
ScorerConfig configFromEnv();

// Flags: --quiet --keep-all-rows --no-attribution --force-sp --skip-sp --help
//        --input= --output= --top= --target-col= --headers=friendly|technical
//        --as-of= --today= --sp-name= --sp-schema= --sp-ttl-hours= --state= --log-dir=
// Throws InputError on unknown flags or bad values.
ScorerConfig parseArgs(const std::vector<std::string>& args, ScorerConfig cfg = configFromEnv());

// Cross-field checks (gate target present unless --skip-sp, dates parse).
void validateConfig(const ScorerConfig& cfg);

const char* usageText();
