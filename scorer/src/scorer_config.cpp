#include "scorer_config.hpp"
#include "churn_errors.hpp"
#include "civil_time.hpp"
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <limits>

// a TTL must stay representable as a system_clock duration
static const long kMaxTtlHours = static_cast<long>(
    std::chrono::duration_cast<std::chrono::hours>(std::chrono::system_clock::duration::max()).count());

static std::string envOr(const char* name, const std::string& fallback) {
  const char* v = std::getenv(name);
  return (v && *v) ? std::string(v) : fallback;
}

static long parseInt(const std::string& flag, const std::string& text, long min_value,
                     long max_value = std::numeric_limits<long>::max()) {
  errno = 0;
  char* end = nullptr;
  long v = std::strtol(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0' || errno == ERANGE || v < min_value || v > max_value) {
    throw InputError("Invalid value for " + flag + ": '" + text + "'");
  }
  return v;
}

std::string ScorerConfig::resolvedOutputPath() const {
  if (!output_path.empty()) return output_path;
  if (top > 0) return "customer_churn_top" + std::to_string(top) + "_predictions.csv";
  return "customer_churn_predictions.csv";
}

ScorerConfig configFromEnv() {
  ScorerConfig cfg;
  cfg.input_path = envOr("CHURN_INPUT", cfg.input_path);
  cfg.state_path = envOr("CHURN_STATE_FILE", cfg.state_path);
  cfg.server = envOr("CHURN_SERVER", "");
  cfg.database = envOr("CHURN_DATABASE", "");
  cfg.refresh_cmd = envOr("CHURN_REFRESH_CMD", "");
  cfg.log_dir = envOr("CHURN_LOG_DIR", cfg.log_dir);
  return cfg;
}

// trivial flag parser: --flag  --key=VALUE
ScorerConfig parseArgs(const std::vector<std::string>& args, ScorerConfig cfg) {
  for (const auto& a : args) {
    auto value = [&](const char* prefix) -> const char* {
      size_t n = std::char_traits<char>::length(prefix);
      return a.rfind(prefix, 0) == 0 ? a.c_str() + n : nullptr;
    };
    const char* v = nullptr;
    if (a == "--quiet") cfg.quiet = true;
    else if (a == "--keep-all-rows") cfg.keep_all_rows = true;
    else if (a == "--no-attribution") cfg.use_attribution = false;
    else if (a == "--force-sp") cfg.force_sp = true;
    else if (a == "--skip-sp") cfg.skip_sp = true;
    else if (a == "--help" || a == "-h") cfg.help = true;
    else if ((v = value("--input="))) cfg.input_path = v;
    else if ((v = value("--output="))) cfg.output_path = v;
    else if ((v = value("--top="))) cfg.top = static_cast<size_t>(parseInt("--top", v, 0));
    else if ((v = value("--target-col="))) cfg.target_col = v;
    else if ((v = value("--headers="))) {
      std::string h = v;
      if (h == "friendly") cfg.headers = HeaderStyle::Friendly;
      else if (h == "technical") cfg.headers = HeaderStyle::Technical;
      else throw InputError("--headers must be 'friendly' or 'technical', got '" + h + "'");
    }
    else if ((v = value("--as-of="))) cfg.as_of = v;
    else if ((v = value("--today="))) cfg.today = v;
    else if ((v = value("--sp-name="))) cfg.sp_name = v;
    else if ((v = value("--sp-schema="))) cfg.sp_schema = v;
    else if ((v = value("--sp-ttl-hours="))) cfg.sp_ttl_hours = static_cast<int>(parseInt("--sp-ttl-hours", v, 0, kMaxTtlHours));
    else if ((v = value("--state="))) cfg.state_path = v;
    else if ((v = value("--log-dir="))) cfg.log_dir = v;
    else throw InputError("Unknown argument: " + a);
  }
  return cfg;
}

void validateConfig(const ScorerConfig& cfg) {
  if (!cfg.skip_sp && (cfg.server.empty() || cfg.database.empty())) {
    throw InputError("CHURN_SERVER and CHURN_DATABASE must be set unless --skip-sp is given");
  }
  if (!cfg.as_of.empty() && !parseIsoDate(cfg.as_of)) {
    throw InputError("--as-of must be YYYY-MM-DD, got '" + cfg.as_of + "'");
  }
  if (!cfg.today.empty() && !parseIsoDate(cfg.today)) {
    throw InputError("--today must be YYYY-MM-DD, got '" + cfg.today + "'");
  }
  if (cfg.target_col.empty()) throw InputError("--target-col must not be empty");
}

const char* usageText() {
  return
    "usage: churn_scorer [options]\n"
    "  --input=PATH            record CSV (CHURN_INPUT, default data/customers.csv)\n"
    "  --output=PATH           predictions CSV\n"
    "  --top=N                 read only the first N records\n"
    "  --target-col=NAME       label column (default churned_hard90)\n"
    "  --headers=STYLE         friendly | technical\n"
    "  --as-of=YYYY-MM-DD      keep only this snapshot date\n"
    "  --keep-all-rows         do not deduplicate by latest snapshot per customer\n"
    "  --today=YYYY-MM-DD      reference date for the business rule\n"
    "  --no-attribution        use weight x value contributions\n"
    "  --sp-name=NAME --sp-schema=NAME --sp-ttl-hours=N --force-sp --skip-sp\n"
    "  --state=PATH            refresh gate state (CHURN_STATE_FILE)\n"
    "  --log-dir=PATH --quiet\n"
    "env: CHURN_SERVER CHURN_DATABASE CHURN_REFRESH_CMD\n";
}
