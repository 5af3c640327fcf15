#include "log.hpp"
#include "civil_time.hpp"
#include "churn_errors.hpp"
#include "churn_pipeline.hpp"
#include "refresh_gate.hpp"
#include "scorer_config.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <string>
#include <vector>


// Platform banner
#if defined(_WIN32)
  #define CHURN_PLATFORM "windows"
#elif defined(__APPLE__)
  #define CHURN_PLATFORM "macos"
#elif defined(__linux__)
  #define CHURN_PLATFORM "linux"
#else
  #define CHURN_PLATFORM "unknown"
#endif

static std::string createdOnStamp() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

// Returns false only when the refresh was due and failed.
static bool runRefreshGate(const ScorerConfig& CFG) {
  if (CFG.skip_sp) {
    Log::write(LogLevel::Info, "Stored procedure skipped: %s.%s (--skip-sp)",
               CFG.sp_schema.c_str(), CFG.sp_name.c_str());
    return true;
  }

  const RefreshTarget target{CFG.server, CFG.database, CFG.sp_schema, CFG.sp_name};
  RefreshPolicy policy;
  policy.ttl = std::chrono::hours(CFG.sp_ttl_hours);
  ShellRefreshExecutor executor(CFG.refresh_cmd);

  // read-modify-write: whole state in, whole state out
  const GateState state = GateState::load(CFG.state_path);
  GateOutcome res = maybeRunRefresh(state, target, executor, policy, GateClock::now(), CFG.force_sp);
  if (res.stateChanged()) {
    try {
      res.state.save(CFG.state_path);
    } catch (const ChurnError& e) {
      Log::write(LogLevel::Warn, "%s (next run will refresh again)", e.what());
    }
  }

  Log::write(res.status == GateStatus::Failed ? LogLevel::Error : LogLevel::Info,
             "Stored procedure %s: %s.%s (%s)", gateStatusName(res.status),
             CFG.sp_schema.c_str(), CFG.sp_name.c_str(), res.reason.c_str());
  return res.status != GateStatus::Failed;
}

static void scoreCustomers(const ScorerConfig& CFG) {
  // --- 1) Load and shape records ---
  RecordTable records = loadRecordCsv(CFG.input_path, CFG.top);
  if (!CFG.as_of.empty()) {
    records = filterByDate(records, CFG.as_of);
    Log::write(LogLevel::Info, "Kept %zu rows with as_of_date=%s", records.size(), CFG.as_of.c_str());
  }
  if (!CFG.keep_all_rows) {
    const size_t before = records.size();
    records = dedupeLatestPerCustomer(records);
    Log::write(LogLevel::Info, "Deduplicated to latest snapshot per customer: %zu -> %zu rows",
               before, records.size());
  }
  if (records.size() == 0) {
    Log::write(LogLevel::Warn, "No records to score");
    return;
  }

  // --- 2) Score ---
  ScoringOptions opts;
  opts.target_col = CFG.target_col;
  opts.today = CFG.today.empty() ? todayLocalDay() : *parseIsoDate(CFG.today);
  opts.explain.use_attribution = CFG.use_attribution;
  const std::vector<PredictionRow> rows = scoreRecords(records, opts);

  // --- 3) Metrics ---
  int predicted = 0, churned_now = 0;
  for (const auto& r : rows) { predicted += r.predicted; churned_now += r.business_churn_now; }
  Log::write(LogLevel::Info, "Predicted %d of %zu customers to churn; business rule flags %d as churned now",
             predicted, rows.size(), churned_now);
  if (!rows.empty() && rows.front().has_actual) {
    const EvalSummary ev = summarize(rows);
    Log::write(LogLevel::Info, "In-sample eval: TP=%d FP=%d FN=%d TN=%d | precision=%.2f recall=%.2f",
               ev.tp, ev.fp, ev.fn, ev.tn, ev.precision(), ev.recall());
  }

  // --- 4) Write predictions ---
  const std::string out = CFG.resolvedOutputPath();
  if (!writePredictionsCsv(out, rows, CFG.headers, createdOnStamp())) {
    throw InputError("Could not write predictions to " + out);
  }
}

int main(int argc, char** argv) {
  ScorerConfig CFG;
  try {
    CFG = parseArgs(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const InputError& e) {
    std::fprintf(stderr, "%s\n%s", e.what(), usageText());
    return 2;
  }
  if (CFG.help) { std::fputs(usageText(), stdout); return 0; }

  Log::init(CFG.log_dir, Log::runFileName("churn_run"));
  Log::setQuiet(CFG.quiet);
  Log::write(LogLevel::Info, "Churn scorer starting | platform=%s | build=%s %s",
             CHURN_PLATFORM, __DATE__, __TIME__);

  try {
    validateConfig(CFG);
    if (!runRefreshGate(CFG)) {
      Log::write(LogLevel::Warn, "Continuing with data from the last successful refresh");
    }
    scoreCustomers(CFG);
  } catch (const InputError& e) {
    Log::write(LogLevel::Error, "%s", e.what());
    return 2;
  } catch (const ChurnError& e) {
    Log::write(LogLevel::Error, "Scoring run aborted: %s", e.what());
    return 1;
  } catch (const std::exception& e) {
    Log::write(LogLevel::Error, "Unexpected error: %s", e.what());
    return 1;
  }
  Log::write(LogLevel::Info, "Churn scorer done");
  return 0;
}
