#include "refresh_gate.hpp"
#include "civil_time.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <stdexcept>

namespace {

struct FakeExecutor : RefreshExecutor {
  bool ok = true;
  bool throws = false;
  int calls = 0;
  bool execute(const RefreshTarget&) override {
    ++calls;
    if (throws) throw std::runtime_error("connection reset");
    return ok;
  }
};

const RefreshTarget kTarget{"SQL01", "Sales", "dbo", "sp_build_customer_churn_cadence_v1"};

GateClock::time_point at(const char* iso) { return *parseIsoTimestamp(iso); }

}  // namespace

TEST(RefreshGate, KeyIgnoresCase) {
  RefreshTarget upper{"SQL01", "SALES", "DBO", "SP_BUILD"};
  RefreshTarget lower{"sql01", "sales", "dbo", "sp_build"};
  EXPECT_EQ(gateKey(upper), gateKey(lower));
  EXPECT_EQ(gateKey(lower), "sql01|sales|dbo|sp_build");
  EXPECT_NE(gateKey(lower), gateKey(RefreshTarget{"sql02", "sales", "dbo", "sp_build"}));
}

TEST(RefreshGate, TtlSequence) {
  FakeExecutor exec;
  RefreshPolicy policy;  // 24h
  const auto t0 = at("2025-01-01T00:00:00Z");

  GateOutcome first = maybeRunRefresh(GateState{}, kTarget, exec, policy, t0, false);
  EXPECT_EQ(first.status, GateStatus::Executed);
  EXPECT_EQ(first.reason, "first_run");
  ASSERT_TRUE(first.state.lastRun(gateKey(kTarget)).has_value());
  EXPECT_EQ(*first.state.lastRun(gateKey(kTarget)), t0);

  GateOutcome again = maybeRunRefresh(first.state, kTarget, exec, policy, t0 + std::chrono::minutes(5), false);
  EXPECT_EQ(again.status, GateStatus::Skipped);
  EXPECT_EQ(again.reason.rfind("recent", 0), 0u);
  EXPECT_FALSE(again.stateChanged());
  EXPECT_EQ(exec.calls, 1);

  const auto later = t0 + std::chrono::hours(24);
  GateOutcome expired = maybeRunRefresh(again.state, kTarget, exec, policy, later, false);
  EXPECT_EQ(expired.status, GateStatus::Executed);
  EXPECT_EQ(expired.reason, "ttl_expired");
  EXPECT_EQ(*expired.state.lastRun(gateKey(kTarget)), later);
  EXPECT_EQ(exec.calls, 2);
}

TEST(RefreshGate, ForceAlwaysRuns) {
  FakeExecutor exec;
  const auto t0 = at("2025-01-01T00:00:00Z");
  GateState state = GateState{}.withRun(gateKey(kTarget), t0);

  GateOutcome out = maybeRunRefresh(state, kTarget, exec, RefreshPolicy{}, t0 + std::chrono::seconds(1), true);
  EXPECT_EQ(out.status, GateStatus::Executed);
  EXPECT_EQ(out.reason, "forced");
  EXPECT_EQ(exec.calls, 1);
}

TEST(RefreshGate, FailedExecutionDoesNotAdvanceState) {
  FakeExecutor exec;
  exec.ok = false;
  GateOutcome out = maybeRunRefresh(GateState{}, kTarget, exec, RefreshPolicy{}, at("2025-01-01T00:00:00Z"), false);
  EXPECT_EQ(out.status, GateStatus::Failed);
  EXPECT_FALSE(out.stateChanged());
  EXPECT_FALSE(out.state.lastRun(gateKey(kTarget)).has_value());

  exec.throws = true;
  GateOutcome thrown = maybeRunRefresh(GateState{}, kTarget, exec, RefreshPolicy{}, at("2025-01-01T00:00:00Z"), true);
  EXPECT_EQ(thrown.status, GateStatus::Failed);
  EXPECT_NE(thrown.reason.find("connection reset"), std::string::npos);
  EXPECT_EQ(thrown.state.size(), 0u);
}

TEST(RefreshGate, StateRoundTripsThroughDisk) {
  ScratchDir dir("gate");
  const std::string path = dir.file("nested/sp_runs.json");
  const auto t0 = at("2025-02-03T04:05:06.789000+00:00");

  GateState s = GateState{}.withRun("a|b|c|d", t0).withRun(gateKey(kTarget), t0 + std::chrono::hours(1));
  s.save(path);

  GateState loaded = GateState::load(path);
  EXPECT_EQ(loaded.size(), 2u);
  EXPECT_EQ(*loaded.lastRun("a|b|c|d"), t0);
  EXPECT_EQ(loaded.toJson(), s.toJson());
}

TEST(RefreshGate, CorruptStoreReadsAsEmpty) {
  ScratchDir dir("gate_corrupt");
  const std::string path = dir.file("sp_runs.json");
  {
    std::ofstream f(path);
    f << "{ not json";
  }
  EXPECT_EQ(GateState::load(path).size(), 0u);
  {
    std::ofstream f(path, std::ios::trunc);
    f << "[1, 2, 3]";
  }
  EXPECT_EQ(GateState::load(path).size(), 0u);
  EXPECT_EQ(GateState::load(dir.file("absent.json")).size(), 0u);
}

TEST(RefreshGate, UnparseableTimestampMeansUnknown) {
  GateState s = GateState::fromJson(nlohmann::json{{"x|y|z|w", "yesterday-ish"}, {"n|u|m|b", 5}});
  EXPECT_EQ(s.size(), 1u);
  EXPECT_FALSE(s.lastRun("x|y|z|w").has_value());

  GateDecision d = decideRefresh(s, "x|y|z|w", at("2025-01-01T00:00:00Z"), RefreshPolicy{}, false);
  EXPECT_TRUE(d.run);
  EXPECT_EQ(d.reason, "first_run");
}

TEST(RefreshGate, ReadsPythonStyleTimestamps) {
  GateState s = GateState::fromJson(
      nlohmann::json{{"sql01|sales|dbo|sp", "2025-01-01T10:00:00.123456+00:00"}});
  RefreshPolicy policy;
  policy.ttl = std::chrono::hours(2);
  EXPECT_FALSE(decideRefresh(s, "sql01|sales|dbo|sp", at("2025-01-01T11:59:59Z"), policy, false).run);
  EXPECT_TRUE(decideRefresh(s, "sql01|sales|dbo|sp", at("2025-01-01T12:00:01Z"), policy, false).run);
}

TEST(RefreshGate, LongTtlSkipsInsideWindow) {
  const auto t0 = at("2025-01-01T00:00:00Z");
  GateState s = GateState{}.withRun(gateKey(kTarget), t0);
  RefreshPolicy policy;
  policy.ttl = std::chrono::hours(2000000);
  EXPECT_FALSE(decideRefresh(s, gateKey(kTarget), t0 + std::chrono::minutes(5), policy, false).run);
  EXPECT_FALSE(decideRefresh(s, gateKey(kTarget), t0 + std::chrono::hours(24 * 365), policy, false).run);

  // clock stepped backwards
  policy.ttl = std::chrono::hours(0);
  EXPECT_FALSE(decideRefresh(s, gateKey(kTarget), t0 - std::chrono::minutes(5), policy, false).run);
  EXPECT_TRUE(decideRefresh(s, gateKey(kTarget), t0, policy, false).run);
}

TEST(RefreshGate, FarFutureOrPastStampMeansUnknown) {
  GateState s = GateState::fromJson(nlohmann::json{{"a|b|c|d", "0001-01-01T00:00:00+00:00"}});
  EXPECT_FALSE(s.lastRun("a|b|c|d").has_value());
  EXPECT_TRUE(decideRefresh(s, "a|b|c|d", at("2025-01-01T00:00:00Z"), RefreshPolicy{}, false).run);
}

TEST(ShellExecutor, SubstitutesPlaceholdersAndReportsExitStatus) {
  ShellRefreshExecutor exec("run {server}/{database} {schema}.{procedure}");
  EXPECT_EQ(exec.commandFor(kTarget), "run SQL01/Sales dbo.sp_build_customer_churn_cadence_v1");

  ShellRefreshExecutor ok("exit 0");
  EXPECT_TRUE(ok.execute(kTarget));
  ShellRefreshExecutor bad("exit 3");
  EXPECT_FALSE(bad.execute(kTarget));
  ShellRefreshExecutor none("");
  EXPECT_FALSE(none.execute(kTarget));
}
