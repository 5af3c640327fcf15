#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

using GateClock = std::chrono::system_clock;

// Upstream procedure whose output the scorer reads.
struct RefreshTarget {
  std::string server;
  std::string database;
  std::string schema;
  std::string procedure;
};

// Lower-cased "server|database|schema|procedure".
std::string gateKey(const RefreshTarget& target);

// Runs the upstream refresh. Returns false on failure; the gate never retries.
class RefreshExecutor {
 public:
  virtual ~RefreshExecutor() = default;
  virtual bool execute(const RefreshTarget& target) = 0;
};

// Runs a shell command built from a template with {server}, {database},
// {schema} and {procedure} placeholders. Success is exit status 0.
class ShellRefreshExecutor : public RefreshExecutor {
 public:
  explicit ShellRefreshExecutor(std::string command_template);
  std::string commandFor(const RefreshTarget& target) const;
  bool execute(const RefreshTarget& target) override;

 private:
  std::string template_;
};

// Key -> last successful run (ISO-8601 UTC). Value type: copies are cheap and
// every change produces a new state that the caller writes back.
class GateState {
 public:
  // Missing file -> empty. Unreadable or malformed file -> empty plus a warning.
  static GateState load(const std::string& path);
  // Throws InputError unless j is an object.
  static GateState fromJson(const nlohmann::json& j);

  // Writes the whole map. Throws ChurnError if the file cannot be written.
  void save(const std::string& path) const;
  nlohmann::json toJson() const;

  // nullopt when the key has no entry or its timestamp does not parse.
  std::optional<GateClock::time_point> lastRun(const std::string& key) const;
  GateState withRun(const std::string& key, GateClock::time_point when) const;
  std::size_t size() const { return runs_.size(); }

 private:
  std::map<std::string, std::string> runs_;
};

struct RefreshPolicy {
  std::chrono::hours ttl{24};
};

struct GateDecision {
  bool run{};
  std::string reason;  // "forced", "first_run", "ttl_expired" or "recent (last run ...)"
  std::optional<GateClock::time_point> last_run;
};

GateDecision decideRefresh(const GateState& state, const std::string& key,
                           GateClock::time_point now, const RefreshPolicy& policy, bool force);

enum class GateStatus { Executed, Skipped, Failed };

struct GateOutcome {
  GateStatus status{GateStatus::Skipped};
  std::string reason;
  GateState state;     // advanced only when status == Executed
  bool stateChanged() const { return status == GateStatus::Executed; }
};

// Decides, executes when due, and returns the next state. Executor failures
// (false or an exception) come back as GateStatus::Failed with the old state.
GateOutcome maybeRunRefresh(const GateState& state, const RefreshTarget& target,
                            RefreshExecutor& executor, const RefreshPolicy& policy,
                            GateClock::time_point now, bool force);

const char* gateStatusName(GateStatus s);
