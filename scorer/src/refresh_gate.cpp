#include "refresh_gate.hpp"
#include "churn_errors.hpp"
#include "civil_time.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <utility>

using json = nlohmann::json;

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string gateKey(const RefreshTarget& t) {
  return lower(t.server) + "|" + lower(t.database) + "|" + lower(t.schema) + "|" + lower(t.procedure);
}

// ---------- executor ----------

ShellRefreshExecutor::ShellRefreshExecutor(std::string command_template)
    : template_(std::move(command_template)) {}

static void replaceAll(std::string& s, const std::string& from, const std::string& to) {
  for (size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
    s.replace(pos, from.size(), to);
  }
}

std::string ShellRefreshExecutor::commandFor(const RefreshTarget& target) const {
  std::string cmd = template_;
  replaceAll(cmd, "{server}", target.server);
  replaceAll(cmd, "{database}", target.database);
  replaceAll(cmd, "{schema}", target.schema);
  replaceAll(cmd, "{procedure}", target.procedure);
  return cmd;
}

bool ShellRefreshExecutor::execute(const RefreshTarget& target) {
  if (template_.empty()) {
    Log::write(LogLevel::Error, "No refresh command configured (CHURN_REFRESH_CMD) for %s.%s",
               target.schema.c_str(), target.procedure.c_str());
    return false;
  }
  const std::string cmd = commandFor(target);
  Log::write(LogLevel::Info, "Running refresh: %s", cmd.c_str());
  int rc = std::system(cmd.c_str());
  if (rc != 0) {
    Log::write(LogLevel::Error, "Refresh command exited with status %d", rc);
    return false;
  }
  return true;
}

// ---------- persisted state ----------

GateState GateState::fromJson(const json& j) {
  GateState s;
  if (!j.is_object()) throw InputError("gate state must be a JSON object");
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (it.value().is_string()) {
      s.runs_[it.key()] = it.value().get<std::string>();
    } else {
      Log::write(LogLevel::Warn, "Ignoring non-string gate state entry '%s'", it.key().c_str());
    }
  }
  return s;
}

GateState GateState::load(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return GateState{};

  std::ifstream f(path);
  if (!f.is_open()) {
    Log::write(LogLevel::Warn, "Could not open gate state '%s'; treating as empty", path.c_str());
    return GateState{};
  }
  try {
    json j; f >> j;
    return fromJson(j);
  } catch (const json::exception& e) {
    Log::write(LogLevel::Warn, "Gate state '%s' is unreadable (%s); treating as empty", path.c_str(), e.what());
  } catch (const InputError& e) {
    Log::write(LogLevel::Warn, "Gate state '%s' is malformed (%s); treating as empty", path.c_str(), e.what());
  }
  return GateState{};
}

json GateState::toJson() const {
  json j = json::object();
  for (const auto& [key, iso] : runs_) j[key] = iso;
  return j;
}

void GateState::save(const std::string& path) const {
  const std::filesystem::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
  std::ofstream f(path, std::ios::trunc);
  if (!f.is_open()) throw ChurnError("Could not write gate state: " + path);
  f << toJson().dump(2) << "\n";
  if (!f) throw ChurnError("Failed writing gate state: " + path);
}

std::optional<GateClock::time_point> GateState::lastRun(const std::string& key) const {
  auto it = runs_.find(key);
  if (it == runs_.end()) return std::nullopt;
  return parseIsoTimestamp(it->second);
}

GateState GateState::withRun(const std::string& key, GateClock::time_point when) const {
  GateState next = *this;
  next.runs_[key] = formatIsoTimestamp(when);
  return next;
}

// ---------- decision ----------

GateDecision decideRefresh(const GateState& state, const std::string& key,
                           GateClock::time_point now, const RefreshPolicy& policy, bool force) {
  GateDecision d;
  d.last_run = state.lastRun(key);
  if (force) {
    d.run = true;
    d.reason = "forced";
  } else if (!d.last_run) {
    d.run = true;
    d.reason = "first_run";
  } else if (now >= *d.last_run &&
             std::chrono::duration_cast<std::chrono::hours>(now - *d.last_run) >= policy.ttl) {
    d.run = true;
    d.reason = "ttl_expired";
  } else {
    d.run = false;
    d.reason = "recent (last run " + formatIsoTimestamp(*d.last_run) + ")";
  }
  return d;
}

GateOutcome maybeRunRefresh(const GateState& state, const RefreshTarget& target,
                            RefreshExecutor& executor, const RefreshPolicy& policy,
                            GateClock::time_point now, bool force) {
  const std::string key = gateKey(target);
  GateDecision d = decideRefresh(state, key, now, policy, force);

  GateOutcome out;
  out.state = state;
  out.reason = d.reason;
  if (!d.run) {
    out.status = GateStatus::Skipped;
    return out;
  }

  bool ok = false;
  try {
    ok = executor.execute(target);
  } catch (const std::exception& e) {
    Log::write(LogLevel::Error, "Refresh executor threw: %s", e.what());
    out.reason = d.reason + "; executor error: " + e.what();
  }
  if (!ok) {
    out.status = GateStatus::Failed;
    if (out.reason == d.reason) out.reason = d.reason + "; execution failed";
    return out;
  }

  out.status = GateStatus::Executed;
  out.state = state.withRun(key, now);
  return out;
}

const char* gateStatusName(GateStatus s) {
  switch (s) {
    case GateStatus::Executed: return "executed";
    case GateStatus::Skipped: return "skipped";
    case GateStatus::Failed: return "failed";
  }
  return "unknown";
}
