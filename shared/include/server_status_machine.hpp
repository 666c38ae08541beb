#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "log_event_parser.hpp"
#include "server_status.hpp"

namespace srvkeeper {

struct StatusTransition {
    ServerStatus previous;
    ServerStatus current;
    bool changed = false;
    // False for transitions that are accepted silently (rejected candidates, startup
    // reconciliation, the first Online of a server that was already up).
    bool notify = false;
};

// Owns the canonical ServerStatus. Stale or out-of-order log evidence never moves the status below
// the highest kind reached, except for the ShuttingDown and Offline overrides.
class ServerStatusMachine {
  public:
    ServerStatusMachine(PerformanceThresholds thresholds, std::chrono::seconds startup_grace);

    StatusTransition Apply(const LogEvent &event);

    // Seeds the status once at orchestrator start. A process the controller reports as stopped is
    // Offline no matter what the log tail claims.
    StatusTransition Reconcile(const std::vector<std::string> &recent_log_tail, bool controller_is_running,
                               TimePoint now);

    // Forgets the high-water mark. Called when the managed process is (re)started.
    void ResetHighWaterMark();

    // Forced transition issued by the orchestrator when the controller contradicts the log
    // (process gone without an exit marker).
    StatusTransition ForceOffline(TimePoint now, const std::string &message);

    const ServerStatus &Status() const { return status_; }

  private:
    bool accepts(StatusKind candidate) const;
    void fold(const LogEvent &event);

    PerformanceThresholds thresholds_;
    std::chrono::seconds startup_grace_;
    LogEventParser parser_;
    ServerStatus status_;
    std::optional<TimePoint> quiet_online_until_;
};

}  // namespace srvkeeper
