#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "collaborators.hpp"
#include "server_status.hpp"

namespace srvkeeper {

struct RecoveryState {
    int consecutive_attempts = 0;
    std::optional<TimePoint> last_attempt_at;
    std::chrono::minutes cooldown{5};
    int max_attempts = 3;
    bool intentionally_stopped = false;
    // A start was requested after the last stop. Stop evidence predates the request, so it is not
    // consulted until the process has been seen running again.
    bool start_requested = false;
};

enum class RecoveryAction { None, Restart };

enum class RecoveryHold { None, Running, IntentionalStop, Cooldown, AttemptsExhausted };

const char *ToString(RecoveryHold hold);

struct RecoveryDecision {
    RecoveryAction action = RecoveryAction::None;
    RecoveryHold hold = RecoveryHold::None;
    // Set when this tick classified the stop as intentional.
    bool stop_classified_intentional = false;
};

// Restarts a managed process that should be running but is not, with a cooldown between attempts
// and a cap on consecutive attempts. A stop that evidence attributes to an operator is left alone.
class AutoRecoveryController {
  public:
    AutoRecoveryController(std::chrono::minutes cooldown, int max_attempts, IntentionalStopEvidence &evidence,
                           std::string service_name, std::chrono::minutes evidence_window);

    RecoveryDecision Tick(TimePoint now, bool controller_is_running, StatusKind status);

    // The orchestrator stopped the process itself.
    void MarkIntentionalStop();
    // An operator, or the orchestrator itself, wants the process running again.
    void ClearIntentionalStop();

    const RecoveryState &State() const { return state_; }

  private:
    void reset_attempts();

    RecoveryState state_;
    IntentionalStopEvidence &evidence_;
    std::string service_name_;
    std::chrono::minutes evidence_window_;
};

}  // namespace srvkeeper
