#include "auto_recovery_controller.hpp"

namespace srvkeeper {

const char *ToString(RecoveryHold hold) {
    switch (hold) {
        case RecoveryHold::None:
            return "none";
        case RecoveryHold::Running:
            return "running";
        case RecoveryHold::IntentionalStop:
            return "intentional_stop";
        case RecoveryHold::Cooldown:
            return "cooldown";
        case RecoveryHold::AttemptsExhausted:
            return "attempts_exhausted";
    }
    return "none";
}

AutoRecoveryController::AutoRecoveryController(std::chrono::minutes cooldown, int max_attempts,
                                               IntentionalStopEvidence &evidence, std::string service_name,
                                               std::chrono::minutes evidence_window)
    : evidence_(evidence), service_name_(std::move(service_name)), evidence_window_(evidence_window) {
    state_.cooldown = cooldown;
    state_.max_attempts = max_attempts;
}

void AutoRecoveryController::reset_attempts() {
    state_.consecutive_attempts = 0;
    state_.last_attempt_at.reset();
}

RecoveryDecision AutoRecoveryController::Tick(TimePoint now, bool controller_is_running, StatusKind status) {
    RecoveryDecision decision;
    if (controller_is_running) {
        state_.start_requested = false;
        decision.hold = RecoveryHold::Running;
        if (status == StatusKind::Online) {
            reset_attempts();
            state_.intentionally_stopped = false;
        }
        return decision;
    }
    if (state_.intentionally_stopped) {
        decision.hold = RecoveryHold::IntentionalStop;
        return decision;
    }
    if (state_.consecutive_attempts >= state_.max_attempts) {
        decision.hold = RecoveryHold::AttemptsExhausted;
        return decision;
    }
    if (state_.last_attempt_at && now - *state_.last_attempt_at < state_.cooldown) {
        decision.hold = RecoveryHold::Cooldown;
        return decision;
    }

    if (!state_.start_requested && evidence_.Assess(service_name_, evidence_window_)) {
        state_.intentionally_stopped = true;
        reset_attempts();
        decision.hold = RecoveryHold::IntentionalStop;
        decision.stop_classified_intentional = true;
        return decision;
    }

    ++state_.consecutive_attempts;
    state_.last_attempt_at = now;
    decision.action = RecoveryAction::Restart;
    return decision;
}

void AutoRecoveryController::MarkIntentionalStop() {
    state_.intentionally_stopped = true;
    state_.start_requested = false;
    reset_attempts();
}

void AutoRecoveryController::ClearIntentionalStop() {
    state_.intentionally_stopped = false;
    state_.start_requested = true;
}

}  // namespace srvkeeper
