#include "auto_recovery_controller.hpp"

#include <chrono>
#include <iostream>

namespace {
using namespace srvkeeper;
using std::chrono::minutes;

class FakeEvidence : public IntentionalStopEvidence {
  public:
    bool Assess(const std::string &, std::chrono::minutes) override {
        ++calls;
        return intentional;
    }

    bool intentional = false;
    int calls = 0;
};

bool cooldown_and_cap() {
    FakeEvidence evidence;
    AutoRecoveryController controller(minutes(2), 3, evidence, "game.service", minutes(10));
    const auto start = Clock::now();

    struct Step {
        int minute;
        RecoveryAction action;
        RecoveryHold hold;
    };
    const Step steps[] = {
        {0, RecoveryAction::Restart, RecoveryHold::None},
        {1, RecoveryAction::None, RecoveryHold::Cooldown},
        {2, RecoveryAction::Restart, RecoveryHold::None},
        {3, RecoveryAction::None, RecoveryHold::Cooldown},
        {4, RecoveryAction::Restart, RecoveryHold::None},
        {6, RecoveryAction::None, RecoveryHold::AttemptsExhausted},
        {30, RecoveryAction::None, RecoveryHold::AttemptsExhausted},
    };
    for (const auto &step : steps) {
        auto decision = controller.Tick(start + minutes(step.minute), false, StatusKind::Offline);
        if (decision.action != step.action || decision.hold != step.hold) {
            std::cerr << "Unexpected recovery decision at minute " << step.minute << " (hold "
                      << ToString(decision.hold) << ")\n";
            return false;
        }
    }
    if (controller.State().consecutive_attempts != 3 || evidence.calls != 3) {
        std::cerr << "Expected three attempts, each after consulting the evidence\n";
        return false;
    }

    // Running but not yet Online keeps the counters.
    controller.Tick(start + minutes(31), true, StatusKind::Starting);
    if (controller.State().consecutive_attempts != 3) {
        std::cerr << "Counters must survive until Online\n";
        return false;
    }
    auto online = controller.Tick(start + minutes(32), true, StatusKind::Online);
    if (online.hold != RecoveryHold::Running || controller.State().consecutive_attempts != 0 ||
        controller.State().last_attempt_at) {
        std::cerr << "Online should reset the counters\n";
        return false;
    }
    if (controller.Tick(start + minutes(33), false, StatusKind::Offline).action != RecoveryAction::Restart) {
        std::cerr << "A fresh crash after recovery should restart immediately\n";
        return false;
    }
    return true;
}

bool intentional_stop_is_respected() {
    FakeEvidence evidence;
    evidence.intentional = true;
    AutoRecoveryController controller(minutes(2), 3, evidence, "game.service", minutes(10));
    const auto start = Clock::now();

    auto first = controller.Tick(start, false, StatusKind::Offline);
    if (first.action != RecoveryAction::None || first.hold != RecoveryHold::IntentionalStop ||
        !first.stop_classified_intentional || !controller.State().intentionally_stopped) {
        std::cerr << "Intentional stop not recognised\n";
        return false;
    }
    auto second = controller.Tick(start + minutes(10), false, StatusKind::Offline);
    if (second.hold != RecoveryHold::IntentionalStop || second.stop_classified_intentional || evidence.calls != 1) {
        std::cerr << "Intentional stop should hold without asking again\n";
        return false;
    }

    controller.ClearIntentionalStop();
    evidence.intentional = false;
    if (controller.Tick(start + minutes(11), false, StatusKind::Offline).action != RecoveryAction::Restart) {
        std::cerr << "Clearing the flag should allow recovery\n";
        return false;
    }

    controller.MarkIntentionalStop();
    auto marked = controller.Tick(start + minutes(20), false, StatusKind::Offline);
    if (marked.action != RecoveryAction::None || marked.hold != RecoveryHold::IntentionalStop ||
        controller.State().consecutive_attempts != 0) {
        std::cerr << "MarkIntentionalStop should hold and reset attempts\n";
        return false;
    }
    auto running = controller.Tick(start + minutes(21), true, StatusKind::Online);
    if (running.hold != RecoveryHold::Running || controller.State().intentionally_stopped) {
        std::cerr << "Confirmed Online should clear the intentional flag\n";
        return false;
    }
    return true;
}

bool requested_start_outranks_old_stop_evidence() {
    FakeEvidence evidence;
    AutoRecoveryController controller(minutes(2), 3, evidence, "game.service", minutes(10));
    const auto start = Clock::now();

    controller.MarkIntentionalStop();
    // Start requested after the stop; the journal still shows the stop job.
    controller.ClearIntentionalStop();
    evidence.intentional = true;
    auto retry = controller.Tick(start, false, StatusKind::Offline);
    if (retry.action != RecoveryAction::Restart || evidence.calls != 0 || controller.State().intentionally_stopped) {
        std::cerr << "A requested start that never came up should be retried\n";
        return false;
    }

    // Once the process has been seen running, a later stop is judged on the evidence again.
    controller.Tick(start + minutes(1), true, StatusKind::Starting);
    auto stopped = controller.Tick(start + minutes(5), false, StatusKind::Offline);
    if (!stopped.stop_classified_intentional || evidence.calls != 1) {
        std::cerr << "Evidence should be consulted after the process ran\n";
        return false;
    }
    return true;
}
}

int main() {
    if (!cooldown_and_cap() || !intentional_stop_is_respected() || !requested_start_outranks_old_stop_evidence()) {
        return 1;
    }
    return 0;
}
