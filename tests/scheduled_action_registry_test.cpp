#include "scheduled_action_registry.hpp"

#include <chrono>
#include <iostream>
#include <vector>

namespace {
using namespace srvkeeper;
using std::chrono::minutes;
using std::chrono::seconds;

// Ticks every 10 seconds from scheduling to execution and returns the warnings in firing order.
std::vector<int> warnings_for_delay(int delay_minutes, bool &executed_once) {
    ScheduledActionRegistry registry;
    const auto start = Clock::now();
    registry.Schedule(ActionKind::Restart, minutes(delay_minutes), start, "test");
    std::vector<int> fired;
    int executions = 0;
    for (auto now = start; now <= start + minutes(delay_minutes) + minutes(1); now += seconds(10)) {
        auto tick = registry.Tick(now);
        for (const auto &warning : tick.warnings) {
            fired.push_back(warning.minutes_remaining);
        }
        executions += static_cast<int>(tick.due.size());
    }
    executed_once = executions == 1 && !registry.Pending(ActionKind::Restart);
    return fired;
}

bool warning_table() {
    struct Case {
        int delay;
        std::vector<int> expected;
    };
    for (const auto &c : {Case{20, {10, 5, 1}}, Case{10, {5, 1}}, Case{3, {1}}, Case{15, {10, 5, 1}},
                          Case{6, {5, 1}}, Case{5, {1}}}) {
        bool executed_once = false;
        auto fired = warnings_for_delay(c.delay, executed_once);
        if (fired != c.expected) {
            std::cerr << "Warning set wrong for a " << c.delay << " minute delay\n";
            return false;
        }
        if (!executed_once) {
            std::cerr << "Action with " << c.delay << " minute delay did not execute exactly once\n";
            return false;
        }
    }
    return true;
}

bool coarse_ticks_skip_passed_windows() {
    ScheduledActionRegistry registry;
    const auto start = Clock::now();
    registry.Schedule(ActionKind::Stop, minutes(20), start, "test");
    // First look comes only 30 seconds before execution: only the 1 minute warning is still valid.
    auto tick = registry.Tick(start + minutes(19) + seconds(30));
    if (tick.warnings.size() != 1 || tick.warnings.front().minutes_remaining != 1) {
        std::cerr << "Late tick should only fire the 1 minute warning\n";
        return false;
    }
    if (!registry.Tick(start + minutes(19) + seconds(40)).warnings.empty()) {
        std::cerr << "Warning fired twice\n";
        return false;
    }
    return true;
}

bool replacement_resets_warnings() {
    ScheduledActionRegistry registry;
    const auto start = Clock::now();
    registry.Schedule(ActionKind::Restart, minutes(20), start, "alice");
    auto tick = registry.Tick(start + minutes(10));
    if (tick.warnings.size() != 1 || tick.warnings.front().minutes_remaining != 10) {
        std::cerr << "10 minute warning missing\n";
        return false;
    }

    const auto replaced_at = start + minutes(10);
    registry.Schedule(ActionKind::Restart, minutes(20), replaced_at, "bob");
    auto pending = registry.Pending(ActionKind::Restart);
    if (!pending || !pending->warnings_sent.empty() || pending->scheduled_at != replaced_at + minutes(20) ||
        pending->requested_by != "bob" || registry.PendingActions().size() != 1) {
        std::cerr << "Replacement did not reset the action\n";
        return false;
    }
    tick = registry.Tick(replaced_at + minutes(10));
    if (tick.warnings.size() != 1 || tick.warnings.front().minutes_remaining != 10) {
        std::cerr << "Replacement should warn again from the top\n";
        return false;
    }
    if (!registry.Tick(start + minutes(20)).due.empty()) {
        std::cerr << "The replaced deadline must not execute\n";
        return false;
    }
    return true;
}

bool cancel_and_precedence() {
    ScheduledActionRegistry registry;
    const auto start = Clock::now();
    registry.Schedule(ActionKind::Update, minutes(5), start, "test");
    if (!registry.Cancel(ActionKind::Update) || registry.Cancel(ActionKind::Update) || !registry.Empty()) {
        std::cerr << "Cancel semantics incorrect\n";
        return false;
    }

    registry.Schedule(ActionKind::Restart, minutes(0), start, "test");
    registry.Schedule(ActionKind::Update, minutes(0), start, "test");
    registry.Schedule(ActionKind::Stop, minutes(0), start, "test");
    auto tick = registry.Tick(start);
    if (tick.due.size() != 3 || tick.due[0].kind != ActionKind::Stop || tick.due[1].kind != ActionKind::Update ||
        tick.due[2].kind != ActionKind::Restart || !registry.Empty()) {
        std::cerr << "Due actions not ordered Stop, Update, Restart\n";
        return false;
    }
    if (!tick.warnings.empty()) {
        std::cerr << "Immediate actions should not warn\n";
        return false;
    }
    return true;
}

bool imminence() {
    ScheduledActionRegistry registry;
    const auto start = Clock::now();
    registry.Schedule(ActionKind::Restart, minutes(20), start, "test");
    if (registry.Imminent(start, seconds(6))) {
        std::cerr << "Nothing is imminent 20 minutes out\n";
        return false;
    }
    if (!registry.Imminent(start + minutes(9) + seconds(57), seconds(6))) {
        std::cerr << "The 10 minute warning should be imminent\n";
        return false;
    }
    if (ParseActionKind(" Update ") != ActionKind::Update || ParseActionKind("reboot")) {
        std::cerr << "ParseActionKind incorrect\n";
        return false;
    }
    return true;
}
}

int main() {
    if (!warning_table() || !coarse_ticks_skip_passed_windows() || !replacement_resets_warnings() ||
        !cancel_and_precedence() || !imminence()) {
        return 1;
    }
    return 0;
}
