#include "scheduled_action_registry.hpp"

#include <array>

#include "text.hpp"

namespace srvkeeper {

namespace {
constexpr std::array<ActionKind, 3> kPrecedence = {ActionKind::Stop, ActionKind::Update, ActionKind::Restart};
}

const char *ToString(ActionKind kind) {
    switch (kind) {
        case ActionKind::Restart:
            return "restart";
        case ActionKind::Stop:
            return "stop";
        case ActionKind::Update:
            return "update";
    }
    return "restart";
}

std::optional<ActionKind> ParseActionKind(const std::string &text) {
    const std::string lower = ToLower(Trim(text));
    if (lower == "restart") {
        return ActionKind::Restart;
    }
    if (lower == "stop") {
        return ActionKind::Stop;
    }
    if (lower == "update") {
        return ActionKind::Update;
    }
    return std::nullopt;
}

Clock::duration ScheduledAction::OriginalDelay() const { return scheduled_at - created_at; }

const ScheduledAction &ScheduledActionRegistry::Schedule(ActionKind kind, std::chrono::minutes delay, TimePoint now,
                                                         std::string requested_by) {
    if (delay < std::chrono::minutes(0)) {
        delay = std::chrono::minutes(0);
    }
    ScheduledAction action;
    action.kind = kind;
    action.created_at = now;
    action.scheduled_at = now + delay;
    action.requested_by = std::move(requested_by);
    auto &slot = actions_[kind];
    slot = std::move(action);
    return slot;
}

bool ScheduledActionRegistry::Cancel(ActionKind kind) { return actions_.erase(kind) > 0; }

RegistryTick ScheduledActionRegistry::Tick(TimePoint now) {
    RegistryTick tick;
    for (ActionKind kind : kPrecedence) {
        auto it = actions_.find(kind);
        if (it == actions_.end()) {
            continue;
        }
        ScheduledAction &action = it->second;
        if (now >= action.scheduled_at) {
            tick.due.push_back(action);
            actions_.erase(it);
            continue;
        }
        const auto schedule = TieredWarningSchedule::ForDelay(action.OriginalDelay());
        for (int minutes : schedule.Due(now, action.scheduled_at, action.warnings_sent)) {
            tick.warnings.push_back({action, minutes});
        }
    }
    return tick;
}

std::optional<ScheduledAction> ScheduledActionRegistry::Pending(ActionKind kind) const {
    auto it = actions_.find(kind);
    if (it == actions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ScheduledAction> ScheduledActionRegistry::PendingActions() const {
    std::vector<ScheduledAction> out;
    for (ActionKind kind : kPrecedence) {
        if (auto action = Pending(kind)) {
            out.push_back(*action);
        }
    }
    return out;
}

bool ScheduledActionRegistry::Imminent(TimePoint now, std::chrono::seconds lookahead) const {
    for (const auto &entry : actions_) {
        const ScheduledAction &action = entry.second;
        const auto schedule = TieredWarningSchedule::ForDelay(action.OriginalDelay());
        if (schedule.Imminent(now, action.scheduled_at, action.warnings_sent, lookahead)) {
            return true;
        }
    }
    return false;
}

}  // namespace srvkeeper
