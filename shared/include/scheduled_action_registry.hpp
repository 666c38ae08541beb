#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "server_status.hpp"
#include "tiered_warning.hpp"

namespace srvkeeper {

enum class ActionKind { Restart, Stop, Update };

const char *ToString(ActionKind kind);
std::optional<ActionKind> ParseActionKind(const std::string &text);

struct ScheduledAction {
    ActionKind kind = ActionKind::Restart;
    TimePoint created_at;
    TimePoint scheduled_at;
    std::set<int> warnings_sent;
    std::string requested_by;

    Clock::duration OriginalDelay() const;
};

struct ActionWarning {
    ScheduledAction action;
    int minutes_remaining = 0;
};

struct RegistryTick {
    std::vector<ActionWarning> warnings;
    // Ordered by precedence: Stop, Update, Restart.
    std::vector<ScheduledAction> due;
};

// At most one pending delayed action per kind.
class ScheduledActionRegistry {
  public:
    // Replaces any pending action of the same kind, including its sent warnings.
    const ScheduledAction &Schedule(ActionKind kind, std::chrono::minutes delay, TimePoint now,
                                    std::string requested_by);
    bool Cancel(ActionKind kind);

    // Collects due warnings and removes every action whose time has come.
    RegistryTick Tick(TimePoint now);

    std::optional<ScheduledAction> Pending(ActionKind kind) const;
    std::vector<ScheduledAction> PendingActions() const;
    bool Empty() const { return actions_.empty(); }

    // True when any pending action is about to warn or execute within `lookahead`.
    bool Imminent(TimePoint now, std::chrono::seconds lookahead) const;

  private:
    std::map<ActionKind, ScheduledAction> actions_;
};

}  // namespace srvkeeper
