#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "server_status.hpp"
#include "tiered_warning.hpp"

namespace srvkeeper {

struct TimeOfDay {
    int hour = 0;
    int minute = 0;

    bool operator<(const TimeOfDay &other) const {
        return hour != other.hour ? hour < other.hour : minute < other.minute;
    }
    bool operator==(const TimeOfDay &other) const { return hour == other.hour && minute == other.minute; }
};

// "HH:mm", 00:00 through 23:59.
std::optional<TimeOfDay> ParseTimeOfDay(std::string_view text);
std::string FormatTimeOfDay(const TimeOfDay &time);

// Earliest configured time of day strictly after `now` (local time), wrapping to the first one
// tomorrow. Requires a non-empty list.
TimePoint NextOccurrence(const std::vector<TimeOfDay> &times_of_day, TimePoint now);

struct PeriodicScheduleState {
    std::vector<TimeOfDay> restart_times_of_day;
    std::optional<TimePoint> next_restart_at;
    std::set<int> warnings_sent;
    std::optional<TimePoint> last_performed_at;
    bool skip_next = false;
};

struct PeriodicTick {
    std::vector<int> warnings;
    bool restart_due = false;
    bool skipped = false;
    TimePoint occurrence{};
};

// Fixed-clock restarts plus the interval driven backup and update-check timers.
class PeriodicScheduler {
  public:
    PeriodicScheduler(std::vector<TimeOfDay> restart_times, std::chrono::minutes backup_interval,
                      std::chrono::minutes update_check_interval, TimePoint now);

    // Fires 15/5/1 minute warnings, then on the occurrence reports restart_due (or skipped when
    // the one-shot skip flag was set) and rolls forward to the next occurrence.
    PeriodicTick Tick(TimePoint now);

    void SkipNext() { state_.skip_next = true; }
    bool SkipPending() const { return state_.skip_next; }

    bool BackupDue(TimePoint now) const;
    void MarkBackup(TimePoint now);
    bool UpdateCheckDue(TimePoint now) const;
    void MarkUpdateCheck(TimePoint now);

    bool Imminent(TimePoint now, std::chrono::seconds lookahead) const;

    const PeriodicScheduleState &State() const { return state_; }
    std::optional<TimePoint> NextBackupAt() const { return next_backup_at_; }
    std::optional<TimePoint> NextUpdateCheckAt() const { return next_update_check_at_; }

  private:
    PeriodicScheduleState state_;
    TieredWarningSchedule warnings_;
    std::chrono::minutes backup_interval_;
    std::chrono::minutes update_check_interval_;
    std::optional<TimePoint> next_backup_at_;
    std::optional<TimePoint> next_update_check_at_;
};

}  // namespace srvkeeper
