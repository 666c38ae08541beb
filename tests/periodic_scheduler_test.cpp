#include "periodic_scheduler.hpp"

#include <chrono>
#include <ctime>
#include <iostream>
#include <stdexcept>

namespace {
using namespace srvkeeper;
using std::chrono::minutes;

TimePoint local_time(int year, int month, int day, int hour, int minute) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&tm));
}

bool next_occurrence_wraps() {
    const std::vector<TimeOfDay> times = {{14, 0}, {2, 0}};
    if (NextOccurrence(times, local_time(2026, 6, 10, 13, 50)) != local_time(2026, 6, 10, 14, 0)) {
        std::cerr << "13:50 should map to 14:00 today\n";
        return false;
    }
    if (NextOccurrence(times, local_time(2026, 6, 10, 15, 0)) != local_time(2026, 6, 11, 2, 0)) {
        std::cerr << "15:00 should wrap to 02:00 tomorrow\n";
        return false;
    }
    if (NextOccurrence(times, local_time(2026, 6, 10, 14, 0)) != local_time(2026, 6, 11, 2, 0)) {
        std::cerr << "An occurrence equal to now is not in the future\n";
        return false;
    }
    if (NextOccurrence(times, local_time(2026, 6, 10, 1, 0)) != local_time(2026, 6, 10, 2, 0)) {
        std::cerr << "01:00 should map to 02:00 today\n";
        return false;
    }
    try {
        NextOccurrence({}, local_time(2026, 6, 10, 1, 0));
        std::cerr << "Empty schedule must throw\n";
        return false;
    } catch (const std::invalid_argument &) {
    }
    return true;
}

bool time_of_day_parsing() {
    auto parsed = ParseTimeOfDay(" 7:05 ");
    if (!parsed || parsed->hour != 7 || parsed->minute != 5 || FormatTimeOfDay(*parsed) != "07:05") {
        std::cerr << "7:05 should parse\n";
        return false;
    }
    for (const char *bad : {"24:00", "12:60", "12:5", "1200", ":30", "ab:cd", ""}) {
        if (ParseTimeOfDay(bad)) {
            std::cerr << "Accepted invalid time " << bad << "\n";
            return false;
        }
    }
    return true;
}

bool restart_warnings_and_roll_forward() {
    PeriodicScheduler scheduler({{14, 0}}, minutes(0), minutes(0), local_time(2026, 6, 10, 13, 40));
    if (scheduler.State().next_restart_at != local_time(2026, 6, 10, 14, 0)) {
        std::cerr << "Initial occurrence wrong\n";
        return false;
    }
    if (!scheduler.Tick(local_time(2026, 6, 10, 13, 44)).warnings.empty()) {
        std::cerr << "No warning 16 minutes out\n";
        return false;
    }
    std::vector<int> fired;
    for (int minute = 45; minute < 60; ++minute) {
        auto tick = scheduler.Tick(local_time(2026, 6, 10, 13, minute));
        fired.insert(fired.end(), tick.warnings.begin(), tick.warnings.end());
        if (tick.restart_due) {
            std::cerr << "Restart fired early\n";
            return false;
        }
    }
    if (fired != std::vector<int>{15, 5, 1}) {
        std::cerr << "Periodic warnings should be 15, 5, 1\n";
        return false;
    }
    auto due = scheduler.Tick(local_time(2026, 6, 10, 14, 0));
    if (!due.restart_due || due.skipped || due.occurrence != local_time(2026, 6, 10, 14, 0)) {
        std::cerr << "Restart not due at 14:00\n";
        return false;
    }
    const auto &state = scheduler.State();
    if (state.next_restart_at != local_time(2026, 6, 11, 14, 0) || !state.warnings_sent.empty() ||
        state.last_performed_at != local_time(2026, 6, 10, 14, 0)) {
        std::cerr << "Schedule did not roll forward\n";
        return false;
    }
    if (scheduler.Tick(local_time(2026, 6, 10, 14, 1)).restart_due) {
        std::cerr << "Restart fired twice\n";
        return false;
    }
    return true;
}

bool skip_next_consumes_one_occurrence() {
    PeriodicScheduler scheduler({{2, 0}, {14, 0}}, minutes(0), minutes(0), local_time(2026, 6, 10, 13, 0));
    scheduler.SkipNext();
    if (!scheduler.SkipPending() || !scheduler.Tick(local_time(2026, 6, 10, 13, 45)).warnings.empty()) {
        std::cerr << "A skipped occurrence should not warn\n";
        return false;
    }
    auto tick = scheduler.Tick(local_time(2026, 6, 10, 14, 0));
    if (!tick.skipped || tick.restart_due || scheduler.SkipPending()) {
        std::cerr << "Skip flag not consumed\n";
        return false;
    }
    if (scheduler.State().next_restart_at != local_time(2026, 6, 11, 2, 0)) {
        std::cerr << "Skipped occurrence should still advance\n";
        return false;
    }
    auto warn = scheduler.Tick(local_time(2026, 6, 11, 1, 45));
    if (warn.warnings != std::vector<int>{15}) {
        std::cerr << "Following occurrence should warn normally\n";
        return false;
    }
    if (!scheduler.Tick(local_time(2026, 6, 11, 2, 0)).restart_due) {
        std::cerr << "Following occurrence should restart\n";
        return false;
    }
    return true;
}

bool interval_timers() {
    const auto start = local_time(2026, 6, 10, 12, 0);
    PeriodicScheduler scheduler({}, minutes(60), minutes(0), start);
    if (scheduler.BackupDue(start + minutes(59)) || !scheduler.BackupDue(start + minutes(60))) {
        std::cerr << "Backup due time wrong\n";
        return false;
    }
    scheduler.MarkBackup(start + minutes(61));
    if (scheduler.BackupDue(start + minutes(120)) || !scheduler.BackupDue(start + minutes(121))) {
        std::cerr << "Backup not rescheduled from the last run\n";
        return false;
    }
    if (scheduler.UpdateCheckDue(start + minutes(100000)) || scheduler.NextUpdateCheckAt()) {
        std::cerr << "Zero interval must disable the update check\n";
        return false;
    }
    auto tick = scheduler.Tick(start + minutes(5));
    if (tick.restart_due || tick.skipped || !tick.warnings.empty() || scheduler.Imminent(start, std::chrono::seconds(6))) {
        std::cerr << "No restart times means no periodic restarts\n";
        return false;
    }
    return true;
}
}

int main() {
    if (!next_occurrence_wraps() || !time_of_day_parsing() || !restart_warnings_and_roll_forward() ||
        !skip_next_consumes_one_occurrence() || !interval_timers()) {
        return 1;
    }
    return 0;
}
