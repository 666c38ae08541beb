#include "periodic_scheduler.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace srvkeeper {

namespace {

TimePoint local_time_on_day(const std::tm &day, const TimeOfDay &time, int day_offset) {
    std::tm tm = day;
    tm.tm_mday += day_offset;
    tm.tm_hour = time.hour;
    tm.tm_min = time.minute;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&tm));
}

}  // namespace

std::optional<TimeOfDay> ParseTimeOfDay(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    const auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon > 2 || text.size() - colon - 1 != 2) {
        return std::nullopt;
    }
    int values[2] = {0, 0};
    std::string_view parts[2] = {text.substr(0, colon), text.substr(colon + 1)};
    for (int i = 0; i < 2; ++i) {
        for (char c : parts[i]) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            values[i] = values[i] * 10 + (c - '0');
        }
    }
    if (values[0] > 23 || values[1] > 59) {
        return std::nullopt;
    }
    return TimeOfDay{values[0], values[1]};
}

std::string FormatTimeOfDay(const TimeOfDay &time) {
    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << time.hour << ':' << std::setw(2) << std::setfill('0') << time.minute;
    return oss.str();
}

TimePoint NextOccurrence(const std::vector<TimeOfDay> &times_of_day, TimePoint now) {
    if (times_of_day.empty()) {
        throw std::invalid_argument("NextOccurrence needs at least one time of day");
    }
    std::vector<TimeOfDay> sorted = times_of_day;
    std::sort(sorted.begin(), sorted.end());

    const std::time_t now_t = Clock::to_time_t(now);
    std::tm today{};
    localtime_r(&now_t, &today);

    for (const auto &time : sorted) {
        const TimePoint candidate = local_time_on_day(today, time, 0);
        if (candidate > now) {
            return candidate;
        }
    }
    return local_time_on_day(today, sorted.front(), 1);
}

PeriodicScheduler::PeriodicScheduler(std::vector<TimeOfDay> restart_times, std::chrono::minutes backup_interval,
                                     std::chrono::minutes update_check_interval, TimePoint now)
    : warnings_({15, 5, 1}), backup_interval_(backup_interval), update_check_interval_(update_check_interval) {
    std::sort(restart_times.begin(), restart_times.end());
    restart_times.erase(std::unique(restart_times.begin(), restart_times.end()), restart_times.end());
    state_.restart_times_of_day = std::move(restart_times);
    if (!state_.restart_times_of_day.empty()) {
        state_.next_restart_at = NextOccurrence(state_.restart_times_of_day, now);
    }
    if (backup_interval_.count() > 0) {
        next_backup_at_ = now + backup_interval_;
    }
    if (update_check_interval_.count() > 0) {
        next_update_check_at_ = now + update_check_interval_;
    }
}

PeriodicTick PeriodicScheduler::Tick(TimePoint now) {
    PeriodicTick tick;
    if (!state_.next_restart_at) {
        return tick;
    }
    const TimePoint occurrence = *state_.next_restart_at;
    tick.occurrence = occurrence;
    if (now < occurrence) {
        if (!state_.skip_next) {
            tick.warnings = warnings_.Due(now, occurrence, state_.warnings_sent);
        }
        return tick;
    }

    if (state_.skip_next) {
        tick.skipped = true;
        state_.skip_next = false;
    } else {
        tick.restart_due = true;
        state_.last_performed_at = now;
    }
    state_.warnings_sent.clear();
    state_.next_restart_at = NextOccurrence(state_.restart_times_of_day, std::max(now, occurrence));
    return tick;
}

bool PeriodicScheduler::BackupDue(TimePoint now) const { return next_backup_at_ && now >= *next_backup_at_; }

void PeriodicScheduler::MarkBackup(TimePoint now) {
    if (backup_interval_.count() > 0) {
        next_backup_at_ = now + backup_interval_;
    }
}

bool PeriodicScheduler::UpdateCheckDue(TimePoint now) const {
    return next_update_check_at_ && now >= *next_update_check_at_;
}

void PeriodicScheduler::MarkUpdateCheck(TimePoint now) {
    if (update_check_interval_.count() > 0) {
        next_update_check_at_ = now + update_check_interval_;
    }
}

bool PeriodicScheduler::Imminent(TimePoint now, std::chrono::seconds lookahead) const {
    if (!state_.next_restart_at) {
        return false;
    }
    return warnings_.Imminent(now, *state_.next_restart_at, state_.warnings_sent, lookahead);
}

}  // namespace srvkeeper
