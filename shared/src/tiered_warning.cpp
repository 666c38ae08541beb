#include "tiered_warning.hpp"

#include <algorithm>
#include <functional>

namespace srvkeeper {

namespace {
constexpr std::chrono::minutes kWarningWindow{2};
}

TieredWarningSchedule::TieredWarningSchedule(std::vector<int> thresholds_minutes)
    : thresholds_(std::move(thresholds_minutes)) {
    std::sort(thresholds_.begin(), thresholds_.end(), std::greater<int>());
    thresholds_.erase(std::unique(thresholds_.begin(), thresholds_.end()), thresholds_.end());
}

TieredWarningSchedule TieredWarningSchedule::ForDelay(Clock::duration original_delay) {
    if (original_delay > std::chrono::minutes(14)) {
        return TieredWarningSchedule({10, 5, 1});
    }
    if (original_delay > std::chrono::minutes(5)) {
        return TieredWarningSchedule({5, 1});
    }
    return TieredWarningSchedule({1});
}

std::vector<int> TieredWarningSchedule::Due(TimePoint now, TimePoint deadline, std::set<int> &sent) const {
    std::vector<int> due;
    if (now >= deadline) {
        return due;
    }
    const auto remaining = deadline - now;
    for (int threshold : thresholds_) {
        const std::chrono::minutes limit(threshold);
        if (remaining <= limit && remaining > limit - kWarningWindow && sent.count(threshold) == 0) {
            sent.insert(threshold);
            due.push_back(threshold);
        }
    }
    return due;
}

bool TieredWarningSchedule::Imminent(TimePoint now, TimePoint deadline, const std::set<int> &sent,
                                     std::chrono::seconds lookahead) const {
    if (deadline - now <= lookahead) {
        return true;
    }
    const auto remaining = deadline - now;
    for (int threshold : thresholds_) {
        if (sent.count(threshold) != 0) {
            continue;
        }
        // Within the polling lookahead of the threshold becoming due.
        if (remaining - std::chrono::minutes(threshold) <= lookahead &&
            remaining > std::chrono::minutes(threshold) - kWarningWindow) {
            return true;
        }
    }
    return false;
}

}  // namespace srvkeeper
