#pragma once

#include <chrono>
#include <set>
#include <vector>

#include "server_status.hpp"

namespace srvkeeper {

// Fires one notification per remaining-time threshold ahead of a deadline. Used both for admin
// scheduled actions and the fixed-time periodic restart; the caller owns the set of thresholds
// already sent so replacing an action resets it.
class TieredWarningSchedule {
  public:
    // Thresholds in minutes, any order.
    explicit TieredWarningSchedule(std::vector<int> thresholds_minutes);

    // 10/5/1 for delays above 14 minutes, 5/1 above 5 minutes, otherwise 1 only.
    static TieredWarningSchedule ForDelay(Clock::duration original_delay);

    // A threshold T is due when remaining <= T and remaining > T - 2 minutes and T has not been
    // sent. Due thresholds are added to `sent`, largest first. Nothing is due once the deadline
    // has passed; that is execution time.
    std::vector<int> Due(TimePoint now, TimePoint deadline, std::set<int> &sent) const;

    // True while `now` lies inside the window of any threshold still unsent, or the deadline is
    // at most `lookahead` away.
    bool Imminent(TimePoint now, TimePoint deadline, const std::set<int> &sent,
                  std::chrono::seconds lookahead) const;

    const std::vector<int> &Thresholds() const { return thresholds_; }

  private:
    std::vector<int> thresholds_;
};

}  // namespace srvkeeper
