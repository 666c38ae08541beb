#pragma once

#include <optional>
#include <string_view>

#include "server_status.hpp"

namespace srvkeeper {

// Turns game-server console lines into lifecycle events. Lines that carry no lifecycle marker
// produce std::nullopt; nothing here throws.
class LogEventParser {
  public:
    std::optional<LogEvent> Parse(std::string_view line, TimePoint now) const;
};

// Best-effort extraction of a leading timestamp such as "[17-10-26 14:03:22.123]" or
// "2026-10-17 14:03:22". Interpreted as local time.
std::optional<TimePoint> ParseLogTimestamp(std::string_view line);

std::optional<PerformanceSample> ParsePerformanceSample(std::string_view line);

}  // namespace srvkeeper
