#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace srvkeeper {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class StatusKind { Unknown, Offline, Starting, Loading, Online, ShuttingDown };

const char *ToString(StatusKind kind);

// Position in the lifecycle order Unknown < Offline < Starting < Loading < Online. ShuttingDown sits
// outside the order and reports -1.
int StatusPriority(StatusKind kind);

struct EntityCounts {
    int characters = 0;
    int zombies = 0;
    int vehicles = 0;
};

struct PerformanceSample {
    double avg_fps = 0.0;
    double min_fps = 0.0;
    double max_fps = 0.0;
    double frame_time_ms = 0.0;
    int player_count = 0;
    EntityCounts entities;
    std::string status;
};

struct PerformanceThresholds {
    double excellent = 30.0;
    double good = 20.0;
    double fair = 15.0;
    double poor = 10.0;
};

std::string ClassifyPerformance(double fps, const PerformanceThresholds &thresholds);

struct LogEvent {
    TimePoint timestamp;
    StatusKind kind = StatusKind::Unknown;
    std::optional<PerformanceSample> performance;
    std::string line;
};

struct ServerStatus {
    StatusKind kind = StatusKind::Unknown;
    std::string phase = "unknown";
    TimePoint last_activity_at{};
    bool is_online = false;
    std::string message;
    std::optional<PerformanceSample> performance;
    StatusKind highest_kind_reached = StatusKind::Unknown;
};

}  // namespace srvkeeper
