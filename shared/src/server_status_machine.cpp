#include "server_status_machine.hpp"

#include <cstddef>

namespace srvkeeper {

namespace {

void describe(ServerStatus &status, StatusKind kind) {
    switch (kind) {
        case StatusKind::Starting:
            status.phase = "starting";
            status.message = "Server process is starting";
            break;
        case StatusKind::Loading:
            status.phase = "loading";
            status.message = "World is loading";
            break;
        case StatusKind::Online:
            status.phase = "online";
            status.message = "Server is online";
            break;
        case StatusKind::ShuttingDown:
            status.phase = "shutting_down";
            status.message = "Server is shutting down";
            break;
        case StatusKind::Offline:
            status.phase = "offline";
            status.message = "Server is offline";
            break;
        case StatusKind::Unknown:
            status.phase = "unknown";
            status.message = "Server state unknown";
            break;
    }
}

bool is_override(StatusKind kind) { return kind == StatusKind::ShuttingDown || kind == StatusKind::Offline; }

}  // namespace

const char *ToString(StatusKind kind) {
    switch (kind) {
        case StatusKind::Unknown:
            return "Unknown";
        case StatusKind::Offline:
            return "Offline";
        case StatusKind::Starting:
            return "Starting";
        case StatusKind::Loading:
            return "Loading";
        case StatusKind::Online:
            return "Online";
        case StatusKind::ShuttingDown:
            return "ShuttingDown";
    }
    return "Unknown";
}

int StatusPriority(StatusKind kind) {
    switch (kind) {
        case StatusKind::Unknown:
            return 0;
        case StatusKind::Offline:
            return 1;
        case StatusKind::Starting:
            return 2;
        case StatusKind::Loading:
            return 3;
        case StatusKind::Online:
            return 4;
        case StatusKind::ShuttingDown:
            return -1;
    }
    return 0;
}

std::string ClassifyPerformance(double fps, const PerformanceThresholds &thresholds) {
    if (fps >= thresholds.excellent) {
        return "Excellent";
    }
    if (fps >= thresholds.good) {
        return "Good";
    }
    if (fps >= thresholds.fair) {
        return "Fair";
    }
    if (fps >= thresholds.poor) {
        return "Poor";
    }
    return "Critical";
}

ServerStatusMachine::ServerStatusMachine(PerformanceThresholds thresholds, std::chrono::seconds startup_grace)
    : thresholds_(thresholds), startup_grace_(startup_grace) {}

bool ServerStatusMachine::accepts(StatusKind candidate) const {
    if (candidate == StatusKind::Unknown) {
        return false;
    }
    if (is_override(candidate)) {
        return true;
    }
    return StatusPriority(candidate) >= StatusPriority(status_.highest_kind_reached);
}

void ServerStatusMachine::fold(const LogEvent &event) {
    status_.kind = event.kind;
    describe(status_, event.kind);
    status_.last_activity_at = event.timestamp;
    status_.is_online = event.kind == StatusKind::Online;

    if (event.kind == StatusKind::Online) {
        if (event.performance) {
            PerformanceSample sample = *event.performance;
            sample.status = ClassifyPerformance(sample.avg_fps, thresholds_);
            status_.performance = sample;
        }
        if (status_.performance) {
            status_.message += " (" + std::to_string(status_.performance->player_count) + " players)";
        }
    } else {
        status_.performance.reset();
    }

    if (!is_override(event.kind) &&
        StatusPriority(event.kind) > StatusPriority(status_.highest_kind_reached)) {
        status_.highest_kind_reached = event.kind;
    }
}

StatusTransition ServerStatusMachine::Apply(const LogEvent &event) {
    StatusTransition transition;
    transition.previous = status_;
    if (!accepts(event.kind)) {
        transition.current = status_;
        return transition;
    }

    fold(event);
    transition.current = status_;
    transition.changed = transition.current.kind != transition.previous.kind;
    transition.notify = transition.changed;

    if (event.kind == StatusKind::Online && quiet_online_until_) {
        if (event.timestamp <= *quiet_online_until_) {
            transition.notify = false;
        }
        quiet_online_until_.reset();
    }
    return transition;
}

StatusTransition ServerStatusMachine::Reconcile(const std::vector<std::string> &recent_log_tail,
                                                bool controller_is_running, TimePoint now) {
    StatusTransition transition;
    transition.previous = status_;
    status_ = ServerStatus{};
    quiet_online_until_.reset();

    if (!controller_is_running) {
        status_.kind = StatusKind::Offline;
        describe(status_, StatusKind::Offline);
        status_.message = "Server process is not running";
        status_.last_activity_at = now;
    } else {
        std::vector<LogEvent> events;
        for (const auto &line : recent_log_tail) {
            if (auto event = parser_.Parse(line, now)) {
                events.push_back(std::move(*event));
            }
        }
        // Only the current run matters: replay from the newest start marker.
        std::size_t first = 0;
        for (std::size_t i = events.size(); i > 0; --i) {
            if (events[i - 1].kind == StatusKind::Starting) {
                first = i - 1;
                break;
            }
        }
        for (std::size_t i = first; i < events.size(); ++i) {
            if (accepts(events[i].kind)) {
                fold(events[i]);
            }
        }
        if (status_.kind == StatusKind::Offline) {
            // The tail ends with an earlier run exiting, yet a process is alive: a fresh start that
            // has not logged anything yet.
            status_.kind = StatusKind::Starting;
            describe(status_, StatusKind::Starting);
            status_.highest_kind_reached = StatusKind::Starting;
            status_.last_activity_at = now;
        }
        if (status_.kind != StatusKind::Online) {
            quiet_online_until_ = now + startup_grace_;
        }
    }

    transition.current = status_;
    transition.changed = transition.current.kind != transition.previous.kind;
    transition.notify = false;
    return transition;
}

void ServerStatusMachine::ResetHighWaterMark() { status_.highest_kind_reached = StatusKind::Unknown; }

StatusTransition ServerStatusMachine::ForceOffline(TimePoint now, const std::string &message) {
    StatusTransition transition;
    transition.previous = status_;
    status_.kind = StatusKind::Offline;
    describe(status_, StatusKind::Offline);
    if (!message.empty()) {
        status_.message = message;
    }
    status_.is_online = false;
    status_.performance.reset();
    status_.last_activity_at = now;
    transition.current = status_;
    transition.changed = transition.current.kind != transition.previous.kind;
    transition.notify = transition.changed;
    return transition;
}

}  // namespace srvkeeper
