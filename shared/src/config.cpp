#include "config.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <stdexcept>

#include "text.hpp"

namespace srvkeeper {

namespace {

std::optional<std::string> get_env(const char *key) {
    const char *value = std::getenv(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    std::string trimmed = Trim(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

long long get_env_integer(const char *key, long long fallback, long long min_value, long long max_value) {
    auto value = get_env(key);
    if (!value) {
        return fallback;
    }
    errno = 0;
    char *end = nullptr;
    long long parsed = std::strtoll(value->c_str(), &end, 10);
    if (errno != 0 || end == value->c_str() || *end != '\0' || parsed < min_value || parsed > max_value) {
        throw std::invalid_argument(std::string(key) + ": expected an integer in [" + std::to_string(min_value) +
                                    ", " + std::to_string(max_value) + "], got '" + *value + "'");
    }
    return parsed;
}

double get_env_double(const char *key, double fallback) {
    auto value = get_env(key);
    if (!value) {
        return fallback;
    }
    char *end = nullptr;
    double parsed = std::strtod(value->c_str(), &end);
    if (end == value->c_str() || *end != '\0' || parsed < 0.0) {
        throw std::invalid_argument(std::string(key) + ": expected a non-negative number, got '" + *value + "'");
    }
    return parsed;
}

bool get_env_bool(const char *key, bool fallback) {
    auto value = get_env(key);
    if (!value) {
        return fallback;
    }
    std::string lowered = ToLower(*value);
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    throw std::invalid_argument(std::string(key) + ": expected a boolean, got '" + *value + "'");
}

std::string get_env_string(const char *key, const std::string &fallback) {
    auto value = get_env(key);
    return value ? *value : fallback;
}

}  // namespace

std::vector<TimeOfDay> ParseRestartTimes(const std::string &value) {
    std::vector<TimeOfDay> times;
    for (const auto &piece : SplitList(value, ',')) {
        auto parsed = ParseTimeOfDay(piece);
        if (!parsed) {
            throw std::invalid_argument("SRVKEEPER_RESTART_TIMES: invalid time of day '" + piece + "'");
        }
        times.push_back(*parsed);
    }
    std::sort(times.begin(), times.end());
    times.erase(std::unique(times.begin(), times.end()), times.end());
    return times;
}

OrchestratorConfig LoadConfigFromEnvironment() {
    constexpr long long kMaxMinutes = 7 * 24 * 60;
    OrchestratorConfig config;

    config.service_name = get_env_string("SRVKEEPER_SERVICE_NAME", config.service_name);
    if (auto times = get_env("SRVKEEPER_RESTART_TIMES")) {
        config.restart_times = ParseRestartTimes(*times);
    }
    config.backup_interval =
        std::chrono::minutes(get_env_integer("SRVKEEPER_BACKUP_INTERVAL_MINUTES", 0, 0, kMaxMinutes));
    config.update_check_interval =
        std::chrono::minutes(get_env_integer("SRVKEEPER_UPDATE_CHECK_INTERVAL_MINUTES", 0, 0, kMaxMinutes));
    config.update_delay = std::chrono::minutes(get_env_integer("SRVKEEPER_UPDATE_DELAY_MINUTES", 15, 0, kMaxMinutes));
    config.max_backups = static_cast<int>(get_env_integer("SRVKEEPER_MAX_BACKUPS", 10, 1, 10000));
    config.compress_backups = get_env_bool("SRVKEEPER_COMPRESS_BACKUPS", true);
    config.auto_restart_cooldown =
        std::chrono::minutes(get_env_integer("SRVKEEPER_AUTO_RESTART_COOLDOWN_MINUTES", 5, 0, kMaxMinutes));
    config.max_restart_attempts = static_cast<int>(get_env_integer("SRVKEEPER_MAX_RESTART_ATTEMPTS", 3, 0, 1000));
    config.startup_timeout =
        std::chrono::minutes(get_env_integer("SRVKEEPER_STARTUP_TIMEOUT_MINUTES", 10, 1, kMaxMinutes));

    config.performance_thresholds.excellent = get_env_double("SRVKEEPER_PERF_EXCELLENT", 30.0);
    config.performance_thresholds.good = get_env_double("SRVKEEPER_PERF_GOOD", 20.0);
    config.performance_thresholds.fair = get_env_double("SRVKEEPER_PERF_FAIR", 15.0);
    config.performance_thresholds.poor = get_env_double("SRVKEEPER_PERF_POOR", 10.0);
    const auto &perf = config.performance_thresholds;
    if (!(perf.excellent >= perf.good && perf.good >= perf.fair && perf.fair >= perf.poor)) {
        throw std::invalid_argument("SRVKEEPER_PERF_*: thresholds must not increase from EXCELLENT to POOR");
    }

    config.log_check_interval =
        std::chrono::milliseconds(get_env_integer("SRVKEEPER_LOG_CHECK_INTERVAL_MS", 500, 50, 600000));
    config.status_check_interval =
        std::chrono::milliseconds(get_env_integer("SRVKEEPER_STATUS_CHECK_INTERVAL_MS", 5000, 50, 600000));

    config.server_log = get_env_string("SRVKEEPER_SERVER_LOG", config.server_log.string());
    config.server_data = get_env_string("SRVKEEPER_SERVER_DATA", config.server_data.string());
    config.backup_dir = get_env_string("SRVKEEPER_BACKUP_DIR", config.backup_dir.string());
    config.journal = get_env_string("SRVKEEPER_JOURNAL", config.journal.string());
    config.command_inbox = get_env_string("SRVKEEPER_COMMAND_INBOX", config.command_inbox.string());
    config.notify_hook = get_env_string("SRVKEEPER_NOTIFY_HOOK", "");
    config.update_check_command = get_env_string("SRVKEEPER_UPDATE_CHECK_COMMAND", "");
    config.update_command = get_env_string("SRVKEEPER_UPDATE_COMMAND", "");
    config.app_manifest = get_env_string("SRVKEEPER_APP_MANIFEST", "");

    config.command_timeout = std::chrono::seconds(get_env_integer("SRVKEEPER_COMMAND_TIMEOUT_SECONDS", 600, 1, 86400));
    config.service_call_timeout =
        std::chrono::seconds(get_env_integer("SRVKEEPER_SERVICE_CALL_TIMEOUT_SECONDS", 30, 1, 3600));
    config.stop_timeout = std::chrono::seconds(get_env_integer("SRVKEEPER_STOP_TIMEOUT_SECONDS", 120, 1, 3600));
    config.notify_timeout = std::chrono::seconds(get_env_integer("SRVKEEPER_NOTIFY_TIMEOUT_SECONDS", 10, 1, 300));
    config.startup_grace = std::chrono::seconds(get_env_integer("SRVKEEPER_STARTUP_GRACE_SECONDS", 120, 0, 86400));
    config.stop_evidence_window =
        std::chrono::minutes(get_env_integer("SRVKEEPER_STOP_EVIDENCE_WINDOW_MINUTES", 10, 1, kMaxMinutes));
    config.tail_lines = static_cast<std::size_t>(get_env_integer("SRVKEEPER_TAIL_LINES", 200, 1, 100000));
    return config;
}

}  // namespace srvkeeper
