#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "periodic_scheduler.hpp"
#include "server_status.hpp"

namespace srvkeeper {

struct OrchestratorConfig {
    std::string service_name = "gameserver.service";
    std::vector<TimeOfDay> restart_times;
    std::chrono::minutes backup_interval{0};
    std::chrono::minutes update_check_interval{0};
    std::chrono::minutes update_delay{15};
    int max_backups = 10;
    bool compress_backups = true;
    std::chrono::minutes auto_restart_cooldown{5};
    int max_restart_attempts = 3;
    std::chrono::minutes startup_timeout{10};
    PerformanceThresholds performance_thresholds;
    std::chrono::milliseconds log_check_interval{500};
    std::chrono::milliseconds status_check_interval{5000};

    std::filesystem::path server_log{"/var/lib/gameserver/server-console.txt"};
    std::filesystem::path server_data{"/var/lib/gameserver/Saves"};
    std::filesystem::path backup_dir{"/var/backups/srvkeeper"};
    std::filesystem::path journal{"/var/log/srvkeeper/orchestrator.log"};
    std::filesystem::path command_inbox{"/var/lib/srvkeeper/commands.log"};
    std::string notify_hook;
    std::string update_check_command;
    std::string update_command;
    std::filesystem::path app_manifest;

    std::chrono::seconds command_timeout{600};
    std::chrono::seconds service_call_timeout{30};
    // How long an update waits for the stopped unit to go inactive.
    std::chrono::seconds stop_timeout{120};
    std::chrono::seconds notify_timeout{10};
    std::chrono::seconds startup_grace{120};
    std::chrono::minutes stop_evidence_window{10};
    std::size_t tail_lines = 200;
};

// Reads the SRVKEEPER_* variables. Unset or empty variables keep their defaults; a malformed value
// throws std::invalid_argument naming the variable.
OrchestratorConfig LoadConfigFromEnvironment();

// Comma separated HH:mm list, sorted with duplicates removed. Throws std::invalid_argument.
std::vector<TimeOfDay> ParseRestartTimes(const std::string &value);

}  // namespace srvkeeper
