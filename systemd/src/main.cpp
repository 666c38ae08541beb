#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "command_inbox.hpp"
#include "config.hpp"
#include "journal_stop_evidence.hpp"
#include "log_tail_reader.hpp"
#include "logger.hpp"
#include "notifiers.hpp"
#include "orchestrator.hpp"
#include "services.hpp"
#include "stop_evidence.hpp"
#include "systemd_service_controller.hpp"

namespace {
std::atomic<bool> g_should_stop{false};

void handle_signal(int) { g_should_stop.store(true); }
}

int main() {
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGINT, handle_signal);

    srvkeeper::OrchestratorConfig config;
    try {
        config = srvkeeper::LoadConfigFromEnvironment();
    } catch (const std::invalid_argument &ex) {
        std::cerr << "srvkeeperd: invalid configuration: " << ex.what() << "\n";
        return 2;
    }

    srvkeeper::JsonLogger journal(config.journal, "srvkeeperd", true);
    srvkeeper::systemd::SystemdServiceController controller(config.service_name, config.service_call_timeout,
                                                            &journal);
    try {
        if (!controller.Exists()) {
            journal.Log(srvkeeper::severity::kCritical, "Loop", "Managed service does not exist",
                        {{"service", config.service_name}});
            return 3;
        }
    } catch (const srvkeeper::ServiceControlError &ex) {
        journal.Log(srvkeeper::severity::kCritical, "Loop", "Cannot query the managed service",
                    {{"service", config.service_name}, {"error", ex.what()}});
        return 3;
    }

    auto clock = [] { return srvkeeper::Clock::now(); };

    srvkeeper::LogTailReader server_log(config.server_log, config.tail_lines);
    srvkeeper::CommandInbox inbox(config.command_inbox);

    srvkeeper::JournalNotifier journal_notifier(journal);
    srvkeeper::HookNotifier hook_notifier(config.notify_hook, config.notify_timeout, &journal);
    srvkeeper::NotifierChain notifier(&journal);
    notifier.Add(journal_notifier);
    if (!config.notify_hook.empty()) {
        notifier.Add(hook_notifier);
    }

    srvkeeper::LogTailEvidenceCollector tail_evidence(server_log, config.tail_lines);
    srvkeeper::systemd::JournalStopEvidenceCollector journal_evidence;
    srvkeeper::TimelineStopEvidence stop_evidence({&tail_evidence, &journal_evidence}, clock, &journal);

    std::unique_ptr<srvkeeper::SteamCmdVersionService> versions;
    if (!config.update_check_command.empty()) {
        versions = std::make_unique<srvkeeper::SteamCmdVersionService>(
            config.app_manifest, config.update_check_command, config.update_command, config.command_timeout);
    }
    srvkeeper::DirectoryBackupService backups(config.backup_dir, config.max_backups, config.compress_backups,
                                              config.command_timeout, &journal);

    srvkeeper::OrchestratorDependencies deps{controller, server_log, inbox, notifier, stop_evidence, journal,
                                             versions.get(), &backups};
    srvkeeper::Orchestrator orchestrator(config, deps, clock);
    try {
        orchestrator.Start();
    } catch (const srvkeeper::ServiceControlError &ex) {
        journal.Log(srvkeeper::severity::kCritical, "Loop", "Initial reconcile failed",
                    {{"service", config.service_name}, {"error", ex.what()}});
        if (ex.fatal()) {
            return 3;
        }
    }

    orchestrator.Run(g_should_stop);
    return 0;
}
