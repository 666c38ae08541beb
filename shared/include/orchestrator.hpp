#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "auto_recovery_controller.hpp"
#include "collaborators.hpp"
#include "config.hpp"
#include "log_event_parser.hpp"
#include "periodic_scheduler.hpp"
#include "scheduled_action_registry.hpp"
#include "server_status_machine.hpp"

namespace srvkeeper {

class JsonLogger;

struct OrchestratorDependencies {
    ServiceController &controller;
    LogSource &log;
    CommandSource &commands;
    Notifier &notifier;
    IntentionalStopEvidence &stop_evidence;
    JsonLogger &journal;
    // Optional; maintenance that needs them is skipped when absent.
    VersionService *versions = nullptr;
    BackupService *backups = nullptr;
};

// What one tick did. Returned for the loop and for tests.
struct TickReport {
    bool action_taken = false;
    // restart, stop, update, start, periodic_restart, recovery_restart. Recorded whether or not
    // the controller call succeeded.
    std::vector<std::string> executed;
    std::vector<std::string> superseded;
    std::optional<RecoveryDecision> recovery;
    bool backup_attempted = false;
    bool update_checked = false;
    std::chrono::milliseconds next_sleep{0};
    std::string error;
};

// The single cooperative loop. Every tick runs, in order: refresh the running flag, fold new log
// events, take admin requests, scheduled actions, the periodic schedule, auto-recovery, backup and
// update checks, then picks the next sleep. At most one process-affecting action runs per tick.
class Orchestrator {
  public:
    Orchestrator(OrchestratorConfig config, OrchestratorDependencies deps, std::function<TimePoint()> clock);

    // Seeds the status from the log tail and the controller, and moves the command cursor past
    // requests issued while the orchestrator was down. Throws ServiceControlError.
    void Start();

    TickReport Tick();

    // Ticks until `stop_requested` becomes true.
    void Run(const std::atomic<bool> &stop_requested);

    const ServerStatus &Status() const { return machine_.Status(); }
    const ScheduledActionRegistry &Registry() const { return registry_; }
    const PeriodicScheduler &Periodic() const { return periodic_; }
    const RecoveryState &Recovery() const { return recovery_.State(); }
    bool AwaitingStartup() const { return awaiting_startup_since_.has_value(); }
    std::uint64_t CommandCursor() const { return command_cursor_; }

  private:
    struct Outcome {
        bool success = false;
        std::string error;
    };

    void refresh_running(TimePoint now);
    void apply_log_events(TimePoint now);
    void handle_transition(const StatusTransition &transition);
    bool poll_commands(TimePoint now, TickReport &report);
    bool run_scheduled_actions(TimePoint now, TickReport &report);
    bool run_periodic(TimePoint now, bool action_taken, TickReport &report);
    bool run_recovery(TimePoint now, TickReport &report);
    void run_maintenance(TimePoint now, TickReport &report);
    void check_startup_timeout(TimePoint now);
    std::chrono::milliseconds next_sleep(TimePoint now) const;

    Outcome execute_restart(TimePoint now, const std::string &reason);
    Outcome execute_stop(const std::string &reason);
    Outcome execute_update(TimePoint now, const std::string &reason);
    Outcome execute_start(TimePoint now, const std::string &context);
    Outcome wait_until_stopped();
    Outcome guarded(const std::function<bool()> &call, const std::string &what);
    BackupResult run_backup();
    void began_startup(TimePoint now);

    void notify(Audience audience, const std::string &event_key, const std::string &message,
                std::vector<EventAttribute> payload = {});
    void journal_status(const ServerStatus &status, const std::string &reason);

    OrchestratorConfig config_;
    OrchestratorDependencies deps_;
    std::function<TimePoint()> clock_;

    ServerStatusMachine machine_;
    LogEventParser parser_;
    ScheduledActionRegistry registry_;
    PeriodicScheduler periodic_;
    AutoRecoveryController recovery_;

    bool running_ = false;
    std::uint64_t command_cursor_ = 0;
    std::optional<TimePoint> awaiting_startup_since_;
    RecoveryHold last_hold_ = RecoveryHold::None;
    std::string last_service_error_;
};

}  // namespace srvkeeper
