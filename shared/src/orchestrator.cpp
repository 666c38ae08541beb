#include "orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <sstream>
#include <thread>

#include "logger.hpp"

namespace srvkeeper {

namespace {

const char *kind_noun(ActionKind kind) {
    switch (kind) {
        case ActionKind::Restart:
            return "restart";
        case ActionKind::Stop:
            return "shutdown";
        case ActionKind::Update:
            return "update";
    }
    return "restart";
}

std::string minutes_phrase(int minutes) {
    return std::to_string(minutes) + (minutes == 1 ? " minute" : " minutes");
}

std::string format_fps(double fps) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fps;
    return oss.str();
}

bool player_visible(StatusKind kind) {
    return kind == StatusKind::Starting || kind == StatusKind::Online || kind == StatusKind::Offline;
}

}  // namespace

Orchestrator::Orchestrator(OrchestratorConfig config, OrchestratorDependencies deps, std::function<TimePoint()> clock)
    : config_(std::move(config)),
      deps_(deps),
      clock_(std::move(clock)),
      machine_(config_.performance_thresholds, config_.startup_grace),
      periodic_(config_.restart_times, config_.backup_interval, config_.update_check_interval, clock_()),
      recovery_(config_.auto_restart_cooldown, config_.max_restart_attempts, deps_.stop_evidence,
                config_.service_name, config_.stop_evidence_window) {}

void Orchestrator::Start() {
    const TimePoint now = clock_();
    running_ = deps_.controller.IsRunning();
    auto transition = machine_.Reconcile(deps_.log.RecentTail(config_.tail_lines), running_, now);
    journal_status(transition.current, "reconcile");

    std::size_t stale = 0;
    for (const auto &request : deps_.commands.Poll(0)) {
        command_cursor_ = std::max(command_cursor_, request.sequence);
        ++stale;
    }
    deps_.journal.Log(severity::kInfo, "Loop", "Orchestrator started",
                      {{"service", config_.service_name},
                       {"running", running_ ? "true" : "false"},
                       {"status", ToString(transition.current.kind)},
                       {"ignored_commands", std::to_string(stale)}});
}

void Orchestrator::Run(const std::atomic<bool> &stop_requested) {
    while (!stop_requested.load()) {
        auto report = Tick();
        auto remaining = report.next_sleep;
        const auto slice = std::chrono::milliseconds(250);
        while (remaining.count() > 0 && !stop_requested.load()) {
            auto step = std::min(remaining, slice);
            std::this_thread::sleep_for(step);
            remaining -= step;
        }
    }
    deps_.journal.Log(severity::kInfo, "Loop", "Orchestrator stopping", {{"service", config_.service_name}});
}

TickReport Orchestrator::Tick() {
    const TimePoint now = clock_();
    TickReport report;
    try {
        refresh_running(now);
        apply_log_events(now);
        report.action_taken = poll_commands(now, report);
        report.action_taken = run_scheduled_actions(now, report) || report.action_taken;
        report.action_taken = run_periodic(now, report.action_taken, report) || report.action_taken;
        if (!report.action_taken) {
            report.action_taken = run_recovery(now, report);
        }
        if (!report.action_taken) {
            run_maintenance(now, report);
        }
        check_startup_timeout(now);
        last_service_error_.clear();
    } catch (const ServiceControlError &ex) {
        report.error = ex.what();
        deps_.journal.Log(ex.fatal() ? severity::kCritical : severity::kError, "Loop", "Service control failed",
                          {{"service", config_.service_name}, {"error", ex.what()},
                           {"fatal", ex.fatal() ? "true" : "false"}});
        if (ex.fatal() && last_service_error_ != ex.what()) {
            last_service_error_ = ex.what();
            notify(Audience::Admin, "service.error", "Service control failed: " + std::string(ex.what()));
        }
    } catch (const std::exception &ex) {
        report.error = ex.what();
        deps_.journal.Log(severity::kError, "Loop", "Tick failed", {{"error", ex.what()}});
    }
    report.next_sleep = next_sleep(now);
    return report;
}

void Orchestrator::refresh_running(TimePoint now) {
    const bool was_running = running_;
    running_ = deps_.controller.IsRunning();
    if (running_ && !was_running) {
        machine_.ResetHighWaterMark();
        if (!awaiting_startup_since_) {
            deps_.journal.Log(severity::kInfo, "Status", "Server process started outside the orchestrator",
                              {{"service", config_.service_name}});
            awaiting_startup_since_ = now;
        }
    }
}

void Orchestrator::apply_log_events(TimePoint now) {
    for (const auto &line : deps_.log.ReadNewLines()) {
        auto event = parser_.Parse(line, now);
        if (!event) {
            continue;
        }
        handle_transition(machine_.Apply(*event));
    }

    const StatusKind kind = machine_.Status().kind;
    if (!running_ && kind != StatusKind::Offline) {
        const std::string message = kind == StatusKind::ShuttingDown ? "Server stopped"
                                                                     : "Server process exited unexpectedly";
        handle_transition(machine_.ForceOffline(now, message));
    }
    if (machine_.Status().kind == StatusKind::Online && awaiting_startup_since_) {
        awaiting_startup_since_.reset();
    }
}

void Orchestrator::handle_transition(const StatusTransition &transition) {
    if (!transition.changed) {
        return;
    }
    const ServerStatus &status = transition.current;
    journal_status(status, "log");
    if (!transition.notify) {
        return;
    }
    std::vector<EventAttribute> payload = {{"phase", status.phase},
                                           {"previous", ToString(transition.previous.kind)}};
    if (status.performance) {
        payload.push_back({"players", std::to_string(status.performance->player_count)});
        payload.push_back({"performance", status.performance->status});
    }
    notify(player_visible(status.kind) ? Audience::Player : Audience::Admin, std::string("status.") + status.phase,
           status.message, std::move(payload));
}

bool Orchestrator::poll_commands(TimePoint now, TickReport &report) {
    bool action_taken = false;
    for (const auto &request : deps_.commands.Poll(command_cursor_)) {
        command_cursor_ = std::max(command_cursor_, request.sequence);
        const std::vector<EventAttribute> who = {{"requested_by", request.requested_by},
                                                 {"sequence", std::to_string(request.sequence)}};
        switch (request.kind) {
            case AdminRequestKind::Schedule: {
                const auto &action = registry_.Schedule(request.action, request.delay, now, request.requested_by);
                const int minutes = static_cast<int>(request.delay.count());
                deps_.journal.Log(severity::kInfo, "Action", "Action scheduled",
                                  {{"kind", ToString(action.kind)},
                                   {"delay_minutes", std::to_string(minutes)},
                                   {"scheduled_at", FormatTimestampUtc(action.scheduled_at)},
                                   {"requested_by", request.requested_by}});
                notify(Audience::Admin, "action.scheduled",
                       std::string("Server ") + kind_noun(action.kind) + " scheduled in " + minutes_phrase(minutes),
                       who);
                break;
            }
            case AdminRequestKind::Cancel: {
                const bool cancelled = registry_.Cancel(request.action);
                deps_.journal.Log(severity::kInfo, "Action", cancelled ? "Action cancelled" : "Nothing to cancel",
                                  {{"kind", ToString(request.action)}, {"requested_by", request.requested_by}});
                notify(Audience::Admin, "action.cancelled",
                       cancelled ? std::string("Scheduled ") + kind_noun(request.action) + " cancelled"
                                 : std::string("No scheduled ") + kind_noun(request.action) + " to cancel",
                       who);
                break;
            }
            case AdminRequestKind::SkipNextPeriodic: {
                const auto &state = periodic_.State();
                if (!state.next_restart_at) {
                    notify(Audience::Admin, "periodic.skip", "No periodic restart is configured", who);
                    break;
                }
                periodic_.SkipNext();
                deps_.journal.Log(severity::kInfo, "Periodic", "Next periodic restart will be skipped",
                                  {{"occurrence", FormatTimestampUtc(*state.next_restart_at)},
                                   {"requested_by", request.requested_by}});
                notify(Audience::Admin, "periodic.skip", "Next periodic restart will be skipped", who);
                break;
            }
            case AdminRequestKind::Start: {
                recovery_.ClearIntentionalStop();
                if (running_) {
                    notify(Audience::Admin, "action.start", "Server is already running", who);
                    break;
                }
                if (action_taken) {
                    notify(Audience::Admin, "action.start", "Start deferred: another start ran this tick", who);
                    break;
                }
                action_taken = true;
                report.executed.push_back("start");
                auto outcome = execute_start(now, "admin request by " + request.requested_by);
                notify(Audience::Admin, outcome.success ? "action.executed" : "action.failed",
                       outcome.success ? "Server start requested" : "Server start failed: " + outcome.error, who);
                break;
            }
        }
    }
    return action_taken;
}

bool Orchestrator::run_scheduled_actions(TimePoint now, TickReport &report) {
    auto tick = registry_.Tick(now);
    for (const auto &warning : tick.warnings) {
        const std::string message = std::string("Server ") + kind_noun(warning.action.kind) + " in " +
                                    minutes_phrase(warning.minutes_remaining);
        deps_.journal.Log(severity::kInfo, "Action", "Warning sent",
                          {{"kind", ToString(warning.action.kind)},
                           {"minutes", std::to_string(warning.minutes_remaining)}});
        notify(Audience::Player, "action.warning", message,
               {{"kind", ToString(warning.action.kind)}, {"minutes", std::to_string(warning.minutes_remaining)}});
    }

    bool action_taken = false;
    for (const auto &action : tick.due) {
        const std::vector<EventAttribute> payload = {{"kind", ToString(action.kind)},
                                                     {"requested_by", action.requested_by}};
        if (action_taken || !report.executed.empty()) {
            report.superseded.push_back(ToString(action.kind));
            deps_.journal.Log(severity::kWarning, "Action", "Action superseded by another action this tick",
                              {{"kind", ToString(action.kind)}});
            notify(Audience::Admin, "action.superseded",
                   std::string("Scheduled ") + kind_noun(action.kind) + " dropped: another action ran this tick",
                   payload);
            continue;
        }
        action_taken = true;
        report.executed.push_back(ToString(action.kind));
        const std::string reason = std::string("scheduled ") + ToString(action.kind) + " by " + action.requested_by;

        Outcome outcome;
        switch (action.kind) {
            case ActionKind::Restart:
                notify(Audience::Player, "action.executing", "Server restarting now");
                outcome = execute_restart(now, reason);
                break;
            case ActionKind::Stop:
                notify(Audience::Player, "action.executing", "Server shutting down now");
                outcome = execute_stop(reason);
                break;
            case ActionKind::Update:
                notify(Audience::Player, "action.executing", "Server going down for an update now");
                outcome = execute_update(now, reason);
                break;
        }
        deps_.journal.Log(outcome.success ? severity::kInfo : severity::kError, "Action",
                          outcome.success ? "Action executed" : "Action failed",
                          {{"kind", ToString(action.kind)}, {"error", outcome.error}});
        notify(Audience::Admin, outcome.success ? "action.executed" : "action.failed",
               outcome.success ? std::string("Scheduled ") + kind_noun(action.kind) + " completed"
                               : std::string("Scheduled ") + kind_noun(action.kind) + " failed: " + outcome.error,
               payload);
    }
    return action_taken;
}

bool Orchestrator::run_periodic(TimePoint now, bool action_taken, TickReport &report) {
    auto tick = periodic_.Tick(now);
    for (int minutes : tick.warnings) {
        deps_.journal.Log(severity::kInfo, "Periodic", "Warning sent", {{"minutes", std::to_string(minutes)}});
        notify(Audience::Player, "periodic.warning", "Scheduled server restart in " + minutes_phrase(minutes),
               {{"minutes", std::to_string(minutes)}});
    }
    const std::vector<EventAttribute> occurrence = {{"occurrence", FormatTimestampUtc(tick.occurrence)}};

    if (tick.skipped) {
        deps_.journal.Log(severity::kInfo, "Periodic", "Periodic restart skipped", occurrence);
        notify(Audience::Admin, "periodic.skipped", "Periodic restart skipped as requested", occurrence);
        return false;
    }
    if (!tick.restart_due) {
        return false;
    }
    if (action_taken) {
        report.superseded.push_back("periodic_restart");
        deps_.journal.Log(severity::kWarning, "Periodic", "Periodic restart superseded by another action this tick",
                          occurrence);
        notify(Audience::Admin, "action.superseded", "Periodic restart dropped: another action ran this tick",
               occurrence);
        return false;
    }

    report.executed.push_back("periodic_restart");
    std::vector<EventAttribute> payload = occurrence;
    if (deps_.backups) {
        report.backup_attempted = true;
        auto backup = run_backup();
        payload.push_back({"backup", backup.success ? backup.location.string() : "failed: " + backup.error});
    }
    notify(Audience::Player, "action.executing", "Server restarting now");
    auto outcome = execute_restart(now, "periodic restart");
    deps_.journal.Log(outcome.success ? severity::kInfo : severity::kError, "Periodic",
                      outcome.success ? "Periodic restart executed" : "Periodic restart failed",
                      {{"error", outcome.error}});
    notify(Audience::Admin, outcome.success ? "periodic.restart" : "action.failed",
           outcome.success ? "Periodic restart completed" : "Periodic restart failed: " + outcome.error, payload);
    return true;
}

bool Orchestrator::run_recovery(TimePoint now, TickReport &report) {
    auto decision = recovery_.Tick(now, running_, machine_.Status().kind);
    report.recovery = decision;
    const RecoveryHold previous_hold = last_hold_;
    last_hold_ = decision.hold;

    if (decision.stop_classified_intentional) {
        deps_.journal.Log(severity::kInfo, "Recovery", "Stop classified as intentional; auto-restart suspended",
                          {{"service", config_.service_name}});
        notify(Audience::Admin, "recovery.intentional_stop",
               "Server was stopped intentionally; automatic restart suspended until it is started again");
        return false;
    }
    if (decision.action != RecoveryAction::Restart) {
        if (decision.hold != previous_hold) {
            if (decision.hold == RecoveryHold::AttemptsExhausted) {
                deps_.journal.Log(severity::kCritical, "Recovery", "Restart attempts exhausted",
                                  {{"attempts", std::to_string(recovery_.State().consecutive_attempts)}});
                notify(Audience::Admin, "recovery.exhausted",
                       "Automatic restart gave up after " +
                           std::to_string(recovery_.State().consecutive_attempts) +
                           " attempts; manual intervention required");
            } else if (decision.hold == RecoveryHold::Cooldown) {
                deps_.journal.Log(severity::kInfo, "Recovery", "Waiting for restart cooldown",
                                  {{"attempts", std::to_string(recovery_.State().consecutive_attempts)}});
            }
        }
        return false;
    }

    report.executed.push_back("recovery_restart");
    const std::string attempt = std::to_string(recovery_.State().consecutive_attempts) + "/" +
                                std::to_string(recovery_.State().max_attempts);
    deps_.journal.Log(severity::kWarning, "Recovery", "Server is down unexpectedly; restarting",
                      {{"attempt", attempt}});
    auto outcome = execute_start(now, "automatic recovery attempt " + attempt);
    notify(Audience::Admin, outcome.success ? "recovery.restart" : "action.failed",
           outcome.success ? "Server crashed; automatic restart " + attempt
                           : "Automatic restart " + attempt + " failed: " + outcome.error,
           {{"attempt", attempt}});
    return true;
}

void Orchestrator::run_maintenance(TimePoint now, TickReport &report) {
    if (periodic_.BackupDue(now)) {
        periodic_.MarkBackup(now);
        if (deps_.backups) {
            report.backup_attempted = true;
            auto backup = run_backup();
            notify(Audience::Admin, backup.success ? "backup.completed" : "backup.failed",
                   backup.success ? "Backup created" : "Backup failed: " + backup.error,
                   {{"location", backup.location.string()}});
        }
    }

    if (periodic_.UpdateCheckDue(now)) {
        periodic_.MarkUpdateCheck(now);
        if (!deps_.versions || registry_.Pending(ActionKind::Update)) {
            return;
        }
        report.update_checked = true;
        auto check = deps_.versions->CheckAvailable();
        if (!check.error.empty()) {
            deps_.journal.Log(severity::kWarning, "Maintenance", "Update check failed", {{"error", check.error}});
            return;
        }
        deps_.journal.Log(severity::kInfo, "Maintenance", "Update check",
                          {{"installed", check.installed_build},
                           {"latest", check.latest_build},
                           {"available", check.available ? "true" : "false"}});
        if (!check.available) {
            return;
        }
        const ServerStatus &status = machine_.Status();
        const bool players_online = status.is_online && status.performance && status.performance->player_count > 0;
        const auto delay = players_online ? config_.update_delay : std::chrono::minutes(0);
        registry_.Schedule(ActionKind::Update, delay, now, "update-check");
        const int minutes = static_cast<int>(delay.count());
        notify(Audience::Admin, "update.available",
               "Update available (" + check.installed_build + " -> " + check.latest_build + "); scheduled in " +
                   minutes_phrase(minutes),
               {{"installed", check.installed_build}, {"latest", check.latest_build}});
    }
}

void Orchestrator::check_startup_timeout(TimePoint now) {
    if (!awaiting_startup_since_ || now - *awaiting_startup_since_ < config_.startup_timeout) {
        return;
    }
    awaiting_startup_since_.reset();
    deps_.journal.Log(severity::kError, "Status", "Server did not come online in time",
                      {{"timeout_minutes", std::to_string(config_.startup_timeout.count())},
                       {"status", ToString(machine_.Status().kind)}});
    notify(Audience::Admin, "startup.timeout",
           "Server did not come online within " + minutes_phrase(static_cast<int>(config_.startup_timeout.count())),
           {{"status", ToString(machine_.Status().kind)}});
}

std::chrono::milliseconds Orchestrator::next_sleep(TimePoint now) const {
    const auto lookahead =
        std::chrono::duration_cast<std::chrono::seconds>(config_.status_check_interval) + std::chrono::seconds(1);
    if (awaiting_startup_since_ || registry_.Imminent(now, lookahead) || periodic_.Imminent(now, lookahead)) {
        return config_.log_check_interval;
    }
    return config_.status_check_interval;
}

Orchestrator::Outcome Orchestrator::guarded(const std::function<bool()> &call, const std::string &what) {
    Outcome outcome;
    try {
        outcome.success = call();
        if (!outcome.success) {
            outcome.error = what + " was rejected by the service manager";
            const std::string detail = deps_.controller.LastError();
            if (!detail.empty()) {
                outcome.error += ": " + detail;
            }
        }
    } catch (const ServiceControlError &ex) {
        outcome.error = ex.what();
        deps_.journal.Log(ex.fatal() ? severity::kCritical : severity::kError, "Action", what + " failed",
                          {{"error", ex.what()}, {"fatal", ex.fatal() ? "true" : "false"}});
    }
    return outcome;
}

void Orchestrator::began_startup(TimePoint now) {
    machine_.ResetHighWaterMark();
    awaiting_startup_since_ = now;
    recovery_.ClearIntentionalStop();
}

Orchestrator::Outcome Orchestrator::execute_restart(TimePoint now, const std::string &reason) {
    if (!running_) {
        return execute_start(now, reason);
    }
    auto outcome = guarded([&] { return deps_.controller.Restart(reason); }, "restart");
    if (outcome.success) {
        began_startup(now);
    }
    return outcome;
}

Orchestrator::Outcome Orchestrator::execute_start(TimePoint now, const std::string &context) {
    auto outcome = guarded([&] { return deps_.controller.Start(context); }, "start");
    if (outcome.success) {
        began_startup(now);
    }
    return outcome;
}

Orchestrator::Outcome Orchestrator::execute_stop(const std::string &reason) {
    recovery_.MarkIntentionalStop();
    awaiting_startup_since_.reset();
    return guarded([&] { return deps_.controller.Stop(reason); }, "stop");
}

Orchestrator::Outcome Orchestrator::execute_update(TimePoint now, const std::string &reason) {
    Outcome outcome;
    if (!deps_.versions) {
        outcome.error = "no version service configured";
        return outcome;
    }
    if (running_) {
        recovery_.MarkIntentionalStop();
        auto stopped = guarded([&] { return deps_.controller.Stop(reason); }, "stop");
        if (!stopped.success) {
            recovery_.ClearIntentionalStop();
            return stopped;
        }
        // The stop job is only queued; the install must not change under a live server.
        auto halted = wait_until_stopped();
        if (!halted.success) {
            recovery_.ClearIntentionalStop();
            deps_.journal.Log(severity::kError, "Maintenance", "Update aborted: server did not stop",
                              {{"error", halted.error}});
            return halted;
        }
    }

    auto update = deps_.versions->Update();
    deps_.journal.Log(update.success ? severity::kInfo : severity::kError, "Maintenance",
                      update.success ? "Update installed" : "Update failed", {{"error", update.error}});

    // The server goes back up whether or not the update worked. If the start fails, auto-recovery
    // owns the retry.
    recovery_.ClearIntentionalStop();
    auto started = execute_start(now, reason);
    if (!update.success) {
        outcome.error = "update failed: " + update.error;
        if (!started.success) {
            outcome.error += "; start failed: " + started.error;
        }
        return outcome;
    }
    return started;
}

Orchestrator::Outcome Orchestrator::wait_until_stopped() {
    Outcome outcome;
    const auto deadline = std::chrono::steady_clock::now() + config_.stop_timeout;
    try {
        while (deps_.controller.IsRunning()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                outcome.error = "server still running " + std::to_string(config_.stop_timeout.count()) +
                                "s after the stop request";
                return outcome;
            }
            std::this_thread::sleep_for(config_.log_check_interval);
        }
    } catch (const ServiceControlError &ex) {
        outcome.error = ex.what();
        return outcome;
    }
    running_ = false;
    outcome.success = true;
    return outcome;
}

BackupResult Orchestrator::run_backup() {
    auto result = deps_.backups->Create(config_.server_data);
    deps_.journal.Log(result.success ? severity::kInfo : severity::kError, "Maintenance",
                      result.success ? "Backup created" : "Backup failed",
                      {{"location", result.location.string()}, {"error", result.error}});
    return result;
}

void Orchestrator::notify(Audience audience, const std::string &event_key, const std::string &message,
                          std::vector<EventAttribute> payload) {
    payload.push_back({"service", config_.service_name});
    deps_.notifier.Send(audience, event_key, message, payload);
}

void Orchestrator::journal_status(const ServerStatus &status, const std::string &reason) {
    std::vector<EventAttribute> attributes = {{"kind", ToString(status.kind)},
                                              {"phase", status.phase},
                                              {"online", status.is_online ? "true" : "false"},
                                              {"highest", ToString(status.highest_kind_reached)},
                                              {"reason", reason},
                                              {"service", config_.service_name}};
    if (status.performance) {
        attributes.push_back({"players", std::to_string(status.performance->player_count)});
        attributes.push_back({"avg_fps", format_fps(status.performance->avg_fps)});
        attributes.push_back({"performance", status.performance->status});
    }
    deps_.journal.Log(severity::kInfo, "Status", status.message, std::move(attributes));
}

}  // namespace srvkeeper
