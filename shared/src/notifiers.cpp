#include "notifiers.hpp"

#include <exception>

#include "logger.hpp"
#include "process_runner.hpp"

namespace srvkeeper {

const char *ToString(Audience audience) {
    switch (audience) {
        case Audience::Admin:
            return "admin";
        case Audience::Player:
            return "player";
    }
    return "admin";
}

JournalNotifier::JournalNotifier(JsonLogger &journal) : journal_(journal) {}

void JournalNotifier::Send(Audience audience, const std::string &event_key, const std::string &message,
                           const std::vector<EventAttribute> &payload) {
    EventRecord record;
    record.category = "Notification";
    record.severity = severity::kInfo;
    record.message = message;
    record.attributes = payload;
    SetAttribute(record, "audience", ToString(audience));
    SetAttribute(record, "event", event_key);
    journal_.Append(record);
}

HookNotifier::HookNotifier(std::string hook_command, std::chrono::seconds timeout, JsonLogger *journal)
    : hook_command_(std::move(hook_command)), timeout_(timeout), journal_(journal) {}

void HookNotifier::Send(Audience audience, const std::string &event_key, const std::string &message,
                        const std::vector<EventAttribute> &payload) {
    if (hook_command_.empty()) {
        return;
    }
    std::vector<std::string> arguments = {ToString(audience), event_key, message};
    for (const auto &attr : payload) {
        arguments.push_back(attr.key + "=" + attr.value);
    }
    auto result = RunShellCommand(hook_command_ + " \"$@\"", timeout_, arguments);
    if (!result.ok() && journal_) {
        journal_->Log(severity::kWarning, "Notification", "Notification hook failed",
                      {{"event", event_key},
                       {"exit_code", std::to_string(result.exit_code)},
                       {"timed_out", result.timed_out ? "true" : "false"},
                       {"error", result.error}});
    }
}

NotifierChain::NotifierChain(JsonLogger *journal) : journal_(journal) {}

void NotifierChain::Add(Notifier &notifier) { notifiers_.push_back(&notifier); }

void NotifierChain::Send(Audience audience, const std::string &event_key, const std::string &message,
                         const std::vector<EventAttribute> &payload) {
    for (auto *notifier : notifiers_) {
        try {
            notifier->Send(audience, event_key, message, payload);
        } catch (const std::exception &ex) {
            if (journal_) {
                journal_->Log(severity::kWarning, "Notification", "Notifier failed",
                              {{"event", event_key}, {"error", ex.what()}});
            }
        }
    }
}

}  // namespace srvkeeper
