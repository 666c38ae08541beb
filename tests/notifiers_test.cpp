#include "notifiers.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "event.hpp"
#include "logger.hpp"

namespace {
using namespace srvkeeper;

class ThrowingNotifier : public Notifier {
  public:
    void Send(Audience, const std::string &, const std::string &, const std::vector<EventAttribute> &) override {
        throw std::runtime_error("webhook unreachable");
    }
};

class RecordingNotifier : public Notifier {
  public:
    void Send(Audience, const std::string &event_key, const std::string &, const std::vector<EventAttribute> &) override {
        keys.push_back(event_key);
    }

    std::vector<std::string> keys;
};

std::vector<EventRecord> read_journal(const std::filesystem::path &path) {
    std::vector<EventRecord> records;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        EventRecord record;
        if (DeserializeEvent(line, record)) {
            records.push_back(record);
        }
    }
    return records;
}

std::filesystem::path write_script(const std::filesystem::path &path, const std::string &body) {
    std::ofstream out(path);
    out << "#!/bin/sh\n" << body << "\n";
    out.close();
    ::chmod(path.c_str(), 0755);
    return path;
}

bool chain_skips_failing_notifier(const std::filesystem::path &dir) {
    JsonLogger journal(dir / "chain.log", "notifiers-test");
    ThrowingNotifier broken;
    RecordingNotifier recording;
    NotifierChain chain(&journal);
    chain.Add(broken);
    chain.Add(recording);

    chain.Send(Audience::Admin, "backup.failed", "Backup failed: disk full", {});
    chain.Send(Audience::Player, "action.warning", "Server restart in 5 minutes", {});
    if (recording.keys != std::vector<std::string>{"backup.failed", "action.warning"}) {
        std::cerr << "A throwing notifier must not block the rest of the chain\n";
        return false;
    }
    int failures = 0;
    for (const auto &record : read_journal(journal.Path())) {
        if (record.message == "Notifier failed" && FindAttribute(record, "error") == "webhook unreachable") {
            ++failures;
        }
    }
    if (failures != 2) {
        std::cerr << "Each notifier failure should be journaled\n";
        return false;
    }
    return true;
}

bool journal_notifier_records_audience(const std::filesystem::path &dir) {
    JsonLogger journal(dir / "journal.log", "notifiers-test");
    JournalNotifier notifier(journal);
    notifier.Send(Audience::Player, "status.online", "Server is online", {{"players", "0"}});

    auto records = read_journal(journal.Path());
    if (records.size() != 1 || records[0].category != "Notification" || records[0].message != "Server is online" ||
        FindAttribute(records[0], "audience") != "player" || FindAttribute(records[0], "event") != "status.online" ||
        FindAttribute(records[0], "players") != "0") {
        std::cerr << "Journal notification record incorrect\n";
        return false;
    }
    return true;
}

bool hook_receives_arguments(const std::filesystem::path &dir) {
    const auto out = dir / "hook.out";
    const auto hook = write_script(dir / "hook.sh", "printf '%s\\n' \"$@\" > '" + out.string() + "'");
    JsonLogger journal(dir / "hook.log", "notifiers-test");
    HookNotifier notifier(hook.string(), std::chrono::seconds(10), &journal);
    notifier.Send(Audience::Admin, "action.failed", "Scheduled update failed: disk full", {{"kind", "update"}});

    std::ifstream in(out);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    const std::vector<std::string> expected = {"admin", "action.failed", "Scheduled update failed: disk full",
                                               "kind=update"};
    if (lines != expected) {
        std::cerr << "Hook arguments incorrect\n";
        return false;
    }
    return true;
}

bool slow_hook_is_cut_off(const std::filesystem::path &dir) {
    const auto hook = write_script(dir / "slow.sh", "sleep 30");
    JsonLogger journal(dir / "slow.log", "notifiers-test");
    HookNotifier notifier(hook.string(), std::chrono::seconds(1), &journal);

    const auto started = std::chrono::steady_clock::now();
    notifier.Send(Audience::Player, "action.warning", "Server restart in 1 minute", {});
    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > std::chrono::seconds(10)) {
        std::cerr << "A hung hook should not hold the loop past its timeout\n";
        return false;
    }
    auto records = read_journal(journal.Path());
    if (records.empty() || records.back().message != "Notification hook failed" ||
        FindAttribute(records.back(), "timed_out") != "true") {
        std::cerr << "Hook timeout should be journaled\n";
        return false;
    }
    return true;
}
}

int main() {
    const auto dir =
        std::filesystem::temp_directory_path() / ("srvkeeper_notifiers_test_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    bool ok = chain_skips_failing_notifier(dir) && journal_notifier_records_audience(dir) &&
              hook_receives_arguments(dir) && slow_hook_is_cut_off(dir);
    std::filesystem::remove_all(dir);
    return ok ? 0 : 1;
}
