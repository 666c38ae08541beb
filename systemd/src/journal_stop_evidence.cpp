#include "journal_stop_evidence.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string_view>

#include <systemd/sd-journal.h>

#include "text.hpp"

namespace srvkeeper::systemd {

namespace {

std::string get_journal_field(sd_journal *journal, const char *field) {
    const void *data = nullptr;
    size_t length = 0;
    if (sd_journal_get_data(journal, field, &data, &length) < 0 || !data) {
        return {};
    }
    std::string_view raw(static_cast<const char *>(data), length);
    auto equals = raw.find('=');
    if (equals == std::string_view::npos) {
        return {};
    }
    std::string value(raw.substr(equals + 1));
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

// Returns the evidence category for one journal entry, or an empty string for irrelevant ones.
std::string classify(sd_journal *journal, const std::string &message) {
    if (!get_journal_field(journal, "COREDUMP_UNIT").empty()) {
        return evidence::kCrash;
    }
    const std::string job_type = get_journal_field(journal, "JOB_TYPE");
    if (job_type == "stop") {
        return evidence::kServiceStop;
    }
    if (job_type == "start" && get_journal_field(journal, "JOB_RESULT") != "failed") {
        return evidence::kServiceStart;
    }
    if (ContainsAnyCaseInsensitive(message, {"code=killed", "code=dumped", "failed with result", "core-dump"})) {
        return evidence::kCrash;
    }
    if (job_type.empty()) {
        if (message.rfind("Stopping ", 0) == 0) {
            return evidence::kServiceStop;
        }
        if (message.rfind("Started ", 0) == 0) {
            return evidence::kServiceStart;
        }
    }
    return {};
}

}  // namespace

std::vector<EventRecord> JournalStopEvidenceCollector::Collect(const std::string &service_name, TimePoint since) {
    std::vector<EventRecord> out;
    sd_journal *journal = nullptr;
    int r = sd_journal_open(&journal, SD_JOURNAL_LOCAL_ONLY | SD_JOURNAL_SYSTEM);
    if (r < 0) {
        throw std::runtime_error(std::string("cannot open systemd journal: ") + std::strerror(-r));
    }

    const std::string unit_match = "UNIT=" + service_name;
    const std::string own_match = "_SYSTEMD_UNIT=" + service_name;
    const std::string coredump_match = "COREDUMP_UNIT=" + service_name;
    sd_journal_add_match(journal, unit_match.c_str(), 0);
    sd_journal_add_disjunction(journal);
    sd_journal_add_match(journal, own_match.c_str(), 0);
    sd_journal_add_disjunction(journal);
    sd_journal_add_match(journal, coredump_match.c_str(), 0);

    const auto since_usec =
        std::chrono::duration_cast<std::chrono::microseconds>(since.time_since_epoch()).count();
    sd_journal_seek_realtime_usec(journal, static_cast<std::uint64_t>(since_usec < 0 ? 0 : since_usec));

    while (sd_journal_next(journal) > 0) {
        const std::string message = get_journal_field(journal, "MESSAGE");
        const std::string category = classify(journal, message);
        if (category.empty()) {
            continue;
        }
        EventRecord record;
        record.source = "systemd.journal";
        record.category = category;
        record.message = message;
        std::uint64_t usec = 0;
        if (sd_journal_get_realtime_usec(journal, &usec) >= 0) {
            record.timestamp = TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(usec)));
        }
        record.attributes.push_back({"unit", service_name});
        record.attributes.push_back({"priority", get_journal_field(journal, "PRIORITY")});
        out.push_back(std::move(record));
    }
    sd_journal_close(journal);
    return out;
}

}  // namespace srvkeeper::systemd
