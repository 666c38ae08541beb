#include "stop_evidence.hpp"

#include <algorithm>
#include <exception>
#include <string_view>

#include "log_event_parser.hpp"
#include "logger.hpp"
#include "text.hpp"

namespace srvkeeper {
namespace {

const std::vector<std::string_view> kCrashMarkers = {"exception in thread", "fatal error", "segmentation fault",
                                                     "outofmemoryerror",    "hs_err_pid",  "core dumped",
                                                     "sigsegv",             "sigabrt"};

bool in_window(const EventRecord &record, TimePoint now, std::chrono::minutes window) {
    if (record.timestamp == TimePoint{}) {
        return true;
    }
    auto delta = now - record.timestamp;
    return delta >= -std::chrono::minutes(1) && delta <= window;
}

std::string compute_confidence(std::size_t weight) {
    if (weight >= 5) {
        return "High";
    }
    if (weight >= 3) {
        return "Medium";
    }
    return "Low";
}

}  // namespace

StopAssessment AssessStopTimeline(std::vector<EventRecord> events, TimePoint now, std::chrono::minutes window) {
    StopAssessment assessment;
    events.erase(std::remove_if(events.begin(), events.end(),
                                [&](const EventRecord &record) { return !in_window(record, now, window); }),
                 events.end());
    std::stable_sort(events.begin(), events.end(), [](const EventRecord &lhs, const EventRecord &rhs) {
        return lhs.timestamp < rhs.timestamp;
    });

    auto last_start = std::find_if(events.rbegin(), events.rend(),
                                   [](const EventRecord &record) { return record.category == evidence::kServiceStart; });
    const auto begin = last_start == events.rend() ? events.begin() : last_start.base();

    std::size_t stop_weight = 0;
    std::size_t crash_weight = 0;
    bool manager_stop = false;
    bool clean_shutdown = false;
    bool crash_after_shutdown = false;
    for (auto it = begin; it != events.end(); ++it) {
        const auto &record = *it;
        if (record.category == evidence::kServiceStop) {
            manager_stop = true;
            stop_weight += 3;
            assessment.supporting_events.push_back(record);
        } else if (record.category == evidence::kCleanShutdown) {
            stop_weight += 2;
            clean_shutdown = true;
            crash_after_shutdown = false;
            assessment.supporting_events.push_back(record);
        } else if (record.category == evidence::kCrash) {
            crash_weight += 3;
            crash_after_shutdown = true;
            assessment.supporting_events.push_back(record);
        }
    }

    if (manager_stop) {
        assessment.intentional = true;
        assessment.confidence = compute_confidence(stop_weight + 2);
        assessment.rationale = "The service manager recorded a stop request for the unit.";
    } else if (clean_shutdown && !crash_after_shutdown) {
        assessment.intentional = true;
        assessment.confidence = compute_confidence(stop_weight + 1);
        assessment.rationale = "The server logged an orderly shutdown with no crash signature after it.";
    } else if (crash_weight > 0) {
        assessment.confidence = compute_confidence(crash_weight);
        assessment.rationale = "Crash signatures were recorded around the stop.";
    } else {
        assessment.confidence = "Low";
        assessment.rationale = "No explicit stop evidence; treating the stop as a crash.";
    }
    return assessment;
}

LogTailEvidenceCollector::LogTailEvidenceCollector(const LogSource &source, std::size_t max_lines)
    : source_(source), max_lines_(max_lines) {}

std::vector<EventRecord> LogTailEvidenceCollector::Collect(const std::string & /*service_name*/, TimePoint since) {
    std::vector<EventRecord> out;
    LogEventParser parser;
    TimePoint carried = since;
    for (const auto &line : source_.RecentTail(max_lines_)) {
        if (auto stamp = ParseLogTimestamp(line)) {
            carried = *stamp;
        }
        EventRecord record;
        record.source = "server.log";
        record.timestamp = carried;
        record.message = line;
        if (ContainsAnyCaseInsensitive(line, kCrashMarkers)) {
            record.category = evidence::kCrash;
        } else if (auto event = parser.Parse(line, carried)) {
            if (event->kind == StatusKind::ShuttingDown) {
                record.category = evidence::kCleanShutdown;
            } else if (event->kind == StatusKind::Starting) {
                record.category = evidence::kServiceStart;
            } else {
                continue;
            }
        } else {
            continue;
        }
        out.push_back(std::move(record));
    }
    return out;
}

TimelineStopEvidence::TimelineStopEvidence(std::vector<StopEvidenceCollector *> collectors,
                                           std::function<TimePoint()> clock, JsonLogger *journal)
    : collectors_(std::move(collectors)), clock_(std::move(clock)), journal_(journal) {}

bool TimelineStopEvidence::Assess(const std::string &service_name, std::chrono::minutes window) {
    const TimePoint now = clock_();
    std::vector<EventRecord> events;
    for (auto *collector : collectors_) {
        try {
            auto collected = collector->Collect(service_name, now - window);
            events.insert(events.end(), collected.begin(), collected.end());
        } catch (const std::exception &ex) {
            if (journal_) {
                journal_->Log(severity::kWarning, "Recovery", "Stop evidence collector failed",
                              {{"service", service_name}, {"error", ex.what()}});
            }
        }
    }

    last_ = AssessStopTimeline(std::move(events), now, window);
    if (journal_) {
        journal_->Log(severity::kInfo, "Recovery", last_.rationale,
                      {{"service", service_name},
                       {"intentional", last_.intentional ? "true" : "false"},
                       {"confidence", last_.confidence},
                       {"evidence", std::to_string(last_.supporting_events.size())}});
    }
    return last_.intentional;
}

}  // namespace srvkeeper
