#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "event.hpp"
#include "server_status.hpp"

namespace srvkeeper {

class JsonLogger;

// Evidence record categories.
namespace evidence {
constexpr const char *kServiceStart = "ServiceStart";
constexpr const char *kServiceStop = "ServiceStop";
constexpr const char *kCleanShutdown = "CleanShutdown";
constexpr const char *kCrash = "Crash";
}  // namespace evidence

struct StopAssessment {
    bool intentional = false;
    std::string confidence;
    std::string rationale;
    std::vector<EventRecord> supporting_events;
};

// Decides whether the most recent stop of the managed process was deliberate. Only evidence after
// the newest start inside the look-back window counts. A stop job from the service manager is
// conclusive; a clean shutdown marker in the server log counts unless crash evidence follows it.
StopAssessment AssessStopTimeline(std::vector<EventRecord> events, TimePoint now, std::chrono::minutes window);

class StopEvidenceCollector {
  public:
    virtual ~StopEvidenceCollector() = default;

    virtual std::vector<EventRecord> Collect(const std::string &service_name, TimePoint since) = 0;
};

// Classifies the server console tail: start markers, clean shutdown markers, crash signatures.
class LogTailEvidenceCollector : public StopEvidenceCollector {
  public:
    LogTailEvidenceCollector(const LogSource &source, std::size_t max_lines);

    std::vector<EventRecord> Collect(const std::string &service_name, TimePoint since) override;

  private:
    const LogSource &source_;
    std::size_t max_lines_;
};

class TimelineStopEvidence : public IntentionalStopEvidence {
  public:
    TimelineStopEvidence(std::vector<StopEvidenceCollector *> collectors, std::function<TimePoint()> clock,
                         JsonLogger *journal);

    bool Assess(const std::string &service_name, std::chrono::minutes window) override;

    const StopAssessment &LastAssessment() const { return last_; }

  private:
    std::vector<StopEvidenceCollector *> collectors_;
    std::function<TimePoint()> clock_;
    JsonLogger *journal_;
    StopAssessment last_;
};

}  // namespace srvkeeper
