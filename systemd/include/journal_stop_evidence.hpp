#pragma once

#include <string>
#include <vector>

#include "stop_evidence.hpp"

namespace srvkeeper::systemd {

// Reads the systemd journal for the managed unit: start and stop jobs, main-process exits and
// core dumps since the requested time.
class JournalStopEvidenceCollector : public StopEvidenceCollector {
  public:
    std::vector<EventRecord> Collect(const std::string &service_name, TimePoint since) override;
};

}  // namespace srvkeeper::systemd
