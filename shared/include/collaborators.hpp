#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "event.hpp"
#include "scheduled_action_registry.hpp"

namespace srvkeeper {

// Raised by a ServiceController for failures that retrying will not fix (permission denied,
// unknown unit). Transient failures are reported as a false return instead.
class ServiceControlError : public std::runtime_error {
  public:
    ServiceControlError(const std::string &message, bool fatal) : std::runtime_error(message), fatal_(fatal) {}

    bool fatal() const { return fatal_; }

  private:
    bool fatal_;
};

class ServiceController {
  public:
    virtual ~ServiceController() = default;

    virtual bool IsRunning() = 0;
    virtual bool Exists() = 0;
    virtual bool Start(const std::string &context) = 0;
    virtual bool Stop(const std::string &reason) = 0;
    virtual bool Restart(const std::string &reason) = 0;

    // Detail of the most recent false return, empty when the implementation has none.
    virtual std::string LastError() const { return {}; }
};

enum class Audience { Admin, Player };

const char *ToString(Audience audience);

class Notifier {
  public:
    virtual ~Notifier() = default;

    // Fire-and-forget. Implementations swallow and log their own delivery failures.
    virtual void Send(Audience audience, const std::string &event_key, const std::string &message,
                      const std::vector<EventAttribute> &payload) = 0;
};

enum class AdminRequestKind { Schedule, Cancel, Start, SkipNextPeriodic };

struct AdminRequest {
    AdminRequestKind kind = AdminRequestKind::Schedule;
    ActionKind action = ActionKind::Restart;
    std::chrono::minutes delay{0};
    std::string requested_by;
    std::uint64_t sequence = 0;
};

class CommandSource {
  public:
    virtual ~CommandSource() = default;

    // Requests with a sequence greater than `after_sequence`, oldest first.
    virtual std::vector<AdminRequest> Poll(std::uint64_t after_sequence) = 0;
};

struct VersionCheck {
    std::string installed_build;
    std::string latest_build;
    bool available = false;
    std::string error;
};

struct UpdateResult {
    bool success = false;
    std::string error;
};

class VersionService {
  public:
    virtual ~VersionService() = default;

    virtual VersionCheck CheckAvailable() = 0;
    virtual UpdateResult Update() = 0;
};

struct BackupResult {
    bool success = false;
    std::string error;
    std::filesystem::path location;
};

class BackupService {
  public:
    virtual ~BackupService() = default;

    virtual BackupResult Create(const std::filesystem::path &source_path) = 0;
};

class IntentionalStopEvidence {
  public:
    virtual ~IntentionalStopEvidence() = default;

    virtual bool Assess(const std::string &service_name, std::chrono::minutes window) = 0;
};

// Supplies the managed server's console output.
class LogSource {
  public:
    virtual ~LogSource() = default;

    // Complete lines written since the previous call.
    virtual std::vector<std::string> ReadNewLines() = 0;
    virtual std::vector<std::string> RecentTail(std::size_t max_lines) const = 0;
};

}  // namespace srvkeeper
