#pragma once

#include <chrono>
#include <string>

#include "collaborators.hpp"

struct sd_bus;

namespace srvkeeper {
class JsonLogger;
}

namespace srvkeeper::systemd {

// Drives one unit through org.freedesktop.systemd1 on the system bus. Access-denied and
// unknown-unit errors throw a fatal ServiceControlError; other bus failures are transient.
class SystemdServiceController : public ServiceController {
  public:
    SystemdServiceController(std::string unit_name, std::chrono::seconds call_timeout,
                             JsonLogger *journal = nullptr);
    ~SystemdServiceController() override;

    SystemdServiceController(const SystemdServiceController &) = delete;
    SystemdServiceController &operator=(const SystemdServiceController &) = delete;

    bool IsRunning() override;
    bool Exists() override;
    bool Start(const std::string &context) override;
    bool Stop(const std::string &reason) override;
    bool Restart(const std::string &reason) override;
    std::string LastError() const override { return last_error_; }

  private:
    sd_bus *bus();
    void drop_bus();
    std::string unit_path();
    std::string unit_property(const std::string &path, const char *interface, const char *name);
    bool submit_job(const char *method, const std::string &why);

    std::string unit_name_;
    std::chrono::seconds call_timeout_;
    JsonLogger *journal_;
    sd_bus *bus_ = nullptr;
    std::string last_error_;
};

}  // namespace srvkeeper::systemd
