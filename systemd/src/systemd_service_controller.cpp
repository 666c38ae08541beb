#include "systemd_service_controller.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <systemd/sd-bus.h>

#include "logger.hpp"

namespace srvkeeper::systemd {

namespace {
constexpr const char *kDestination = "org.freedesktop.systemd1";
constexpr const char *kManagerPath = "/org/freedesktop/systemd1";
constexpr const char *kManagerInterface = "org.freedesktop.systemd1.Manager";
constexpr const char *kUnitInterface = "org.freedesktop.systemd1.Unit";
constexpr const char *kServiceInterface = "org.freedesktop.systemd1.Service";

// Owns an sd_bus_error for the duration of one call.
struct BusError {
    sd_bus_error error = SD_BUS_ERROR_NULL;

    BusError() = default;
    BusError(const BusError &) = delete;
    BusError &operator=(const BusError &) = delete;
    ~BusError() { sd_bus_error_free(&error); }
};

bool is_fatal(const sd_bus_error &error, int result) {
    if (result == -EACCES || result == -EPERM) {
        return true;
    }
    return sd_bus_error_has_name(&error, SD_BUS_ERROR_ACCESS_DENIED) ||
           sd_bus_error_has_name(&error, SD_BUS_ERROR_INTERACTIVE_AUTHORIZATION_REQUIRED) ||
           sd_bus_error_has_name(&error, "org.freedesktop.systemd1.NoSuchUnit") ||
           sd_bus_error_has_name(&error, "org.freedesktop.systemd1.LoadFailed");
}

std::string describe(const sd_bus_error &error, int result) {
    return error.message ? error.message : std::strerror(-result);
}

[[noreturn]] void throw_bus_error(const std::string &what, const sd_bus_error &error, int result) {
    throw ServiceControlError(what + ": " + describe(error, result), is_fatal(error, result));
}

}  // namespace

SystemdServiceController::SystemdServiceController(std::string unit_name, std::chrono::seconds call_timeout,
                                                   JsonLogger *journal)
    : unit_name_(std::move(unit_name)), call_timeout_(call_timeout), journal_(journal) {}

SystemdServiceController::~SystemdServiceController() { drop_bus(); }

sd_bus *SystemdServiceController::bus() {
    if (bus_) {
        return bus_;
    }
    int r = sd_bus_open_system(&bus_);
    if (r < 0) {
        bus_ = nullptr;
        throw ServiceControlError(std::string("cannot connect to the system bus: ") + std::strerror(-r),
                                  r == -EACCES || r == -EPERM);
    }
    sd_bus_set_method_call_timeout(bus_, static_cast<std::uint64_t>(call_timeout_.count()) * 1000000ULL);
    return bus_;
}

void SystemdServiceController::drop_bus() {
    if (bus_) {
        sd_bus_flush_close_unref(bus_);
        bus_ = nullptr;
    }
}

std::string SystemdServiceController::unit_path() {
    BusError error;
    sd_bus_message *reply = nullptr;
    int r = sd_bus_call_method(bus(), kDestination, kManagerPath, kManagerInterface, "LoadUnit", &error.error,
                               &reply, "s", unit_name_.c_str());
    if (r < 0) {
        if (r == -ECONNRESET || r == -ENOTCONN) {
            drop_bus();
        }
        throw_bus_error("LoadUnit " + unit_name_, error.error, r);
    }
    const char *path = nullptr;
    r = sd_bus_message_read(reply, "o", &path);
    std::string result = (r >= 0 && path) ? path : "";
    sd_bus_message_unref(reply);
    if (result.empty()) {
        throw ServiceControlError("LoadUnit " + unit_name_ + ": malformed reply", false);
    }
    return result;
}

std::string SystemdServiceController::unit_property(const std::string &path, const char *interface,
                                                    const char *name) {
    BusError error;
    char *value = nullptr;
    int r = sd_bus_get_property_string(bus(), kDestination, path.c_str(), interface, name, &error.error, &value);
    if (r < 0) {
        throw_bus_error(std::string("reading ") + name + " of " + unit_name_, error.error, r);
    }
    std::string result = value ? value : "";
    std::free(value);
    return result;
}

bool SystemdServiceController::Exists() {
    const auto path = unit_path();
    return unit_property(path, kUnitInterface, "LoadState") != "not-found";
}

bool SystemdServiceController::IsRunning() {
    const auto path = unit_path();
    if (unit_property(path, kUnitInterface, "LoadState") == "not-found") {
        throw ServiceControlError("unit " + unit_name_ + " does not exist", true);
    }
    const auto state = unit_property(path, kUnitInterface, "ActiveState");
    if (state == "active" || state == "reloading") {
        return true;
    }
    if (state != "activating") {
        return false;
    }
    // Still activating: running once the main process exists.
    BusError error;
    std::uint32_t main_pid = 0;
    int r = sd_bus_get_property_trivial(bus(), kDestination, path.c_str(), kServiceInterface, "MainPID",
                                        &error.error, 'u', &main_pid);
    if (r < 0) {
        throw_bus_error("reading MainPID of " + unit_name_, error.error, r);
    }
    return main_pid > 0;
}

bool SystemdServiceController::submit_job(const char *method, const std::string &why) {
    BusError error;
    sd_bus_message *reply = nullptr;
    int r = sd_bus_call_method(bus(), kDestination, kManagerPath, kManagerInterface, method, &error.error, &reply,
                               "ss", unit_name_.c_str(), "replace");
    if (r < 0) {
        if (r == -ECONNRESET || r == -ENOTCONN) {
            drop_bus();
        }
        if (is_fatal(error.error, r)) {
            throw_bus_error(std::string(method) + " " + unit_name_ + " (" + why + ")", error.error, r);
        }
        last_error_ = std::string(method) + ": " + describe(error.error, r);
        if (journal_) {
            journal_->Log(severity::kWarning, "Service", "Service manager call failed",
                          {{"service", unit_name_}, {"method", method}, {"reason", why}, {"error", last_error_}});
        }
        return false;
    }
    sd_bus_message_unref(reply);
    last_error_.clear();
    return true;
}

bool SystemdServiceController::Start(const std::string &context) { return submit_job("StartUnit", context); }

bool SystemdServiceController::Stop(const std::string &reason) { return submit_job("StopUnit", reason); }

bool SystemdServiceController::Restart(const std::string &reason) { return submit_job("RestartUnit", reason); }

}  // namespace srvkeeper::systemd
