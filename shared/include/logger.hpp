#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include "event.hpp"

namespace srvkeeper {

namespace severity {
constexpr const char *kInfo = "Info";
constexpr const char *kWarning = "Warning";
constexpr const char *kError = "Error";
constexpr const char *kCritical = "Critical";
}  // namespace severity

// Append-only JSON-lines journal with size based rotation.
class JsonLogger {
  public:
    JsonLogger(std::filesystem::path log_path, std::string default_source, bool echo_to_stderr = false);

    void Append(const EventRecord &record);
    void Log(const std::string &severity, const std::string &category, const std::string &message,
             std::vector<EventAttribute> attributes = {});
    void Rotate();

    const std::filesystem::path &Path() const { return log_path_; }

  private:
    void open_stream();
    void ensure_directory();
    void recover_sequence();
    void rotate_locked();
    void echo(const EventRecord &record) const;

    std::filesystem::path log_path_;
    std::ofstream stream_;
    std::mutex mutex_;
    std::string default_source_;
    bool echo_to_stderr_ = false;
    std::uint64_t next_sequence_ = 1;
};

}  // namespace srvkeeper
