#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace srvkeeper {

namespace {
constexpr std::size_t kMaxLogSizeBytes = 5 * 1024 * 1024;

std::string format_rotation_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t_value = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time_t_value, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

}  // namespace

JsonLogger::JsonLogger(std::filesystem::path log_path, std::string default_source, bool echo_to_stderr)
    : log_path_(std::move(log_path)), default_source_(std::move(default_source)), echo_to_stderr_(echo_to_stderr) {
    ensure_directory();
    recover_sequence();
    open_stream();
}

void JsonLogger::ensure_directory() {
    const auto directory = log_path_.parent_path();
    if (directory.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        std::cerr << "srvkeeper: cannot create " << directory << ": " << ec.message() << "\n";
    }
}

void JsonLogger::open_stream() {
    stream_.open(log_path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!stream_.is_open()) {
        std::cerr << "srvkeeper: cannot open journal " << log_path_ << "\n";
    }
}

// Continues the sequence of an existing journal so a restarted orchestrator never reuses numbers.
void JsonLogger::recover_sequence() {
    std::ifstream in(log_path_);
    if (!in) {
        return;
    }
    std::string line;
    std::string last;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            last = std::move(line);
        }
    }
    EventRecord record;
    if (!last.empty() && DeserializeEvent(last, record) && record.sequence >= next_sequence_) {
        next_sequence_ = record.sequence + 1;
    }
}

void JsonLogger::echo(const EventRecord &record) const {
    std::cerr << '[' << record.severity << "] " << record.category << ": " << record.message;
    for (const auto &attr : record.attributes) {
        std::cerr << ' ' << attr.key << '=' << attr.value;
    }
    std::cerr << '\n';
}

void JsonLogger::Append(const EventRecord &record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_.is_open()) {
        open_stream();
    }
    EventRecord enriched = record;
    if (enriched.sequence == 0) {
        enriched.sequence = next_sequence_++;
    } else if (enriched.sequence >= next_sequence_) {
        next_sequence_ = enriched.sequence + 1;
    }
    if (enriched.timestamp.time_since_epoch().count() == 0) {
        enriched.timestamp = std::chrono::system_clock::now();
    }
    if (enriched.source.empty()) {
        enriched.source = default_source_;
    }
    if (enriched.category.empty()) {
        enriched.category = "General";
    }
    if (enriched.severity.empty()) {
        enriched.severity = severity::kInfo;
    }

    if (echo_to_stderr_) {
        echo(enriched);
    }
    if (!stream_.is_open()) {
        return;
    }
    stream_ << SerializeEvent(enriched) << '\n';
    stream_.flush();

    if (stream_.tellp() > static_cast<std::streamoff>(kMaxLogSizeBytes)) {
        rotate_locked();
    }
}

void JsonLogger::Log(const std::string &severity, const std::string &category, const std::string &message,
                     std::vector<EventAttribute> attributes) {
    EventRecord record;
    record.severity = severity;
    record.category = category;
    record.message = message;
    record.attributes = std::move(attributes);
    Append(record);
}

void JsonLogger::Rotate() {
    std::lock_guard<std::mutex> lock(mutex_);
    rotate_locked();
}

void JsonLogger::rotate_locked() {
    stream_.close();

    auto rotated_name = log_path_;
    rotated_name += '.' + format_rotation_suffix();
    std::error_code ec;
    std::filesystem::rename(log_path_, rotated_name, ec);
    if (ec) {
        std::cerr << "srvkeeper: journal rotation failed: " << ec.message() << "\n";
    }
    open_stream();
}

}  // namespace srvkeeper
