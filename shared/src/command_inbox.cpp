#include "command_inbox.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "logger.hpp"
#include "text.hpp"

namespace srvkeeper {

namespace {
constexpr const char *kCommandCategory = "Command";

std::optional<int> parse_delay(const std::optional<std::string> &value) {
    if (!value || value->empty()) {
        return 0;
    }
    char *end = nullptr;
    long parsed = std::strtol(value->c_str(), &end, 10);
    if (*end != '\0' || parsed < 0 || parsed > 7 * 24 * 60) {
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

}  // namespace

std::optional<AdminRequest> ToAdminRequest(const EventRecord &record) {
    if (record.category != kCommandCategory || record.sequence == 0) {
        return std::nullopt;
    }
    auto action = FindAttribute(record, "action");
    if (!action) {
        return std::nullopt;
    }
    AdminRequest request;
    request.sequence = record.sequence;
    request.requested_by = FindAttribute(record, "requested_by").value_or("unknown");

    const std::string verb = ToLower(*action);
    if (verb == "start") {
        request.kind = AdminRequestKind::Start;
        return request;
    }
    if (verb == "skip-next") {
        request.kind = AdminRequestKind::SkipNextPeriodic;
        return request;
    }
    if (verb == "cancel") {
        auto target = FindAttribute(record, "target");
        auto kind = target ? ParseActionKind(ToLower(*target)) : std::nullopt;
        if (!kind) {
            return std::nullopt;
        }
        request.kind = AdminRequestKind::Cancel;
        request.action = *kind;
        return request;
    }
    auto kind = ParseActionKind(verb);
    auto delay = parse_delay(FindAttribute(record, "delay_minutes"));
    if (!kind || !delay) {
        return std::nullopt;
    }
    request.kind = AdminRequestKind::Schedule;
    request.action = *kind;
    request.delay = std::chrono::minutes(*delay);
    return request;
}

CommandInbox::CommandInbox(std::filesystem::path path) : path_(std::move(path)) {}

std::vector<AdminRequest> CommandInbox::Poll(std::uint64_t after_sequence) {
    std::vector<AdminRequest> requests;
    std::error_code ec;
    auto size = std::filesystem::file_size(path_, ec);
    if (ec) {
        return requests;
    }
    if (size < offset_) {
        offset_ = 0;
    }
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        return requests;
    }
    in.seekg(static_cast<std::streamoff>(offset_));
    std::string line;
    while (std::getline(in, line)) {
        if (in.eof()) {
            // Writer has not finished the line yet.
            break;
        }
        offset_ += line.size() + 1;
        EventRecord record;
        if (line.empty() || !DeserializeEvent(line, record) || record.sequence <= after_sequence) {
            continue;
        }
        if (auto request = ToAdminRequest(record)) {
            requests.push_back(std::move(*request));
        }
    }
    return requests;
}

EventRecord MakeCommandRecord(const std::string &action, int delay_minutes, const std::string &target,
                              const std::string &requested_by) {
    const std::string verb = ToLower(action);
    EventRecord record;
    record.category = kCommandCategory;
    record.severity = severity::kInfo;
    record.message = "Admin command: " + verb;
    if (verb == "cancel") {
        if (!ParseActionKind(ToLower(target))) {
            throw std::invalid_argument("cancel needs restart, stop or update, got '" + target + "'");
        }
        record.attributes.push_back({"target", ToLower(target)});
    } else if (verb != "start" && verb != "skip-next") {
        if (!ParseActionKind(verb)) {
            throw std::invalid_argument("unknown command '" + action + "'");
        }
        if (delay_minutes < 0) {
            throw std::invalid_argument("delay must not be negative");
        }
        record.attributes.push_back({"delay_minutes", std::to_string(delay_minutes)});
    }
    record.attributes.push_back({"action", verb});
    record.attributes.push_back({"requested_by", requested_by});
    return record;
}

void AppendCommand(const std::filesystem::path &inbox, const EventRecord &command) {
    JsonLogger spool(inbox, "srvkeeper-ctl");
    spool.Append(command);
}

}  // namespace srvkeeper
