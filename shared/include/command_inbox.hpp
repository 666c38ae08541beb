#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "event.hpp"

namespace srvkeeper {

// Admin command spool: a JSON-lines file of EventRecords with category "Command". Each record
// carries an `action` attribute (restart, stop, update, start, cancel, skip-next), plus
// `delay_minutes`, `target` (cancel only) and `requested_by`. Record sequence numbers form the
// cursor the orchestrator passes back to Poll.
class CommandInbox : public CommandSource {
  public:
    explicit CommandInbox(std::filesystem::path path);

    std::vector<AdminRequest> Poll(std::uint64_t after_sequence) override;

    const std::filesystem::path &Path() const { return path_; }

  private:
    std::filesystem::path path_;
    std::uint64_t offset_ = 0;
};

// Converts one spool record. Returns std::nullopt for records that are not well-formed commands.
std::optional<AdminRequest> ToAdminRequest(const EventRecord &record);

// Builds the spool record for a command; `delay_minutes` is ignored for start, cancel and
// skip-next. Throws std::invalid_argument for an unknown action or cancel target.
EventRecord MakeCommandRecord(const std::string &action, int delay_minutes, const std::string &target,
                              const std::string &requested_by);

// Appends a command to the spool, assigning the next sequence number.
void AppendCommand(const std::filesystem::path &inbox, const EventRecord &command);

}  // namespace srvkeeper
