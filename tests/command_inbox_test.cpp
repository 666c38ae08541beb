#include "command_inbox.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {
using namespace srvkeeper;

std::filesystem::path make_scratch_dir() {
    auto dir = std::filesystem::temp_directory_path() / ("srvkeeper_inbox_test_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

bool event_codec_keeps_awkward_text() {
    EventRecord record;
    record.source = "test";
    record.category = "Command";
    record.severity = "Info";
    record.message = "line one\nline \"two\"\t\\ end";
    record.attributes = {{"zeta", "}{,\""}, {"alpha", "1"}};
    record.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1760700000123));
    record.sequence = 42;

    EventRecord decoded;
    if (!DeserializeEvent(SerializeEvent(record), decoded)) {
        std::cerr << "Serialized event did not parse\n";
        return false;
    }
    if (decoded.message != record.message || decoded.sequence != 42 || decoded.timestamp != record.timestamp ||
        decoded.attributes.size() != 2 || decoded.attributes[0].key != "alpha" ||
        FindAttribute(decoded, "zeta") != std::optional<std::string>("}{,\"")) {
        std::cerr << "Event codec lost information\n";
        return false;
    }
    return true;
}
}

int main() {
    if (!event_codec_keeps_awkward_text()) {
        return 1;
    }

    const auto dir = make_scratch_dir();
    const auto inbox_path = dir / "commands.log";
    {
        std::ofstream garbage(inbox_path);
        garbage << "this is not json\n";
    }

    AppendCommand(inbox_path, MakeCommandRecord("restart", 10, "", "alice"));
    AppendCommand(inbox_path, MakeCommandRecord("cancel", 0, "Stop", "bob"));
    AppendCommand(inbox_path, MakeCommandRecord("skip-next", 0, "", "carol"));
    AppendCommand(inbox_path, MakeCommandRecord("START", 0, "", "dave"));

    CommandInbox inbox(inbox_path);
    auto requests = inbox.Poll(0);
    if (requests.size() != 4) {
        std::cerr << "Expected four commands, got " << requests.size() << "\n";
        return 1;
    }
    if (requests[0].kind != AdminRequestKind::Schedule || requests[0].action != ActionKind::Restart ||
        requests[0].delay != std::chrono::minutes(10) || requests[0].requested_by != "alice" ||
        requests[0].sequence != 1) {
        std::cerr << "Schedule command decoded incorrectly\n";
        return 1;
    }
    if (requests[1].kind != AdminRequestKind::Cancel || requests[1].action != ActionKind::Stop ||
        requests[2].kind != AdminRequestKind::SkipNextPeriodic || requests[3].kind != AdminRequestKind::Start ||
        requests[3].sequence != 4) {
        std::cerr << "Command kinds decoded incorrectly\n";
        return 1;
    }

    if (!inbox.Poll(4).empty()) {
        std::cerr << "Nothing new after the cursor\n";
        return 1;
    }
    AppendCommand(inbox_path, MakeCommandRecord("update", 0, "", "erin"));
    auto more = inbox.Poll(4);
    if (more.size() != 1 || more[0].action != ActionKind::Update || more[0].sequence != 5) {
        std::cerr << "New command not picked up\n";
        return 1;
    }

    CommandInbox fresh(inbox_path);
    if (fresh.Poll(3).size() != 2) {
        std::cerr << "Cursor filtering incorrect\n";
        return 1;
    }

    try {
        MakeCommandRecord("reboot", 0, "", "x");
        std::cerr << "Unknown command accepted\n";
        return 1;
    } catch (const std::invalid_argument &) {
    }
    try {
        MakeCommandRecord("cancel", 0, "everything", "x");
        std::cerr << "Unknown cancel target accepted\n";
        return 1;
    } catch (const std::invalid_argument &) {
    }

    EventRecord unrelated;
    unrelated.category = "Status";
    unrelated.sequence = 9;
    SetAttribute(unrelated, "action", "restart");
    if (ToAdminRequest(unrelated)) {
        std::cerr << "Only Command records are requests\n";
        return 1;
    }
    EventRecord bad_delay = MakeCommandRecord("stop", 5, "", "x");
    bad_delay.sequence = 10;
    SetAttribute(bad_delay, "delay_minutes", "soon");
    if (ToAdminRequest(bad_delay)) {
        std::cerr << "Malformed delay accepted\n";
        return 1;
    }

    std::filesystem::remove_all(dir);
    return 0;
}
