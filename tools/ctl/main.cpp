#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "command_inbox.hpp"
#include "config.hpp"
#include "event.hpp"

namespace {
struct CtlOptions {
    std::filesystem::path inbox;
    std::filesystem::path journal;
    std::string requested_by;
    std::vector<std::string> positional;
};

void print_usage(std::ostream &out) {
    out << "Usage: srvkeeper-ctl [--inbox <path>] [--by <name>] <command>\n"
           "Commands:\n"
           "  restart [minutes]     schedule a restart (default: now)\n"
           "  stop [minutes]        schedule a shutdown\n"
           "  update [minutes]      schedule an update\n"
           "  start                 start the server and resume automatic recovery\n"
           "  cancel <kind>         cancel a scheduled restart, stop or update\n"
           "  skip-next             skip the next periodic restart\n"
           "  status [--journal <path>]\n"
           "                        print the latest recorded server status\n";
}

std::string default_requester() {
    for (const char *key : {"SUDO_USER", "USER", "LOGNAME"}) {
        const char *value = std::getenv(key);
        if (value && *value) {
            return value;
        }
    }
    return "cli";
}

CtlOptions parse_arguments(int argc, char **argv) {
    CtlOptions options;
    srvkeeper::OrchestratorConfig defaults;
    try {
        defaults = srvkeeper::LoadConfigFromEnvironment();
    } catch (const std::invalid_argument &ex) {
        std::cerr << "Warning: ignoring environment configuration: " << ex.what() << "\n";
    }
    options.inbox = defaults.command_inbox;
    options.journal = defaults.journal;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--inbox" && i + 1 < argc) {
            options.inbox = argv[++i];
        } else if (arg == "--journal" && i + 1 < argc) {
            options.journal = argv[++i];
        } else if (arg == "--by" && i + 1 < argc) {
            options.requested_by = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            std::exit(0);
        } else {
            options.positional.push_back(arg);
        }
    }
    if (options.requested_by.empty()) {
        options.requested_by = default_requester();
    }
    return options;
}

std::optional<int> parse_minutes(const std::string &text) {
    char *end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || value < 0 || value > 7 * 24 * 60) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

bool load_latest_status(const std::filesystem::path &path, srvkeeper::EventRecord &latest) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }
    bool found = false;
    std::string line;
    while (std::getline(in, line)) {
        srvkeeper::EventRecord record;
        if (!srvkeeper::DeserializeEvent(line, record) || record.category != "Status" ||
            !srvkeeper::FindAttribute(record, "kind")) {
            continue;
        }
        latest = std::move(record);
        found = true;
    }
    return found;
}

int print_status(const std::filesystem::path &journal) {
    srvkeeper::EventRecord latest;
    if (!load_latest_status(journal, latest)) {
        std::cerr << "No status recorded in " << journal << "\n";
        return 1;
    }
    std::cout << "Status:  " << srvkeeper::FindAttribute(latest, "kind").value_or("Unknown") << "\n";
    std::cout << "Message: " << latest.message << "\n";
    std::cout << "Since:   " << srvkeeper::FormatTimestampUtc(latest.timestamp) << "\n";
    if (auto players = srvkeeper::FindAttribute(latest, "players")) {
        std::cout << "Players: " << *players << "\n";
    }
    if (auto fps = srvkeeper::FindAttribute(latest, "avg_fps")) {
        std::cout << "FPS:     " << *fps << " (" << srvkeeper::FindAttribute(latest, "performance").value_or("?")
                  << ")\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char **argv) {
    CtlOptions options = parse_arguments(argc, argv);
    if (options.positional.empty()) {
        print_usage(std::cerr);
        return 2;
    }

    const std::string command = options.positional.front();
    if (command == "status") {
        return print_status(options.journal);
    }

    int delay = 0;
    std::string target;
    if (command == "cancel") {
        if (options.positional.size() < 2) {
            std::cerr << "cancel needs a kind: restart, stop or update\n";
            return 2;
        }
        target = options.positional[1];
    } else if (options.positional.size() > 1) {
        auto minutes = parse_minutes(options.positional[1]);
        if (!minutes) {
            std::cerr << "Invalid delay '" << options.positional[1] << "'\n";
            return 2;
        }
        delay = *minutes;
    }

    try {
        auto record = srvkeeper::MakeCommandRecord(command, delay, target, options.requested_by);
        srvkeeper::AppendCommand(options.inbox, record);
    } catch (const std::invalid_argument &ex) {
        std::cerr << ex.what() << "\n";
        print_usage(std::cerr);
        return 2;
    }
    std::cout << "Queued '" << command << "' in " << options.inbox << "\n";
    return 0;
}
