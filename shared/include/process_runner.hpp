#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace srvkeeper {

struct CommandResult {
    // Exit status, 128 + signal for a signalled child, -1 when the child could not be spawned.
    int exit_code = -1;
    std::string output;
    bool timed_out = false;
    std::string error;

    bool ok() const { return exit_code == 0 && !timed_out && error.empty(); }
};

// Runs argv[0] with the given arguments, capturing stdout and stderr together. A child still
// running at the deadline receives SIGTERM, then SIGKILL two seconds later.
CommandResult RunProcess(const std::vector<std::string> &argv, std::chrono::seconds timeout);

// `/bin/sh -c command`, plus optional positional parameters available to the command as "$@".
CommandResult RunShellCommand(const std::string &command, std::chrono::seconds timeout,
                              const std::vector<std::string> &positional = {});

}  // namespace srvkeeper
