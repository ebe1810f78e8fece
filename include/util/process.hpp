#pragma once

#include <string>
#include <vector>

namespace rv::util {

struct ProcessResult {
    int exit_code = -1;
    std::string output; // stdout and stderr, interleaved

    [[nodiscard]] bool ok() const { return exit_code == 0; }
};

// Runs argv[0] (looked up on PATH) with the given arguments and waits for it.
// Throws only when the process cannot be spawned; a non-zero exit is reported through exit_code.
ProcessResult runProcess(const std::vector<std::string>& argv);

// True if an executable with this name is found on PATH.
bool commandExists(const std::string& name);

}
