#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <vector>

// Exit code reported when the wall-clock timeout killed the process.
// Matches coreutils timeout(1); signal deaths otherwise map to 128 + signo.
constexpr int kTimeoutExitCode = 124;

struct ProcessSpec {
    std::vector<std::string> argv;           // argv[0] is looked up in PATH
    std::string dir;                         // empty = inherit the caller's cwd
    std::chrono::milliseconds timeout{0};    // 0 = no limit
    std::chrono::milliseconds poll_interval{50};
    bool echo = false;                       // mirror output to std::cout / std::cerr
    std::function<void()> on_timeout;        // runs after the process group is killed
};

struct ProcessResult {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = -1;
    bool timed_out = false;
    double ms = 0.0;
};

// Spawns argv in its own process group with stdin on /dev/null and drains
// stdout and stderr into separate buffers until the process has exited and
// both pipes are at EOF, or until the timeout fires. Spawn and pipe failures
// throw std::system_error carrying the errno (ENOENT for a missing binary).
ProcessResult run_process(const ProcessSpec& spec);
