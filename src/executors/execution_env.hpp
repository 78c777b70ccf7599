#pragma once
#include <string>
#include "../files.hpp"
#include "process_runner.hpp"

using RunResult = ProcessResult;

// Runs one shell command against a staged file set.
class ExecutionEnv {
public:
    virtual ~ExecutionEnv() = default;

    // Blocks until the command finishes or the wall-clock timeout fires.
    // A timeout is reported through RunResult, never thrown.
    virtual RunResult run(const std::string& command, bool silent) = 0;
    virtual void upload(const Files& files) = 0;
    virtual Files download() = 0;

    RunResult run(const std::string& command) { return run(command, true); }
};
