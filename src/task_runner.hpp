#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "executors/execution_env.hpp"

// Runs independent tasks, each in a fresh environment:
//   {"id", "backend", "options", "files", "command", "silent"}
// and reports
//   {"id", "ok", "stdout", "stderr", "exit_code", "timed_out", "ms", "files", "checksums"}
// or {"id", "ok": false, "error"} when the environment could not be used.
// stdout, stderr and file contents are JSON strings when they are valid
// UTF-8 and {"base64": ...} otherwise.
class TaskRunner {
public:
    using json = nlohmann::json;

    // defaults supplies "backend" and backend options; a task's own
    // "backend"/"options" override them key by key.
    explicit TaskRunner(json defaults = json::object(), int concurrency = 1);

    json run_task(const json& task) const;
    // Results come back in input order.
    json run_all(const json& tasks) const;

    static std::unique_ptr<ExecutionEnv> make_env(const std::string& backend, const json& options);
    static std::string sha256(const std::string& data);

private:
    json effective_options(const json& task) const;
    std::string effective_backend(const json& task) const;

    json defaults_;
    int max_concurrency_;
};
