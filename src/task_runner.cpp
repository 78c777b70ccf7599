#include "task_runner.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "thread_pool.hpp"
#include "executors/docker_execution_env.hpp"
#include "executors/simple_execution_env.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

using json = nlohmann::json;

std::string TaskRunner::sha256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, data.data(), data.size());
    SHA256_Final(hash, &ctx);
    std::ostringstream ss;
    for (unsigned char c : hash) ss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return ss.str();
}

TaskRunner::TaskRunner(json defaults, int concurrency)
    : defaults_(defaults.is_object() ? std::move(defaults) : json::object()),
      max_concurrency_(std::max(1, concurrency)) {}

std::unique_ptr<ExecutionEnv> TaskRunner::make_env(const std::string& backend, const json& options) {
    if (backend == "simple") {
        return std::make_unique<SimpleExecutionEnv>(SimpleExecutionEnv::Options::from_json(options));
    }
    if (backend == "docker") {
        return std::make_unique<DockerExecutionEnv>(DockerExecutionEnv::Options::from_json(options));
    }
    throw ConfigurationError("unknown backend: " + backend);
}

std::string TaskRunner::effective_backend(const json& task) const {
    auto backend = config::get_string(defaults_, "backend", "simple");
    return config::get_string(task, "backend", backend);
}

json TaskRunner::effective_options(const json& task) const {
    json opts = defaults_;
    opts.erase("backend");
    if (task.contains("options")) {
        if (!task["options"].is_object()) throw ConfigurationError("task 'options' must be an object");
        for (auto& [key, value] : task["options"].items()) opts[key] = value;
    }
    return opts;
}

json TaskRunner::run_task(const json& task) const {
    json out;
    out["id"] = task.is_object() ? task.value("id", json()) : json();

    try {
        if (!task.is_object()) throw ConfigurationError("task must be an object");
        if (!task.contains("command") || !task["command"].is_string()) {
            throw ConfigurationError("task 'command' must be a string");
        }
        Files files;
        if (task.contains("files")) files = task["files"].get<Files>();
        const bool silent = task.value("silent", true);

        // scope owns the environment; its destructor removes container and temp dir
        auto env = make_env(effective_backend(task), effective_options(task));
        env->upload(files);
        RunResult r = env->run(task["command"].get<std::string>(), silent);
        Files result_files = env->download();

        json checksums = json::object();
        for (const auto& [path, content] : result_files) checksums[path] = sha256(content.bytes());

        out["ok"] = true;
        // commands may print arbitrary bytes; JSON strings must stay UTF-8
        out["stdout"] = FileContent::from_bytes(r.stdout_data);
        out["stderr"] = FileContent::from_bytes(r.stderr_data);
        out["exit_code"] = r.exit_code;
        out["timed_out"] = r.timed_out;
        out["ms"] = r.ms;
        out["files"] = result_files;
        out["checksums"] = checksums;
    } catch (const std::exception& e) {
        std::cerr << "[TaskRunner] Task " << out["id"].dump() << " failed: " << e.what() << std::endl;
        out["ok"] = false;
        out["error"] = e.what();
    }
    return out;
}

json TaskRunner::run_all(const json& tasks) const {
    if (!tasks.is_array()) throw ConfigurationError("tasks must be a JSON array");

    ThreadPool pool(static_cast<size_t>(std::min<size_t>(max_concurrency_, std::max<size_t>(1, tasks.size()))));
    std::vector<std::future<json>> pending;
    pending.reserve(tasks.size());
    for (const auto& task : tasks) {
        pending.push_back(pool.submit([this, &task] { return run_task(task); }));
    }

    json results = json::array();
    for (auto& f : pending) results.push_back(f.get());
    return results;
}
