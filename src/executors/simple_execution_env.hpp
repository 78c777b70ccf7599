#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "execution_env.hpp"
#include "../file_store.hpp"

// Runs commands on the host through the shell, inside the store's root.
class SimpleExecutionEnv : public FileStore, public ExecutionEnv {
public:
    using json = nlohmann::json;

    struct Options {
        std::filesystem::path working_dir;          // empty = owned temp dir
        std::string shell = "/bin/bash";
        std::chrono::milliseconds timeout{30000};

        static Options from_json(const json& cfg);
    };

    SimpleExecutionEnv();
    explicit SimpleExecutionEnv(Options opts);

    using ExecutionEnv::run;
    RunResult run(const std::string& command, bool silent) override;
    void upload(const Files& files) override { FileStore::upload(files); }
    Files download() override { return FileStore::download(); }

    const Options& options() const { return opts_; }

private:
    Options opts_;
};
