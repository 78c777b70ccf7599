#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "execution_env.hpp"
#include "../file_store.hpp"

// Runs commands inside a long-lived container that bind-mounts host_dir at
// container_workdir. The container is started lazily by the first run() and
// removed by cleanup() or the destructor.
class DockerExecutionEnv : public ExecutionEnv {
public:
    using json = nlohmann::json;

    static constexpr const char* kDefaultImage = "evalbox-eval:latest";
    static constexpr const char* kHostDirPrefix = "evalbox-docker-";

    struct Options {
        std::string image = kDefaultImage;
        std::string container_workdir = "/workspace";
        std::filesystem::path host_dir;                 // empty = owned temp dir
        std::string docker_binary = "docker";
        std::string user;                               // --user; empty = host uid:gid
        std::chrono::milliseconds timeout{30000};
        std::chrono::milliseconds stop_timeout{5000};   // bound on `docker stop` after a timeout
        std::chrono::milliseconds launch_timeout{120000};
        int stop_grace_s = 1;
        std::vector<std::string> env_passthrough;       // forwarded when set on the host

        static Options from_json(const json& cfg);
    };

    DockerExecutionEnv();
    explicit DockerExecutionEnv(Options opts);
    ~DockerExecutionEnv() override;

    DockerExecutionEnv(const DockerExecutionEnv&) = delete;
    DockerExecutionEnv& operator=(const DockerExecutionEnv&) = delete;

    // ConfigurationError when the image or the docker binary is missing,
    // ResourceCreationError for any other launch failure.
    void start_container();

    using ExecutionEnv::run;
    RunResult run(const std::string& command, bool silent) override;
    void upload(const Files& files) override { store_.upload(files); }
    Files download() override { return store_.download(); }

    // Stops and removes the container, then drops an owned host_dir.
    // Idempotent, never throws.
    void cleanup() noexcept;

    const std::optional<std::string>& container_id() const { return container_id_; }
    // --name given to the running container, empty when none is running.
    const std::string& container_name() const { return container_name_; }
    const std::filesystem::path& host_dir() const { return store_.working_dir(); }
    const Options& options() const { return opts_; }

    static std::string build_hint(const std::string& image);

private:
    ProcessResult docker(const std::vector<std::string>& args, std::chrono::milliseconds timeout) const;
    void docker_quietly(const std::vector<std::string>& args, std::chrono::milliseconds timeout) const noexcept;
    void stop_after_timeout() noexcept;
    void remove_container() noexcept;
    std::vector<std::string> env_args() const;
    std::string run_user() const;
    void discard_launch(const std::string& name) noexcept;

    Options opts_;
    FileStore store_;
    std::optional<std::string> container_id_;
    std::string container_name_;
    bool container_stopped_ = false;
};
