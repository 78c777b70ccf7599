#include "docker_execution_env.hpp"
#include "container_registry.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <system_error>

// evalbox-<pid>-<seq>-<random>, unique across concurrent envs and processes
static std::string next_container_name() {
    static std::atomic<unsigned> seq{0};
    std::random_device rd;
    std::ostringstream ss;
    ss << "evalbox-" << ::getpid() << "-" << ++seq << "-" << std::hex << std::setw(8) << std::setfill('0') << rd();
    return ss.str();
}

DockerExecutionEnv::Options DockerExecutionEnv::Options::from_json(const json& cfg) {
    Options o;
    o.image = config::get_string(cfg, "image", o.image);
    o.container_workdir = config::get_string(cfg, "container_workdir", o.container_workdir);
    o.host_dir = config::get_string(cfg, "host_dir", "");
    o.docker_binary = config::get_string(cfg, "docker_binary", o.docker_binary);
    o.user = config::get_string(cfg, "user", o.user);
    o.timeout = config::get_seconds(cfg, "timeout_s", o.timeout);
    o.stop_timeout = config::get_seconds(cfg, "stop_timeout_s", o.stop_timeout);
    o.launch_timeout = config::get_seconds(cfg, "launch_timeout_s", o.launch_timeout);
    o.stop_grace_s = config::get_int(cfg, "stop_grace_s", o.stop_grace_s);
    o.env_passthrough = config::get_string_list(cfg, "env_passthrough", o.env_passthrough);
    if (o.image.empty()) throw ConfigurationError("option 'image' must not be empty");
    if (o.container_workdir.empty() || o.container_workdir[0] != '/') {
        throw ConfigurationError("option 'container_workdir' must be an absolute path");
    }
    if (o.stop_grace_s < 0) throw ConfigurationError("option 'stop_grace_s' must not be negative");
    return o;
}

DockerExecutionEnv::DockerExecutionEnv() : DockerExecutionEnv(Options{}) {}

DockerExecutionEnv::DockerExecutionEnv(Options opts)
    : opts_(std::move(opts)), store_(opts_.host_dir, kHostDirPrefix) {}

DockerExecutionEnv::~DockerExecutionEnv() { cleanup(); }

std::string DockerExecutionEnv::build_hint(const std::string& image) {
    return "Docker image not found. Build it with: docker build -t " + image + " -f docker/Dockerfile docker/";
}

ProcessResult DockerExecutionEnv::docker(const std::vector<std::string>& args, std::chrono::milliseconds timeout) const {
    ProcessSpec spec;
    spec.argv.reserve(args.size() + 1);
    spec.argv.push_back(opts_.docker_binary);
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.timeout = timeout;
    try {
        return run_process(spec);
    } catch (const std::system_error& e) {
        if (e.code().value() == ENOENT) {
            throw ConfigurationError("docker binary not found: " + opts_.docker_binary);
        }
        throw ExecError(std::string("failed to run docker: ") + e.what());
    }
}

void DockerExecutionEnv::docker_quietly(const std::vector<std::string>& args, std::chrono::milliseconds timeout) const noexcept {
    try {
        auto r = docker(args, timeout);
        if (r.exit_code != 0) {
            std::cerr << "[DockerExecutionEnv] docker " << args.front() << " exited with " << r.exit_code
                      << (r.stderr_data.empty() ? "" : ": " + r.stderr_data) << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[DockerExecutionEnv] docker " << args.front() << " failed: " << e.what() << std::endl;
    }
}

std::vector<std::string> DockerExecutionEnv::env_args() const {
    std::vector<std::string> out;
    for (const auto& name : opts_.env_passthrough) {
        const char* value = std::getenv(name.c_str());
        if (value && *value) {
            out.push_back("-e");
            out.push_back(name + "=" + value);
        }
    }
    return out;
}

std::string DockerExecutionEnv::run_user() const {
    if (!opts_.user.empty()) return opts_.user;
    // host ids, so the bind-mounted 0700 host_dir stays readable and writable
    return std::to_string(::getuid()) + ":" + std::to_string(::getgid());
}

void DockerExecutionEnv::discard_launch(const std::string& name) noexcept {
    docker_quietly({"rm", "-f", name}, opts_.stop_timeout);
    ContainerRegistry::instance().untrack(name);
}

void DockerExecutionEnv::start_container() {
    const std::string name = next_container_name();
    std::vector<std::string> args = {"run", "-d", "--name", name, "--user", run_user(),
                                     "-v", host_dir().string() + ":" + opts_.container_workdir};
    auto env = env_args();
    args.insert(args.end(), env.begin(), env.end());
    // keep-alive entrypoint so the container outlives individual exec sessions
    args.insert(args.end(), {opts_.image, "tail", "-f", "/dev/null"});

    // tracked before launch so a shutdown during `docker run` still removes it
    ContainerRegistry::instance().track(name, opts_.docker_binary);
    ProcessResult r;
    try {
        r = docker(args, opts_.launch_timeout);
    } catch (const EvalboxError&) {
        ContainerRegistry::instance().untrack(name);
        throw;
    }

    const std::string msg = "Failed to start Docker container with image '" + opts_.image + "'.\n";
    if (r.timed_out || r.exit_code != 0) {
        const std::string& err = r.stderr_data;
        if (err.find("Unable to find image") != std::string::npos || err.find("No such image") != std::string::npos) {
            ContainerRegistry::instance().untrack(name);
            throw ConfigurationError(msg + build_hint(opts_.image));
        }
        // the daemon may have created the container before the client gave up
        discard_launch(name);
        if (r.timed_out) throw ResourceCreationError(msg + "Error: docker run timed out", err);
        throw ResourceCreationError(msg + "Error: " + err, err);
    }

    auto id = r.stdout_data;
    while (!id.empty() && (id.back() == '\n' || id.back() == '\r' || id.back() == ' ')) id.pop_back();
    if (id.empty()) {
        discard_launch(name);
        throw ResourceCreationError(msg + "Error: docker run printed no container id", r.stderr_data);
    }
    container_id_ = id;
    container_name_ = name;
    container_stopped_ = false;
    std::cerr << "[DockerExecutionEnv] Started container " << name << " (" << id.substr(0, 12) << ") from "
              << opts_.image << " (" << host_dir().string() << " -> " << opts_.container_workdir << ")" << std::endl;
}

void DockerExecutionEnv::stop_after_timeout() noexcept {
    if (!container_id_) return;
    std::cerr << "[DockerExecutionEnv] Stopping container " << container_id_->substr(0, 12) << " after timeout" << std::endl;
    docker_quietly({"stop", "-t", std::to_string(opts_.stop_grace_s), *container_id_}, opts_.stop_timeout);
    container_stopped_ = true;
}

void DockerExecutionEnv::remove_container() noexcept {
    if (!container_id_) return;
    docker_quietly({"rm", "-f", *container_id_}, opts_.stop_timeout);
    ContainerRegistry::instance().untrack(container_name_);
    container_id_.reset();
    container_name_.clear();
    container_stopped_ = false;
}

RunResult DockerExecutionEnv::run(const std::string& command, bool silent) {
    // a timeout left the previous container stopped; start over on the same mount
    if (container_id_ && container_stopped_) remove_container();
    if (!container_id_) start_container();

    if (!silent) {
        std::cout << "\n--- Start of run (Docker) ---" << std::endl;
        std::cout << "$ " << command << std::endl;
    }

    ProcessSpec spec;
    spec.argv = {opts_.docker_binary, "exec", "-i", "-w", opts_.container_workdir, *container_id_,
                 "/bin/bash", "-c", command};
    spec.timeout = opts_.timeout;
    spec.echo = !silent;
    // killing the exec client alone would leave the command running in the container
    spec.on_timeout = [this] { stop_after_timeout(); };

    RunResult r;
    try {
        r = run_process(spec);
    } catch (const std::system_error& e) {
        if (e.code().value() == ENOENT) {
            throw ConfigurationError("docker binary not found: " + opts_.docker_binary);
        }
        throw ExecError(std::string("docker exec failed: ") + e.what());
    }

    if (!silent) std::cout << "--- Finished run (Docker) ---\n" << std::endl;
    return r;
}

void DockerExecutionEnv::cleanup() noexcept {
    if (container_id_) {
        docker_quietly({"stop", "-t", std::to_string(opts_.stop_grace_s), *container_id_}, opts_.stop_timeout);
        docker_quietly({"rm", *container_id_}, opts_.stop_timeout);
        std::cerr << "[DockerExecutionEnv] Removed container " << container_id_->substr(0, 12) << std::endl;
        ContainerRegistry::instance().untrack(container_name_);
        container_id_.reset();
        container_name_.clear();
        container_stopped_ = false;
    }
    store_.cleanup();
}
