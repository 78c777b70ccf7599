#include "container_registry.hpp"
#include "process_runner.hpp"
#include <iostream>

ContainerRegistry& ContainerRegistry::instance() {
    static ContainerRegistry* registry = new ContainerRegistry();
    return *registry;
}

void ContainerRegistry::track(const std::string& name, const std::string& docker_binary) {
    std::lock_guard<std::mutex> lk(mtx_);
    containers_[name] = docker_binary;
}

void ContainerRegistry::untrack(const std::string& name) {
    std::lock_guard<std::mutex> lk(mtx_);
    containers_.erase(name);
}

std::vector<std::string> ContainerRegistry::tracked() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> names;
    for (const auto& [name, binary] : containers_) names.push_back(name);
    return names;
}

void ContainerRegistry::remove_all(std::chrono::milliseconds timeout) noexcept {
    std::map<std::string, std::string> containers;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        containers.swap(containers_);
    }
    for (const auto& [name, binary] : containers) {
        try {
            ProcessSpec spec;
            spec.argv = {binary, "rm", "-f", name};
            spec.timeout = timeout;
            auto r = run_process(spec);
            if (r.exit_code != 0) {
                std::cerr << "[ContainerRegistry] docker rm -f " << name << " exited with " << r.exit_code
                          << (r.stderr_data.empty() ? "" : ": " + r.stderr_data) << std::endl;
            } else {
                std::cerr << "[ContainerRegistry] Removed container " << name << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[ContainerRegistry] Could not remove " << name << ": " << e.what() << std::endl;
        }
    }
}
