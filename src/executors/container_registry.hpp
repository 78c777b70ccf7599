#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Names of containers that are (or may be) alive, so a shutdown that skips
// destructors can still remove them. Thread-safe.
class ContainerRegistry {
public:
    static ContainerRegistry& instance();

    void track(const std::string& name, const std::string& docker_binary);
    void untrack(const std::string& name);
    std::vector<std::string> tracked() const;

    // `docker rm -f` for every tracked container, then forgets them.
    // Never throws.
    void remove_all(std::chrono::milliseconds timeout = std::chrono::seconds(10)) noexcept;

    ContainerRegistry(const ContainerRegistry&) = delete;
    ContainerRegistry& operator=(const ContainerRegistry&) = delete;

private:
    ContainerRegistry() = default;

    mutable std::mutex mtx_;
    std::map<std::string, std::string> containers_;   // name -> docker binary
};
