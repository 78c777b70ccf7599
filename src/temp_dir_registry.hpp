#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

// Tracks auto-allocated working directories so that any whose owner never
// cleaned up are removed at shutdown. Thread-safe.
class TempDirRegistry {
public:
    static TempDirRegistry& instance();

    // Registers dir and, on the first call, installs the exit-time sweep.
    void track(const std::filesystem::path& dir);
    void untrack(const std::filesystem::path& dir);
    std::vector<std::filesystem::path> tracked() const;

    // Removes every tracked directory and forgets it. Never throws.
    void sweep() noexcept;

    TempDirRegistry(const TempDirRegistry&) = delete;
    TempDirRegistry& operator=(const TempDirRegistry&) = delete;

private:
    TempDirRegistry() = default;
    static void sweep_at_exit();

    mutable std::mutex mtx_;
    std::vector<std::filesystem::path> dirs_;
    std::once_flag exit_hook_once_;
};

// Creates a fresh directory named <prefix>XXXXXX under the system temp dir.
std::filesystem::path make_unique_temp_dir(const std::string& prefix);
