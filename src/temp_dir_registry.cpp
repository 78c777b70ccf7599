#include "temp_dir_registry.hpp"
#include <string>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <system_error>

TempDirRegistry& TempDirRegistry::instance() {
    // Leaked on purpose: the atexit sweep may run after static destructors.
    static TempDirRegistry* registry = new TempDirRegistry();
    return *registry;
}

void TempDirRegistry::track(const std::filesystem::path& dir) {
    std::call_once(exit_hook_once_, [] {
        if (std::atexit(&TempDirRegistry::sweep_at_exit) != 0) {
            std::cerr << "[TempDirRegistry] Failed to install exit-time sweep" << std::endl;
        }
    });
    std::lock_guard<std::mutex> lk(mtx_);
    if (std::find(dirs_.begin(), dirs_.end(), dir) == dirs_.end()) dirs_.push_back(dir);
}

void TempDirRegistry::untrack(const std::filesystem::path& dir) {
    std::lock_guard<std::mutex> lk(mtx_);
    dirs_.erase(std::remove(dirs_.begin(), dirs_.end(), dir), dirs_.end());
}

std::vector<std::filesystem::path> TempDirRegistry::tracked() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dirs_;
}

void TempDirRegistry::sweep() noexcept {
    std::vector<std::filesystem::path> dirs;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        dirs.swap(dirs_);
    }
    for (const auto& dir : dirs) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            std::cerr << "[TempDirRegistry] Could not remove " << dir.string() << ": " << ec.message() << std::endl;
        }
    }
}

void TempDirRegistry::sweep_at_exit() { instance().sweep(); }

std::filesystem::path make_unique_temp_dir(const std::string& prefix) {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) base = "/tmp";
    std::string tmpl = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        throw std::system_error(errno, std::generic_category(), "mkdtemp " + tmpl);
    }
    return std::filesystem::path(buf.data());
}
