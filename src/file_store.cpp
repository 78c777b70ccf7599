#include "file_store.hpp"
#include "errors.hpp"
#include "temp_dir_registry.hpp"
#include <cerrno>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

FileStore::FileStore() : FileStore(fs::path{}) {}

FileStore::FileStore(const fs::path& working_dir, const std::string& temp_prefix) {
    if (!working_dir.empty()) {
        working_dir_ = working_dir;
        owned_ = false;
        fs::create_directories(working_dir_);
    } else {
        working_dir_ = make_unique_temp_dir(temp_prefix);
        owned_ = true;
        TempDirRegistry::instance().track(working_dir_);
    }
}

FileStore::~FileStore() { cleanup(); }

void FileStore::cleanup() noexcept {
    if (!owned_) return;
    std::error_code ec;
    fs::remove_all(working_dir_, ec);
    if (ec) {
        std::cerr << "[FileStore] Could not remove " << working_dir_.string() << ": " << ec.message() << std::endl;
    }
    TempDirRegistry::instance().untrack(working_dir_);
    owned_ = false;
}

fs::path FileStore::resolve_inside(const fs::path& root, const std::string& key) {
    const fs::path rel(key);
    if (key.empty() || rel.is_absolute()) throw PathSecurityError(key);

    const fs::path base = fs::weakly_canonical(root);
    const fs::path target = fs::weakly_canonical(base / rel);

    // target must be a strict descendant of base
    auto b = base.begin();
    auto t = target.begin();
    for (; b != base.end(); ++b, ++t) {
        if (t == target.end() || *b != *t) throw PathSecurityError(key);
    }
    if (t == target.end()) throw PathSecurityError(key);
    return target;
}

void FileStore::write_files(const fs::path& root, const Files& files) {
    std::vector<std::pair<fs::path, std::string>> pending;
    pending.reserve(files.size());
    for (const auto& [name, content] : files) {
        // decode before touching disk so a bad payload writes nothing
        pending.emplace_back(resolve_inside(root, name), content.bytes());
    }
    for (const auto& [path, bytes] : pending) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::system_error(errno, std::generic_category(), "open " + path.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            throw std::system_error(errno, std::generic_category(), "write " + path.string());
        }
    }
}

Files FileStore::read_files(const fs::path& root) {
    Files files;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) return files;
    for (const auto& entry : it) {
        // a link written by the command may point anywhere on the host
        if (entry.is_symlink(ec)) {
            std::cerr << "[FileStore] Skipping symlink " << entry.path().string() << std::endl;
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;
        std::ifstream in(entry.path(), std::ios::binary);
        if (!in) {
            std::cerr << "[FileStore] Skipping unreadable file " << entry.path().string() << std::endl;
            continue;
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        files[entry.path().lexically_relative(root).generic_string()] = FileContent::from_bytes(ss.str());
    }
    return files;
}

void FileStore::upload(const Files& files) { write_files(working_dir_, files); }

Files FileStore::download() const { return read_files(working_dir_); }
