#pragma once
#include <filesystem>
#include <string>
#include "files.hpp"

// Working directory for one execution. A caller-supplied directory is used
// as-is and never removed; otherwise a unique temp directory is allocated,
// owned, and tracked by TempDirRegistry until cleanup().
class FileStore {
public:
    static constexpr const char* kDefaultPrefix = "evalbox-evals-";

    FileStore();
    explicit FileStore(const std::filesystem::path& working_dir, const std::string& temp_prefix = kDefaultPrefix);
    virtual ~FileStore();

    FileStore(const FileStore&) = delete;
    FileStore& operator=(const FileStore&) = delete;

    // Writes every entry below the root. All keys are validated before the
    // first write; an escaping key raises PathSecurityError.
    void upload(const Files& files);
    // Snapshot of every regular file below the root, keyed by relative path.
    // Symlinks are skipped, whatever they point at.
    Files download() const;
    // Removes an owned directory. Idempotent, never throws.
    void cleanup() noexcept;

    const std::filesystem::path& working_dir() const { return working_dir_; }
    bool owns_working_dir() const { return owned_; }

    // Absolute target for key, or PathSecurityError if it leaves root.
    static std::filesystem::path resolve_inside(const std::filesystem::path& root, const std::string& key);
    static void write_files(const std::filesystem::path& root, const Files& files);
    static Files read_files(const std::filesystem::path& root);

private:
    std::filesystem::path working_dir_;
    bool owned_ = false;
};
