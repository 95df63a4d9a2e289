#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace sandbar::runner {

// Per-execution directory holding the materialized source. Removed on
// destruction whatever the execution outcome.
class EphemeralWorkspace {
public:
    EphemeralWorkspace(std::filesystem::path root, const std::string& execution_id);
    ~EphemeralWorkspace();

    EphemeralWorkspace(const EphemeralWorkspace&) = delete;
    EphemeralWorkspace& operator=(const EphemeralWorkspace&) = delete;

    static std::filesystem::path PathFor(const std::filesystem::path& root, const std::string& execution_id);

    // Throws std::system_error; the directory must not exist yet.
    void Create();
    const std::filesystem::path& WriteSource(const std::string& extension, std::string_view source, mode_t mode);
    void GrantTo(uid_t uid, gid_t gid);
    // Idempotent; false when something is left behind.
    bool Remove() noexcept;

    const std::filesystem::path& Root() const { return root_; }
    const std::filesystem::path& Directory() const { return directory_; }
    const std::filesystem::path& SourcePath() const { return source_path_; }

private:
    std::filesystem::path root_;
    std::filesystem::path directory_;
    std::filesystem::path source_path_;
    bool created_ = false;
};

}  // namespace sandbar::runner
