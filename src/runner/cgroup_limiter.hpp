#pragma once

#include <filesystem>
#include <string>

#include "sandbox/sandbox_types.hpp"

namespace sandbar::runner {

// One cgroup v2 directory per execution under a delegated root.
class CgroupLimiter {
public:
    CgroupLimiter(std::filesystem::path root, const std::string& execution_id);
    ~CgroupLimiter();

    CgroupLimiter(const CgroupLimiter&) = delete;
    CgroupLimiter& operator=(const CgroupLimiter&) = delete;

    // Throws std::system_error when the group or a limit file cannot be written.
    void Create(const sandbox::ExecutionOptions& options);
    std::string ProcsPath() const;
    void KillAll() noexcept;
    bool OomKilled() const;
    bool Remove() noexcept;

private:
    void WriteControl(const std::string& file, const std::string& value) const;

    std::filesystem::path path_;
    bool created_ = false;
};

}  // namespace sandbar::runner
