#include "runner/ephemeral_workspace.hpp"

#include <cerrno>
#include <fcntl.h>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <sys/stat.h>

#include "utils/logging.hpp"

namespace sandbar::runner {
namespace {

[[noreturn]] void ThrowErrno(const std::string& what) {
    throw std::system_error(errno, std::system_category(), what);
}

bool IsSafeComponent(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    for (const char c : name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                        c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

}  // namespace

EphemeralWorkspace::EphemeralWorkspace(std::filesystem::path root, const std::string& execution_id)
    : root_(std::move(root)), directory_(PathFor(root_, execution_id)) {}

EphemeralWorkspace::~EphemeralWorkspace() {
    if (!Remove()) {
        utils::LogLine(utils::LogLevel::kError, "runner") << "failed to remove " << directory_.string();
    }
}

std::filesystem::path EphemeralWorkspace::PathFor(const std::filesystem::path& root,
                                                  const std::string& execution_id) {
    if (!IsSafeComponent(execution_id)) {
        throw std::invalid_argument("unsafe execution id");
    }
    return root / execution_id;
}

void EphemeralWorkspace::Create() {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw std::system_error(ec, "create workspace root");
    }
    // Sandbox identities need to traverse the root but never list it.
    if (::chmod(root_.c_str(), 0711) != 0) {
        ThrowErrno("chmod workspace root");
    }
    if (::mkdir(directory_.c_str(), 0700) != 0) {
        ThrowErrno("mkdir execution directory");
    }
    created_ = true;
}

const std::filesystem::path& EphemeralWorkspace::WriteSource(const std::string& extension,
                                                             std::string_view source,
                                                             mode_t mode) {
    source_path_ = directory_ / ("main" + extension);
    const int fd = ::open(source_path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, mode);
    if (fd < 0) {
        ThrowErrno("create source file");
    }
    std::size_t written = 0;
    while (written < source.size()) {
        const auto n = ::write(fd, source.data() + written, source.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int error = errno;
            ::close(fd);
            throw std::system_error(error, std::system_category(), "write source file");
        }
        written += static_cast<std::size_t>(n);
    }
    // The umask must not narrow the requested mode.
    if (::fchmod(fd, mode) != 0) {
        const int error = errno;
        ::close(fd);
        throw std::system_error(error, std::system_category(), "chmod source file");
    }
    ::close(fd);
    return source_path_;
}

void EphemeralWorkspace::GrantTo(uid_t uid, gid_t gid) {
    if (::chown(directory_.c_str(), uid, gid) != 0) {
        ThrowErrno("chown execution directory");
    }
    if (!source_path_.empty() && ::lchown(source_path_.c_str(), uid, gid) != 0) {
        ThrowErrno("chown source file");
    }
}

bool EphemeralWorkspace::Remove() noexcept {
    if (!created_) {
        return true;
    }
    std::error_code ec;
    if (!std::filesystem::exists(directory_, ec)) {
        return !ec;
    }
    std::filesystem::remove_all(directory_, ec);
    if (ec) {
        utils::LogLine(utils::LogLevel::kWarn, "runner") << "cleanup of " << directory_.string()
                                                         << " failed: " << ec.message();
        return false;
    }
    return true;
}

}  // namespace sandbar::runner
