#include "runner/isolation_policy.hpp"

#include <fcntl.h>
#include <grp.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>

namespace sandbar::runner {
namespace {

constexpr int kMaxCapability = 63;

bool WriteFile(const char* path, const char* data, std::size_t length) noexcept {
    const int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    const auto written = ::write(fd, data, length);
    const int error = errno;
    ::close(fd);
    errno = error;
    return written == static_cast<ssize_t>(length);
}

bool WriteFile(const std::string& path, const std::string& data) noexcept {
    return WriteFile(path.c_str(), data.data(), data.size());
}

void CloseInheritedDescriptors(int max_fd) noexcept {
    for (int fd = 3; fd < max_fd; ++fd) {
        const int flags = ::fcntl(fd, F_GETFD);
        if (flags != -1 && (flags & FD_CLOEXEC) == 0) {
            ::close(fd);
        }
    }
}

}  // namespace

unsigned long LockedRootFlags() {
    struct statvfs info {};
    if (::statvfs("/", &info) != 0) {
        return 0;
    }
    unsigned long flags = 0;
    if (info.f_flag & ST_NOSUID) {
        flags |= MS_NOSUID;
    }
    if (info.f_flag & ST_NODEV) {
        flags |= MS_NODEV;
    }
    if (info.f_flag & ST_NOEXEC) {
        flags |= MS_NOEXEC;
    }
    if (info.f_flag & ST_NOATIME) {
        flags |= MS_NOATIME;
    }
    if (info.f_flag & ST_NODIRATIME) {
        flags |= MS_NODIRATIME;
    }
    if (info.f_flag & ST_RELATIME) {
        flags |= MS_RELATIME;
    }
    return flags;
}

const char* ApplyIsolation(const IsolationPlan& plan) noexcept {
    if (plan.new_session && ::setsid() < 0) {
        return "setsid";
    }
    if (!plan.cgroup_procs_path.empty() && !WriteFile(plan.cgroup_procs_path.c_str(), "0", 1)) {
        return "join cgroup";
    }
    if (plan.clone_flags != 0 && ::unshare(plan.clone_flags) != 0) {
        return "unshare";
    }
    if (plan.map_identity) {
        if (!WriteFile("/proc/self/setgroups", "deny", 4)) {
            return "write setgroups";
        }
        if (!WriteFile("/proc/self/uid_map", plan.uid_map)) {
            return "write uid_map";
        }
        if (!WriteFile("/proc/self/gid_map", plan.gid_map)) {
            return "write gid_map";
        }
    }
    if (plan.private_mounts) {
        if (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
            return "make mounts private";
        }
        // Cover every sibling execution, then bring back only our own directory.
        if (::mount("tmpfs", plan.workspace_root.c_str(), "tmpfs", MS_NOSUID | MS_NODEV | MS_NOEXEC,
                    "size=64k,mode=0711") != 0) {
            return "mount workspace tmpfs";
        }
        if (::mkdir(plan.execution_dir.c_str(), 0700) != 0) {
            return "create execution mountpoint";
        }
        if (::mount(plan.execution_dir_fd_path.c_str(), plan.execution_dir.c_str(), nullptr,
                    MS_BIND, nullptr) != 0) {
            return "bind execution directory";
        }
        if (plan.readonly_root &&
            ::mount(nullptr, "/", nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY | plan.root_remount_flags,
                    nullptr) != 0) {
            return "remount root read-only";
        }
    }
    CloseInheritedDescriptors(plan.max_inherited_fd);
    if (plan.niceness > 0) {
        errno = 0;
        const int current = ::getpriority(PRIO_PROCESS, 0);
        // Only ever lower the priority; raising it needs privileges we drop anyway.
        if (errno == 0 && current < plan.niceness && ::setpriority(PRIO_PROCESS, 0, plan.niceness) != 0) {
            return "setpriority";
        }
    }
    for (const auto& [resource, limit] : plan.rlimits) {
        if (::setrlimit(resource, &limit) != 0) {
            return "setrlimit";
        }
    }
    if (plan.drop_capabilities) {
        for (int cap = 0; cap <= kMaxCapability; ++cap) {
            if (::prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) != 0 && errno != EINVAL) {
                return "drop capabilities";
            }
        }
    }
    if (plan.switch_identity) {
        if (::setgroups(0, nullptr) != 0) {
            return "setgroups";
        }
        if (::setresgid(plan.gid, plan.gid, plan.gid) != 0) {
            return "setresgid";
        }
        if (::setresuid(plan.uid, plan.uid, plan.uid) != 0) {
            return "setresuid";
        }
    }
    if (plan.no_new_privs && ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        return "no_new_privs";
    }
    if (!plan.working_dir.empty() && ::chdir(plan.working_dir.c_str()) != 0) {
        return "chdir";
    }
    errno = 0;
    return nullptr;
}

}  // namespace sandbar::runner
