#pragma once

#include <cerrno>
#include <cstdlib>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/process/extend.hpp>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandbar::runner {

// Everything the forked child needs, computed in the parent so that the child
// only issues system calls between fork and exec.
struct IsolationPlan {
    bool new_session = true;
    int clone_flags = 0;
    bool map_identity = false;
    std::string uid_map;
    std::string gid_map;
    bool private_mounts = false;
    bool readonly_root = false;
    unsigned long root_remount_flags = 0;
    std::string workspace_root;
    std::string execution_dir;
    std::string execution_dir_fd_path;
    std::vector<std::pair<int, rlimit>> rlimits;
    int niceness = 0;
    int max_inherited_fd = 1024;
    bool drop_capabilities = false;
    bool switch_identity = false;
    uid_t uid = 0;
    gid_t gid = 0;
    bool no_new_privs = true;
    std::string cgroup_procs_path;
    std::string working_dir;
};

// Applies the plan in the child. Returns the name of the failed step, or
// nullptr when the boundary is complete; errno is left from the failed call.
const char* ApplyIsolation(const IsolationPlan& plan) noexcept;

// Root mount flags that a user namespace must preserve when remounting.
unsigned long LockedRootFlags();

struct IsolationHandler : boost::process::extend::handler {
    explicit IsolationHandler(const IsolationPlan& plan) : plan_(plan) {}

    template <class Executor>
    void on_exec_setup(Executor& exec) const {
        if (const char* step = ApplyIsolation(plan_)) {
            const int error = errno;
            exec.set_error(std::error_code(error, std::system_category()), step);
            ::_exit(EXIT_FAILURE);
        }
    }

    // The failed child has already exited; reap it.
    template <class Executor>
    void on_error(Executor& exec, const std::error_code&) const {
        if (exec.pid > 0) {
            int status = 0;
            ::waitpid(exec.pid, &status, 0);
        }
    }

    const IsolationPlan& plan_;
};

}  // namespace sandbar::runner
