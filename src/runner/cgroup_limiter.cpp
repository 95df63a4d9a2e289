#include "runner/cgroup_limiter.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <fstream>
#include <system_error>
#include <thread>
#include <sys/stat.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace sandbar::runner {
namespace {

constexpr long long kCpuPeriodUs = 100000;
constexpr int kRemoveAttempts = 10;

}  // namespace

CgroupLimiter::CgroupLimiter(std::filesystem::path root, const std::string& execution_id)
    : path_(std::move(root) / ("sandbar_" + execution_id)) {}

CgroupLimiter::~CgroupLimiter() {
    Remove();
}

void CgroupLimiter::Create(const sandbox::ExecutionOptions& options) {
    if (::mkdir(path_.c_str(), 0755) != 0) {
        throw std::system_error(errno, std::system_category(), "create cgroup " + path_.string());
    }
    created_ = true;
    WriteControl("memory.max", std::to_string(options.memory_ceiling_bytes));
    WriteControl("memory.swap.max", "0");
    WriteControl("pids.max", std::to_string(options.max_processes));
    const auto quota = static_cast<long long>(options.cpu_share * static_cast<double>(kCpuPeriodUs));
    WriteControl("cpu.max", std::to_string(std::max<long long>(quota, 1000)) + " " + std::to_string(kCpuPeriodUs));
}

void CgroupLimiter::WriteControl(const std::string& file, const std::string& value) const {
    std::ofstream output(path_ / file);
    output << value;
    output.flush();
    if (!output) {
        throw std::system_error(EIO, std::system_category(), "write " + (path_ / file).string());
    }
}

std::string CgroupLimiter::ProcsPath() const {
    return (path_ / "cgroup.procs").string();
}

void CgroupLimiter::KillAll() noexcept {
    if (!created_) {
        return;
    }
    {
        std::ofstream kill_file(path_ / "cgroup.kill");
        if (kill_file) {
            kill_file << "1";
            kill_file.flush();
            if (kill_file) {
                return;
            }
        }
    }
    // Kernels before 5.14 have no cgroup.kill.
    std::ifstream procs(path_ / "cgroup.procs");
    pid_t pid = 0;
    while (procs >> pid) {
        if (pid > 0) {
            ::kill(pid, SIGKILL);
        }
    }
}

bool CgroupLimiter::OomKilled() const {
    if (!created_) {
        return false;
    }
    std::ifstream events(path_ / "memory.events");
    std::string key;
    long long value = 0;
    while (events >> key >> value) {
        if (key == "oom_kill" && value > 0) {
            return true;
        }
    }
    return false;
}

bool CgroupLimiter::Remove() noexcept {
    if (!created_) {
        return true;
    }
    for (int attempt = 0; attempt < kRemoveAttempts; ++attempt) {
        if (::rmdir(path_.c_str()) == 0 || errno == ENOENT) {
            created_ = false;
            return true;
        }
        if (errno != EBUSY) {
            break;
        }
        KillAll();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    utils::LogLine(utils::LogLevel::kError, "runner") << "failed to remove cgroup " << path_.string();
    return false;
}

}  // namespace sandbar::runner
