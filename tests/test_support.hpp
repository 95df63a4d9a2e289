#pragma once

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "runner/runner.hpp"
#include "sandbox/sandbox_types.hpp"

namespace sandbar::test {

// Fresh directory under the system temp dir, removed with its contents.
class TempDir {
public:
    TempDir() {
        auto pattern = (std::filesystem::temp_directory_path() / "sandbar_test_XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::system_error(errno, std::system_category(), "mkdtemp");
        }
        path_ = pattern;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Runner whose executions block until released (or cancelled) so tests can
// observe the scheduler with work in flight.
class GatedRunner : public runner::Runner {
public:
    sandbox::ExecutionResult Run(const runner::RunContext& context) override {
        const auto& id = context.request.id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            started_.push_back(id);
            slots_.push_back(context.slot);
            ++active_;
            peak_ = std::max(peak_, active_);
        }
        cv_.notify_all();

        bool cancelled = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (!open_ && released_.count(id) == 0) {
                if (context.cancel_requested && context.cancel_requested->load()) {
                    cancelled = true;
                    break;
                }
                cv_.wait_for(lock, std::chrono::milliseconds(5));
            }
            --active_;
        }
        cv_.notify_all();

        if (cancelled) {
            return sandbox::CancelledResult();
        }
        if (result_for_) {
            return result_for_(context);
        }
        sandbox::ExecutionResult result{};
        result.stdout_text = "ran " + id;
        result.exit_code = 0;
        result.elapsed_ms = 1;
        return result;
    }

    void Release(const std::string& id) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_.insert(id);
        }
        cv_.notify_all();
    }

    void ReleaseAll() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    bool WaitForStarted(std::size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return started_.size() >= count; });
    }

    void SetResult(std::function<sandbox::ExecutionResult(const runner::RunContext&)> result_for) {
        result_for_ = std::move(result_for);
    }

    std::vector<std::string> Started() {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    std::vector<int> Slots() {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_;
    }

    int Peak() {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> started_;
    std::vector<int> slots_;
    std::set<std::string> released_;
    bool open_ = false;
    int active_ = 0;
    int peak_ = 0;
    std::function<sandbox::ExecutionResult(const runner::RunContext&)> result_for_;
};

inline sandbox::ExecutionRequest MakeRequest(const std::string& id,
                                             sandbox::Language language = sandbox::Language::kShell,
                                             const std::string& source = "echo hi") {
    sandbox::ExecutionRequest request;
    request.id = id;
    request.language = language;
    request.source_code = source;
    request.options.timeout_ms = 5000;
    request.options.memory_ceiling_bytes = 128LL * 1024 * 1024;
    request.options.cpu_share = 0.5;
    request.options.max_processes = 32;
    return request;
}

}  // namespace sandbar::test
