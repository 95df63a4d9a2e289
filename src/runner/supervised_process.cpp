#include "runner/supervised_process.hpp"

#include <algorithm>
#include <array>
#include <csignal>
#include <system_error>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/process.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/system/error_code.hpp>
#include <sys/wait.h>

namespace sandbar::runner {
namespace bp = boost::process;

namespace {

constexpr auto kTick = std::chrono::milliseconds(20);
constexpr auto kDrainGrace = std::chrono::seconds(1);

struct StreamCapture {
    std::string data;
    std::array<char, 4096> buffer{};
    bool open = true;
    bool truncated = false;
};

// Keeps draining past the limit so the writer never blocks on a full pipe.
void StartRead(bp::async_pipe& pipe, StreamCapture& capture, std::size_t limit) {
    pipe.async_read_some(
        boost::asio::buffer(capture.buffer),
        [&pipe, &capture, limit](const boost::system::error_code& ec, std::size_t n) {
            if (n > 0) {
                const auto room = limit > capture.data.size() ? limit - capture.data.size() : 0;
                capture.data.append(capture.buffer.data(), std::min(n, room));
                if (n > room) {
                    capture.truncated = true;
                }
            }
            if (ec) {
                capture.open = false;
                return;
            }
            StartRead(pipe, capture, limit);
        });
}

long long ElapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

}  // namespace

ProcessOutcome Supervise(const LaunchSpec& spec, const IsolationPlan& plan, const SupervisionLimits& limits) {
    ProcessOutcome outcome{};
    boost::asio::io_context ioc;
    std::optional<bp::async_pipe> out_pipe;
    std::optional<bp::async_pipe> err_pipe;

    bp::environment env;
    for (const auto& [key, value] : spec.environment) {
        env[key] = value;
    }

    const auto started = std::chrono::steady_clock::now();
    bp::child child;
    try {
        out_pipe.emplace(ioc);
        err_pipe.emplace(ioc);
        child = bp::child(
            bp::exe = spec.executable,
            bp::args = spec.args,
            env,
            bp::std_in < bp::null,
            bp::std_out > *out_pipe,
            bp::std_err > *err_pipe,
            IsolationHandler(plan));
    } catch (const bp::process_error& ex) {
        outcome.launch_error = ex.what();
        return outcome;
    } catch (const std::system_error& ex) {
        outcome.launch_error = ex.what();
        return outcome;
    }
    outcome.launched = true;

    const pid_t group = child.id();
    const auto deadline = started + limits.timeout;
    bool killed = false;
    bool exited = false;
    std::optional<std::chrono::steady_clock::time_point> drain_deadline;
    auto kill_group = [&] {
        if (killed) {
            return;
        }
        killed = true;
        ::killpg(group, SIGKILL);
        if (limits.on_kill) {
            limits.on_kill();
        }
    };

    StreamCapture out;
    StreamCapture err;
    StartRead(*out_pipe, out, limits.output_limit_bytes);
    StartRead(*err_pipe, err, limits.output_limit_bytes);

    boost::asio::steady_timer ticker(ioc);
    std::function<void()> schedule_tick;
    auto on_tick = [&](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        const auto now = std::chrono::steady_clock::now();
        if (!exited) {
            std::error_code wait_ec;
            if (!child.running(wait_ec)) {
                exited = true;
                outcome.elapsed_ms = ElapsedMs(started);
                // Whatever still holds the pipes is a leftover of the group.
                if (out.open || err.open) {
                    ::killpg(group, SIGKILL);
                    drain_deadline = now + kDrainGrace;
                }
            } else if (now >= deadline) {
                outcome.timed_out = true;
                kill_group();
            } else if (limits.cancel_requested && limits.cancel_requested->load()) {
                outcome.cancelled = true;
                kill_group();
            }
        }
        if (exited && !out.open && !err.open) {
            return;
        }
        if (drain_deadline && now >= *drain_deadline) {
            boost::system::error_code close_ec;
            out_pipe->close(close_ec);
            err_pipe->close(close_ec);
            return;
        }
        schedule_tick();
    };
    schedule_tick = [&] {
        ticker.expires_after(kTick);
        ticker.async_wait(on_tick);
    };
    schedule_tick();
    ioc.run();

    if (!exited) {
        std::error_code wait_ec;
        child.wait(wait_ec);
        outcome.elapsed_ms = ElapsedMs(started);
    }
    const int status = child.native_exit_code();
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
    }
    outcome.stdout_text = std::move(out.data);
    outcome.stderr_text = std::move(err.data);
    outcome.output_truncated = out.truncated || err.truncated;
    return outcome;
}

}  // namespace sandbar::runner
