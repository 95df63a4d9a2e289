#include <gtest/gtest.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <set>
#include <string>
#include <thread>

#include "bus/event_bus.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

// NOLINTNEXTLINE
TEST(event_bus, dispatches_to_subscribers_until_stopped) {
    sandbar::bus::EventBus bus;
    std::atomic<int> delivered{0};
    bus.Subscribe([&delivered](const sandbar::bus::ExecutionEvent&) { ++delivered; });
    std::thread dispatcher([&bus] { bus.Dispatch(); });

    for (int i = 0; i < 3; ++i) {
        sandbar::bus::ExecutionEvent event;
        event.execution_id = "e" + std::to_string(i);
        bus.Publish(event);
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (delivered < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    bus.Stop();
    dispatcher.join();
    EXPECT_EQ(delivered, 3);
}

// NOLINTNEXTLINE
TEST(event_bus, stop_before_dispatch_returns_immediately) {
    sandbar::bus::EventBus bus;
    bus.Stop();
    bus.Dispatch();
    sandbar::bus::ExecutionEvent event;
    EXPECT_FALSE(bus.TryConsume(event, std::chrono::milliseconds(1)));
}

// NOLINTNEXTLINE
TEST(utils, execution_ids_are_unique_and_path_safe) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        const auto id = sandbar::utils::GenerateExecutionId();
        EXPECT_EQ(id.rfind("exec_", 0), 0u);
        for (const char c : id) {
            EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c)) || c == '_') << id;
        }
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 1000u);
}

// NOLINTNEXTLINE
TEST(utils, log_levels_parse_case_insensitively) {
    EXPECT_EQ(sandbar::utils::ParseLogLevel("DEBUG"), sandbar::utils::LogLevel::kDebug);
    EXPECT_EQ(sandbar::utils::ParseLogLevel("warning"), sandbar::utils::LogLevel::kWarn);
    EXPECT_FALSE(sandbar::utils::ParseLogLevel("loud").has_value());

    sandbar::utils::ConfigureLogging({sandbar::utils::LogLevel::kError});
    EXPECT_FALSE(sandbar::utils::ShouldLog(sandbar::utils::LogLevel::kWarn));
    EXPECT_TRUE(sandbar::utils::ShouldLog(sandbar::utils::LogLevel::kError));
    sandbar::utils::ConfigureLogging({});
}
