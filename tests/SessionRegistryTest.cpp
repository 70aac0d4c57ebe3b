#include <gtest/gtest.h>

#include <format>
#include <thread>
#include <vector>

#include "shared/SessionRegistry.hpp"

TEST(SessionRegistry, CreateStartsWithDefaults) {
    CSessionRegistry registry;
    registry.create("/org/freedesktop/portal/desktop/session/1_1/a");

    const auto SESSION = registry.get("/org/freedesktop/portal/desktop/session/1_1/a");
    ASSERT_TRUE(SESSION.has_value());
    EXPECT_EQ(SESSION->sourceTypes, 0u);
    EXPECT_EQ(SESSION->cursorMode, CURSOR_EMBEDDED);
    EXPECT_EQ(SESSION->persistMode, PERSIST_NONE);
    EXPECT_FALSE(SESSION->restoreToken.has_value());
}

TEST(SessionRegistry, GetUnknownIsEmpty) {
    CSessionRegistry registry;
    EXPECT_FALSE(registry.get("/nope").has_value());
}

TEST(SessionRegistry, UpdateStoresPreferences) {
    CSessionRegistry registry;
    registry.create("s");

    ASSERT_TRUE(registry.update("s", {.sourceTypes = SOURCE_WINDOW, .cursorMode = CURSOR_HIDDEN, .persistMode = PERSIST_PERSISTENT, .restoreToken = "HDMI-A-1"}));

    const auto SESSION = registry.get("s");
    ASSERT_TRUE(SESSION.has_value());
    EXPECT_EQ(SESSION->sourceTypes, SOURCE_WINDOW);
    EXPECT_EQ(SESSION->cursorMode, CURSOR_HIDDEN);
    EXPECT_EQ(SESSION->persistMode, PERSIST_PERSISTENT);
    EXPECT_EQ(SESSION->restoreToken, "HDMI-A-1");
}

TEST(SessionRegistry, UpdateUnknownDoesNotInsert) {
    CSessionRegistry registry;

    EXPECT_FALSE(registry.update("ghost", {}));
    EXPECT_FALSE(registry.get("ghost").has_value());
    EXPECT_EQ(registry.size(), 0u);
}

TEST(SessionRegistry, CreateAgainResetsPreferences) {
    CSessionRegistry registry;
    registry.create("s");
    registry.update("s", {.sourceTypes = SOURCE_WINDOW, .cursorMode = CURSOR_METADATA});

    registry.create("s");

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(*registry.get("s"), SScreencastSession{});
}

TEST(SessionRegistry, SessionsAreIndependent) {
    CSessionRegistry registry;
    registry.create("a");
    registry.create("b");

    registry.update("a", {.sourceTypes = SOURCE_WINDOW, .cursorMode = CURSOR_HIDDEN});

    EXPECT_EQ(registry.get("a")->sourceTypes, SOURCE_WINDOW);
    EXPECT_EQ(*registry.get("b"), SScreencastSession{});
}

TEST(SessionRegistry, RemoveForgetsSession) {
    CSessionRegistry registry;
    registry.create("s");

    EXPECT_TRUE(registry.remove("s"));
    EXPECT_FALSE(registry.remove("s"));
    EXPECT_FALSE(registry.get("s").has_value());
}

TEST(SessionRegistry, ConcurrentCreateAndUpdate) {
    CSessionRegistry         registry;
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&registry, t]() {
            for (int i = 0; i < 100; ++i) {
                const auto HANDLE = std::format("s{}_{}", t, i);
                registry.create(HANDLE);
                registry.update(HANDLE, {.sourceTypes = (uint32_t)t});
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(registry.size(), 800u);
    EXPECT_EQ(registry.get("s5_42")->sourceTypes, 5u);
}
