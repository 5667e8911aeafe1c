#include <gtest/gtest.h>
#include "active_sandboxes.h"
#include <thread>
#include <vector>

namespace contestrun {
namespace {

TEST(ActiveSandboxesTest, TracksContainersUntilRemoved) {
    ActiveSandboxes active;

    active.add("c1", "sub-1");
    active.add("c2", "sub-2");

    EXPECT_EQ(active.size(), 2u);
    EXPECT_TRUE(active.contains("c1"));
    EXPECT_EQ(active.submission_of("c2"), "sub-2");

    active.remove("c1");

    EXPECT_FALSE(active.contains("c1"));
    EXPECT_EQ(active.snapshot(), std::vector<std::string>{"c2"});
}

TEST(ActiveSandboxesTest, RemovingUnknownContainerIsHarmless) {
    ActiveSandboxes active;

    active.remove("never-added");

    EXPECT_EQ(active.size(), 0u);
    EXPECT_EQ(active.submission_of("never-added"), "");
}

TEST(ActiveSandboxesTest, ReclaimedFlagOutlivesRemovalAndIsTakenOnce) {
    ActiveSandboxes active;
    active.add("c1", "sub-1");

    active.mark_reclaimed("c1");
    active.remove("c1");

    EXPECT_FALSE(active.take_reclaimed("c2"));
    EXPECT_TRUE(active.take_reclaimed("c1"));
    EXPECT_FALSE(active.take_reclaimed("c1"));
}

TEST(ActiveSandboxesTest, ConcurrentUpdatesKeepCountExact) {
    ActiveSandboxes active;
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&active, t]() {
            for (int i = 0; i < 200; i++) {
                std::string id = "c" + std::to_string(t) + "-" + std::to_string(i);
                active.add(id, "sub");
                if (i % 2 == 0) {
                    active.remove(id);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(active.size(), 8u * 100);
}

} // namespace
} // namespace contestrun
