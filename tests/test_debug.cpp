#include <gtest/gtest.h>
#include <debug.hpp>
#include <chrono>
#include <thread>

using FxCacheManager::ScopedTimer;

TEST(ScopedTimer, StartsNearZero) {
    ScopedTimer timer("idle", 1000);
    EXPECT_GE(timer.elapsedMs(), 0);
    EXPECT_LT(timer.elapsedMs(), 1000);
}

TEST(ScopedTimer, MeasuresElapsedTime) {
    ScopedTimer timer("sleep", 1000);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_GE(timer.elapsedMs(), 30);
}

TEST(ScopedTimer, ElapsedNeverDecreases) {
    ScopedTimer timer("monotonic");
    long long first = timer.elapsedMs();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_GE(timer.elapsedMs(), first);
}
