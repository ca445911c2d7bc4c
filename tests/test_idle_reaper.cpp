#include <gtest/gtest.h>
#include "IdleReaper.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace respool;
using namespace std::chrono_literals;

class IdleReaperTest : public ::testing::Test {
protected:
    std::atomic<int> sweeps_{0};
};

TEST_F(IdleReaperTest, SweepsPeriodically) {
    IdleReaper reaper(10ms, [this] { sweeps_++; }, nullptr);
    reaper.start();
    EXPECT_TRUE(reaper.isRunning());

    std::this_thread::sleep_for(120ms);
    reaper.stop();

    EXPECT_GE(sweeps_.load(), 3);
    EXPECT_EQ(reaper.sweepCount(), static_cast<uint64_t>(sweeps_.load()));
    EXPECT_FALSE(reaper.isRunning());
}

TEST_F(IdleReaperTest, FirstSweepWaitsOneInterval) {
    IdleReaper reaper(1h, [this] { sweeps_++; }, nullptr);
    reaper.start();
    std::this_thread::sleep_for(20ms);
    reaper.stop();

    EXPECT_EQ(sweeps_.load(), 0);
}

TEST_F(IdleReaperTest, StopIsPromptAndFinal) {
    IdleReaper reaper(1h, [this] { sweeps_++; }, nullptr);
    reaper.start();

    auto start = std::chrono::steady_clock::now();
    reaper.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);

    int after = sweeps_.load();
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(sweeps_.load(), after);
}

TEST_F(IdleReaperTest, FailingSweepDoesNotStopTheLoop) {
    IdleReaper reaper(5ms, [this] {
        sweeps_++;
        throw std::runtime_error("sweep failed");
    }, nullptr);
    reaper.start();

    std::this_thread::sleep_for(60ms);
    reaper.stop();

    EXPECT_GE(sweeps_.load(), 2);
}

TEST_F(IdleReaperTest, StopWithoutStartIsHarmless) {
    IdleReaper reaper(10ms, [this] { sweeps_++; }, nullptr);
    EXPECT_NO_THROW(reaper.stop());
    EXPECT_NO_THROW(reaper.stop());
    EXPECT_EQ(sweeps_.load(), 0);
}
