#pragma once

#include <atomic>
#include <chrono>
#include <thread>

// ----------------------------------------------------------
// RunFlag – prozessweites "running", wird genau einmal gelöscht
// ----------------------------------------------------------
class RunFlag
{
public:
    RunFlag() : running_(true) {}

    RunFlag(const RunFlag&) = delete;
    RunFlag& operator=(const RunFlag&) = delete;

    bool isRunning() const { return running_.load(); }

    // only touches a lock-free atomic, safe to call from a signal handler
    void stop() { running_.store(false); }

    // Sleeps for `duration` but wakes up within one slice once stopped.
    // Returns whether the flag is still set.
    bool sleepFor(std::chrono::milliseconds duration) const
    {
        const auto deadline = std::chrono::steady_clock::now() + duration;
        while (running_.load())
        {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) break;

            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(left < kSlice ? left : kSlice);
        }
        return running_.load();
    }

private:
    static constexpr std::chrono::milliseconds kSlice{10};

    std::atomic<bool> running_;
};
