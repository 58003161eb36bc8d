#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>

class MyceliumSimulation;

/**
 * drives a simulation from a background thread at a target tick rate
 * manual stepping goes straight to the simulation and ignores the pause flag
 */
class SimulationRunner
{
public:
    static constexpr float MIN_SPEED = 0.1f;
    static constexpr float MAX_SPEED = 10.0f;

    struct TimingStats
    {
        uint64_t ticks = 0; // automatic ticks only
        double lastTickMs = 0.0;
        double avgTickMs = 0.0;
        double maxTickMs = 0.0;
    };

    explicit SimulationRunner(MyceliumSimulation &simulation, float targetTicksPerSecond = 60.0f);
    ~SimulationRunner();

    SimulationRunner(const SimulationRunner &) = delete;
    SimulationRunner &operator=(const SimulationRunner &) = delete;

    void start();
    void stop(); // joins the loop thread
    bool isRunning() const { return running_; }

    void setPaused(bool paused) { paused_ = paused; }
    bool isPaused() const { return paused_; }
    void togglePause() { paused_ = !paused_; }

    // runs immediately on the caller's thread, paused or not
    void stepManual(int count);

    void setTargetTicksPerSecond(float ticksPerSecond);
    float getTargetTicksPerSecond() const { return targetTicksPerSecond_; }

    // speed multiplier, clamped to [MIN_SPEED, MAX_SPEED]
    void increaseSpeed();
    void decreaseSpeed();
    void resetSpeed() { setSpeed(1.0f); }
    void setSpeed(float multiplier);
    float getSpeed() const { return speed_; }

    TimingStats getStats() const;

private:
    MyceliumSimulation &simulation_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};
    std::atomic<float> targetTicksPerSecond_;
    std::atomic<float> speed_{1.0f};

    mutable std::mutex statsMutex_;
    TimingStats stats_;

    void loop();
    void recordTick(double milliseconds);
};
