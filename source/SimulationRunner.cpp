#include "SimulationRunner.h"
#include "MyceliumSimulation.h"
#include <SFML/System/Clock.hpp>
#include <SFML/System/Sleep.hpp>
#include <SFML/System/Time.hpp>
#include <algorithm>
#include <iostream>

namespace
{
    constexpr float SPEED_STEP = 1.25f;
}

SimulationRunner::SimulationRunner(MyceliumSimulation &simulation, float targetTicksPerSecond)
    : simulation_(simulation), targetTicksPerSecond_(std::max(targetTicksPerSecond, 1.0f))
{
}

SimulationRunner::~SimulationRunner()
{
    stop();
}

void SimulationRunner::start()
{
    if (running_.exchange(true))
        return;

    thread_ = std::thread(&SimulationRunner::loop, this);
    if (simulation_.getSettings().verboseLogging)
        std::cout << "Runner started at " << targetTicksPerSecond_.load() << " ticks/s" << std::endl;
}

void SimulationRunner::stop()
{
    if (!running_.exchange(false))
        return;

    if (thread_.joinable())
        thread_.join();

    if (simulation_.getSettings().verboseLogging)
        std::cout << "Runner stopped after " << getStats().ticks << " ticks" << std::endl;
}

void SimulationRunner::stepManual(int count)
{
    simulation_.stepMany(count);
}

void SimulationRunner::setTargetTicksPerSecond(float ticksPerSecond)
{
    targetTicksPerSecond_ = std::max(ticksPerSecond, 1.0f);
}

void SimulationRunner::increaseSpeed()
{
    setSpeed(speed_.load() * SPEED_STEP);
}

void SimulationRunner::decreaseSpeed()
{
    setSpeed(speed_.load() / SPEED_STEP);
}

void SimulationRunner::setSpeed(float multiplier)
{
    speed_ = std::clamp(multiplier, MIN_SPEED, MAX_SPEED);
}

SimulationRunner::TimingStats SimulationRunner::getStats() const
{
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

void SimulationRunner::recordTick(double milliseconds)
{
    std::lock_guard<std::mutex> lock(statsMutex_);
    ++stats_.ticks;
    stats_.lastTickMs = milliseconds;
    stats_.avgTickMs += (milliseconds - stats_.avgTickMs) / static_cast<double>(stats_.ticks);
    stats_.maxTickMs = std::max(stats_.maxTickMs, milliseconds);
}

void SimulationRunner::loop()
{
    sf::Clock frameClock;
    sf::Clock tickClock;
    float pending = 0.0f; // fractional ticks carried between frames

    while (running_)
    {
        frameClock.restart();
        const sf::Time frameBudget = sf::seconds(1.0f / targetTicksPerSecond_);

        if (!paused_)
        {
            // the speed multiplier is spent as whole ticks per frame
            pending += speed_;
            int ticks = static_cast<int>(pending);
            pending -= static_cast<float>(ticks);

            for (int i = 0; i < ticks && running_; ++i)
            {
                tickClock.restart();
                simulation_.step();
                recordTick(tickClock.getElapsedTime().asMicroseconds() / 1000.0);
            }
        }
        else
        {
            pending = 0.0f;
        }

        // a slow frame simply delays the next one
        sf::Time elapsed = frameClock.getElapsedTime();
        if (elapsed < frameBudget)
            sf::sleep(frameBudget - elapsed);
    }
}
