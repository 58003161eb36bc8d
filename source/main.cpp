#include <SFML/System/Clock.hpp>
#include <SFML/System/Sleep.hpp>
#include <SFML/System/Time.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <random>
#include <stdexcept>

#include "MyceliumSimulation.h"
#include "SimulationRunner.h"
#include "SimulationSettings.h"

// headless driver constants
const float RUN_SECONDS = 60.0f;
const float REPORT_INTERVAL = 2.0f;

void printStats(const SimulationSnapshot &snap, const SimulationRunner::TimingStats &timing)
{
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "tick " << snap.tickIndex
              << " | hyphae " << snap.aliveCount
              << " | links " << snap.connectionCount
              << " | fruits " << snap.fruitingBodyCount
              << " | spores " << snap.sporeCount
              << " | energy " << snap.totalEnergy << " (avg " << snap.averageEnergy << ")"
              << " | " << Weather::seasonName(snap.season) << " T=" << snap.temperature << " rain=" << snap.rain
              << " | births " << snap.counters.births << " deaths " << snap.counters.deaths()
              << " (starved " << snap.counters.deathsStarvation
              << ", senescent " << snap.counters.deathsSenescence
              << ", fused " << snap.counters.deathsFusion << ")"
              << " | tick " << timing.avgTickMs << "ms avg" << std::endl;
}

int main(int argc, char *argv[])
{
    SimulationSettings settings;
    if (argc > 1)
    {
        if (!settings.loadFromFile(argv[1]))
        {
            std::cerr << "Failed to load settings from " << argv[1] << ", using defaults" << std::endl;
            settings = SimulationSettings();
        }
    }

    std::random_device rd;
    const uint32_t seed = rd();

    try
    {
        MyceliumSimulation simulation(seed, settings);
        SimulationRunner runner(simulation, settings.targetTicksPerSecond);
        runner.setSpeed(static_cast<float>(std::max(settings.stepsPerFrame, 1)));
        runner.start();

        sf::Clock runClock;
        while (runClock.getElapsedTime().asSeconds() < RUN_SECONDS)
        {
            sf::sleep(sf::seconds(REPORT_INTERVAL));
            auto snap = simulation.snapshot();
            printStats(*snap, runner.getStats());

            if (snap->aliveCount == 0 && snap->sporeCount == 0)
            {
                std::cout << "Colony died out" << std::endl;
                break;
            }
        }

        runner.stop();
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Invalid settings: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
