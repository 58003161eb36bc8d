#pragma once
#include <string>
#include <utility>
#include <vector>

class SimulationSettings
{
public:
    // grid and time settings
    int gridSize = 200;          // cells per side, field and world share units
    float bucketSize = 4.0f;     // spatial grid bucket edge length
    float tickSeconds = 1.0f / 60.0f;
    float ageIncrement = 0.01f;  // age units added per tick (agents, fruits, spores)

    // initialization
    int initialHyphaeCount = 5;
    float initialSpawnSpread = 10.0f; // half width of the central spawn square
    float initialCarbon = 0.5f;
    float initialNitrogen = 0.05f;
    bool seedNutrients = true;
    int obstacleCount = 300;

    // steering settings (chemotaxis + tropism + wander)
    float stepLength = 0.5f;
    float gradientWeight = 0.35f;
    float minGradientMagnitude = 0.08f;
    float tropismAngle = 0.785398f; // radians
    float tropismStrength = 0.01f;
    float angleWanderRange = 0.05f; // radians per tick
    float avoidanceDistance = 2.0f;
    float avoidanceWeight = 0.6f;
    float reflectionJitter = 0.15f; // radians

    // feeding
    float uptakeRate = 0.01f;   // max nutrient taken per tick
    float uptakeRadius = 0.0f;  // 0 = the containing cell only
    float maxReserve = 1.0f;    // cap for carbon and nitrogen reserves
    float optimalCnRatio = 10.0f;
    float cnPenaltyStrength = 0.5f;
    float minGrowthEfficiency = 0.2f;

    // energy
    float energyDecayRate = 0.999f; // multiplicative per tick
    float minEnergyToLive = 0.005f;

    // senescence
    bool senescenceEnabled = true;
    float senescenceMinAge = 2.0f;
    float senescenceBaseProbability = 0.00001f;
    float senescenceFlowThreshold = 0.05f;
    float senescenceDistanceThreshold = 20.0f;
    float senescenceCollapseDistance = 60.0f;
    float senescenceWeatherExtremeThreshold = 0.2f;
    int senescenceHubMinDegree = 3;

    // branching and population cap
    float branchProbability = 0.002f;
    int maxHyphae = 5000;                     // hard cap on alive agents (0 = no cap)
    int branchingSuppressionThreshold = 4000; // branching stops above this (0 = off)
    float branchAngleRange = 1.2f;
    float branchOffset = 1.5f;

    // fusion
    bool fusionEnabled = true;
    float fusionDistance = 1.0f;
    float fusionMinAge = 0.1f;
    float fusionEnergyTransfer = 0.8f;

    // network (anastomosis, flow, reinforcement, pruning)
    float anastomosisDistance = 2.0f;
    float initialConnectionStrength = 0.3f;
    float minConnectionStrength = 0.05f;
    float pruningThreshold = 0.08f;
    float connectionBalanceFraction = 0.1f;
    float connectionFlowRate = 0.02f;
    float maxFlowPerTick = 0.02f;
    bool adaptiveGrowthEnabled = true;
    float flowStrengtheningRate = 5.0f;
    float connectionDecayRate = 0.998f;

    // signal propagation
    bool signalPropagationEnabled = true;
    float signalTriggerNutrientThreshold = 0.5f;
    float signalDecayRate = 0.95f;
    float signalStrengthThreshold = 0.1f;
    float signalSteeringWeight = 0.3f;

    // nutrient field
    float maxNutrient = 1.0f;
    float diffusionRate = 0.05f;
    float nitrogenDiffusionScale = 0.7f;
    float regenRate = 0.0005f;
    float regenFloor = 0.15f;
    int regenSamples = 200;
    float flowBaseStrength = 0.0f;
    float flowRainStrength = 0.05f;
    float flowDriftRange = 0.02f; // radians per tick
    float patchAmount = 1.0f;     // amount added per cell by perturbations
    float patchRadius = 3.0f;
    int fieldThreads = 0;         // diffusion workers, 0 = all cores but one

    // memory field
    bool memoryEnabled = true;
    float memoryDecayRate = 0.995f;
    float memoryUpdateStrength = 1.0f;
    float memoryWeight = 0.2f;
    float maxMemory = 1.0f;

    // weather
    bool weatherEnabled = true;
    bool seasonalCycleEnabled = true;
    bool weatherAffectsGrowth = true;
    bool weatherAffectsEnergy = true;

    // trail segments
    bool trailsEnabled = true;
    float maxSegmentAge = 10.0f;
    float segmentAgeIncrement = 0.05f;
    int maxSegments = 20000;

    // reproduction
    bool fruitingEnabled = true;
    int fruitingMinHyphae = 50;
    float fruitingEnergyThreshold = 15.0f;
    float fruitingCooldown = 10.0f; // seconds
    float fruitingLifespanMin = 3.0f;
    float fruitingLifespanMax = 6.0f;
    float fruitingTransferRadius = 20.0f;
    float fruitingNutrientReturnFraction = 0.5f;
    float sporeReleaseFraction = 0.5f;
    float sporeReleaseInterval = 0.2f;
    int sporesPerRelease = 6;
    int maxSporeReleases = 3;
    float sporeRadius = 3.0f;
    float sporeDrift = 0.15f;
    float sporeEnergy = 0.3f;
    float sporeMaxAge = 5.0f;
    float sporeGerminationThreshold = 0.6f;
    float sporeImmediateGerminationChance = 0.3f;

    // runner
    int stepsPerFrame = 1;
    float targetTicksPerSecond = 60.0f;

    // logging
    bool verboseLogging = true;

    SimulationSettings() = default;

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    // assigns one option from its text form, false on unknown key or bad value
    bool setValue(const std::string &key, const std::string &value);

    // every option as key/value text, in declaration order
    std::vector<std::pair<std::string, std::string>> describe() const;

    // throws std::invalid_argument naming the first offending option
    void validate() const;
};
