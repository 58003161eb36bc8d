#include "SimulationSettings.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <limits>
#include <stdexcept>

namespace
{
    // option tables shared by save/load/describe so every key round-trips
    struct FloatOption
    {
        const char *key;
        float SimulationSettings::*member;
    };
    struct IntOption
    {
        const char *key;
        int SimulationSettings::*member;
    };
    struct BoolOption
    {
        const char *key;
        bool SimulationSettings::*member;
    };

    const IntOption INT_OPTIONS[] = {
        {"gridSize", &SimulationSettings::gridSize},
        {"initialHyphaeCount", &SimulationSettings::initialHyphaeCount},
        {"obstacleCount", &SimulationSettings::obstacleCount},
        {"senescenceHubMinDegree", &SimulationSettings::senescenceHubMinDegree},
        {"maxHyphae", &SimulationSettings::maxHyphae},
        {"branchingSuppressionThreshold", &SimulationSettings::branchingSuppressionThreshold},
        {"regenSamples", &SimulationSettings::regenSamples},
        {"fieldThreads", &SimulationSettings::fieldThreads},
        {"maxSegments", &SimulationSettings::maxSegments},
        {"fruitingMinHyphae", &SimulationSettings::fruitingMinHyphae},
        {"sporesPerRelease", &SimulationSettings::sporesPerRelease},
        {"maxSporeReleases", &SimulationSettings::maxSporeReleases},
        {"stepsPerFrame", &SimulationSettings::stepsPerFrame},
    };

    const FloatOption FLOAT_OPTIONS[] = {
        {"bucketSize", &SimulationSettings::bucketSize},
        {"tickSeconds", &SimulationSettings::tickSeconds},
        {"ageIncrement", &SimulationSettings::ageIncrement},
        {"initialSpawnSpread", &SimulationSettings::initialSpawnSpread},
        {"initialCarbon", &SimulationSettings::initialCarbon},
        {"initialNitrogen", &SimulationSettings::initialNitrogen},
        {"stepLength", &SimulationSettings::stepLength},
        {"gradientWeight", &SimulationSettings::gradientWeight},
        {"minGradientMagnitude", &SimulationSettings::minGradientMagnitude},
        {"tropismAngle", &SimulationSettings::tropismAngle},
        {"tropismStrength", &SimulationSettings::tropismStrength},
        {"angleWanderRange", &SimulationSettings::angleWanderRange},
        {"avoidanceDistance", &SimulationSettings::avoidanceDistance},
        {"avoidanceWeight", &SimulationSettings::avoidanceWeight},
        {"reflectionJitter", &SimulationSettings::reflectionJitter},
        {"uptakeRate", &SimulationSettings::uptakeRate},
        {"uptakeRadius", &SimulationSettings::uptakeRadius},
        {"maxReserve", &SimulationSettings::maxReserve},
        {"optimalCnRatio", &SimulationSettings::optimalCnRatio},
        {"cnPenaltyStrength", &SimulationSettings::cnPenaltyStrength},
        {"minGrowthEfficiency", &SimulationSettings::minGrowthEfficiency},
        {"energyDecayRate", &SimulationSettings::energyDecayRate},
        {"minEnergyToLive", &SimulationSettings::minEnergyToLive},
        {"senescenceMinAge", &SimulationSettings::senescenceMinAge},
        {"senescenceBaseProbability", &SimulationSettings::senescenceBaseProbability},
        {"senescenceFlowThreshold", &SimulationSettings::senescenceFlowThreshold},
        {"senescenceDistanceThreshold", &SimulationSettings::senescenceDistanceThreshold},
        {"senescenceCollapseDistance", &SimulationSettings::senescenceCollapseDistance},
        {"senescenceWeatherExtremeThreshold", &SimulationSettings::senescenceWeatherExtremeThreshold},
        {"branchProbability", &SimulationSettings::branchProbability},
        {"branchAngleRange", &SimulationSettings::branchAngleRange},
        {"branchOffset", &SimulationSettings::branchOffset},
        {"fusionDistance", &SimulationSettings::fusionDistance},
        {"fusionMinAge", &SimulationSettings::fusionMinAge},
        {"fusionEnergyTransfer", &SimulationSettings::fusionEnergyTransfer},
        {"anastomosisDistance", &SimulationSettings::anastomosisDistance},
        {"initialConnectionStrength", &SimulationSettings::initialConnectionStrength},
        {"minConnectionStrength", &SimulationSettings::minConnectionStrength},
        {"pruningThreshold", &SimulationSettings::pruningThreshold},
        {"connectionBalanceFraction", &SimulationSettings::connectionBalanceFraction},
        {"connectionFlowRate", &SimulationSettings::connectionFlowRate},
        {"maxFlowPerTick", &SimulationSettings::maxFlowPerTick},
        {"flowStrengtheningRate", &SimulationSettings::flowStrengtheningRate},
        {"connectionDecayRate", &SimulationSettings::connectionDecayRate},
        {"signalTriggerNutrientThreshold", &SimulationSettings::signalTriggerNutrientThreshold},
        {"signalDecayRate", &SimulationSettings::signalDecayRate},
        {"signalStrengthThreshold", &SimulationSettings::signalStrengthThreshold},
        {"signalSteeringWeight", &SimulationSettings::signalSteeringWeight},
        {"maxNutrient", &SimulationSettings::maxNutrient},
        {"diffusionRate", &SimulationSettings::diffusionRate},
        {"nitrogenDiffusionScale", &SimulationSettings::nitrogenDiffusionScale},
        {"regenRate", &SimulationSettings::regenRate},
        {"regenFloor", &SimulationSettings::regenFloor},
        {"flowBaseStrength", &SimulationSettings::flowBaseStrength},
        {"flowRainStrength", &SimulationSettings::flowRainStrength},
        {"flowDriftRange", &SimulationSettings::flowDriftRange},
        {"patchAmount", &SimulationSettings::patchAmount},
        {"patchRadius", &SimulationSettings::patchRadius},
        {"memoryDecayRate", &SimulationSettings::memoryDecayRate},
        {"memoryUpdateStrength", &SimulationSettings::memoryUpdateStrength},
        {"memoryWeight", &SimulationSettings::memoryWeight},
        {"maxMemory", &SimulationSettings::maxMemory},
        {"maxSegmentAge", &SimulationSettings::maxSegmentAge},
        {"segmentAgeIncrement", &SimulationSettings::segmentAgeIncrement},
        {"fruitingEnergyThreshold", &SimulationSettings::fruitingEnergyThreshold},
        {"fruitingCooldown", &SimulationSettings::fruitingCooldown},
        {"fruitingLifespanMin", &SimulationSettings::fruitingLifespanMin},
        {"fruitingLifespanMax", &SimulationSettings::fruitingLifespanMax},
        {"fruitingTransferRadius", &SimulationSettings::fruitingTransferRadius},
        {"fruitingNutrientReturnFraction", &SimulationSettings::fruitingNutrientReturnFraction},
        {"sporeReleaseFraction", &SimulationSettings::sporeReleaseFraction},
        {"sporeReleaseInterval", &SimulationSettings::sporeReleaseInterval},
        {"sporeRadius", &SimulationSettings::sporeRadius},
        {"sporeDrift", &SimulationSettings::sporeDrift},
        {"sporeEnergy", &SimulationSettings::sporeEnergy},
        {"sporeMaxAge", &SimulationSettings::sporeMaxAge},
        {"sporeGerminationThreshold", &SimulationSettings::sporeGerminationThreshold},
        {"sporeImmediateGerminationChance", &SimulationSettings::sporeImmediateGerminationChance},
        {"targetTicksPerSecond", &SimulationSettings::targetTicksPerSecond},
    };

    const BoolOption BOOL_OPTIONS[] = {
        {"seedNutrients", &SimulationSettings::seedNutrients},
        {"senescenceEnabled", &SimulationSettings::senescenceEnabled},
        {"fusionEnabled", &SimulationSettings::fusionEnabled},
        {"adaptiveGrowthEnabled", &SimulationSettings::adaptiveGrowthEnabled},
        {"signalPropagationEnabled", &SimulationSettings::signalPropagationEnabled},
        {"memoryEnabled", &SimulationSettings::memoryEnabled},
        {"weatherEnabled", &SimulationSettings::weatherEnabled},
        {"seasonalCycleEnabled", &SimulationSettings::seasonalCycleEnabled},
        {"weatherAffectsGrowth", &SimulationSettings::weatherAffectsGrowth},
        {"weatherAffectsEnergy", &SimulationSettings::weatherAffectsEnergy},
        {"trailsEnabled", &SimulationSettings::trailsEnabled},
        {"fruitingEnabled", &SimulationSettings::fruitingEnabled},
        {"verboseLogging", &SimulationSettings::verboseLogging},
    };

    std::string formatFloat(float value)
    {
        // max_digits10 so a saved file reads back bit-identical
        std::ostringstream out;
        out << std::setprecision(std::numeric_limits<float>::max_digits10) << value;
        return out.str();
    }

    void require(bool condition, const char *key, const char *what)
    {
        if (!condition)
        {
            throw std::invalid_argument(std::string("invalid setting '") + key + "': " + what);
        }
    }

    bool isUnit(float v) { return v >= 0.0f && v <= 1.0f; }
    bool isDecayFactor(float v) { return v > 0.0f && v <= 1.0f; }
}

bool SimulationSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# Mycelium Simulation Settings\n";
    for (const auto &[key, value] : describe())
    {
        file << key << "=" << value << "\n";
    }

    return true;
}

bool SimulationSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    bool ok = true;
    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line))
    {
        ++lineNumber;
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
        {
            std::cerr << "Warning: " << filename << ":" << lineNumber << " has no '=', skipped" << std::endl;
            ok = false;
            continue;
        }

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);
        if (!setValue(key, value))
        {
            std::cerr << "Warning: " << filename << ":" << lineNumber << " bad option '" << key << "'" << std::endl;
            ok = false;
        }
    }

    return ok;
}

bool SimulationSettings::setValue(const std::string &key, const std::string &value)
{
    try
    {
        for (const auto &option : INT_OPTIONS)
        {
            if (key == option.key)
            {
                this->*option.member = std::stoi(value);
                return true;
            }
        }
        for (const auto &option : FLOAT_OPTIONS)
        {
            if (key == option.key)
            {
                this->*option.member = std::stof(value);
                return true;
            }
        }
        for (const auto &option : BOOL_OPTIONS)
        {
            if (key == option.key)
            {
                this->*option.member = (std::stoi(value) != 0);
                return true;
            }
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: could not parse '" << value << "' for " << key << ": " << e.what() << std::endl;
        return false;
    }
    return false;
}

std::vector<std::pair<std::string, std::string>> SimulationSettings::describe() const
{
    std::vector<std::pair<std::string, std::string>> entries;
    for (const auto &option : INT_OPTIONS)
        entries.emplace_back(option.key, std::to_string(this->*option.member));
    for (const auto &option : FLOAT_OPTIONS)
        entries.emplace_back(option.key, formatFloat(this->*option.member));
    for (const auto &option : BOOL_OPTIONS)
        entries.emplace_back(option.key, (this->*option.member) ? "1" : "0");
    return entries;
}

void SimulationSettings::validate() const
{
    // grid and time
    require(gridSize >= 3, "gridSize", "must be at least 3");
    require(bucketSize > 0.0f, "bucketSize", "must be positive");
    require(tickSeconds > 0.0f, "tickSeconds", "must be positive");
    require(ageIncrement >= 0.0f, "ageIncrement", "must not be negative");

    // initialization
    require(initialHyphaeCount >= 0, "initialHyphaeCount", "must not be negative");
    require(initialSpawnSpread >= 0.0f, "initialSpawnSpread", "must not be negative");
    require(initialCarbon >= 0.0f && initialCarbon <= maxReserve, "initialCarbon", "must be within [0, maxReserve]");
    require(initialNitrogen >= 0.0f && initialNitrogen <= maxReserve, "initialNitrogen", "must be within [0, maxReserve]");
    require(obstacleCount >= 0, "obstacleCount", "must not be negative");

    // steering
    require(stepLength > 0.0f, "stepLength", "must be positive");
    require(stepLength < static_cast<float>(gridSize) * 0.25f, "stepLength", "must be small against the grid");
    require(gradientWeight >= 0.0f, "gradientWeight", "must not be negative");
    require(minGradientMagnitude >= 0.0f, "minGradientMagnitude", "must not be negative");
    require(tropismStrength >= 0.0f, "tropismStrength", "must not be negative");
    require(angleWanderRange >= 0.0f, "angleWanderRange", "must not be negative");
    require(avoidanceDistance >= 0.0f, "avoidanceDistance", "must not be negative");
    require(avoidanceWeight >= 0.0f, "avoidanceWeight", "must not be negative");
    require(reflectionJitter >= 0.0f, "reflectionJitter", "must not be negative");

    // feeding
    require(uptakeRate >= 0.0f, "uptakeRate", "must not be negative");
    require(uptakeRadius >= 0.0f, "uptakeRadius", "must not be negative");
    require(maxReserve > 0.0f, "maxReserve", "must be positive");
    require(optimalCnRatio > 0.0f, "optimalCnRatio", "must be positive");
    require(cnPenaltyStrength >= 0.0f, "cnPenaltyStrength", "must not be negative");
    require(isUnit(minGrowthEfficiency), "minGrowthEfficiency", "must be within [0, 1]");

    // energy
    require(isDecayFactor(energyDecayRate), "energyDecayRate", "must be within (0, 1]");
    require(minEnergyToLive >= 0.0f && minEnergyToLive < maxReserve, "minEnergyToLive", "must be within [0, maxReserve)");

    // senescence
    require(senescenceMinAge >= 0.0f, "senescenceMinAge", "must not be negative");
    require(isUnit(senescenceBaseProbability), "senescenceBaseProbability", "must be within [0, 1]");
    require(senescenceFlowThreshold > 0.0f, "senescenceFlowThreshold", "must be positive");
    require(senescenceDistanceThreshold >= 0.0f, "senescenceDistanceThreshold", "must not be negative");
    require(senescenceCollapseDistance > senescenceDistanceThreshold, "senescenceCollapseDistance", "must exceed senescenceDistanceThreshold");
    require(senescenceWeatherExtremeThreshold > 0.0f, "senescenceWeatherExtremeThreshold", "must be positive");
    require(senescenceHubMinDegree >= 1, "senescenceHubMinDegree", "must be at least 1");

    // branching
    require(isUnit(branchProbability), "branchProbability", "must be within [0, 1]");
    require(maxHyphae >= 0, "maxHyphae", "must not be negative");
    require(branchingSuppressionThreshold >= 0, "branchingSuppressionThreshold", "must not be negative");
    require(branchAngleRange >= 0.0f, "branchAngleRange", "must not be negative");
    require(branchOffset >= 0.0f, "branchOffset", "must not be negative");

    // fusion
    require(fusionDistance >= 0.0f, "fusionDistance", "must not be negative");
    require(fusionMinAge >= 0.0f, "fusionMinAge", "must not be negative");
    require(isUnit(fusionEnergyTransfer), "fusionEnergyTransfer", "must be within [0, 1]");

    // network
    require(anastomosisDistance >= 0.0f, "anastomosisDistance", "must not be negative");
    require(minConnectionStrength > 0.0f && minConnectionStrength <= 1.0f, "minConnectionStrength", "must be within (0, 1]");
    require(initialConnectionStrength >= minConnectionStrength && initialConnectionStrength <= 1.0f,
            "initialConnectionStrength", "must be within [minConnectionStrength, 1]");
    require(pruningThreshold >= 0.0f && pruningThreshold <= initialConnectionStrength,
            "pruningThreshold", "must be within [0, initialConnectionStrength]");
    require(connectionBalanceFraction >= 0.0f && connectionBalanceFraction <= 0.5f, "connectionBalanceFraction", "must be within [0, 0.5]");
    require(connectionFlowRate >= 0.0f && connectionFlowRate <= 0.5f, "connectionFlowRate", "must be within [0, 0.5]");
    require(maxFlowPerTick >= 0.0f, "maxFlowPerTick", "must not be negative");
    require(flowStrengtheningRate >= 0.0f, "flowStrengtheningRate", "must not be negative");
    require(isDecayFactor(connectionDecayRate), "connectionDecayRate", "must be within (0, 1]");

    // signal
    require(signalTriggerNutrientThreshold >= 0.0f, "signalTriggerNutrientThreshold", "must not be negative");
    require(isDecayFactor(signalDecayRate), "signalDecayRate", "must be within (0, 1]");
    require(signalStrengthThreshold >= 0.0f, "signalStrengthThreshold", "must not be negative");
    require(signalSteeringWeight >= 0.0f, "signalSteeringWeight", "must not be negative");

    // nutrients
    require(maxNutrient > 0.0f, "maxNutrient", "must be positive");
    require(isUnit(diffusionRate), "diffusionRate", "must be within [0, 1]");
    require(isUnit(nitrogenDiffusionScale), "nitrogenDiffusionScale", "must be within [0, 1]");
    require(regenRate >= 0.0f, "regenRate", "must not be negative");
    require(regenFloor >= 0.0f && regenFloor <= maxNutrient, "regenFloor", "must be within [0, maxNutrient]");
    require(regenSamples >= 0, "regenSamples", "must not be negative");
    require(fieldThreads >= 0, "fieldThreads", "must not be negative");
    require(flowBaseStrength >= 0.0f, "flowBaseStrength", "must not be negative");
    require(flowRainStrength >= 0.0f, "flowRainStrength", "must not be negative");
    require(flowDriftRange >= 0.0f, "flowDriftRange", "must not be negative");
    require(patchAmount >= 0.0f, "patchAmount", "must not be negative");
    require(patchRadius >= 0.0f, "patchRadius", "must not be negative");

    // memory
    require(isDecayFactor(memoryDecayRate), "memoryDecayRate", "must be within (0, 1]");
    require(memoryUpdateStrength >= 0.0f, "memoryUpdateStrength", "must not be negative");
    require(memoryWeight >= 0.0f, "memoryWeight", "must not be negative");
    require(maxMemory > 0.0f, "maxMemory", "must be positive");

    // trails
    require(maxSegmentAge >= 0.0f, "maxSegmentAge", "must not be negative");
    require(segmentAgeIncrement >= 0.0f, "segmentAgeIncrement", "must not be negative");
    require(maxSegments >= 0, "maxSegments", "must not be negative");

    // reproduction
    require(fruitingMinHyphae >= 0, "fruitingMinHyphae", "must not be negative");
    require(fruitingEnergyThreshold >= 0.0f, "fruitingEnergyThreshold", "must not be negative");
    require(fruitingCooldown >= 0.0f, "fruitingCooldown", "must not be negative");
    require(fruitingLifespanMin > 0.0f, "fruitingLifespanMin", "must be positive");
    require(fruitingLifespanMax >= fruitingLifespanMin, "fruitingLifespanMax", "must not be below fruitingLifespanMin");
    require(fruitingTransferRadius >= 0.0f, "fruitingTransferRadius", "must not be negative");
    require(isUnit(fruitingNutrientReturnFraction), "fruitingNutrientReturnFraction", "must be within [0, 1]");
    require(isUnit(sporeReleaseFraction), "sporeReleaseFraction", "must be within [0, 1]");
    require(sporeReleaseInterval > 0.0f, "sporeReleaseInterval", "must be positive");
    require(sporesPerRelease >= 0, "sporesPerRelease", "must not be negative");
    require(maxSporeReleases >= 0, "maxSporeReleases", "must not be negative");
    require(sporeRadius >= 0.0f, "sporeRadius", "must not be negative");
    require(sporeDrift >= 0.0f, "sporeDrift", "must not be negative");
    require(sporeEnergy >= 0.0f && sporeEnergy <= maxReserve, "sporeEnergy", "must be within [0, maxReserve]");
    require(sporeMaxAge >= 0.0f, "sporeMaxAge", "must not be negative");
    require(sporeGerminationThreshold >= 0.0f, "sporeGerminationThreshold", "must not be negative");
    require(isUnit(sporeImmediateGerminationChance), "sporeImmediateGerminationChance", "must be within [0, 1]");

    // runner
    require(stepsPerFrame >= 1, "stepsPerFrame", "must be at least 1");
    require(targetTicksPerSecond > 0.0f, "targetTicksPerSecond", "must be positive");
}
