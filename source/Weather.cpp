#include "Weather.h"
#include "SimulationRng.h"
#include <algorithm>
#include <cmath>

namespace
{
    // one year is four time units, one per season
    constexpr float YEAR_LENGTH = 4.0f;
    constexpr float OPTIMAL_TEMP_MIN = 0.8f;
    constexpr float OPTIMAL_TEMP_MAX = 1.2f;
}

Weather::Weather(bool enabled, bool seasonalCycle)
    : enabled_(enabled), seasonalCycle_(seasonalCycle)
{
}

void Weather::updateSeason()
{
    if (!seasonalCycle_)
        return;

    float cyclePos = std::fmod(time_, YEAR_LENGTH) / YEAR_LENGTH;
    int index = std::min(3, static_cast<int>(cyclePos * 4.0f));
    season_ = static_cast<Season>(index);
    seasonProgress_ = cyclePos * 4.0f - static_cast<float>(index);
}

void Weather::update(float dt, SimulationRng &rng)
{
    if (!enabled_)
        return;

    time_ += dt;
    updateSeason();

    float seasonalTemp = 0.85f;
    float humidityTarget = 0.65f;
    float rainProbability = 0.0005f;
    if (seasonalCycle_)
    {
        switch (season_)
        {
        case Season::Spring:
            seasonalTemp = 0.7f + seasonProgress_ * 0.3f;
            humidityTarget = 0.75f;
            rainProbability = 0.0010f;
            break;
        case Season::Summer:
            seasonalTemp = 1.0f + seasonProgress_ * 0.4f;
            humidityTarget = 0.45f;
            rainProbability = 0.0002f;
            break;
        case Season::Autumn:
            seasonalTemp = 1.4f - seasonProgress_ * 0.3f;
            humidityTarget = 0.70f;
            rainProbability = 0.0008f;
            break;
        case Season::Winter:
            seasonalTemp = 1.1f - seasonProgress_ * 0.5f;
            humidityTarget = 0.60f;
            rainProbability = 0.0005f;
            break;
        }
    }

    // slow relaxation toward the seasonal target plus a day/night wobble
    float dayNight = std::sin(time_ * 0.03f) * 0.1f;
    float kick = (rng.uniform() - 0.5f) * 0.03f;
    temperature_ = std::clamp(temperature_ * 0.998f + (seasonalTemp + dayNight + kick) * 0.002f, 0.3f, 1.6f);

    if (rain_ > 0.1f)
        humidity_ = std::min(humidity_ + rain_ * 0.02f * dt * 60.0f, 0.95f);
    else
        humidity_ = std::clamp(humidity_ * 0.999f + humidityTarget * 0.001f, 0.3f, 0.95f);

    if (rng.uniform() < rainProbability * dt * 60.0f)
        rain_ = rng.uniform(0.4f, 1.0f);
    else if (rain_ > 0.0f)
        rain_ = std::max(rain_ - 0.005f * dt * 60.0f, 0.0f);
}

float Weather::growthMultiplier() const
{
    if (!enabled_)
        return 1.0f;

    float tempFactor;
    if (temperature_ < 0.5f)
        tempFactor = 0.4f + (temperature_ / 0.5f) * 0.3f;
    else if (temperature_ < OPTIMAL_TEMP_MIN)
        tempFactor = 0.7f + (temperature_ - 0.5f) / 0.3f * 0.2f;
    else if (temperature_ <= OPTIMAL_TEMP_MAX)
        tempFactor = 1.0f;
    else if (temperature_ < 1.4f)
        tempFactor = 1.0f - (temperature_ - 1.2f) / 0.2f * 0.2f;
    else
        tempFactor = 0.8f - std::min((temperature_ - 1.4f) / 0.1f, 1.0f) * 0.3f;

    float humidityFactor;
    if (humidity_ < 0.4f)
        humidityFactor = 0.5f + (humidity_ / 0.4f) * 0.4f;
    else if (humidity_ <= 0.9f)
        humidityFactor = 1.0f;
    else
        humidityFactor = 1.0f - (humidity_ - 0.9f) / 0.05f * 0.2f;

    float rainFactor;
    if (rain_ < 0.3f)
        rainFactor = 1.0f + rain_ * 0.15f;
    else if (rain_ < 0.7f)
        rainFactor = 1.05f + (rain_ - 0.3f) * 0.1f;
    else
        rainFactor = 1.09f - (rain_ - 0.7f) / 0.3f * 0.15f;

    return std::clamp(tempFactor * humidityFactor * rainFactor, 0.5f, 1.3f);
}

// heat and dry air cost energy
float Weather::energyConsumptionMultiplier() const
{
    if (!enabled_)
        return 1.0f;
    float tempFactor = 0.85f + (temperature_ - 0.85f) * 0.2f;
    float humidityFactor = 1.1f - (humidity_ - 0.5f) * 0.2f;
    return std::clamp(tempFactor * humidityFactor, 0.7f, 1.3f);
}

float Weather::nutrientDiffusionMultiplier() const
{
    if (!enabled_)
        return 1.0f;
    if (rain_ > 0.5f)
        return 1.0f - (rain_ - 0.5f) * 0.5f; // heavy rain washes nutrients away
    if (rain_ > 0.1f)
        return 1.0f + rain_ * 0.3f;
    return 1.0f;
}

float Weather::regenerationMultiplier() const
{
    if (!enabled_)
        return 1.0f;
    return std::clamp(0.6f + 0.4f * humidity_ + 0.5f * rain_, 0.5f, 1.5f);
}

float Weather::sporeGerminationMultiplier() const
{
    if (!enabled_)
        return 1.0f;
    float humidityFactor = 0.3f + humidity_ * 0.7f;
    float rainFactor = 1.0f + rain_ * 0.5f;
    return std::min(humidityFactor * rainFactor, 2.0f);
}

float Weather::fruitingMultiplier() const
{
    if (!enabled_ || !seasonalCycle_)
        return 1.0f;
    switch (season_)
    {
    case Season::Spring:
        return 0.6f;
    case Season::Summer:
        return 0.3f;
    case Season::Autumn:
        return 1.5f;
    case Season::Winter:
        return 0.2f;
    }
    return 1.0f;
}

float Weather::extremeFactor(float threshold) const
{
    if (!enabled_ || threshold <= 0.0f)
        return 0.0f;
    if (temperature_ < OPTIMAL_TEMP_MIN - threshold)
        return std::min((OPTIMAL_TEMP_MIN - threshold - temperature_) / threshold, 1.0f);
    if (temperature_ > OPTIMAL_TEMP_MAX + threshold)
        return std::min((temperature_ - OPTIMAL_TEMP_MAX - threshold) / threshold, 1.0f);
    return 0.0f;
}

const char *Weather::seasonName(Season season)
{
    switch (season)
    {
    case Season::Spring:
        return "spring";
    case Season::Summer:
        return "summer";
    case Season::Autumn:
        return "autumn";
    case Season::Winter:
        return "winter";
    }
    return "unknown";
}
