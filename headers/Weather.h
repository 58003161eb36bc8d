#pragma once

struct SimulationRng;

/**
 * stochastic weather: temperature, humidity and rain drift toward seasonal
 * targets with small random kicks; everything else is derived multipliers
 *
 * temperature is in arbitrary units (0 freezing, 1 optimal, 2 too hot)
 */
class Weather
{
public:
    enum class Season
    {
        Spring,
        Summer,
        Autumn,
        Winter
    };

    Weather(bool enabled = true, bool seasonalCycle = true);

    void update(float dt, SimulationRng &rng);

    bool isEnabled() const { return enabled_; }
    float getTemperature() const { return temperature_; }
    float getHumidity() const { return humidity_; }
    float getRain() const { return rain_; }
    float getTime() const { return time_; }
    Season getSeason() const { return season_; }
    float getSeasonProgress() const { return seasonProgress_; }

    // all multipliers are 1 while the weather is disabled
    float growthMultiplier() const;
    float energyConsumptionMultiplier() const;
    float nutrientDiffusionMultiplier() const;
    float regenerationMultiplier() const;
    float sporeGerminationMultiplier() const;
    float fruitingMultiplier() const;

    // 0 inside [0.8 - threshold, 1.2 + threshold], growing to 1 one threshold further out
    float extremeFactor(float threshold) const;
    bool isExtreme(float threshold) const { return extremeFactor(threshold) > 0.0f; }

    static const char *seasonName(Season season);

private:
    bool enabled_;
    bool seasonalCycle_;
    float temperature_ = 0.85f;
    float humidity_ = 0.65f;
    float rain_ = 0.0f;
    float time_ = 0.0f;
    Season season_ = Season::Spring;
    float seasonProgress_ = 0.0f;

    void updateSeason();
};
