#include "NetworkGraph.h"
#include "AgentPool.h"
#include "SimulationSettings.h"
#include "SpatialGrid.h"
#include <algorithm>
#include <cassert>
#include <cmath>

namespace
{
    constexpr float FLOW_MEMORY = 0.99f;   // cumulative flow decay per tick
    constexpr float SIGNAL_BOOST = 0.3f;   // share of a strong edge signal passed to each endpoint

    // moves rate * (a - b) from the richer to the poorer side, bounded by limit
    float exchange(float &a, float &b, float rate, float limit)
    {
        float amount = std::clamp(rate * (a - b), -limit, limit);
        a -= amount;
        b += amount;
        return amount;
    }
}

void NetworkGraph::clear()
{
    connections_.clear();
    links_.clear();
}

template <typename Predicate>
size_t NetworkGraph::removeIf(Predicate predicate)
{
    size_t before = connections_.size();
    auto it = std::remove_if(connections_.begin(), connections_.end(), [&](const Connection &c)
                             {
        if (!predicate(c))
            return false;
        links_.erase(linkKey(c.a.id, c.b.id));
        return true; });
    connections_.erase(it, connections_.end());
    return before - connections_.size();
}

size_t NetworkGraph::formConnections(AgentPool &pool, const SpatialGrid &index, const SimulationSettings &settings,
                                     const std::vector<std::pair<AgentRef, AgentRef>> &fusedPairs)
{
    if (settings.anastomosisDistance <= 0.0f)
        return 0;

    std::set<std::pair<uint64_t, uint64_t>> fused;
    for (const auto &[survivor, absorbed] : fusedPairs)
        fused.insert(linkKey(survivor.id, absorbed.id));

    size_t formed = 0;
    for (size_t i = 0; i < pool.slotCount(); ++i)
    {
        if (!pool.isLive(i))
            continue;

        for (size_t j : index.neighbors(pool.at(i).position, settings.anastomosisDistance))
        {
            if (j <= i || !pool.isLive(j))
                continue;

            Agent &first = pool.at(i);
            Agent &second = pool.at(j);
            auto key = linkKey(first.id, second.id);
            if (links_.count(key) || fused.count(key))
                continue;

            Connection connection;
            connection.a = pool.refOf(i);
            connection.b = pool.refOf(j);
            connection.strength = settings.initialConnectionStrength;
            connections_.push_back(connection);
            links_.insert(key);
            ++formed;

            // one-time balancing toward the mean
            float fraction = settings.connectionBalanceFraction;
            exchange(first.reserves.carbon, second.reserves.carbon, fraction, settings.maxReserve);
            exchange(first.reserves.nitrogen, second.reserves.nitrogen, fraction, settings.maxReserve);
        }
    }
    return formed;
}

size_t NetworkGraph::removeDeadEdges(const AgentPool &pool)
{
    return removeIf([&pool](const Connection &c)
                    { return !pool.isLive(c.a) || !pool.isLive(c.b); });
}

void NetworkGraph::updateFlow(AgentPool &pool, const SimulationSettings &settings)
{
    for (Connection &c : connections_)
    {
        assert(pool.isLive(c.a) && pool.isLive(c.b));
        Agent &first = pool.at(c.a.slot);
        Agent &second = pool.at(c.b.slot);

        float rate = settings.connectionFlowRate * c.strength;
        float carbon = exchange(first.reserves.carbon, second.reserves.carbon, rate, settings.maxFlowPerTick);
        float nitrogen = exchange(first.reserves.nitrogen, second.reserves.nitrogen, rate, settings.maxFlowPerTick);

        c.lastFlow = std::abs(carbon) + std::abs(nitrogen);
        c.cumulativeFlow = c.cumulativeFlow * FLOW_MEMORY + c.lastFlow;
        c.age += settings.ageIncrement;

        // used edges thicken, idle ones fade
        if (settings.adaptiveGrowthEnabled)
        {
            c.strength += c.lastFlow * settings.flowStrengtheningRate;
            c.strength *= settings.connectionDecayRate;
        }
        c.strength = std::clamp(c.strength, settings.minConnectionStrength, 1.0f);
    }
}

void NetworkGraph::propagateSignals(AgentPool &pool, const SimulationSettings &settings)
{
    if (!settings.signalPropagationEnabled)
        return;

    for (Connection &c : connections_)
    {
        assert(pool.isLive(c.a) && pool.isLive(c.b));
        Agent &first = pool.at(c.a.slot);
        Agent &second = pool.at(c.b.slot);

        c.signal = (first.signal + second.signal) * 0.5f * c.strength;
        if (c.signal > settings.signalStrengthThreshold)
        {
            first.signal = std::min(first.signal + c.signal * SIGNAL_BOOST, 1.0f);
            second.signal = std::min(second.signal + c.signal * SIGNAL_BOOST, 1.0f);
        }
        c.signal *= settings.signalDecayRate;
    }

    for (size_t slot = 0; slot < pool.slotCount(); ++slot)
    {
        if (pool.isLive(slot))
            pool.at(slot).signal *= settings.signalDecayRate;
    }
}

size_t NetworkGraph::prune(const SimulationSettings &settings)
{
    const float threshold = settings.pruningThreshold;
    return removeIf([threshold](const Connection &c)
                    { return c.strength < threshold; });
}

void NetworkGraph::agentInputs(size_t slotCount, std::vector<int> &degree, std::vector<float> &aggregateFlow) const
{
    degree.assign(slotCount, 0);
    aggregateFlow.assign(slotCount, 0.0f);
    for (const Connection &c : connections_)
    {
        for (size_t slot : {c.a.slot, c.b.slot})
        {
            if (slot >= slotCount)
                continue;
            ++degree[slot];
            aggregateFlow[slot] += c.cumulativeFlow;
        }
    }
}

int NetworkGraph::degree(size_t slot) const
{
    return static_cast<int>(std::count_if(connections_.begin(), connections_.end(), [slot](const Connection &c)
                                          { return c.a.slot == slot || c.b.slot == slot; }));
}

bool NetworkGraph::contains(const AgentRef &first, const AgentRef &second) const
{
    return links_.count(linkKey(first.id, second.id)) > 0;
}
