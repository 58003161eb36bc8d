#pragma once
#include "Agent.h"
#include <cstdint>
#include <set>
#include <utility>
#include <vector>

class AgentPool;
class SpatialGrid;
class SimulationSettings;

// persistent anastomosis link between two agents, endpoints are not owned
struct Connection
{
    AgentRef a; // a.slot < b.slot at creation
    AgentRef b;
    float strength = 0.0f;
    float cumulativeFlow = 0.0f; // decaying accumulator of |flow|
    float lastFlow = 0.0f;       // |carbon| + |nitrogen| moved last tick
    float age = 0.0f;
    float signal = 0.0f;
};

/**
 * connectivity graph over the agent pool
 * edges are kept in creation order, which is also the update order
 */
class NetworkGraph
{
public:
    NetworkGraph() = default;

    void clear();

    // links unconnected live pairs within anastomosisDistance, skipping pairs fused this tick;
    // each new link balances the two reserves once
    size_t formConnections(AgentPool &pool, const SpatialGrid &index, const SimulationSettings &settings,
                           const std::vector<std::pair<AgentRef, AgentRef>> &fusedPairs);

    // drops every edge with a dead or recycled endpoint
    size_t removeDeadEdges(const AgentPool &pool);

    // diffusive reserve flow along every edge, then adaptive reinforcement
    void updateFlow(AgentPool &pool, const SimulationSettings &settings);

    void propagateSignals(AgentPool &pool, const SimulationSettings &settings);

    // removes edges weaker than pruningThreshold, endpoints untouched
    size_t prune(const SimulationSettings &settings);

    // per-slot degree and summed cumulative flow, sized to the pool
    void agentInputs(size_t slotCount, std::vector<int> &degree, std::vector<float> &aggregateFlow) const;

    int degree(size_t slot) const;
    bool contains(const AgentRef &first, const AgentRef &second) const;

    const std::vector<Connection> &getConnections() const { return connections_; }
    std::vector<Connection> &getConnections() { return connections_; }
    size_t size() const { return connections_.size(); }

private:
    std::vector<Connection> connections_;
    std::set<std::pair<uint64_t, uint64_t>> links_; // agent id pairs, smaller id first

    static std::pair<uint64_t, uint64_t> linkKey(uint64_t first, uint64_t second)
    {
        return first < second ? std::make_pair(first, second) : std::make_pair(second, first);
    }

    template <typename Predicate>
    size_t removeIf(Predicate predicate);
};
