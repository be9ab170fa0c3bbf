#include "Agent.h"
#include <algorithm>

Agent::Agent(std::size_t id, std::size_t cid, std::uint32_t consumptionRate,
             std::uint32_t allocatedResource, std::uint32_t healthPoint, bool alive)
    : id_(id),
      cid_(cid),
      consumptionRate_(consumptionRate),
      allocatedResource_(allocatedResource),
      healthPoint_(healthPoint),
      alive_(alive && healthPoint > 0)
{
    // a dead record always carries zero hp
    if (!alive_)
        healthPoint_ = 0;
}

void Agent::loseHealth(std::uint32_t amount)
{
    healthPoint_ -= std::min(amount, healthPoint_);
    if (healthPoint_ == 0)
        alive_ = false;
}

SimulationResult Agent::retrieveResource(std::uint32_t offered, std::uint32_t &leftover)
{
    if (!alive_)
        return SimulationResult::notAlive();

    std::uint32_t take = std::min(offered, consumptionRate_);
    allocatedResource_ = take;
    leftover = offered - take;
    return SimulationResult::success();
}

std::optional<std::size_t> Agent::decideMove(const Neighborhood &neighbors) const
{
    if (!alive_ || !isHungry())
        return std::nullopt;

    std::optional<NeighborInfo> best;
    for (const auto &candidate : neighbors)
    {
        if (!candidate)
            continue;

        // >= lets later candidates win ties: up, down, left, right
        if (!best || candidate->resource >= best->resource)
            best = candidate;
    }

    // every neighbour empty: stay put
    if (!best || best->resource == 0)
        return std::nullopt;
    return best->cellId;
}

SimulationResult Agent::moveTo(std::size_t newCid)
{
    if (!alive_)
        return SimulationResult::notAlive();

    cid_ = newCid;
    loseHealth(MOVEMENT_COST);
    return SimulationResult::success();
}

SimulationResult Agent::update()
{
    if (!alive_)
        return SimulationResult::notAlive();

    if (allocatedResource_ < consumptionRate_)
        loseHealth(STARVATION_COST);

    allocatedResource_ = 0;
    return SimulationResult::success();
}
