#include "Cell.h"
#include <algorithm>
#include <limits>

Cell::Cell(std::size_t id, std::uint32_t curResource, std::uint32_t maxResource,
           std::uint32_t regenRate, std::uint32_t maxRegenRate)
    : id_(id),
      curResource_(std::min(curResource, maxResource)),
      maxResource_(maxResource),
      regenRate_(std::min(regenRate, maxRegenRate)),
      maxRegenRate_(maxRegenRate)
{
}

std::uint32_t Cell::cappedAdd(std::uint32_t value, std::uint32_t delta, std::uint32_t cap)
{
    // saturate before capping so large deltas never wrap
    std::uint32_t headroom = std::numeric_limits<std::uint32_t>::max() - value;
    std::uint32_t sum = delta > headroom ? std::numeric_limits<std::uint32_t>::max() : value + delta;
    return std::min(sum, cap);
}

SimulationResult Cell::update()
{
    curResource_ = cappedAdd(curResource_, regenRate_, maxResource_);
    return SimulationResult::success();
}

SimulationResult Cell::resourceConsumption(std::uint32_t amount)
{
    if (amount > curResource_)
        return SimulationResult::notEnoughResources(curResource_);

    curResource_ -= amount;
    return SimulationResult::success();
}

std::uint32_t Cell::takeUpTo(std::uint32_t want)
{
    std::uint32_t taken = std::min(want, curResource_);
    curResource_ -= taken;
    return taken;
}

void Cell::addResource(std::uint32_t amount)
{
    curResource_ = cappedAdd(curResource_, amount, maxResource_);
}

void Cell::increaseRate(std::uint32_t delta)
{
    regenRate_ = cappedAdd(regenRate_, delta, maxRegenRate_);
}

void Cell::applyDeathFeedback()
{
    addResource(DEATH_RESOURCE_BOOST);
    increaseRate(DEATH_REGEN_BONUS);
}
