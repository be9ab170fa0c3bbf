#pragma once
#include "SimulationError.h"
#include <cstddef>
#include <cstdint>

// a grid slot holding a regenerating resource
// invariants: curResource <= maxResource, regenRate <= maxRegenRate
class Cell
{
public:
    // fixed boost a cell receives when an agent dies on it
    static constexpr std::uint32_t DEATH_RESOURCE_BOOST = 5;
    static constexpr std::uint32_t DEATH_REGEN_BONUS = 1;

    // initial values above their ceilings are clamped down
    Cell(std::size_t id, std::uint32_t curResource, std::uint32_t maxResource,
         std::uint32_t regenRate, std::uint32_t maxRegenRate);

    // regeneration: curResource += regenRate, capped at maxResource
    SimulationResult update();
    void regenerate() { update(); }

    // all or nothing deduction of exactly amount
    SimulationResult resourceConsumption(std::uint32_t amount);

    // never fails; returns what was actually taken
    std::uint32_t takeUpTo(std::uint32_t want);

    void addResource(std::uint32_t amount);
    void increaseRate(std::uint32_t delta);
    void applyDeathFeedback();

    std::size_t getId() const { return id_; }
    std::uint32_t getCurResource() const { return curResource_; }
    std::uint32_t getMaxResource() const { return maxResource_; }
    std::uint32_t getRegenRate() const { return regenRate_; }
    std::uint32_t getMaxRegenRate() const { return maxRegenRate_; }

private:
    std::size_t id_;
    std::uint32_t curResource_;
    std::uint32_t maxResource_;
    std::uint32_t regenRate_;
    std::uint32_t maxRegenRate_;

    static std::uint32_t cappedAdd(std::uint32_t value, std::uint32_t delta, std::uint32_t cap);
};
