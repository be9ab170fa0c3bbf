#pragma once
#include <cstdint>
#include <string>

// failure kinds shared by cell, agent and world operations
enum class SimulationError
{
    None,
    NotAlive,          // operation invoked on a dead agent
    NotEnoughResources // deduction larger than what the cell holds
};

// result of a single engine operation
// failed operations leave the target state untouched
struct SimulationResult
{
    SimulationError error = SimulationError::None;
    std::uint32_t available = 0; // only meaningful for NotEnoughResources

    static SimulationResult success() { return {}; }
    static SimulationResult notAlive() { return {SimulationError::NotAlive, 0}; }
    static SimulationResult notEnoughResources(std::uint32_t available)
    {
        return {SimulationError::NotEnoughResources, available};
    }

    bool ok() const { return error == SimulationError::None; }
    explicit operator bool() const { return ok(); }

    std::string describe() const;

    static const char *errorName(SimulationError e);
};
