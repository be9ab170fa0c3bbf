#pragma once
#include "SimulationError.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

// resource reading of one neighbouring cell
struct NeighborInfo
{
    std::size_t cellId;
    std::uint32_t resource;
};

// fixed iteration order of the neighbour readings
enum class Direction
{
    Up = 0,
    Down,
    Left,
    Right
};

// absent entries are off the grid edge
using Neighborhood = std::array<std::optional<NeighborInfo>, 4>;

// a mobile consumer living on one cell at a time
// cid is a plain index into the world's cell arena, not an owning reference
class Agent
{
public:
    static constexpr std::uint32_t MOVEMENT_COST = 1;
    static constexpr std::uint32_t STARVATION_COST = 1;

    Agent(std::size_t id, std::size_t cid, std::uint32_t consumptionRate,
          std::uint32_t allocatedResource, std::uint32_t healthPoint, bool alive = true);

    // takes min(offered, consumptionRate) for this tick, leftover goes back to the caller
    SimulationResult retrieveResource(std::uint32_t offered, std::uint32_t &leftover);

    // greedy choice of the richest neighbour, ties resolve to the last candidate
    // (four equal neighbours always pick right); nullopt when fed, isolated
    // or when every neighbour is empty
    std::optional<std::size_t> decideMove(const Neighborhood &neighbors) const;

    SimulationResult moveTo(std::size_t newCid);

    // metabolism: underfed agents lose a health point, allocation resets every call
    SimulationResult update();

    std::size_t getId() const { return id_; }
    std::size_t getCid() const { return cid_; }
    std::uint32_t getConsumptionRate() const { return consumptionRate_; }
    std::uint32_t getAllocatedResource() const { return allocatedResource_; }
    std::uint32_t getHealthPoint() const { return healthPoint_; }
    bool isAlive() const { return alive_; }
    bool isHungry() const { return allocatedResource_ < consumptionRate_; }

private:
    std::size_t id_;
    std::size_t cid_;
    std::uint32_t consumptionRate_;
    std::uint32_t allocatedResource_;
    std::uint32_t healthPoint_;
    bool alive_;

    void loseHealth(std::uint32_t amount);
};
