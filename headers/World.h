#pragma once
#include "Agent.h"
#include "Cell.h"
#include "SimulationError.h"
#include "WorldConfig.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

// owns the cell grid and the agent population and runs the tick
// cells and agents live in dense arenas indexed by their ids
class World
{
public:
    // samples a fresh world from the (clamped) config ranges
    World(const WorldConfig &config, std::uint32_t seed);

    // builds a world from explicit parts; nullopt if ids, sizes or placements are inconsistent
    static std::optional<World> assemble(std::size_t width, std::size_t height,
                                         std::vector<Cell> cells, std::vector<Agent> agents);

    // one tick: regeneration -> allocation -> movement -> metabolism -> death feedback
    // a failure here is an ordering bug and is handed straight back to the caller
    SimulationResult update();

    // up/down/left/right readings for a cell, absent past the grid edge
    Neighborhood neighbors(std::size_t cid) const;

    // accessors
    std::size_t getWidth() const { return width_; }
    std::size_t getHeight() const { return height_; }
    std::pair<std::size_t, std::size_t> getSize() const { return {width_, height_}; }
    std::size_t getCellCount() const { return cells_.size(); }
    std::size_t getAgentCount() const { return agents_.size(); }
    std::size_t getAliveAgentCount() const;
    std::uint64_t getTotalResource() const;
    std::uint64_t getTick() const { return tick_; }
    std::size_t getDeathsLastTick() const { return deathsLastTick_; }
    std::size_t getTotalDeaths() const { return totalDeaths_; }

    const Cell &getCell(std::size_t cid) const { return cells_.at(cid); }
    const Agent &getAgent(std::size_t id) const { return agents_.at(id); }
    const std::vector<Cell> &getCells() const { return cells_; }
    const std::vector<Agent> &getAgents() const { return agents_; }

private:
    World(std::size_t width, std::size_t height, std::vector<Cell> cells, std::vector<Agent> agents);

    std::size_t width_;
    std::size_t height_;
    std::vector<Cell> cells_;
    std::vector<Agent> agents_;

    std::uint64_t tick_ = 0;
    std::size_t deathsLastTick_ = 0;
    std::size_t totalDeaths_ = 0;

    // tick phases
    SimulationResult regenerateCells();
    SimulationResult allocateResources();
    SimulationResult stepAgents();

    void recordDeath(std::size_t cid);
};
