#include "World.h"
#include "Updatable.h"
#include <iostream>
#include <random>

World::World(std::size_t width, std::size_t height, std::vector<Cell> cells, std::vector<Agent> agents)
    : width_(width), height_(height), cells_(std::move(cells)), agents_(std::move(agents))
{
}

World::World(const WorldConfig &config, std::uint32_t seed)
    : width_(0), height_(0)
{
    WorldConfig cfg = config;
    cfg.validateAndClamp();

    width_ = static_cast<std::size_t>(cfg.width);
    height_ = static_cast<std::size_t>(cfg.height);

    std::mt19937 gen(seed);

    std::uniform_int_distribution<std::uint32_t> resourceDist(cfg.minResource, cfg.maxResource);
    std::uniform_int_distribution<std::uint32_t> regenDist(cfg.minRegenRate, cfg.maxRegenRate);

    const std::size_t cellCount = width_ * height_;
    cells_.reserve(cellCount);
    for (std::size_t cid = 0; cid < cellCount; ++cid)
    {
        std::uint32_t resource = resourceDist(gen);
        std::uint32_t regen = regenDist(gen);
        cells_.emplace_back(cid, resource, static_cast<std::uint32_t>(cfg.maxResource),
                            regen, static_cast<std::uint32_t>(cfg.maxRegenRate));
    }

    std::uniform_int_distribution<int> countDist(cfg.minAgents, cfg.maxAgents);
    std::uniform_int_distribution<std::size_t> cellDist(0, cellCount - 1);
    std::uniform_int_distribution<std::uint32_t> consumptionDist(cfg.minConsumptionRate, cfg.maxConsumptionRate);

    const std::size_t agentCount = static_cast<std::size_t>(countDist(gen));
    agents_.reserve(agentCount);
    for (std::size_t id = 0; id < agentCount; ++id)
    {
        std::size_t cid = cellDist(gen);
        std::uint32_t consumption = consumptionDist(gen);
        agents_.emplace_back(id, cid, consumption, 0, static_cast<std::uint32_t>(cfg.agentHp));
    }

    std::cout << "World initialized:" << std::endl;
    std::cout << "  Grid: " << width_ << "x" << height_ << std::endl;
    std::cout << "  Agents: " << agents_.size() << std::endl;
    std::cout << "  Seed: " << seed << std::endl;
}

std::optional<World> World::assemble(std::size_t width, std::size_t height,
                                     std::vector<Cell> cells, std::vector<Agent> agents)
{
    if (width == 0 || height == 0 || cells.size() != width * height)
    {
        std::cerr << "Error: World needs exactly " << width * height << " cells, got "
                  << cells.size() << std::endl;
        return std::nullopt;
    }

    for (std::size_t i = 0; i < cells.size(); ++i)
    {
        if (cells[i].getId() != i)
        {
            std::cerr << "Error: Cell at index " << i << " has id " << cells[i].getId() << std::endl;
            return std::nullopt;
        }
    }

    for (std::size_t i = 0; i < agents.size(); ++i)
    {
        const Agent &agent = agents[i];
        if (agent.getId() != i)
        {
            std::cerr << "Error: Agent at index " << i << " has id " << agent.getId() << std::endl;
            return std::nullopt;
        }
        if (agent.isAlive() && agent.getCid() >= cells.size())
        {
            std::cerr << "Error: Agent " << i << " sits on missing cell " << agent.getCid() << std::endl;
            return std::nullopt;
        }
    }

    return World(width, height, std::move(cells), std::move(agents));
}

Neighborhood World::neighbors(std::size_t cid) const
{
    Neighborhood result;
    if (cid >= cells_.size())
        return result;

    const std::size_t x = cid % width_;
    const std::size_t y = cid / width_;

    auto reading = [this](std::size_t id) {
        return NeighborInfo{id, cells_[id].getCurResource()};
    };

    if (y > 0)
        result[static_cast<std::size_t>(Direction::Up)] = reading(cid - width_);
    if (y + 1 < height_)
        result[static_cast<std::size_t>(Direction::Down)] = reading(cid + width_);
    if (x > 0)
        result[static_cast<std::size_t>(Direction::Left)] = reading(cid - 1);
    if (x + 1 < width_)
        result[static_cast<std::size_t>(Direction::Right)] = reading(cid + 1);

    return result;
}

SimulationResult World::update()
{
    deathsLastTick_ = 0;

    SimulationResult result = regenerateCells();
    if (!result.ok())
        return result;

    result = allocateResources();
    if (!result.ok())
        return result;

    result = stepAgents();
    if (!result.ok())
        return result;

    ++tick_;
    totalDeaths_ += deathsLastTick_;
    return SimulationResult::success();
}

SimulationResult World::regenerateCells()
{
    return stepAll(cells_);
}

SimulationResult World::allocateResources()
{
    // alive occupants per cell, agent id order preserved by the scan
    std::vector<std::vector<std::size_t>> occupants(cells_.size());
    for (const auto &agent : agents_)
    {
        if (agent.isAlive())
            occupants[agent.getCid()].push_back(agent.getId());
    }

    for (std::size_t cid = 0; cid < cells_.size(); ++cid)
    {
        const auto &here = occupants[cid];
        if (here.empty())
            continue;

        Cell &cell = cells_[cid];
        // integer share, the division remainder stays in the cell
        const std::uint32_t baseShare = cell.getCurResource() / static_cast<std::uint32_t>(here.size());

        std::uint32_t consumed = 0;
        for (std::size_t id : here)
        {
            std::uint32_t leftover = 0;
            SimulationResult result = agents_[id].retrieveResource(baseShare, leftover);
            if (!result.ok())
                return result;
            consumed += baseShare - leftover;
        }

        SimulationResult result = cell.resourceConsumption(consumed);
        if (!result.ok())
            return result;
    }

    return SimulationResult::success();
}

SimulationResult World::stepAgents()
{
    for (auto &agent : agents_)
    {
        if (!agent.isAlive())
            continue;

        if (agent.isHungry())
        {
            std::optional<std::size_t> target = agent.decideMove(neighbors(agent.getCid()));
            if (target)
            {
                const std::size_t previous = agent.getCid();
                SimulationResult result = agent.moveTo(*target);
                if (!result.ok())
                    return result;

                // died in transit: feedback goes to the cell it left, metabolism skipped
                if (!agent.isAlive())
                {
                    recordDeath(previous);
                    continue;
                }
            }
        }

        // metabolism still runs after a surviving move, using this tick's harvest
        SimulationResult result = step(agent);
        if (!result.ok())
            return result;

        if (!agent.isAlive())
            recordDeath(agent.getCid());
    }

    return SimulationResult::success();
}

void World::recordDeath(std::size_t cid)
{
    cells_[cid].applyDeathFeedback();
    ++deathsLastTick_;
}

std::size_t World::getAliveAgentCount() const
{
    std::size_t alive = 0;
    for (const auto &agent : agents_)
    {
        if (agent.isAlive())
            ++alive;
    }
    return alive;
}

std::uint64_t World::getTotalResource() const
{
    std::uint64_t total = 0;
    for (const auto &cell : cells_)
        total += cell.getCurResource();
    return total;
}
