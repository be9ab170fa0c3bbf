#pragma once
#include <string>

// world build parameters; every [min, max] pair is sampled uniformly
class WorldConfig
{
public:
    // grid size
    int width = 20;
    int height = 20;

    // cell initial resource, maxResource is also the cell capacity
    int minResource = 10;
    int maxResource = 50;

    // cell regeneration per tick, maxRegenRate is also the regen ceiling
    int minRegenRate = 0;
    int maxRegenRate = 3;

    // initial population
    int minAgents = 20;
    int maxAgents = 60;

    // agent resource need per tick
    int minConsumptionRate = 1;
    int maxConsumptionRate = 5;

    // initial agent hp (fixed, not a range)
    int agentHp = 10;

    // editor limits
    static constexpr int MIN_GRID_SIZE = 3;
    static constexpr int MAX_GRID_SIZE = 200;
    static constexpr int RESOURCE_LIMIT = 100;
    static constexpr int REGEN_RATE_LIMIT = 10;
    static constexpr int AGENT_COUNT_LIMIT = 2000;
    static constexpr int CONSUMPTION_RATE_LIMIT = 10;
    static constexpr int AGENT_HP_LIMIT = 30;

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    void validateAndClamp();

    bool operator==(const WorldConfig &other) const;
    bool operator!=(const WorldConfig &other) const { return !(*this == other); }
};
