#include "WorldConfig.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

bool WorldConfig::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# Resource Ecology Settings\n";
    file << "width=" << width << "\n";
    file << "height=" << height << "\n";
    file << "minResource=" << minResource << "\n";
    file << "maxResource=" << maxResource << "\n";
    file << "minRegenRate=" << minRegenRate << "\n";
    file << "maxRegenRate=" << maxRegenRate << "\n";
    file << "minAgents=" << minAgents << "\n";
    file << "maxAgents=" << maxAgents << "\n";
    file << "minConsumptionRate=" << minConsumptionRate << "\n";
    file << "maxConsumptionRate=" << maxConsumptionRate << "\n";
    file << "agentHp=" << agentHp << "\n";

    if (!file.good())
    {
        std::cerr << "Error: Failed while writing settings to: " << filename << std::endl;
        return false;
    }
    return true;
}

bool WorldConfig::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line))
    {
        ++lineNumber;
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        int parsed = 0;
        try
        {
            parsed = std::stoi(value);
        }
        catch (const std::exception &)
        {
            std::cerr << "Warning: Skipping bad value on line " << lineNumber
                      << " of " << filename << ": " << line << std::endl;
            continue;
        }

        if (key == "width")
            width = parsed;
        else if (key == "height")
            height = parsed;
        else if (key == "minResource")
            minResource = parsed;
        else if (key == "maxResource")
            maxResource = parsed;
        else if (key == "minRegenRate")
            minRegenRate = parsed;
        else if (key == "maxRegenRate")
            maxRegenRate = parsed;
        else if (key == "minAgents")
            minAgents = parsed;
        else if (key == "maxAgents")
            maxAgents = parsed;
        else if (key == "minConsumptionRate")
            minConsumptionRate = parsed;
        else if (key == "maxConsumptionRate")
            maxConsumptionRate = parsed;
        else if (key == "agentHp")
            agentHp = parsed;
    }

    validateAndClamp();
    return true;
}

void WorldConfig::validateAndClamp()
{
    width = std::clamp(width, MIN_GRID_SIZE, MAX_GRID_SIZE);
    height = std::clamp(height, MIN_GRID_SIZE, MAX_GRID_SIZE);

    // upper bounds first, then each min is kept inside [floor, max]
    maxResource = std::clamp(maxResource, 0, RESOURCE_LIMIT);
    minResource = std::clamp(minResource, 0, maxResource);

    maxRegenRate = std::clamp(maxRegenRate, 0, REGEN_RATE_LIMIT);
    minRegenRate = std::clamp(minRegenRate, 0, maxRegenRate);

    maxAgents = std::clamp(maxAgents, 1, AGENT_COUNT_LIMIT);
    minAgents = std::clamp(minAgents, 1, maxAgents);

    maxConsumptionRate = std::clamp(maxConsumptionRate, 1, CONSUMPTION_RATE_LIMIT);
    minConsumptionRate = std::clamp(minConsumptionRate, 1, maxConsumptionRate);

    agentHp = std::clamp(agentHp, 1, AGENT_HP_LIMIT);
}

bool WorldConfig::operator==(const WorldConfig &other) const
{
    return width == other.width && height == other.height &&
           minResource == other.minResource && maxResource == other.maxResource &&
           minRegenRate == other.minRegenRate && maxRegenRate == other.maxRegenRate &&
           minAgents == other.minAgents && maxAgents == other.maxAgents &&
           minConsumptionRate == other.minConsumptionRate &&
           maxConsumptionRate == other.maxConsumptionRate &&
           agentHp == other.agentHp;
}
