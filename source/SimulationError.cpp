#include "SimulationError.h"
#include <sstream>

const char *SimulationResult::errorName(SimulationError e)
{
    switch (e)
    {
    case SimulationError::None:
        return "None";
    case SimulationError::NotAlive:
        return "NotAlive";
    case SimulationError::NotEnoughResources:
        return "NotEnoughResources";
    default:
        return "Unknown";
    }
}

std::string SimulationResult::describe() const
{
    std::ostringstream oss;
    oss << errorName(error);
    if (error == SimulationError::NotEnoughResources)
    {
        oss << " (available: " << available << ")";
    }
    return oss.str();
}
