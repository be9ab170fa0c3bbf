#pragma once
#include "SimulationError.h"
#include <type_traits>
#include <utility>

// common "advance one step" capability for Cell, Agent and World
// resolved at compile time: anything with SimulationResult update() qualifies
template <typename T, typename = void>
struct IsUpdatable : std::false_type
{
};

template <typename T>
struct IsUpdatable<T, std::void_t<decltype(std::declval<T &>().update())>>
    : std::is_same<decltype(std::declval<T &>().update()), SimulationResult>
{
};

template <typename T>
inline constexpr bool isUpdatable = IsUpdatable<T>::value;

template <typename T>
SimulationResult step(T &entity)
{
    static_assert(isUpdatable<T>, "step() needs a SimulationResult update() member");
    return entity.update();
}

// steps every entity in order, stopping at the first failure
template <typename Range>
SimulationResult stepAll(Range &entities)
{
    for (auto &entity : entities)
    {
        SimulationResult result = step(entity);
        if (!result.ok())
            return result;
    }
    return SimulationResult::success();
}
