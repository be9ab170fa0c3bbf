#pragma once
#include <SFML/Graphics.hpp>
#include "World.h"
#include <optional>

// draws a world: one pixel per cell scaled up, agents as circles on top
class WorldRenderer
{
public:
    WorldRenderer();

    // call after a reset so the cell image matches the new grid size
    void rebuild(const World &world);

    void draw(sf::RenderWindow &window, const World &world, float cellPx,
              std::uint32_t maxResource, std::uint32_t maxHp);

    // grid size in window pixels at the given cell size
    sf::Vector2f getExtent(const World &world, float cellPx) const;

    static sf::Color resourceColor(std::uint32_t resource, std::uint32_t maxResource);
    static sf::Color healthColor(std::uint32_t hp, std::uint32_t maxHp);

private:
    sf::Image cellImage_;
    sf::Texture cellTexture_;
    std::optional<sf::Sprite> cellSprite_;
    sf::CircleShape agentShape_;
    sf::VertexArray gridLines_;

    void updateCellImage(const World &world, std::uint32_t maxResource);
    void buildGridLines(const World &world, float cellPx);
};
