#include "WorldRenderer.h"
#include <algorithm>
#include <cstdint>

WorldRenderer::WorldRenderer()
    : gridLines_(sf::PrimitiveType::Lines)
{
    agentShape_.setPointCount(16);
}

void WorldRenderer::rebuild(const World &world)
{
    // one pixel per cell, scaled up by the sprite
    cellImage_ = sf::Image(sf::Vector2u(static_cast<unsigned>(world.getWidth()),
                                        static_cast<unsigned>(world.getHeight())),
                           sf::Color::Black);

    cellTexture_ = sf::Texture(cellImage_);
    cellTexture_.setSmooth(false); // hard cell edges

    cellSprite_.emplace(cellTexture_);
    cellSprite_->setPosition(sf::Vector2f(0.0f, 0.0f));
}

sf::Color WorldRenderer::resourceColor(std::uint32_t resource, std::uint32_t maxResource)
{
    float t = std::clamp(static_cast<float>(resource) / static_cast<float>(std::max<std::uint32_t>(maxResource, 1)), 0.0f, 1.0f);
    return sf::Color(static_cast<std::uint8_t>(30.0f + t * 80.0f),
                     static_cast<std::uint8_t>(80.0f + t * 140.0f),
                     static_cast<std::uint8_t>(120.0f - t * 60.0f));
}

sf::Color WorldRenderer::healthColor(std::uint32_t hp, std::uint32_t maxHp)
{
    // full hp = white, fading to red as it drops
    float t = std::clamp(static_cast<float>(hp) / static_cast<float>(std::max<std::uint32_t>(maxHp, 1)), 0.0f, 1.0f);
    std::uint8_t gb = static_cast<std::uint8_t>(255.0f * t);
    return sf::Color(255, gb, gb);
}

sf::Vector2f WorldRenderer::getExtent(const World &world, float cellPx) const
{
    return {static_cast<float>(world.getWidth()) * cellPx,
            static_cast<float>(world.getHeight()) * cellPx};
}

void WorldRenderer::updateCellImage(const World &world, std::uint32_t maxResource)
{
    const std::size_t width = world.getWidth();
    for (const Cell &cell : world.getCells())
    {
        unsigned x = static_cast<unsigned>(cell.getId() % width);
        unsigned y = static_cast<unsigned>(cell.getId() / width);
        cellImage_.setPixel(sf::Vector2u(x, y), resourceColor(cell.getCurResource(), maxResource));
    }
    cellTexture_.update(cellImage_);
}

void WorldRenderer::buildGridLines(const World &world, float cellPx)
{
    gridLines_.clear();
    const sf::Color lineColor(64, 64, 64);
    const sf::Vector2f extent = getExtent(world, cellPx);

    for (std::size_t x = 0; x <= world.getWidth(); ++x)
    {
        float px = static_cast<float>(x) * cellPx;
        gridLines_.append(sf::Vertex{{px, 0.0f}, lineColor});
        gridLines_.append(sf::Vertex{{px, extent.y}, lineColor});
    }
    for (std::size_t y = 0; y <= world.getHeight(); ++y)
    {
        float py = static_cast<float>(y) * cellPx;
        gridLines_.append(sf::Vertex{{0.0f, py}, lineColor});
        gridLines_.append(sf::Vertex{{extent.x, py}, lineColor});
    }
}

void WorldRenderer::draw(sf::RenderWindow &window, const World &world, float cellPx,
                         std::uint32_t maxResource, std::uint32_t maxHp)
{
    if (!cellSprite_ || cellImage_.getSize().x != world.getWidth() ||
        cellImage_.getSize().y != world.getHeight())
    {
        rebuild(world);
    }

    updateCellImage(world, maxResource);
    cellSprite_->setScale(sf::Vector2f(cellPx, cellPx));
    window.draw(*cellSprite_);

    // grid lines only when cells are big enough to see them
    if (cellPx >= 6.0f)
    {
        buildGridLines(world, cellPx);
        window.draw(gridLines_);
    }

    const float radius = cellPx * 0.35f;
    agentShape_.setRadius(radius);
    agentShape_.setOrigin({radius, radius});

    const std::size_t width = world.getWidth();
    for (const Agent &agent : world.getAgents())
    {
        if (!agent.isAlive())
            continue;

        float cx = (static_cast<float>(agent.getCid() % width) + 0.5f) * cellPx;
        float cy = (static_cast<float>(agent.getCid() / width) + 0.5f) * cellPx;
        agentShape_.setPosition({cx, cy});
        agentShape_.setFillColor(healthColor(agent.getHealthPoint(), maxHp));
        window.draw(agentShape_);
    }
}
