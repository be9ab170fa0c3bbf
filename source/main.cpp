#include <SFML/Graphics.hpp>
#include <SFML/Window.hpp>
#include <SFML/System.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <random>
#include <string>

#include "UIManager.h"
#include "World.h"
#include "WorldConfig.h"
#include "WorldRenderer.h"

// window constants
const unsigned WINDOW_WIDTH = 1200;
const unsigned WINDOW_HEIGHT = 900;
const float PANEL_WIDTH = 320.0f;

const char *DEFAULT_SETTINGS_FILE = "ecology_settings.txt";

static std::uint32_t freshSeed()
{
    static std::random_device rd;
    return rd();
}

int main(int argc, char **argv)
{
    std::string settingsFile = argc > 1 ? argv[1] : DEFAULT_SETTINGS_FILE;

    WorldConfig config;
    if (argc > 1 && !config.loadFromFile(settingsFile))
    {
        std::cout << "Warning: Using default settings" << std::endl;
    }
    config.validateAndClamp();

    sf::RenderWindow window(sf::VideoMode({WINDOW_WIDTH, WINDOW_HEIGHT}), "Resource Ecology");
    window.setFramerateLimit(60);

    // initialize font
    sf::Font font;
    if (!font.openFromFile("DejaVuSans.ttf") &&
        !font.openFromFile("bin/DejaVuSans.ttf") &&
        !font.openFromFile("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"))
    {
        std::cout << "Warning: Could not load font file, HUD text may not display properly" << std::endl;
    }

    // replaced wholesale on every reset
    World world(config, freshSeed());
    WorldRenderer renderer;
    renderer.rebuild(world);

    UIManager ui(font);

    // the hp scale in the renderer follows the world actually running, not the edited config
    WorldConfig activeConfig = config;

    auto advance = [&]() {
        SimulationResult result = world.update();
        if (!result.ok())
        {
            std::cerr << "Error: Tick " << world.getTick() << " failed: " << result.describe() << std::endl;
            ui.setPaused(true);
        }
    };

    ui.onStep = [&]() {
        advance();
    };
    ui.onReset = [&]() {
        world = World(config, freshSeed());
        activeConfig = config;
        renderer.rebuild(world);
        std::cout << "Simulation reset with " << world.getAgentCount() << " agents" << std::endl;
    };
    ui.onSaveSettings = [&]() {
        if (config.saveToFile(settingsFile))
            std::cout << "Settings saved to " << settingsFile << std::endl;
    };
    ui.onLoadSettings = [&]() {
        if (config.loadFromFile(settingsFile))
            std::cout << "Settings loaded from " << settingsFile << " (press R to apply)" << std::endl;
    };

    sf::Clock tickClock;

    while (window.isOpen())
    {
        while (const std::optional event = window.pollEvent())
        {
            if (event->is<sf::Event::Closed>())
            {
                window.close();
            }
            else if (const auto *resized = event->getIf<sf::Event::Resized>())
            {
                sf::FloatRect visibleArea({0.0f, 0.0f}, sf::Vector2f(resized->size));
                window.setView(sf::View(visibleArea));
            }
            else if (const auto *keyPressed = event->getIf<sf::Event::KeyPressed>())
            {
                if (keyPressed->code == sf::Keyboard::Key::Escape)
                    window.close();
                else
                    ui.handleInput(keyPressed, config);
            }
        }

        // external pacing: at most one tick per interval
        if (!ui.isPaused() && tickClock.getElapsedTime().asSeconds() >= ui.getTickInterval())
        {
            advance();
            tickClock.restart();
        }

        window.clear(sf::Color(20, 20, 20));

        renderer.draw(window, world, ui.getCellSize(),
                      static_cast<std::uint32_t>(activeConfig.maxResource),
                      static_cast<std::uint32_t>(activeConfig.agentHp));

        const float panelX = static_cast<float>(window.getSize().x) - PANEL_WIDTH;
        ui.drawHUD(window, world, config, {panelX, 10.0f});
        ui.drawParameterEditor(window, config, {panelX, 400.0f});

        window.display();
    }

    return 0;
}
