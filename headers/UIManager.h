#pragma once
#include <SFML/Graphics.hpp>
#include "World.h"
#include "WorldConfig.h"
#include <functional>
#include <string>
#include <vector>

class UIManager
{
public:
    UIManager(sf::Font &font);

    // event handling
    void handleInput(const sf::Event::KeyPressed *keyEvent, WorldConfig &config);

    // rendering
    void drawHUD(sf::RenderWindow &window, const World &world, const WorldConfig &config,
                 sf::Vector2f origin);
    void drawParameterEditor(sf::RenderWindow &window, const WorldConfig &config,
                             sf::Vector2f origin);

    // ui state
    bool isPaused() const { return paused_; }
    void setPaused(bool paused) { paused_ = paused; }
    float getTickInterval() const { return tickInterval_; }
    float getCellSize() const { return cellPx_; }
    bool isParameterEditorOpen() const { return showParameterEditor_; }
    void toggleParameterEditor() { showParameterEditor_ = !showParameterEditor_; }

    // callbacks for simulation control
    std::function<void()> onReset;
    std::function<void()> onStep;
    std::function<void()> onSaveSettings;
    std::function<void()> onLoadSettings;

    // tick pacing and view limits
    static constexpr float MIN_TICK_INTERVAL = 0.01f;
    static constexpr float MAX_TICK_INTERVAL = 1.0f;
    static constexpr float MIN_CELL_SIZE = 5.0f;
    static constexpr float MAX_CELL_SIZE = 100.0f;

private:
    sf::Font &font_;
    bool showParameterEditor_ = true;
    bool showHelp_ = false;
    bool paused_ = false;
    float tickInterval_ = 0.2f; // seconds per tick
    float cellPx_ = 25.0f;
    size_t selectedField_ = 0;

    // ui styling
    sf::Color hudBackgroundColor_ = sf::Color(0, 0, 0, 150);
    sf::Color hudTextColor_ = sf::Color::White;
    sf::Color hudAccentColor_ = sf::Color::Yellow;

    // one editable config entry and the range its bar is drawn against
    struct ConfigField
    {
        const char *label;
        int WorldConfig::*field;
        int floor;
        int limit;
    };
    static const std::vector<ConfigField> &configFields();

    // parameter adjustment
    void adjustParameter(float &param, float delta, float min, float max);
    void adjustSelectedField(WorldConfig &config, int direction);

    // ui drawing helpers
    void drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds);
    void drawParameterSlider(sf::RenderWindow &window, const std::string &name,
                             int value, int min, int max, sf::Vector2f position, bool selected);
    void drawHelpText(sf::RenderWindow &window, sf::Vector2f origin);

    void handleKeyboardInput(sf::Keyboard::Key key, WorldConfig &config);
};
