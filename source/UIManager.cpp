#include "UIManager.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

UIManager::UIManager(sf::Font &font) : font_(font) {}

const std::vector<UIManager::ConfigField> &UIManager::configFields()
{
    static const std::vector<ConfigField> fields = {
        {"World Width", &WorldConfig::width, WorldConfig::MIN_GRID_SIZE, WorldConfig::MAX_GRID_SIZE},
        {"World Height", &WorldConfig::height, WorldConfig::MIN_GRID_SIZE, WorldConfig::MAX_GRID_SIZE},
        {"Cell Resource Min", &WorldConfig::minResource, 0, WorldConfig::RESOURCE_LIMIT},
        {"Cell Resource Max", &WorldConfig::maxResource, 0, WorldConfig::RESOURCE_LIMIT},
        {"Cell Regen Min", &WorldConfig::minRegenRate, 0, WorldConfig::REGEN_RATE_LIMIT},
        {"Cell Regen Max", &WorldConfig::maxRegenRate, 0, WorldConfig::REGEN_RATE_LIMIT},
        {"Agents Min", &WorldConfig::minAgents, 1, WorldConfig::AGENT_COUNT_LIMIT},
        {"Agents Max", &WorldConfig::maxAgents, 1, WorldConfig::AGENT_COUNT_LIMIT},
        {"Consumption Min", &WorldConfig::minConsumptionRate, 1, WorldConfig::CONSUMPTION_RATE_LIMIT},
        {"Consumption Max", &WorldConfig::maxConsumptionRate, 1, WorldConfig::CONSUMPTION_RATE_LIMIT},
        {"Agent HP", &WorldConfig::agentHp, 1, WorldConfig::AGENT_HP_LIMIT},
    };
    return fields;
}

void UIManager::handleInput(const sf::Event::KeyPressed *keyEvent, WorldConfig &config)
{
    if (keyEvent)
    {
        handleKeyboardInput(keyEvent->code, config);
    }
}

void UIManager::handleKeyboardInput(sf::Keyboard::Key key, WorldConfig &config)
{
    bool shiftDown = sf::Keyboard::isKeyPressed(sf::Keyboard::Key::LShift) ||
                     sf::Keyboard::isKeyPressed(sf::Keyboard::Key::RShift);

    switch (key)
    {
    // simulation control
    case sf::Keyboard::Key::Space:
        paused_ = !paused_;
        std::cout << (paused_ ? "Paused" : "Resumed") << std::endl;
        break;
    case sf::Keyboard::Key::N:
        if (onStep)
            onStep();
        break;
    case sf::Keyboard::Key::R:
        if (onReset)
            onReset();
        break;

    // pacing and view
    case sf::Keyboard::Key::Up:
        adjustParameter(tickInterval_, -0.05f, MIN_TICK_INTERVAL, MAX_TICK_INTERVAL);
        break;
    case sf::Keyboard::Key::Down:
        adjustParameter(tickInterval_, 0.05f, MIN_TICK_INTERVAL, MAX_TICK_INTERVAL);
        break;
    case sf::Keyboard::Key::Equal:
    case sf::Keyboard::Key::Add:
        adjustParameter(cellPx_, shiftDown ? 5.0f : 1.0f, MIN_CELL_SIZE, MAX_CELL_SIZE);
        break;
    case sf::Keyboard::Key::Hyphen:
    case sf::Keyboard::Key::Subtract:
        adjustParameter(cellPx_, shiftDown ? -5.0f : -1.0f, MIN_CELL_SIZE, MAX_CELL_SIZE);
        break;

    // config editor
    case sf::Keyboard::Key::P:
        toggleParameterEditor();
        break;
    case sf::Keyboard::Key::Tab:
        if (shiftDown)
            selectedField_ = (selectedField_ + configFields().size() - 1) % configFields().size();
        else
            selectedField_ = (selectedField_ + 1) % configFields().size();
        break;
    case sf::Keyboard::Key::Right:
        adjustSelectedField(config, shiftDown ? 10 : 1);
        break;
    case sf::Keyboard::Key::Left:
        adjustSelectedField(config, shiftDown ? -10 : -1);
        break;

    // settings file
    case sf::Keyboard::Key::F5:
        if (onSaveSettings)
            onSaveSettings();
        break;
    case sf::Keyboard::Key::F9:
        if (onLoadSettings)
            onLoadSettings();
        break;

    case sf::Keyboard::Key::H:
        showHelp_ = !showHelp_;
        break;

    default:
        break;
    }
}

void UIManager::adjustParameter(float &param, float delta, float min, float max)
{
    param = std::clamp(param + delta, min, max);
}

void UIManager::adjustSelectedField(WorldConfig &config, int direction)
{
    const ConfigField &entry = configFields()[selectedField_];
    int &value = config.*(entry.field);
    value = std::clamp(value + direction, entry.floor, entry.limit);

    // keeps every min <= max; changes take effect on the next reset
    config.validateAndClamp();
}

void UIManager::drawHUD(sf::RenderWindow &window, const World &world, const WorldConfig &config,
                        sf::Vector2f origin)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    oss << "=== Resource Ecology ===" << "\n";
    oss << "Tick: " << world.getTick() << (paused_ ? "  [PAUSED]" : "") << "\n";
    oss << "Grid: " << world.getWidth() << "x" << world.getHeight() << "\n";
    oss << "Agents alive: " << world.getAliveAgentCount() << " / " << world.getAgentCount() << "\n";
    oss << "Deaths: " << world.getTotalDeaths() << " (last tick " << world.getDeathsLastTick() << ")\n";
    oss << "Total resource: " << world.getTotalResource() << "\n\n";

    oss << "=== View ===" << "\n";
    oss << "Seconds per tick [Up/Down]: " << tickInterval_ << "\n";
    oss << "Cell size [+/-]: " << cellPx_ << "px\n\n";

    oss << "=== Controls ===" << "\n";
    oss << "[Space] Pause | [N] Step | [R] Reset" << "\n";
    oss << "[P] Config Editor | [H] Help" << "\n";
    oss << "[F5] Save | [F9] Load Settings" << "\n";
    oss << "Next reset: " << config.width << "x" << config.height
        << ", " << config.minAgents << "-" << config.maxAgents << " agents" << "\n";

    sf::Text text(font_, oss.str(), 14);
    text.setFillColor(hudTextColor_);
    text.setOutlineColor(sf::Color::Black);
    text.setOutlineThickness(1.5f);
    text.setPosition(origin + sf::Vector2f(5.0f, 5.0f));

    sf::FloatRect textBounds = text.getLocalBounds();
    drawBackground(window, sf::FloatRect(origin, {textBounds.size.x + 10, textBounds.size.y + 15}));

    window.draw(text);

    if (showHelp_)
        drawHelpText(window, origin + sf::Vector2f(0.0f, textBounds.size.y + 25.0f));
}

void UIManager::drawParameterEditor(sf::RenderWindow &window, const WorldConfig &config,
                                    sf::Vector2f origin)
{
    if (!showParameterEditor_)
        return;

    const auto &fields = configFields();
    float lineHeight = 25.0f;
    sf::FloatRect editorBounds(origin, {300, lineHeight * static_cast<float>(fields.size() + 3)});

    drawBackground(window, editorBounds);

    sf::Vector2f pos(editorBounds.position.x + 10, editorBounds.position.y + 10);

    sf::Text title(font_, "World Config (applied on reset)", 16);
    title.setFillColor(hudAccentColor_);
    title.setPosition(pos);
    window.draw(title);
    pos.y += lineHeight * 1.5f;

    for (size_t i = 0; i < fields.size(); ++i)
    {
        const ConfigField &entry = fields[i];
        drawParameterSlider(window, entry.label, config.*(entry.field), entry.floor, entry.limit,
                            pos, i == selectedField_);
        pos.y += lineHeight;
    }

    sf::Text hint(font_, "[Tab] select  [Left/Right] adjust", 12);
    hint.setFillColor(sf::Color(180, 180, 180));
    hint.setPosition(pos);
    window.draw(hint);
}

void UIManager::drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds)
{
    sf::RectangleShape background(sf::Vector2f(bounds.size.x, bounds.size.y));
    background.setPosition({bounds.position.x, bounds.position.y});
    background.setFillColor(hudBackgroundColor_);
    background.setOutlineThickness(1.0f);
    background.setOutlineColor(sf::Color(100, 100, 100));
    window.draw(background);
}

void UIManager::drawParameterSlider(sf::RenderWindow &window, const std::string &name,
                                    int value, int min, int max, sf::Vector2f position, bool selected)
{
    std::ostringstream oss;
    oss << (selected ? "> " : "  ") << name << ": " << value;

    sf::Text text(font_, oss.str(), 12);
    text.setFillColor(selected ? hudAccentColor_ : hudTextColor_);
    text.setPosition(position);
    window.draw(text);

    // simple progress bar
    float progress = max > min ? static_cast<float>(value - min) / static_cast<float>(max - min) : 0.0f;
    progress = std::clamp(progress, 0.0f, 1.0f);
    sf::RectangleShape bar(sf::Vector2f(200.0f * progress, 3.0f));
    bar.setPosition({position.x + 10.0f, position.y + 17.0f});
    bar.setFillColor(selected ? hudAccentColor_ : sf::Color(120, 180, 120));
    window.draw(bar);
}

void UIManager::drawHelpText(sf::RenderWindow &window, sf::Vector2f origin)
{
    std::ostringstream oss;
    oss << "=== Help ===" << "\n";
    oss << "Cells: darker = less resource, greener = more" << "\n";
    oss << "Agents: white = full hp, red = near death" << "\n";
    oss << "Hungry agents step to the richest neighbour" << "\n";
    oss << "Moving costs 1 hp, starving costs 1 hp" << "\n";
    oss << "A death feeds its cell (+" << Cell::DEATH_RESOURCE_BOOST
        << " resource, +" << Cell::DEATH_REGEN_BONUS << " regen)" << "\n";
    oss << "Hold Shift for bigger steps" << "\n";

    sf::Text text(font_, oss.str(), 12);
    text.setFillColor(hudTextColor_);
    text.setPosition(origin + sf::Vector2f(5.0f, 5.0f));

    sf::FloatRect textBounds = text.getLocalBounds();
    drawBackground(window, sf::FloatRect(origin, {textBounds.size.x + 10, textBounds.size.y + 15}));
    window.draw(text);
}
