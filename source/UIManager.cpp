#include "UIManager.h"
#include <sstream>
#include <iomanip>
#include <algorithm>

UIManager::UIManager(sf::Font &font) : font_(font) {}

void UIManager::handleInput(const sf::Event::KeyPressed *keyEvent, SimulationSettings &settings)
{
    if (keyEvent)
    {
        handleKeyboardInput(keyEvent->code, settings);
    }
}

void UIManager::drawHUD(sf::RenderWindow &window, const ForagingSimulation &simulation, bool paused)
{
    const SimulationSettings &settings = simulation.getSettings();
    const SimulationStats &stats = simulation.getStats();
    const Nest &nest = simulation.getNest();

    int carrying = 0;
    for (const auto &ant : simulation.getAnts())
    {
        if (ant.hasFood())
            ++carrying;
    }

    int foodLeft = 0;
    for (const auto &food : simulation.getFoodSources())
        foodLeft += food.amount;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    // basic info
    oss << "=== Ant Foraging ===" << "\n";
    oss << "Tick: " << simulation.getTick() << (paused ? "  [PAUSED]" : "") << "\n";
    oss << "Ants: " << simulation.getAntCount() << " (" << carrying << " carrying)"
        << " | Update: " << simulation.getLastUpdateTime() << "ms" << "\n";
    oss << "Arena: " << settings.width << "x" << settings.height << " | Seed: " << simulation.getSeed() << "\n\n";

    // colony
    oss << "=== Colony ===" << "\n";
    oss << "Nest: " << nest.getFoodStored() << " / " << nest.getMaxCapacity()
        << (nest.isFull() ? "  FULL" : "") << "\n";
    oss << "Efficiency: " << nest.getEfficiency() << "\n";
    oss << "Food in field: " << foodLeft << " in " << simulation.getFoodSources().size() << " sources" << "\n";
    oss << "Pickups: " << stats.pickups << " | Deliveries: " << stats.deliveries << "\n";
    if (settings.ants.mortal)
        oss << "Deaths: " << stats.deaths << " | Spawned: " << stats.spawned << "\n";
    oss << "\n";

    // trail settings
    oss << "=== Trails ===" << "\n";
    oss << "Evaporation [3/4]: " << settings.evaporationRate << "\n";
    oss << "Display Threshold [T/Y]: " << settings.displayThreshold << "\n";

    if (showHelp_)
    {
        oss << "\n=== Controls ===" << "\n";
        oss << "[Space] Reset | [R] Restart | [P] Pause" << "\n";
        oss << "[Up/Down] Ants +/-" << AntCountStep << "\n";
        oss << "[S] Save | [L] Load Settings" << "\n";
        oss << "[Drag] Move obstacle, food or nest" << "\n";
        oss << "[H] Hide help | [Esc] Quit" << "\n";
    }

    sf::Text text(font_, oss.str(), 14);
    text.setFillColor(hudTextColor_);
    text.setOutlineColor(sf::Color::Black);
    text.setOutlineThickness(1.5f);
    text.setPosition({10.0f, 10.0f});

    // draw background
    sf::FloatRect textBounds = text.getLocalBounds();
    drawBackground(window, sf::FloatRect({5, 5}, {textBounds.size.x + 10, textBounds.size.y + 10}));

    window.draw(text);

    if (nest.isFull())
    {
        sf::Vector2f windowSize = static_cast<sf::Vector2f>(window.getSize());
        drawStatusLine(window, "Nest full: all food collected", {windowSize.x * 0.5f, 20.0f});
    }
}

void UIManager::handleKeyboardInput(sf::Keyboard::Key key, SimulationSettings &settings)
{
    const float smallStep = 0.01f;

    switch (key)
    {
    // evaporation rate
    case sf::Keyboard::Key::Num3:
        adjustParameter(settings.evaporationRate, smallStep * 0.1f, 0.0f, 1.0f);
        if (onSettingsChanged)
            onSettingsChanged();
        break;
    case sf::Keyboard::Key::Num4:
        adjustParameter(settings.evaporationRate, -smallStep * 0.1f, 0.0f, 1.0f);
        if (onSettingsChanged)
            onSettingsChanged();
        break;

    // display parameters
    case sf::Keyboard::Key::T:
        adjustParameter(settings.displayThreshold, 0.5f, 0.0f, 100.0f);
        break;
    case sf::Keyboard::Key::Y:
        adjustParameter(settings.displayThreshold, -0.5f, 0.0f, 100.0f);
        break;
    case sf::Keyboard::Key::H:
        toggleHelp();
        break;

    // actions
    case sf::Keyboard::Key::Space:
        if (onReset)
            onReset();
        break;
    case sf::Keyboard::Key::R:
        if (onRestart)
            onRestart();
        break;
    case sf::Keyboard::Key::P:
        if (onTogglePause)
            onTogglePause();
        break;
    case sf::Keyboard::Key::Up:
        if (onAntCountChange)
            onAntCountChange(AntCountStep);
        break;
    case sf::Keyboard::Key::Down:
        if (onAntCountChange)
            onAntCountChange(-AntCountStep);
        break;
    case sf::Keyboard::Key::S:
        if (onSaveSettings)
            onSaveSettings();
        break;
    case sf::Keyboard::Key::L:
        if (onLoadSettings)
            onLoadSettings();
        break;
    case sf::Keyboard::Key::Escape:
        if (onQuit)
            onQuit();
        break;

    default:
        break;
    }
}

void UIManager::adjustParameter(float &param, float delta, float min, float max)
{
    param = std::clamp(param + delta, min, max);
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

// centered banner at the given point
void UIManager::drawStatusLine(sf::RenderWindow &window, const std::string &message, sf::Vector2f position)
{
    sf::Text text(font_, message, 18);
    text.setFillColor(hudAccentColor_);
    text.setOutlineColor(sf::Color::Black);
    text.setOutlineThickness(1.5f);

    sf::FloatRect bounds = text.getLocalBounds();
    text.setPosition({position.x - bounds.size.x * 0.5f, position.y});

    drawBackground(window, sf::FloatRect({position.x - bounds.size.x * 0.5f - 8.0f, position.y - 4.0f},
                                         {bounds.size.x + 16.0f, bounds.size.y + 14.0f}));
    window.draw(text);
}
