#pragma once
#include <SFML/Graphics.hpp>
#include "SimulationSettings.h"
#include "ForagingSimulation.h"
#include <functional>

class UIManager
{
public:
    UIManager(sf::Font &font);

    // event handling
    void handleInput(const sf::Event::KeyPressed *keyEvent, SimulationSettings &settings);

    // rendering
    void drawHUD(sf::RenderWindow &window, const ForagingSimulation &simulation, bool paused);

    // ui state
    void toggleHelp() { showHelp_ = !showHelp_; }

    // callbacks for simulation control
    std::function<void()> onReset;
    std::function<void()> onRestart;
    std::function<void()> onTogglePause;
    std::function<void(int)> onAntCountChange; // signed delta
    std::function<void()> onSettingsChanged;
    std::function<void()> onSaveSettings;
    std::function<void()> onLoadSettings;
    std::function<void()> onQuit;

    static constexpr int AntCountStep = 50;

private:
    sf::Font &font_;
    bool showHelp_ = true;

    // ui styling
    sf::Color hudBackgroundColor_ = sf::Color(0, 0, 0, 150);
    sf::Color hudTextColor_ = sf::Color::White;
    sf::Color hudAccentColor_ = sf::Color::Yellow;

    // parameter adjustment
    void adjustParameter(float &param, float delta, float min, float max);

    // ui drawing helpers
    void drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds);
    void drawStatusLine(sf::RenderWindow &window, const std::string &message, sf::Vector2f position);

    void handleKeyboardInput(sf::Keyboard::Key key, SimulationSettings &settings);
};
