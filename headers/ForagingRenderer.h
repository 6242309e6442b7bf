#pragma once
#include <SFML/Graphics.hpp>
#include "ForagingSimulation.h"
#include <optional>

// draws a ForagingSimulation: field texture, obstacles, food, nest and ants
class ForagingRenderer
{
public:
    explicit ForagingRenderer(const ForagingSimulation &simulation);

    void draw(sf::RenderWindow &window, const ForagingSimulation &simulation, float displayThreshold);

    // colours
    static const sf::Color ExploringColor;
    static const sf::Color ReturningColor;
    static const sf::Color NestColor;
    static const sf::Color ObstacleColor;
    static const sf::Color FoodColor;

private:
    // rendering components
    sf::Image displayImage_;
    sf::Texture displayTexture_;
    std::optional<sf::Sprite> displaySprite_;
    sf::VertexArray antLines_{sf::PrimitiveType::Lines};
    int gridWidth_ = 0;
    int gridHeight_ = 0;

    // helper methods
    void initializeDisplay(const PheromoneField &field);
    void updateDisplay(const PheromoneField &field, float displayThreshold);
    void drawObstacles(sf::RenderWindow &window, const std::vector<Obstacle> &obstacles) const;
    void drawFood(sf::RenderWindow &window, const std::vector<FoodSource> &foodSources) const;
    void drawNest(sf::RenderWindow &window, const Nest &nest) const;
    void drawAnts(sf::RenderWindow &window, const std::vector<Ant> &ants);
};
