#include "ForagingRenderer.h"
#include "VectorMath.h"
#include <algorithm>
#include <cstdint>

const sf::Color ForagingRenderer::ExploringColor(90, 190, 80);
const sf::Color ForagingRenderer::ReturningColor(220, 60, 60);
const sf::Color ForagingRenderer::NestColor(58, 109, 54);
const sf::Color ForagingRenderer::ObstacleColor(50, 50, 50, 242);
const sf::Color ForagingRenderer::FoodColor(240, 200, 60);

namespace
{
    // trail values above this render at full brightness
    constexpr float FullBrightness = 120.0f;
    constexpr float AntLineLength = 4.0f;

    std::uint8_t channel(float value)
    {
        return static_cast<std::uint8_t>(std::clamp(value, 0.0f, 255.0f));
    }
}

ForagingRenderer::ForagingRenderer(const ForagingSimulation &simulation)
{
    initializeDisplay(simulation.getField());
}

void ForagingRenderer::initializeDisplay(const PheromoneField &field)
{
    gridWidth_ = field.getGridWidth();
    gridHeight_ = field.getGridHeight();

    // one pixel per cell, the sprite scales it up to world size
    displayImage_ = sf::Image(sf::Vector2u(static_cast<unsigned>(gridWidth_), static_cast<unsigned>(gridHeight_)),
                              sf::Color::Black);
    displayTexture_ = sf::Texture(displayImage_);
    displayTexture_.setSmooth(true);

    displaySprite_.emplace(displayTexture_);
    displaySprite_->setPosition(sf::Vector2f(0.0f, 0.0f));
    displaySprite_->setScale(sf::Vector2f(field.getCellSize(), field.getCellSize()));
}

void ForagingRenderer::draw(sf::RenderWindow &window, const ForagingSimulation &simulation, float displayThreshold)
{
    const PheromoneField &field = simulation.getField();

    // the field is recreated on reset and resize
    if (field.getGridWidth() != gridWidth_ || field.getGridHeight() != gridHeight_ ||
        displaySprite_->getScale().x != field.getCellSize())
    {
        initializeDisplay(field);
    }

    updateDisplay(field, displayThreshold);
    window.draw(*displaySprite_);

    drawObstacles(window, simulation.getObstacles());
    drawFood(window, simulation.getFoodSources());
    drawNest(window, simulation.getNest());
    drawAnts(window, simulation.getAnts());
}

void ForagingRenderer::updateDisplay(const PheromoneField &field, float displayThreshold)
{
    for (int y = 0; y < gridHeight_; ++y)
    {
        for (int x = 0; x < gridWidth_; ++x)
        {
            float home = field.cell(x, y, PheromoneChannel::Home);
            float food = field.cell(x, y, PheromoneChannel::Food);

            float homeLevel = home > displayThreshold ? std::min(1.0f, home / FullBrightness) : 0.0f;
            float foodLevel = food > displayThreshold ? std::min(1.0f, food / FullBrightness) : 0.0f;

            // reinforced routes glow brighter on the food channel
            float boost = 1.0f + std::min(1.0f, field.successCell(x, y) / PheromoneField::MaxSuccess) * 0.8f;
            foodLevel = std::min(1.0f, foodLevel * boost);

            sf::Color color(channel(50.0f * homeLevel + 170.0f * foodLevel),
                            channel(75.0f * homeLevel + 40.0f * foodLevel),
                            channel(45.0f * homeLevel + 40.0f * foodLevel));
            displayImage_.setPixel({static_cast<unsigned>(x), static_cast<unsigned>(y)}, color);
        }
    }
    displayTexture_.update(displayImage_);
}

// blobs are star shaped around their center, so a triangle fan covers them
void ForagingRenderer::drawObstacles(sf::RenderWindow &window, const std::vector<Obstacle> &obstacles) const
{
    sf::ConvexShape triangle(3);
    triangle.setFillColor(ObstacleColor);

    for (const auto &obstacle : obstacles)
    {
        const auto &points = obstacle.points();
        for (size_t i = 0; i < points.size(); ++i)
        {
            triangle.setPoint(0, obstacle.center());
            triangle.setPoint(1, points[i]);
            triangle.setPoint(2, points[(i + 1) % points.size()]);
            window.draw(triangle);
        }

        sf::VertexArray outline(sf::PrimitiveType::LineStrip, points.size() + 1);
        for (size_t i = 0; i <= points.size(); ++i)
        {
            outline[i].position = points[i % points.size()];
            outline[i].color = sf::Color(80, 80, 80, 204);
        }
        window.draw(outline);
    }
}

void ForagingRenderer::drawFood(sf::RenderWindow &window, const std::vector<FoodSource> &foodSources) const
{
    for (const auto &food : foodSources)
    {
        sf::CircleShape ring(food.radius);
        ring.setOrigin({food.radius, food.radius});
        ring.setPosition(food.position);
        ring.setFillColor(sf::Color::Transparent);
        ring.setOutlineThickness(1.5f);
        ring.setOutlineColor(sf::Color(FoodColor.r, FoodColor.g, FoodColor.b, 120));
        window.draw(ring);

        // the core shrinks as the source is carried away
        float coreRadius = food.radius * food.fractionRemaining();
        if (coreRadius > 0.5f)
        {
            sf::CircleShape core(coreRadius);
            core.setOrigin({coreRadius, coreRadius});
            core.setPosition(food.position);
            core.setFillColor(FoodColor);
            window.draw(core);
        }
    }
}

void ForagingRenderer::drawNest(sf::RenderWindow &window, const Nest &nest) const
{
    float radius = nest.getRadius();
    sf::CircleShape body(radius);
    body.setOrigin({radius, radius});
    body.setPosition(nest.getPosition());
    body.setFillColor(sf::Color(NestColor.r, NestColor.g, NestColor.b, 90));
    body.setOutlineThickness(2.0f);
    body.setOutlineColor(nest.isFull() ? sf::Color(255, 215, 0) : NestColor);
    window.draw(body);

    float stored = radius * std::min(1.0f, nest.fillFraction());
    if (stored > 0.5f)
    {
        sf::CircleShape fill(stored);
        fill.setOrigin({stored, stored});
        fill.setPosition(nest.getPosition());
        fill.setFillColor(sf::Color(FoodColor.r, FoodColor.g, FoodColor.b, 160));
        window.draw(fill);
    }
}

void ForagingRenderer::drawAnts(sf::RenderWindow &window, const std::vector<Ant> &ants)
{
    antLines_.resize(ants.size() * 2);
    for (size_t i = 0; i < ants.size(); ++i)
    {
        const Ant &ant = ants[i];
        sf::Vector2f heading = vec::normalize(ant.velocity);
        if (vec::isZero(heading))
            heading = {1.0f, 0.0f};

        sf::Color color = ant.hasFood() ? ReturningColor : ExploringColor;
        // starving ants fade out
        color.a = channel(255.0f * ant.speedFactor());

        antLines_[i * 2].position = ant.position - heading * (AntLineLength * 0.5f);
        antLines_[i * 2].color = color;
        antLines_[i * 2 + 1].position = ant.position + heading * (AntLineLength * 0.5f);
        antLines_[i * 2 + 1].color = color;
    }
    window.draw(antLines_);
}
