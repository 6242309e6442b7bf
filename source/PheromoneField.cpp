#include "PheromoneField.h"
#include "VectorMath.h"
#include <algorithm>
#include <cmath>
#include <cstring>

PheromoneField::PheromoneField(float width, float height, float cellSize)
    : cellSize_(std::max(cellSize, 1.0f))
{
    gridWidth_ = std::max(1, static_cast<int>(std::ceil(width / cellSize_)));
    gridHeight_ = std::max(1, static_cast<int>(std::ceil(height / cellSize_)));

    size_t size = cellCount();
    home_ = std::make_unique<float[]>(size);
    food_ = std::make_unique<float[]>(size);
    success_ = std::make_unique<float[]>(size);

    clear();
}

PheromoneField::~PheromoneField() = default;

void PheromoneField::clear()
{
    size_t bytes = cellCount() * sizeof(float);
    std::memset(home_.get(), 0, bytes);
    std::memset(food_.get(), 0, bytes);
    std::memset(success_.get(), 0, bytes);
}

GridIndex PheromoneField::index(const sf::Vector2f &position) const
{
    // nan compares false everywhere, route it to cell 0
    float fx = std::isnan(position.x) ? 0.0f : std::floor(position.x / cellSize_);
    float fy = std::isnan(position.y) ? 0.0f : std::floor(position.y / cellSize_);

    // clamp in float space first so huge values never overflow the int cast
    fx = std::clamp(fx, 0.0f, static_cast<float>(gridWidth_ - 1));
    fy = std::clamp(fy, 0.0f, static_cast<float>(gridHeight_ - 1));
    return {static_cast<int>(fx), static_cast<int>(fy)};
}

float *PheromoneField::channelData(PheromoneChannel channel)
{
    switch (channel)
    {
    case PheromoneChannel::Home:
        return home_.get();
    case PheromoneChannel::Food:
        return food_.get();
    }
    return home_.get();
}

const float *PheromoneField::channelData(PheromoneChannel channel) const
{
    switch (channel)
    {
    case PheromoneChannel::Home:
        return home_.get();
    case PheromoneChannel::Food:
        return food_.get();
    }
    return home_.get();
}

const float *PheromoneField::getData(PheromoneChannel channel) const
{
    return channelData(channel);
}

void PheromoneField::deposit(const sf::Vector2f &position, PheromoneChannel channel, float amount, float successBonus)
{
    GridIndex c = index(position);
    float *data = channelData(channel);
    float total = amount * successBonus;

    int idx = getIndex(c.x, c.y);
    data[idx] = std::min(data[idx] + total, MaxIntensity);
    success_[idx] = std::min(success_[idx] + successBonus * 0.1f, MaxSuccess);

    // spread a fraction to the eight surrounding cells, weighted by distance
    for (int dy = -1; dy <= 1; ++dy)
    {
        for (int dx = -1; dx <= 1; ++dx)
        {
            if (dx == 0 && dy == 0)
                continue;
            int nx = c.x + dx;
            int ny = c.y + dy;
            if (nx < 0 || nx >= gridWidth_ || ny < 0 || ny >= gridHeight_)
                continue;

            float d = std::sqrt(static_cast<float>(dx * dx + dy * dy));
            float share = total * (1.0f - d / SpreadRadius) * SpreadShare;
            int n = getIndex(nx, ny);
            data[n] = std::min(data[n] + share, MaxIntensity);
        }
    }
}

float PheromoneField::sample(const sf::Vector2f &position, PheromoneChannel channel) const
{
    GridIndex c = index(position);
    return channelData(channel)[getIndex(c.x, c.y)];
}

float PheromoneField::success(const sf::Vector2f &position) const
{
    GridIndex c = index(position);
    return success_[getIndex(c.x, c.y)];
}

float PheromoneField::cell(int gx, int gy, PheromoneChannel channel) const
{
    gx = std::clamp(gx, 0, gridWidth_ - 1);
    gy = std::clamp(gy, 0, gridHeight_ - 1);
    return channelData(channel)[getIndex(gx, gy)];
}

float PheromoneField::successCell(int gx, int gy) const
{
    gx = std::clamp(gx, 0, gridWidth_ - 1);
    gy = std::clamp(gy, 0, gridHeight_ - 1);
    return success_[getIndex(gx, gy)];
}

// central difference over the 4 axis neighbours plus the diagonals
sf::Vector2f PheromoneField::gradient(const sf::Vector2f &position, PheromoneChannel channel) const
{
    const float delta = cellSize_ * 0.8f;
    const float diag = delta * 0.7f;

    float right = sample(position + sf::Vector2f(delta, 0.0f), channel);
    float left = sample(position - sf::Vector2f(delta, 0.0f), channel);
    float down = sample(position + sf::Vector2f(0.0f, delta), channel);
    float up = sample(position - sf::Vector2f(0.0f, delta), channel);

    float upRight = sample(position + sf::Vector2f(diag, -diag), channel);
    float upLeft = sample(position + sf::Vector2f(-diag, -diag), channel);
    float downRight = sample(position + sf::Vector2f(diag, diag), channel);
    float downLeft = sample(position + sf::Vector2f(-diag, diag), channel);

    sf::Vector2f g((right - left) * 0.5f + (upRight - upLeft + downRight - downLeft) * 0.25f,
                   (down - up) * 0.5f + (downRight - upRight + downLeft - upLeft) * 0.25f);

    if (vec::length(g) <= 0.1f)
        return {0.0f, 0.0f};
    return vec::normalize(g);
}

void PheromoneField::evaporate(float rate)
{
    rate = std::clamp(rate, 0.0f, 1.0f);
    float trailFactor = 1.0f - rate;
    float successFactor = 1.0f - rate * 0.3f; // successful routes fade slower

    float *home = home_.get();
    float *food = food_.get();
    float *success = success_.get();
    size_t size = cellCount();
    for (size_t i = 0; i < size; ++i)
    {
        home[i] *= trailFactor;
        if (home[i] < SnapToZero)
            home[i] = 0.0f;

        food[i] *= trailFactor;
        if (food[i] < SnapToZero)
            food[i] = 0.0f;

        success[i] *= successFactor;
        if (success[i] < SnapToZero)
            success[i] = 0.0f;
    }
}

void PheromoneField::reinforcePath(const std::vector<sf::Vector2f> &points, float strength)
{
    for (const auto &point : points)
    {
        GridIndex c = index(point);
        int idx = getIndex(c.x, c.y);
        success_[idx] = std::clamp(success_[idx] + strength, 0.0f, MaxSuccess);
    }
}
