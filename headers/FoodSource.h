#pragma once
#include "VectorMath.h"
#include <SFML/System/Vector2.hpp>
#include <algorithm>

// depletable circular patch of food, ants carry it away one unit at a time
struct FoodSource
{
    sf::Vector2f position;
    float radius;
    int amount;
    int originalAmount;

    FoodSource(float x, float y, int units, float rad = 25.0f)
        : position(x, y), radius(rad), amount(std::max(units, 0)), originalAmount(std::max(units, 0)) {}

    // removes one unit when the taker stands inside the patch
    bool take(const sf::Vector2f &from)
    {
        if (amount <= 0 || vec::distance(from, position) >= radius)
            return false;
        --amount;
        return true;
    }

    bool isDepleted() const { return amount <= 0; }

    float fractionRemaining() const
    {
        if (originalAmount <= 0)
            return 0.0f;
        return static_cast<float>(amount) / static_cast<float>(originalAmount);
    }

    void moveTo(const sf::Vector2f &pos) { position = pos; }
    void refill() { amount = originalAmount; }
};
