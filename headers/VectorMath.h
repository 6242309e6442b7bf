#pragma once
#include <SFML/System/Vector2.hpp>
#include <cmath>

// for float pi to avoid double promotion warnings
static constexpr float PI_F = 3.14159265358979323846f;

// total vector helpers on top of sf::Vector2f
// sf::Vector2f::normalized() asserts on zero vectors, these never do
namespace vec
{
    inline float length(const sf::Vector2f &v)
    {
        return std::sqrt(v.x * v.x + v.y * v.y);
    }

    inline float lengthSquared(const sf::Vector2f &v)
    {
        return v.x * v.x + v.y * v.y;
    }

    inline float distance(const sf::Vector2f &a, const sf::Vector2f &b)
    {
        return length(a - b);
    }

    inline float dot(const sf::Vector2f &a, const sf::Vector2f &b)
    {
        return a.x * b.x + a.y * b.y;
    }

    // heading in radians, atan2 convention (0 along +x, y grows downward on screen)
    inline float angle(const sf::Vector2f &v)
    {
        return std::atan2(v.y, v.x);
    }

    inline sf::Vector2f fromAngle(float radians, float magnitude = 1.0f)
    {
        return {std::cos(radians) * magnitude, std::sin(radians) * magnitude};
    }

    // zero in, zero out
    inline sf::Vector2f normalize(const sf::Vector2f &v)
    {
        float len = length(v);
        if (len > 0.0f && std::isfinite(len))
            return v / len;
        return {0.0f, 0.0f};
    }

    inline bool isZero(const sf::Vector2f &v)
    {
        return v.x == 0.0f && v.y == 0.0f;
    }

    inline bool isFinite(const sf::Vector2f &v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y);
    }

    // wraps an angle difference into [-pi, pi]
    inline float wrapAngle(float radians)
    {
        return std::remainder(radians, 2.0f * PI_F);
    }
}
