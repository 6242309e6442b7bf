#include "Obstacle.h"
#include "RandomSource.h"
#include "VectorMath.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace
{
    // closest point to p on segment ab, a zero length edge degrades to a
    sf::Vector2f closestOnSegment(const sf::Vector2f &a, const sf::Vector2f &b, const sf::Vector2f &p)
    {
        sf::Vector2f ab = b - a;
        float lenSq = vec::lengthSquared(ab);
        if (lenSq <= 0.0f)
            return a;
        float t = std::clamp(vec::dot(p - a, ab) / lenSq, 0.0f, 1.0f);
        return a + ab * t;
    }

    constexpr float CoincidentDistance = 0.1f;
}

Obstacle::Obstacle(const sf::Vector2f &center, float baseRadius, RandomSource &rng,
                   float irregularity, int vertexCount)
    : center_(center),
      baseRadius_(std::max(baseRadius, 1.0f)),
      irregularity_(std::clamp(irregularity, 0.0f, 0.9f)),
      vertexCount_(std::max(vertexCount, 3))
{
    buildBlob(rng);
}

Obstacle::Obstacle(std::vector<sf::Vector2f> points)
    : irregularity_(0.0f), points_(std::move(points))
{
    // pad degenerate outlines to a tiny triangle so the polygon invariant holds
    if (points_.empty())
        points_.push_back({0.0f, 0.0f});
    while (points_.size() < 3)
        points_.push_back(points_.back() + sf::Vector2f(1.0f, static_cast<float>(points_.size() - 1)));

    vertexCount_ = static_cast<int>(points_.size());
    center_ = centroid();
    baseRadius_ = boundingRadius();
}

void Obstacle::buildBlob(RandomSource &rng)
{
    points_.clear();
    points_.reserve(vertexCount_);
    for (int i = 0; i < vertexCount_; ++i)
    {
        float angle = static_cast<float>(i) / static_cast<float>(vertexCount_) * 2.0f * PI_F;
        float u = rng.range(-1.0f, 1.0f);
        float radius = baseRadius_ * (1.0f + u * irregularity_);
        points_.push_back(center_ + vec::fromAngle(angle, radius));
    }
}

Repulsion Obstacle::repulse(const sf::Vector2f &position, RandomSource &rng) const
{
    float minDist = std::numeric_limits<float>::max();
    sf::Vector2f closest = points_.front();

    for (size_t i = 0; i < points_.size(); ++i)
    {
        const sf::Vector2f &a = points_[i];
        const sf::Vector2f &b = points_[(i + 1) % points_.size()];
        sf::Vector2f cp = closestOnSegment(a, b, position);
        float d = vec::distance(position, cp);
        if (d < minDist)
        {
            minDist = d;
            closest = cp;
        }
    }

    sf::Vector2f away = position - closest;
    if (vec::length(away) < CoincidentDistance)
    {
        // on the outline: push away from the middle instead
        sf::Vector2f fromMiddle = position - centroid();
        if (vec::length(fromMiddle) > CoincidentDistance)
            return {vec::normalize(fromMiddle), 0.0f};
        return {rng.unitVector(), 0.0f};
    }

    return {vec::normalize(away), minDist};
}

// even-odd ray cast
bool Obstacle::contains(const sf::Vector2f &position) const
{
    bool inside = false;
    size_t n = points_.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++)
    {
        const sf::Vector2f &pi = points_[i];
        const sf::Vector2f &pj = points_[j];
        if ((pi.y > position.y) != (pj.y > position.y))
        {
            float xCross = (pj.x - pi.x) * (position.y - pi.y) / (pj.y - pi.y) + pi.x;
            if (position.x < xCross)
                inside = !inside;
        }
    }
    return inside;
}

void Obstacle::translate(const sf::Vector2f &delta)
{
    center_ += delta;
    for (auto &point : points_)
        point += delta;
}

void Obstacle::regenerate(const sf::Vector2f &center, float baseRadius, RandomSource &rng)
{
    center_ = center;
    baseRadius_ = std::max(baseRadius, 1.0f);
    if (irregularity_ <= 0.0f)
        irregularity_ = DefaultIrregularity;
    buildBlob(rng);
}

sf::Vector2f Obstacle::centroid() const
{
    sf::Vector2f sum(0.0f, 0.0f);
    for (const auto &point : points_)
        sum += point;
    return sum / static_cast<float>(points_.size());
}

float Obstacle::boundingRadius() const
{
    float radius = 0.0f;
    for (const auto &point : points_)
        radius = std::max(radius, vec::distance(point, center_));
    return radius;
}
