#pragma once
#include <SFML/System/Vector2.hpp>
#include <vector>

class RandomSource;

// result of a proximity query against an obstacle outline
struct Repulsion
{
    sf::Vector2f direction; // unit vector from the closest outline point toward the query
    float distance = 0.0f;
};

// irregular closed polygon ("blob") approximating a disk
class Obstacle
{
public:
    static constexpr float DefaultIrregularity = 0.2f;
    static constexpr int DefaultVertexCount = 18;

    Obstacle(const sf::Vector2f &center, float baseRadius, RandomSource &rng,
             float irregularity = DefaultIrregularity, int vertexCount = DefaultVertexCount);

    // builds an obstacle from an explicit outline, center is the vertex centroid
    explicit Obstacle(std::vector<sf::Vector2f> points);

    Repulsion repulse(const sf::Vector2f &position, RandomSource &rng) const;
    bool contains(const sf::Vector2f &position) const;

    // drag: same shape, new place
    void translate(const sf::Vector2f &delta);
    // new random shape around a new center
    void regenerate(const sf::Vector2f &center, float baseRadius, RandomSource &rng);

    // accessors
    const std::vector<sf::Vector2f> &points() const { return points_; }
    const sf::Vector2f &center() const { return center_; }
    sf::Vector2f centroid() const;
    float baseRadius() const { return baseRadius_; }
    float boundingRadius() const;

private:
    sf::Vector2f center_;
    float baseRadius_;
    float irregularity_;
    int vertexCount_;
    std::vector<sf::Vector2f> points_;

    void buildBlob(RandomSource &rng);
};
