#pragma once
#include <SFML/System/Vector2.hpp>
#include <cstdint>
#include <random>

// every random draw in the simulation goes through one of these
// so tests can script the sequence and production can seed it
class RandomSource
{
public:
    virtual ~RandomSource() = default;

    // uniform in [0, 1)
    virtual float uniform() = 0;

    float range(float lo, float hi) { return lo + (hi - lo) * uniform(); }

    // uniform in [-0.5, 0.5)
    float centered() { return uniform() - 0.5f; }

    // uniform in [lo, hi] inclusive
    int rangeInt(int lo, int hi);

    // uniformly distributed direction on the unit circle
    sf::Vector2f unitVector();
};

// production source: seeded mersenne twister
class MersenneRandom : public RandomSource
{
public:
    // seed 0 picks a fresh seed from std::random_device
    explicit MersenneRandom(std::uint32_t seed = 0);

    float uniform() override;

    void reseed(std::uint32_t seed);
    std::uint32_t seed() const { return seed_; }

private:
    std::uint32_t seed_;
    std::mt19937 gen_;
    std::uniform_real_distribution<float> dist_{0.0f, 1.0f};
};
