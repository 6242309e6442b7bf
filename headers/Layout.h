#pragma once
#include "FoodSource.h"
#include "Nest.h"
#include "Obstacle.h"
#include "SimulationSettings.h"
#include <optional>
#include <vector>

class RandomSource;

// static part of an arena: everything except the ants and the field
struct Layout
{
    std::vector<Obstacle> obstacles;
    std::vector<FoodSource> foodSources;
    Nest nest;

    // the nest can hold exactly what the initial sources offer
    int totalFood() const;
};

// procedural arena generation
class LayoutFactory
{
public:
    static Layout createDefault(const SimulationSettings &settings, RandomSource &rng);

    static std::vector<Obstacle> createObstacles(const SimulationSettings &settings, RandomSource &rng);
    static std::vector<FoodSource> createFoodSources(const SimulationSettings &settings,
                                                     const std::vector<Obstacle> &obstacles, RandomSource &rng);
    static sf::Vector2f placeNest(const SimulationSettings &settings, const std::vector<Obstacle> &obstacles,
                                  const std::vector<FoodSource> &foodSources, RandomSource &rng);

    // fresh source for one that ran dry, nullopt when the arena has no room left
    static std::optional<FoodSource> placeReplacementFood(const SimulationSettings &settings, const Layout &layout,
                                                          RandomSource &rng);

private:
    static constexpr int MaxAttempts = 100;
    static constexpr int NestAttemptsPerStrategy = 50;
    static constexpr float ArenaMargin = 100.0f;

    static bool nestPositionIsClear(const sf::Vector2f &position, float nestRadius,
                                    const std::vector<Obstacle> &obstacles,
                                    const std::vector<FoodSource> &foodSources);
    static sf::Vector2f leastCrowdedNestPosition(const SimulationSettings &settings,
                                                 const std::vector<Obstacle> &obstacles);
};
