#pragma once
#include <SFML/System/Vector2.hpp>
#include "SimulationSettings.h"
#include "PheromoneField.h"
#include <optional>
#include <vector>

class Obstacle;
class Nest;
class RandomSource;
struct FoodSource;

enum class AntState
{
    Exploring, // searching for food, lays home trail
    Returning, // carrying food, lays food trail
    Dead       // mortal colonies only, removed by the simulation the same tick
};

// everything an ant may read or mutate during one update
// the simulation owns all of it, tests build it by hand
struct AntEnvironment
{
    PheromoneField &field;
    std::vector<FoodSource> &foodSources;
    const std::vector<Obstacle> &obstacles;
    Nest &nest;
    sf::Vector2f arenaSize;
};

enum class AntEvent
{
    None,
    PickedUpFood,
    DeliveredFood,
    WastedFood, // reached a full nest, food dropped
    Died
};

// what happened during one update, for bookkeeping by the caller
struct AntStepResult
{
    AntEvent event = AntEvent::None;
    int foodIndex = -1;          // source picked from
    float efficiency = 0.0f;     // delivery quality in [0.5, 1]
    int unitsStored = 0;         // units the nest actually kept
    int pathPoints = 0;          // path buffer size when the leg finished
    int outboundPathPoints = 0;  // path buffer size at pickup of the delivered food
    int tripTicks = 0;           // ticks spent on the finished leg
    int roundTripTicks = 0;      // ticks since the previous delivery (or birth)
};

struct SensorReading
{
    sf::Vector2f direction;
    float strength = 0.0f;
};

struct Ant
{
public:
    static constexpr float FullEnergy = 100.0f;

    sf::Vector2f position;
    sf::Vector2f velocity;
    sf::Vector2f momentum;
    AntState state = AntState::Exploring;

    // sparse breadcrumbs of the current leg, cleared at every pickup and delivery
    std::vector<sf::Vector2f> path;

    int tripTicks = 0;
    int roundTripTicks = 0;
    int outboundPathPoints = 0;

    // lifetime counters
    int deliveries = 0;
    int unitsDelivered = 0;

    // lifecycle, only advanced when the colony is mortal
    float ageTicks = 0.0f;
    float lifespanTicks = 18000.0f;
    float energy = FullEnergy;

    Ant(const sf::Vector2f &pos, const sf::Vector2f &vel = {0.0f, 0.0f}, float lifespan = 18000.0f);

    AntStepResult update(AntEnvironment &env, const SimulationSettings::AntSettings &settings, RandomSource &rng);

    bool hasFood() const { return state == AntState::Returning; }
    bool isAlive() const { return state != AntState::Dead; }
    float speedFactor() const;

    // noisy antenna cone ahead of the current heading
    std::optional<SensorReading> senseForward(const PheromoneField &field, PheromoneChannel channel,
                                              const SimulationSettings::AntSettings &settings,
                                              RandomSource &rng) const;

private:
    bool ageAndCheckDeath(const SimulationSettings::AntSettings &settings);
    sf::Vector2f steerReturning(AntEnvironment &env, const SimulationSettings::AntSettings &settings, RandomSource &rng);
    sf::Vector2f steerExploring(AntEnvironment &env, const SimulationSettings::AntSettings &settings, RandomSource &rng);
    sf::Vector2f avoidObstacles(const AntEnvironment &env, const SimulationSettings::AntSettings &settings,
                                RandomSource &rng) const;
    sf::Vector2f blendMomentum(sf::Vector2f direction, const SimulationSettings::AntSettings &settings, RandomSource &rng);
    void applyTurnAndSpeed(const sf::Vector2f &direction, const SimulationSettings::AntSettings &settings);
    void integrate(const AntEnvironment &env, const SimulationSettings::AntSettings &settings, RandomSource &rng);
    void recordPathPoint(const SimulationSettings::AntSettings &settings);

    AntStepResult tryPickup(AntEnvironment &env, const SimulationSettings::AntSettings &settings);
    AntStepResult tryDeliver(AntEnvironment &env, const SimulationSettings::AntSettings &settings, RandomSource &rng);
    void startExploring(RandomSource &rng);

    // index of the closest non depleted source inside visual range, -1 if none
    int nearestVisibleFood(const AntEnvironment &env, const SimulationSettings::AntSettings &settings,
                           float &distance) const;
};

// ant factory for the colony spawn patterns
class AntFactory
{
public:
    // initial colony: evenly spread around the nest, heading outward
    static std::vector<Ant> createColony(int count, const Nest &nest, const std::vector<Obstacle> &obstacles,
                                         const SimulationSettings::AntSettings &settings, RandomSource &rng);
    // reinforcement: random spot close to the nest, random heading
    static Ant spawnNearNest(const Nest &nest, const std::vector<Obstacle> &obstacles,
                             const SimulationSettings::AntSettings &settings, RandomSource &rng);

private:
    static bool isClearOfObstacles(const sf::Vector2f &position, const std::vector<Obstacle> &obstacles,
                                   RandomSource &rng);
    static float rollLifespan(const SimulationSettings::AntSettings &settings, RandomSource &rng);
};
