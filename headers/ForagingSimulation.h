#pragma once
#include <SFML/System/Clock.hpp>
#include "SimulationSettings.h"
#include "Ant.h"
#include "Layout.h"
#include "PheromoneField.h"
#include "RandomSource.h"
#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

// one finished delivery, for trail convergence statistics
struct DeliveryRecord
{
    std::int64_t tick = 0;
    int pathPoints = 0;         // return leg breadcrumbs
    int outboundPathPoints = 0; // outbound leg breadcrumbs
    int tripTicks = 0;          // return leg duration
    int roundTripTicks = 0;     // since the ant's previous delivery or birth
    float efficiency = 0.0f;
    int unitsStored = 0;
};

// averages over the deliveries made inside a tick window
struct DeliverySummary
{
    int count = 0;
    float meanPathPoints = 0.0f;
    float meanRoundTripPathPoints = 0.0f; // outbound + return breadcrumbs
    float meanTripTicks = 0.0f;
    float meanRoundTripTicks = 0.0f;
    float meanEfficiency = 0.0f;
};

struct SimulationStats
{
    static constexpr size_t HistoryLimit = 20000;

    std::int64_t ticks = 0;
    int pickups = 0;
    int deliveries = 0;
    int foodDelivered = 0;
    int foodWasted = 0;
    int deaths = 0;
    int spawned = 0;
    int foodSourcesReplaced = 0;
    int trappedEjections = 0;
    std::deque<DeliveryRecord> history; // oldest dropped past HistoryLimit

    // deliveries with fromTick <= tick < toTick
    DeliverySummary summarize(std::int64_t fromTick, std::int64_t toTick) const;
};

class ForagingSimulation
{
public:
    explicit ForagingSimulation(const SimulationSettings &settings);
    // takes over a caller supplied random source (scripted in tests)
    ForagingSimulation(const SimulationSettings &settings, std::unique_ptr<RandomSource> rng);
    // starts from a caller built layout instead of a generated one
    ForagingSimulation(const SimulationSettings &settings, Layout layout, std::unique_ptr<RandomSource> rng = nullptr);
    ~ForagingSimulation() = default;

    // core simulation methods
    void step();
    void run(int ticks);
    void reset();   // new layout, field and colony
    void restart(); // same layout, refilled food, empty field, new colony
    void loadLayout(Layout layout);

    // settings management
    void updateSettings(const SimulationSettings &newSettings);
    const SimulationSettings &getSettings() const { return settings_; }

    // ant management
    void setAntCount(int count);
    void adjustAntCount(int delta); // add near the nest or drop from the back without a reset
    int getAntCount() const { return static_cast<int>(ants_.size()); }

    // drag and drop, false for an unknown index
    bool translateObstacle(size_t index, const sf::Vector2f &delta);
    bool regenerateObstacle(size_t index, const sf::Vector2f &center, float baseRadius);
    bool moveFoodSource(size_t index, const sf::Vector2f &position);
    void moveNest(const sf::Vector2f &position);
    // bumped whenever entities are added, removed or replaced, drag indices die with it
    std::uint64_t getLayoutRevision() const { return layoutRevision_; }

    // plain data for the viewer and tests
    const std::vector<Ant> &getAnts() const { return ants_; }
    std::vector<Ant> &getAnts() { return ants_; }
    const PheromoneField &getField() const { return *field_; }
    const std::vector<Obstacle> &getObstacles() const { return layout_.obstacles; }
    const std::vector<FoodSource> &getFoodSources() const { return layout_.foodSources; }
    const Nest &getNest() const { return layout_.nest; }
    const SimulationStats &getStats() const { return stats_; }
    std::int64_t getTick() const { return tick_; }
    std::uint32_t getSeed() const { return seed_; }

    // performance tracking
    float getLastUpdateTime() const { return lastUpdateTime_; } // milliseconds

private:
    SimulationSettings settings_;
    std::unique_ptr<RandomSource> rng_;
    std::unique_ptr<PheromoneField> field_;
    Layout layout_;
    std::vector<Ant> ants_;
    SimulationStats stats_;
    std::uint32_t seed_ = 0;

    std::int64_t tick_ = 0;
    std::int64_t lastSpawnTick_ = 0;
    int nextSpawnInterval_ = 60;
    bool nestWasFull_ = false;
    std::uint64_t layoutRevision_ = 0;

    float lastUpdateTime_ = 0.0f;
    sf::Clock updateTimer_;

    // helper methods
    void initializeColony();
    void resetCounters();
    void updateAnts();
    void removeDeadAnts();
    void ejectTrappedAnts();
    void pushOutOf(Ant &ant, const Obstacle &obstacle);
    void sweepAnts(const Obstacle &obstacle, const sf::Vector2f &delta);
    void replaceDepletedFood();
    void maintainPopulation();
    void spawnAnts(int count);
    void recordDelivery(const AntStepResult &result);
    void logLayout() const;
    AntEnvironment environment();
};
