#include "ForagingSimulation.h"
#include "VectorMath.h"
#include <algorithm>
#include <iostream>

DeliverySummary SimulationStats::summarize(std::int64_t fromTick, std::int64_t toTick) const
{
    DeliverySummary summary;
    for (const auto &record : history)
    {
        if (record.tick < fromTick || record.tick >= toTick)
            continue;
        ++summary.count;
        summary.meanPathPoints += static_cast<float>(record.pathPoints);
        summary.meanRoundTripPathPoints += static_cast<float>(record.pathPoints + record.outboundPathPoints);
        summary.meanTripTicks += static_cast<float>(record.tripTicks);
        summary.meanRoundTripTicks += static_cast<float>(record.roundTripTicks);
        summary.meanEfficiency += record.efficiency;
    }

    if (summary.count > 0)
    {
        float n = static_cast<float>(summary.count);
        summary.meanPathPoints /= n;
        summary.meanRoundTripPathPoints /= n;
        summary.meanTripTicks /= n;
        summary.meanRoundTripTicks /= n;
        summary.meanEfficiency /= n;
    }
    return summary;
}

ForagingSimulation::ForagingSimulation(const SimulationSettings &settings)
    : ForagingSimulation(settings, std::unique_ptr<RandomSource>())
{
}

ForagingSimulation::ForagingSimulation(const SimulationSettings &settings, std::unique_ptr<RandomSource> rng)
    : settings_(settings), rng_(std::move(rng))
{
    settings_.validateAndClamp();
    if (!rng_)
    {
        auto mersenne = std::make_unique<MersenneRandom>(settings_.seed);
        seed_ = mersenne->seed();
        rng_ = std::move(mersenne);
    }
    else
    {
        seed_ = settings_.seed;
    }

    field_ = std::make_unique<PheromoneField>(static_cast<float>(settings_.width),
                                              static_cast<float>(settings_.height), settings_.cellSize);
    layout_ = LayoutFactory::createDefault(settings_, *rng_);
    initializeColony();
    resetCounters();

    std::cout << "Foraging simulation initialized (seed " << seed_ << ")" << std::endl;
    logLayout();
}

ForagingSimulation::ForagingSimulation(const SimulationSettings &settings, Layout layout,
                                       std::unique_ptr<RandomSource> rng)
    : settings_(settings), rng_(std::move(rng))
{
    settings_.validateAndClamp();
    if (!rng_)
    {
        auto mersenne = std::make_unique<MersenneRandom>(settings_.seed);
        seed_ = mersenne->seed();
        rng_ = std::move(mersenne);
    }
    else
    {
        seed_ = settings_.seed;
    }

    field_ = std::make_unique<PheromoneField>(static_cast<float>(settings_.width),
                                              static_cast<float>(settings_.height), settings_.cellSize);
    loadLayout(std::move(layout));
}

AntEnvironment ForagingSimulation::environment()
{
    return AntEnvironment{*field_, layout_.foodSources, layout_.obstacles, layout_.nest,
                          sf::Vector2f(static_cast<float>(settings_.width), static_cast<float>(settings_.height))};
}

void ForagingSimulation::step()
{
    updateTimer_.restart();

    updateAnts();
    removeDeadAnts();
    ejectTrappedAnts();
    if (settings_.replenishFood)
        replaceDepletedFood();
    if (settings_.populationMaintenance)
        maintainPopulation();

    field_->evaporate(settings_.evaporationRate);

    ++tick_;
    stats_.ticks = tick_;

    if (!nestWasFull_ && layout_.nest.isFull())
    {
        nestWasFull_ = true;
        std::cout << "Nest is full: " << layout_.nest.getFoodStored() << "/" << layout_.nest.getMaxCapacity()
                  << " at tick " << tick_ << std::endl;
    }

    lastUpdateTime_ = updateTimer_.getElapsedTime().asSeconds() * 1000.0f;
}

void ForagingSimulation::run(int ticks)
{
    for (int i = 0; i < ticks; ++i)
        step();
}

// sequential on purpose: later ants read what earlier ants deposited this tick
void ForagingSimulation::updateAnts()
{
    AntEnvironment env = environment();
    for (auto &ant : ants_)
    {
        AntStepResult result = ant.update(env, settings_.ants, *rng_);
        switch (result.event)
        {
        case AntEvent::None:
            break;
        case AntEvent::PickedUpFood:
            ++stats_.pickups;
            if (settings_.verbose)
                std::cout << "[tick " << tick_ << "] pickup from source " << result.foodIndex << " after "
                          << result.tripTicks << " ticks" << std::endl;
            break;
        case AntEvent::DeliveredFood:
            recordDelivery(result);
            if (settings_.verbose)
                std::cout << "[tick " << tick_ << "] delivery, efficiency " << result.efficiency << ", stored "
                          << result.unitsStored << std::endl;
            break;
        case AntEvent::WastedFood:
            ++stats_.foodWasted;
            break;
        case AntEvent::Died:
            ++stats_.deaths;
            break;
        }
    }
}

void ForagingSimulation::recordDelivery(const AntStepResult &result)
{
    ++stats_.deliveries;
    stats_.foodDelivered += result.unitsStored;

    DeliveryRecord record;
    record.tick = tick_;
    record.pathPoints = result.pathPoints;
    record.outboundPathPoints = result.outboundPathPoints;
    record.tripTicks = result.tripTicks;
    record.roundTripTicks = result.roundTripTicks;
    record.efficiency = result.efficiency;
    record.unitsStored = result.unitsStored;

    stats_.history.push_back(record);
    if (stats_.history.size() > SimulationStats::HistoryLimit)
        stats_.history.pop_front();
}

void ForagingSimulation::removeDeadAnts()
{
    ants_.erase(std::remove_if(ants_.begin(), ants_.end(), [](const Ant &ant) { return !ant.isAlive(); }),
                ants_.end());
}

void ForagingSimulation::ejectTrappedAnts()
{
    for (auto &ant : ants_)
    {
        for (const auto &obstacle : layout_.obstacles)
        {
            if (!obstacle.contains(ant.position))
                continue;

            pushOutOf(ant, obstacle);
            ++stats_.trappedEjections;
            break;
        }
    }
}

void ForagingSimulation::pushOutOf(Ant &ant, const Obstacle &obstacle)
{
    sf::Vector2f away = vec::normalize(ant.position - obstacle.center());
    if (vec::isZero(away))
        away = rng_->unitVector();
    ant.position = obstacle.center() + away * (obstacle.boundingRadius() + 10.0f);
    ant.velocity = away * 3.0f;
}

void ForagingSimulation::sweepAnts(const Obstacle &obstacle, const sf::Vector2f &delta)
{
    float moved = vec::length(delta);
    if (moved < 0.1f)
        return;

    const sf::Vector2f direction = delta / moved;
    const float sweepRange = obstacle.baseRadius() + 20.0f;
    const float width = static_cast<float>(settings_.width);
    const float height = static_cast<float>(settings_.height);

    for (auto &ant : ants_)
    {
        // measured against the shape before it moved
        float distance = obstacle.repulse(ant.position, *rng_).distance;
        if (distance >= sweepRange)
            continue;

        float push = (sweepRange - distance) / sweepRange * 1.2f;
        ant.position += delta * push;
        ant.velocity += direction * (push * 3.0f);
        if (vec::length(ant.velocity) > 8.0f)
            ant.velocity = vec::normalize(ant.velocity) * 8.0f;
        ant.position.x = std::clamp(ant.position.x, 0.0f, width);
        ant.position.y = std::clamp(ant.position.y, 0.0f, height);
    }
}

void ForagingSimulation::replaceDepletedFood()
{
    for (size_t i = 0; i < layout_.foodSources.size();)
    {
        if (!layout_.foodSources[i].isDepleted())
        {
            ++i;
            continue;
        }

        layout_.foodSources.erase(layout_.foodSources.begin() + static_cast<std::ptrdiff_t>(i));
        ++layoutRevision_;
        std::optional<FoodSource> replacement = LayoutFactory::placeReplacementFood(settings_, layout_, *rng_);
        if (!replacement)
        {
            std::cerr << "Warning: no room for a replacement food source" << std::endl;
            continue;
        }

        std::cout << "Food source depleted, new source of " << replacement->amount << " at ("
                  << static_cast<int>(replacement->position.x) << ", " << static_cast<int>(replacement->position.y)
                  << ")" << std::endl;
        // appended at the back so the remaining indices stay valid for this pass
        layout_.foodSources.push_back(*replacement);
        ++stats_.foodSourcesReplaced;
    }
}

void ForagingSimulation::maintainPopulation()
{
    const int target = settings_.numAnts;
    const int current = static_cast<int>(ants_.size());
    if (current >= target)
        return;

    // colony collapsing, refill fast
    if (current < static_cast<int>(static_cast<float>(target) * 0.3f))
    {
        spawnAnts(std::min(rng_->rangeInt(10, 19), target - current));
        lastSpawnTick_ = tick_;
        nextSpawnInterval_ = rng_->rangeInt(30, 89);
        return;
    }

    if (tick_ - lastSpawnTick_ >= nextSpawnInterval_)
    {
        spawnAnts(std::min(rng_->rangeInt(3, 8), target - current));
        lastSpawnTick_ = tick_;
        nextSpawnInterval_ = rng_->rangeInt(60, 179);
    }
}

void ForagingSimulation::spawnAnts(int count)
{
    for (int i = 0; i < count; ++i)
        ants_.push_back(AntFactory::spawnNearNest(layout_.nest, layout_.obstacles, settings_.ants, *rng_));
    stats_.spawned += std::max(count, 0);
}

void ForagingSimulation::initializeColony()
{
    ants_ = AntFactory::createColony(settings_.numAnts, layout_.nest, layout_.obstacles, settings_.ants, *rng_);
}

void ForagingSimulation::resetCounters()
{
    tick_ = 0;
    stats_ = SimulationStats();
    lastSpawnTick_ = 0;
    nextSpawnInterval_ = rng_->rangeInt(60, 179);
    nestWasFull_ = false;
}

void ForagingSimulation::reset()
{
    field_ = std::make_unique<PheromoneField>(static_cast<float>(settings_.width),
                                              static_cast<float>(settings_.height), settings_.cellSize);
    layout_ = LayoutFactory::createDefault(settings_, *rng_);
    ++layoutRevision_;
    initializeColony();
    resetCounters();

    std::cout << "Simulation reset with " << ants_.size() << " ants" << std::endl;
    logLayout();
}

void ForagingSimulation::restart()
{
    field_->clear();
    for (auto &food : layout_.foodSources)
        food.refill();
    layout_.nest.reset();
    initializeColony();
    resetCounters();

    std::cout << "Simulation restarted with " << ants_.size() << " ants, layout kept" << std::endl;
}

void ForagingSimulation::loadLayout(Layout layout)
{
    layout_ = std::move(layout);
    ++layoutRevision_;
    if (layout_.nest.getMaxCapacity() <= 0)
        layout_.nest.setCapacity(layout_.totalFood());
    layout_.nest.reset();

    field_->clear();
    initializeColony();
    resetCounters();

    std::cout << "Layout loaded" << std::endl;
    logLayout();
}

void ForagingSimulation::updateSettings(const SimulationSettings &newSettings)
{
    bool needsResize = (newSettings.width != settings_.width || newSettings.height != settings_.height ||
                        newSettings.cellSize != settings_.cellSize);

    settings_ = newSettings;
    settings_.validateAndClamp();

    // the old layout may not fit the new arena
    if (needsResize)
    {
        std::cout << "Arena resized to " << settings_.width << "x" << settings_.height << std::endl;
        reset();
    }
    // numAnts changes wait for a reset, or for population upkeep to catch up
}

void ForagingSimulation::setAntCount(int count)
{
    adjustAntCount(std::max(0, count) - static_cast<int>(ants_.size()));
}

void ForagingSimulation::adjustAntCount(int delta)
{
    if (delta > 0)
    {
        spawnAnts(delta);
        std::cout << "Added " << delta << " ants (total: " << ants_.size() << ")" << std::endl;
    }
    else if (delta < 0)
    {
        int toRemove = std::min(-delta, static_cast<int>(ants_.size()));
        ants_.erase(ants_.end() - toRemove, ants_.end());
        std::cout << "Removed " << toRemove << " ants (total: " << ants_.size() << ")" << std::endl;
    }
    settings_.numAnts = static_cast<int>(ants_.size());
}

bool ForagingSimulation::translateObstacle(size_t index, const sf::Vector2f &delta)
{
    if (index >= layout_.obstacles.size())
        return false;

    // carries ants along even while paused, the next step would only eject them
    Obstacle &obstacle = layout_.obstacles[index];
    sweepAnts(obstacle, delta);
    obstacle.translate(delta);
    for (auto &ant : ants_)
    {
        if (obstacle.contains(ant.position))
            pushOutOf(ant, obstacle);
    }
    return true;
}

bool ForagingSimulation::regenerateObstacle(size_t index, const sf::Vector2f &center, float baseRadius)
{
    if (index >= layout_.obstacles.size())
        return false;
    layout_.obstacles[index].regenerate(center, baseRadius, *rng_);
    return true;
}

bool ForagingSimulation::moveFoodSource(size_t index, const sf::Vector2f &position)
{
    if (index >= layout_.foodSources.size())
        return false;
    layout_.foodSources[index].moveTo(position);
    return true;
}

void ForagingSimulation::moveNest(const sf::Vector2f &position)
{
    layout_.nest.moveTo(position);
}

void ForagingSimulation::logLayout() const
{
    std::cout << "Layout: " << layout_.obstacles.size() << " obstacles, " << layout_.foodSources.size()
              << " food sources (" << layout_.totalFood() << " units), nest at ("
              << static_cast<int>(layout_.nest.getPosition().x) << ", "
              << static_cast<int>(layout_.nest.getPosition().y) << "), " << ants_.size() << " ants" << std::endl;
}
