#include "Ant.h"
#include "FoodSource.h"
#include "Nest.h"
#include "Obstacle.h"
#include "RandomSource.h"
#include "VectorMath.h"
#include <algorithm>
#include <cmath>

namespace
{
    // trail laying bonuses
    constexpr float TripBonusBase = 3.0f;
    constexpr float TripBonusTicks = 600.0f;    // a return leg this long loses one bonus point
    constexpr float PathBonusReturning = 0.01f; // per path point on the food trail
    constexpr float PathBonusExploring = 0.02f; // per path point on the home trail
    constexpr float PathBonusExploringCap = 2.0f;

    // delivery scoring
    constexpr float PathPointPenalty = 2.0f / 1000.0f;
    constexpr float TripTicksForHalfScore = 1800.0f;
    constexpr float MinLegScore = 0.5f;

    constexpr float NestArrivalSlack = 5.0f;
    constexpr float CloseFoodRadius = 30.0f;
    constexpr float CloseFoodBoost = 1.2f;
    constexpr float MaxDirectBias = 0.8f;
    constexpr float ReturnHomingFallback = 0.7f;
    constexpr float MomentumKick = 0.3f;
    constexpr float SlowSpeed = 0.1f;
    constexpr float SpeedCapFactor = 1.5f;
    constexpr float BoundaryJitter = 0.5f;

    float degToRad(float degrees) { return degrees * PI_F / 180.0f; }

    sf::Vector2f orRandom(const sf::Vector2f &v, RandomSource &rng)
    {
        sf::Vector2f n = vec::normalize(v);
        if (vec::isZero(n))
            return rng.unitVector();
        return n;
    }
}

Ant::Ant(const sf::Vector2f &pos, const sf::Vector2f &vel, float lifespan)
    : position(pos), velocity(vel), momentum(0.0f, 0.0f), lifespanTicks(lifespan)
{
}

float Ant::speedFactor() const
{
    return std::max(0.3f, energy / FullEnergy);
}

AntStepResult Ant::update(AntEnvironment &env, const SimulationSettings::AntSettings &settings, RandomSource &rng)
{
    AntStepResult result;

    switch (state)
    {
    case AntState::Dead:
        return result;
    case AntState::Exploring:
    case AntState::Returning:
        break;
    }

    if (settings.mortal && ageAndCheckDeath(settings))
    {
        state = AntState::Dead;
        result.event = AntEvent::Died;
        result.pathPoints = static_cast<int>(path.size());
        result.tripTicks = tripTicks;
        return result;
    }

    ++tripTicks;
    ++roundTripTicks;

    // 1. goal seeking and trail following, deposits at the current spot
    sf::Vector2f direction;
    switch (state)
    {
    case AntState::Returning:
        direction = steerReturning(env, settings, rng);
        break;
    case AntState::Exploring:
        direction = steerExploring(env, settings, rng);
        break;
    case AntState::Dead:
        return result;
    }

    // 2. obstacle avoidance
    direction += avoidObstacles(env, settings, rng);

    // 3. normalize, 4. momentum
    direction = orRandom(direction, rng);
    direction = blendMomentum(direction, settings, rng);

    // 5. turn limit, 6. speed
    applyTurnAndSpeed(direction, settings);

    // 7. integrate with collision response, 8. arena boundary
    integrate(env, settings, rng);

    // 9. breadcrumbs
    recordPathPoint(settings);

    // 10. pickup and delivery
    switch (state)
    {
    case AntState::Exploring:
        result = tryPickup(env, settings);
        break;
    case AntState::Returning:
        result = tryDeliver(env, settings, rng);
        break;
    case AntState::Dead:
        break;
    }
    return result;
}

bool Ant::ageAndCheckDeath(const SimulationSettings::AntSettings &settings)
{
    ageTicks += 1.0f;
    energy = std::max(0.0f, energy - settings.energyDecay);
    return ageTicks > lifespanTicks || energy <= 0.0f;
}

sf::Vector2f Ant::steerReturning(AntEnvironment &env, const SimulationSettings::AntSettings &settings, RandomSource &rng)
{
    const sf::Vector2f &nestPos = env.nest.getPosition();
    sf::Vector2f toNest = vec::normalize(nestPos - position);
    float nestDistance = vec::distance(position, nestPos);

    sf::Vector2f direction;
    if (nestDistance < settings.nestApproachRadius)
    {
        // close enough to head straight in, with a little wobble
        float bias = std::min(MaxDirectBias, (settings.nestApproachRadius - nestDistance) / settings.nestApproachRadius);
        direction = toNest * bias + rng.unitVector() * (1.0f - bias);
    }
    else
    {
        std::optional<SensorReading> home = senseForward(env.field, PheromoneChannel::Home, settings, rng);
        if (home && home->strength > settings.detectionThreshold)
        {
            float attraction = std::min(settings.returnTrailWeightCap, home->strength);
            direction = home->direction * attraction + toNest * settings.returnHomingWeight;
        }
        else
        {
            direction = toNest * ReturnHomingFallback + rng.unitVector() * (1.0f - ReturnHomingFallback);
        }
    }

    momentum *= settings.returnMomentumDamping;

    // faster return legs and longer paths lay a stronger food trail
    float tripBonus = std::max(1.0f, TripBonusBase - static_cast<float>(tripTicks) / TripBonusTicks);
    float successBonus = tripBonus * (1.0f + static_cast<float>(path.size()) * PathBonusReturning);
    env.field.deposit(position, PheromoneChannel::Food, settings.foodDeposit, successBonus);

    return direction;
}

sf::Vector2f Ant::steerExploring(AntEnvironment &env, const SimulationSettings::AntSettings &settings, RandomSource &rng)
{
    float foodDistance = 0.0f;
    int foodIndex = nearestVisibleFood(env, settings, foodDistance);

    sf::Vector2f direction;
    if (foodIndex >= 0)
    {
        sf::Vector2f toFood = vec::normalize(env.foodSources[foodIndex].position - position);
        float bias = std::min(MaxDirectBias, (settings.visualRange - foodDistance) / settings.visualRange);
        direction = toFood * bias + rng.unitVector() * (1.0f - bias);
        if (foodDistance < CloseFoodRadius)
            direction *= CloseFoodBoost;
    }
    else
    {
        std::optional<SensorReading> food = senseForward(env.field, PheromoneChannel::Food, settings, rng);
        if (food && food->strength > settings.detectionThreshold)
        {
            float attraction = std::min(settings.exploreTrailWeightCap, food->strength);
            direction = food->direction * attraction + rng.unitVector() * settings.exploreRandomWeight;
        }
        else
        {
            // wander
            direction = rng.unitVector() + momentum * settings.wanderMomentumWeight;
        }
    }

    float explorationBonus = std::min(PathBonusExploringCap, static_cast<float>(path.size()) * PathBonusExploring);
    env.field.deposit(position, PheromoneChannel::Home, settings.homeDeposit, 1.0f + explorationBonus);

    return direction;
}

std::optional<SensorReading> Ant::senseForward(const PheromoneField &field, PheromoneChannel channel,
                                               const SimulationSettings::AntSettings &settings,
                                               RandomSource &rng) const
{
    const float range = settings.sensorRange;
    const float noise = settings.sensorNoise;
    const float heading = vec::isZero(velocity) ? 0.0f : vec::angle(velocity);
    const float spread = degToRad(settings.sensorSpreadDegrees);
    const float step = degToRad(settings.sensorStepDegrees);
    const int samples = static_cast<int>(std::round(2.0f * spread / step)) + 1;

    float bestStrength = -1.0f;
    sf::Vector2f bestPoint = position;
    for (int i = 0; i < samples; ++i)
    {
        float angle = heading - spread + static_cast<float>(i) * step;
        sf::Vector2f jitter(rng.centered() * noise * range, rng.centered() * noise * range);
        sf::Vector2f point = position + vec::fromAngle(angle, range) + jitter;

        // jittered samples further out count for less
        float falloff = std::max(0.0f, 1.0f - vec::distance(position, point) / range);
        float strength = field.sample(point, channel) * falloff;
        if (strength > bestStrength)
        {
            bestStrength = strength;
            bestPoint = point;
        }
    }

    if (bestStrength < settings.detectionThreshold)
        return std::nullopt;

    sf::Vector2f toward = vec::normalize(bestPoint - position);
    float angle = vec::angle(toward) + rng.centered() * noise;
    return SensorReading{vec::fromAngle(angle), bestStrength};
}

sf::Vector2f Ant::avoidObstacles(const AntEnvironment &env, const SimulationSettings::AntSettings &settings,
                                 RandomSource &rng) const
{
    sf::Vector2f total(0.0f, 0.0f);
    int count = 0;
    for (const auto &obstacle : env.obstacles)
    {
        Repulsion rep = obstacle.repulse(position, rng);
        if (rep.distance < settings.avoidanceDistance)
        {
            float force = std::max(0.5f, 2.0f / (rep.distance + 0.1f));
            total += rep.direction * force;
            ++count;
        }
    }

    if (count == 0)
        return {0.0f, 0.0f};
    return total / static_cast<float>(count) * settings.avoidanceWeight;
}

sf::Vector2f Ant::blendMomentum(sf::Vector2f direction, const SimulationSettings::AntSettings &settings, RandomSource &rng)
{
    float weight = hasFood() ? settings.returnMomentumWeight : settings.exploreMomentumWeight;
    momentum = momentum * settings.momentumRetain + direction * (1.0f - settings.momentumRetain);
    return orRandom(direction * (1.0f - weight) + momentum * weight, rng);
}

void Ant::applyTurnAndSpeed(const sf::Vector2f &direction, const SimulationSettings::AntSettings &settings)
{
    float targetSpeed = hasFood() ? settings.returnSpeed : settings.exploreSpeed;
    float currentSpeed = vec::length(velocity);

    if (currentSpeed > SlowSpeed)
    {
        float currentAngle = vec::angle(velocity);
        float turn = vec::wrapAngle(vec::angle(direction) - currentAngle);
        turn = std::clamp(turn, -settings.maxTurnRate, settings.maxTurnRate);

        float speedDiff = targetSpeed - currentSpeed;
        float speedChange = std::clamp(speedDiff, -settings.acceleration, settings.acceleration);
        velocity = vec::fromAngle(currentAngle + turn, currentSpeed + speedChange);
    }
    else
    {
        velocity = direction * targetSpeed;
    }

    float maxAllowed = settings.maxSpeed * speedFactor() * SpeedCapFactor;
    if (vec::length(velocity) > maxAllowed)
        velocity = vec::normalize(velocity) * maxAllowed;
}

void Ant::integrate(const AntEnvironment &env, const SimulationSettings::AntSettings &settings, RandomSource &rng)
{
    sf::Vector2f next = position + velocity;

    // bounce off the first obstacle the step would touch
    for (const auto &obstacle : env.obstacles)
    {
        Repulsion rep = obstacle.repulse(next, rng);
        if (rep.distance < settings.collisionDistance)
        {
            sf::Vector2f outward = rep.direction;
            // inside the outline the closest edge point lies outward, flip toward it
            if (rep.distance > 0.0f && obstacle.contains(next))
                outward = -outward;
            velocity = outward * settings.bounceFactor;
            next = position + velocity;
            break;
        }
    }

    const float margin = settings.boundaryMargin;
    const float restitution = settings.boundaryRestitution;
    const float maxX = env.arenaSize.x - margin;
    const float maxY = env.arenaSize.y - margin;

    if (next.x < margin)
    {
        next.x = margin;
        velocity.x = std::abs(velocity.x) * restitution;
        velocity.y += rng.centered() * BoundaryJitter;
    }
    if (next.x > maxX)
    {
        next.x = maxX;
        velocity.x = -std::abs(velocity.x) * restitution;
        velocity.y += rng.centered() * BoundaryJitter;
    }
    if (next.y < margin)
    {
        next.y = margin;
        velocity.y = std::abs(velocity.y) * restitution;
        velocity.x += rng.centered() * BoundaryJitter;
    }
    if (next.y > maxY)
    {
        next.y = maxY;
        velocity.y = -std::abs(velocity.y) * restitution;
        velocity.x += rng.centered() * BoundaryJitter;
    }

    // only reachable with non finite input state, park the ant instead of spreading nan
    if (!vec::isFinite(next) || !vec::isFinite(velocity))
    {
        next = vec::isFinite(position) ? position : env.arenaSize * 0.5f;
        velocity = {0.0f, 0.0f};
    }

    position = next;
}

void Ant::recordPathPoint(const SimulationSettings::AntSettings &settings)
{
    if (!path.empty() && vec::distance(position, path.back()) <= settings.pathPointSpacing)
        return;

    path.push_back(position);
    if (static_cast<int>(path.size()) > settings.pathCapacity)
        path.erase(path.begin());
}

int Ant::nearestVisibleFood(const AntEnvironment &env, const SimulationSettings::AntSettings &settings,
                            float &distance) const
{
    int nearest = -1;
    distance = settings.visualRange;
    for (size_t i = 0; i < env.foodSources.size(); ++i)
    {
        const FoodSource &food = env.foodSources[i];
        if (food.isDepleted())
            continue;
        float d = vec::distance(position, food.position);
        if (d < distance)
        {
            distance = d;
            nearest = static_cast<int>(i);
        }
    }
    return nearest;
}

AntStepResult Ant::tryPickup(AntEnvironment &env, const SimulationSettings::AntSettings &settings)
{
    AntStepResult result;

    float foodDistance = 0.0f;
    int foodIndex = nearestVisibleFood(env, settings, foodDistance);
    if (foodIndex < 0 || !env.foodSources[foodIndex].take(position))
        return result;

    result.event = AntEvent::PickedUpFood;
    result.foodIndex = foodIndex;
    result.pathPoints = static_cast<int>(path.size());
    result.tripTicks = tripTicks;

    state = AntState::Returning;
    tripTicks = 0;
    energy = FullEnergy;
    momentum = vec::normalize(env.nest.getPosition() - position) * MomentumKick;

    if (path.size() > 3)
        env.field.reinforcePath(path, settings.pickupReinforcement);
    outboundPathPoints = static_cast<int>(path.size());
    path.clear();

    return result;
}

AntStepResult Ant::tryDeliver(AntEnvironment &env, const SimulationSettings::AntSettings &settings, RandomSource &rng)
{
    AntStepResult result;

    Nest &nest = env.nest;
    if (vec::distance(position, nest.getPosition()) >= nest.getRadius() + NestArrivalSlack)
        return result;

    result.pathPoints = static_cast<int>(path.size());
    result.outboundPathPoints = outboundPathPoints;
    result.tripTicks = tripTicks;
    result.roundTripTicks = roundTripTicks;

    if (nest.refuseIfFull())
    {
        result.event = AntEvent::WastedFood;
        startExploring(rng);
        return result;
    }

    float distanceScore = std::max(MinLegScore, 1.0f - static_cast<float>(path.size()) * PathPointPenalty);
    float timeScore = std::max(MinLegScore, 1.0f - static_cast<float>(tripTicks) / TripTicksForHalfScore);
    float efficiency = (distanceScore + timeScore) * 0.5f;

    nest.recordEfficiency(efficiency);
    int stored = nest.store(static_cast<int>(std::floor(1.0f + efficiency)));

    if (path.size() > 3)
        env.field.reinforcePath(path, efficiency * settings.deliveryReinforcement);

    result.event = AntEvent::DeliveredFood;
    result.efficiency = efficiency;
    result.unitsStored = stored;

    ++deliveries;
    unitsDelivered += stored;
    roundTripTicks = 0;
    energy = FullEnergy;
    startExploring(rng);
    return result;
}

void Ant::startExploring(RandomSource &rng)
{
    state = AntState::Exploring;
    path.clear();
    momentum = rng.unitVector() * MomentumKick;
    tripTicks = 0;
    outboundPathPoints = 0;
}

// ant factory

bool AntFactory::isClearOfObstacles(const sf::Vector2f &position, const std::vector<Obstacle> &obstacles,
                                    RandomSource &rng)
{
    for (const auto &obstacle : obstacles)
    {
        if (obstacle.contains(position) || obstacle.repulse(position, rng).distance < 5.0f)
            return false;
    }
    return true;
}

float AntFactory::rollLifespan(const SimulationSettings::AntSettings &settings, RandomSource &rng)
{
    return settings.lifespanTicks + rng.centered() * 2.0f * settings.lifespanJitterTicks;
}

std::vector<Ant> AntFactory::createColony(int count, const Nest &nest, const std::vector<Obstacle> &obstacles,
                                          const SimulationSettings::AntSettings &settings, RandomSource &rng)
{
    std::vector<Ant> ants;
    if (count <= 0)
        return ants;
    ants.reserve(count);

    const sf::Vector2f &center = nest.getPosition();
    for (int i = 0; i < count; ++i)
    {
        sf::Vector2f spawn = center;
        for (int attempt = 0; attempt < 50; ++attempt)
        {
            float angle = static_cast<float>(i) / static_cast<float>(count) * 2.0f * PI_F + rng.uniform() * 0.5f;
            float distance = rng.range(15.0f, 25.0f);
            spawn = center + vec::fromAngle(angle, distance);
            if (isClearOfObstacles(spawn, obstacles, rng))
                break;
        }

        // outward from the nest give or take a quarter turn
        float outward = vec::angle(spawn - center) + rng.centered() * PI_F;
        ants.emplace_back(spawn, vec::fromAngle(outward, 2.0f), rollLifespan(settings, rng));
    }
    return ants;
}

Ant AntFactory::spawnNearNest(const Nest &nest, const std::vector<Obstacle> &obstacles,
                              const SimulationSettings::AntSettings &settings, RandomSource &rng)
{
    const sf::Vector2f &center = nest.getPosition();
    sf::Vector2f spawn = center;
    for (int attempt = 0; attempt < 50; ++attempt)
    {
        spawn = center + rng.unitVector() * rng.range(10.0f, 25.0f);
        if (isClearOfObstacles(spawn, obstacles, rng))
            break;
    }
    return Ant(spawn, rng.unitVector() * 2.0f, rollLifespan(settings, rng));
}
