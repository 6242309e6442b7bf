#include <doctest/doctest.h>

#include "Ant.h"
#include "FoodSource.h"
#include "Nest.h"
#include "Obstacle.h"
#include "PheromoneField.h"
#include "RandomSource.h"
#include "VectorMath.h"
#include "test_support/SequenceRandom.h"

#include <cmath>
#include <vector>

namespace
{
    // hand built arena the ant can mutate
    struct TestArena
    {
        PheromoneField field{400.0f, 400.0f, 6.0f};
        std::vector<FoodSource> food;
        std::vector<Obstacle> obstacles;
        Nest nest{{200.0f, 200.0f}, 40.0f, 100};
        SimulationSettings::AntSettings settings;

        AntEnvironment env() { return AntEnvironment{field, food, obstacles, nest, {400.0f, 400.0f}}; }
    };
}

TEST_CASE("exploring ant standing on food picks up one unit")
{
    TestArena arena;
    arena.food.emplace_back(100.0f, 100.0f, 10, 25.0f);
    SequenceRandom rng(0.5f);

    Ant ant({100.0f, 100.0f});
    AntEnvironment env = arena.env();
    AntStepResult result = ant.update(env, arena.settings, rng);

    CHECK(result.event == AntEvent::PickedUpFood);
    CHECK(result.foodIndex == 0);
    CHECK(ant.state == AntState::Returning);
    CHECK(ant.hasFood());
    CHECK(arena.food[0].amount == 9);
    CHECK(ant.path.empty());
    CHECK(ant.tripTicks == 0);
    CHECK(ant.energy == doctest::Approx(Ant::FullEnergy));
}

TEST_CASE("the last unit depletes the source on the same tick")
{
    TestArena arena;
    arena.food.emplace_back(100.0f, 100.0f, 1, 25.0f);
    SequenceRandom rng(0.5f);

    Ant ant({100.0f, 100.0f});
    AntEnvironment env = arena.env();
    CHECK(ant.update(env, arena.settings, rng).event == AntEvent::PickedUpFood);
    CHECK(arena.food[0].isDepleted());
    CHECK(ant.state == AntState::Returning);
}

TEST_CASE("returning ant at the nest delivers")
{
    TestArena arena;
    SequenceRandom rng(0.5f);

    Ant ant({200.0f, 200.0f});
    ant.state = AntState::Returning;
    ant.roundTripTicks = 40;
    ant.outboundPathPoints = 6;

    AntEnvironment env = arena.env();
    AntStepResult result = ant.update(env, arena.settings, rng);

    CHECK(result.event == AntEvent::DeliveredFood);
    CHECK(result.unitsStored == 1);
    CHECK(result.efficiency >= 0.5f);
    CHECK(result.efficiency <= 1.0f);
    CHECK(result.roundTripTicks == 41);
    CHECK(result.outboundPathPoints == 6);

    CHECK(arena.nest.getFoodStored() == 1);
    CHECK(ant.state == AntState::Exploring);
    CHECK(ant.deliveries == 1);
    CHECK(ant.unitsDelivered == 1);
    CHECK(ant.roundTripTicks == 0);
    CHECK(ant.path.empty());
}

TEST_CASE("food brought to a full nest is wasted")
{
    TestArena arena;
    arena.nest = Nest({200.0f, 200.0f}, 40.0f, 0);
    SequenceRandom rng(0.5f);

    Ant ant({200.0f, 200.0f});
    ant.state = AntState::Returning;

    AntEnvironment env = arena.env();
    AntStepResult result = ant.update(env, arena.settings, rng);

    CHECK(result.event == AntEvent::WastedFood);
    CHECK(result.unitsStored == 0);
    CHECK(arena.nest.getFoodStored() == 0);
    CHECK(arena.nest.isFull());
    CHECK(ant.state == AntState::Exploring);
    CHECK(ant.path.empty());
    CHECK(ant.deliveries == 0);
}

TEST_CASE("a resting ant on an empty field moves off finitely")
{
    TestArena arena;
    SequenceRandom rng({0.0f, 0.5f, 0.25f});

    for (AntState state : {AntState::Exploring, AntState::Returning})
    {
        Ant ant({200.0f, 200.0f}, {0.0f, 0.0f});
        ant.state = state;
        AntEnvironment env = arena.env();
        for (int tick = 0; tick < 20; ++tick)
        {
            ant.update(env, arena.settings, rng);
            REQUIRE(vec::isFinite(ant.position));
            REQUIRE(vec::isFinite(ant.velocity));
            REQUIRE(vec::isFinite(ant.momentum));
        }
    }
}

TEST_CASE("each state lays its own trail where it stands")
{
    TestArena arena;
    SequenceRandom rng({0.1f, 0.7f, 0.4f});

    Ant explorer({50.0f, 50.0f}, {1.0f, 0.0f});
    AntEnvironment env = arena.env();
    explorer.update(env, arena.settings, rng);
    CHECK(arena.field.sample({50.0f, 50.0f}, PheromoneChannel::Home) == doctest::Approx(arena.settings.homeDeposit));
    CHECK(arena.field.sample({50.0f, 50.0f}, PheromoneChannel::Food) == 0.0f);

    Ant carrier({350.0f, 350.0f}, {-1.0f, 0.0f});
    carrier.state = AntState::Returning;
    carrier.update(env, arena.settings, rng);
    CHECK(arena.field.sample({350.0f, 350.0f}, PheromoneChannel::Food) >= arena.settings.foodDeposit);
    CHECK(arena.field.sample({350.0f, 350.0f}, PheromoneChannel::Home) == 0.0f);
}

TEST_CASE("ants never leave the arena margin")
{
    TestArena arena;
    SequenceRandom rng({0.1f, 0.6f, 0.35f, 0.9f, 0.02f, 0.75f, 0.5f});

    std::vector<Ant> ants = {
        Ant({12.0f, 100.0f}, {-3.0f, 0.0f}),
        Ant({388.0f, 388.0f}, {3.0f, 3.0f}),
        Ant({200.0f, 11.0f}, {0.0f, -3.0f}),
    };

    AntEnvironment env = arena.env();
    const float margin = arena.settings.boundaryMargin;
    for (int tick = 0; tick < 500; ++tick)
    {
        for (auto &ant : ants)
        {
            ant.update(env, arena.settings, rng);
            REQUIRE(ant.position.x >= margin);
            REQUIRE(ant.position.x <= 400.0f - margin);
            REQUIRE(ant.position.y >= margin);
            REQUIRE(ant.position.y <= 400.0f - margin);
            REQUIRE(vec::isFinite(ant.velocity));
        }
    }
}

TEST_CASE("turn rate and speed are limited")
{
    TestArena arena;
    SequenceRandom rng(0.5f); // wander heading is straight back along -x

    Ant ant({200.0f, 100.0f}, {3.0f, 0.0f});
    float before = vec::angle(ant.velocity);
    AntEnvironment env = arena.env();
    ant.update(env, arena.settings, rng);

    float turned = std::abs(vec::wrapAngle(vec::angle(ant.velocity) - before));
    CHECK(turned <= arena.settings.maxTurnRate + 1e-4f);
    CHECK(vec::length(ant.velocity) <= arena.settings.maxSpeed * 1.5f + 1e-4f);
}

TEST_CASE("ants bounce off obstacles instead of walking through")
{
    TestArena arena;
    MersenneRandom blobRng(5);
    arena.obstacles.emplace_back(sf::Vector2f(200.0f, 100.0f), 40.0f, blobRng);
    SequenceRandom rng(0.0f); // wander heading is +x, straight into the blob

    Ant ant({140.0f, 100.0f}, {3.0f, 0.0f});
    AntEnvironment env = arena.env();
    for (int tick = 0; tick < 100; ++tick)
    {
        ant.update(env, arena.settings, rng);
        CHECK_FALSE(arena.obstacles[0].contains(ant.position));
    }
}

TEST_CASE("path keeps sparse points up to its capacity")
{
    TestArena arena;
    arena.settings.pathCapacity = 5;
    arena.settings.pathPointSpacing = 15.0f;
    SequenceRandom rng(0.0f); // wander heading is +x

    Ant ant({20.0f, 200.0f}, {3.0f, 0.0f});
    AntEnvironment env = arena.env();
    for (int tick = 0; tick < 60; ++tick)
        ant.update(env, arena.settings, rng);

    CHECK(ant.path.size() == 5);
    for (size_t i = 1; i < ant.path.size(); ++i)
        CHECK(vec::distance(ant.path[i], ant.path[i - 1]) > 15.0f);
}

TEST_CASE("mortal ants age out and dead ants stay put")
{
    TestArena arena;
    arena.settings.mortal = true;
    SequenceRandom rng(0.3f);

    Ant ant({100.0f, 300.0f}, {1.0f, 0.0f}, 1.0f);
    AntEnvironment env = arena.env();

    CHECK(ant.update(env, arena.settings, rng).event != AntEvent::Died);
    CHECK(ant.isAlive());

    AntStepResult result = ant.update(env, arena.settings, rng);
    CHECK(result.event == AntEvent::Died);
    CHECK_FALSE(ant.isAlive());

    sf::Vector2f where = ant.position;
    CHECK(ant.update(env, arena.settings, rng).event == AntEvent::None);
    CHECK(ant.position == where);
}

TEST_CASE("immortal colonies ignore age and energy")
{
    TestArena arena;
    SequenceRandom rng(0.3f);

    Ant ant({100.0f, 300.0f}, {1.0f, 0.0f}, 1.0f);
    AntEnvironment env = arena.env();
    for (int tick = 0; tick < 10; ++tick)
        ant.update(env, arena.settings, rng);

    CHECK(ant.isAlive());
    CHECK(ant.ageTicks == 0.0f);
    CHECK(ant.energy == doctest::Approx(Ant::FullEnergy));
}

TEST_CASE("forward sensor finds a trail ahead and ignores one behind")
{
    PheromoneField field(400.0f, 400.0f, 6.0f);
    SimulationSettings::AntSettings settings;
    SequenceRandom rng(0.0f); // every jitter pulls the samples back toward the ant

    Ant ant({100.0f, 100.0f}, {2.0f, 0.0f});
    CHECK_FALSE(ant.senseForward(field, PheromoneChannel::Home, settings, rng).has_value());

    field.deposit({30.0f, 100.0f}, PheromoneChannel::Home, 500.0f);
    CHECK_FALSE(ant.senseForward(field, PheromoneChannel::Home, settings, rng).has_value());

    // the straight ahead sample lands at (168, 88) with this jitter
    field.deposit({168.0f, 88.0f}, PheromoneChannel::Home, 500.0f);
    auto reading = ant.senseForward(field, PheromoneChannel::Home, settings, rng);
    REQUIRE(reading.has_value());
    CHECK(reading->strength > settings.detectionThreshold);
    CHECK(reading->direction.x > 0.9f);
    CHECK(vec::length(reading->direction) == doctest::Approx(1.0f));
}

TEST_CASE("colony spawns around the nest heading outward")
{
    SimulationSettings::AntSettings settings;
    Nest nest({300.0f, 300.0f}, 40.0f, 100);
    std::vector<Obstacle> obstacles;
    MersenneRandom rng(21);

    std::vector<Ant> ants = AntFactory::createColony(24, nest, obstacles, settings, rng);
    REQUIRE(ants.size() == 24);
    for (const auto &ant : ants)
    {
        float d = vec::distance(ant.position, nest.getPosition());
        CHECK(d >= doctest::Approx(15.0f));
        CHECK(d <= doctest::Approx(25.0f));
        CHECK(vec::length(ant.velocity) == doctest::Approx(2.0f));
        // within a quarter turn of straight out
        CHECK(vec::dot(ant.velocity, ant.position - nest.getPosition()) >= -1e-3f);
        CHECK(ant.state == AntState::Exploring);
    }

    CHECK(AntFactory::createColony(0, nest, obstacles, settings, rng).empty());
}

TEST_CASE("reinforcements spawn clear of obstacles")
{
    SimulationSettings::AntSettings settings;
    Nest nest({300.0f, 300.0f}, 40.0f, 100);
    MersenneRandom rng(4);
    std::vector<Obstacle> obstacles;
    obstacles.emplace_back(std::vector<sf::Vector2f>{{300.0f, 270.0f}, {340.0f, 270.0f}, {340.0f, 330.0f}, {300.0f, 330.0f}});

    for (int i = 0; i < 50; ++i)
    {
        Ant ant = AntFactory::spawnNearNest(nest, obstacles, settings, rng);
        float d = vec::distance(ant.position, nest.getPosition());
        CHECK(d <= doctest::Approx(25.0f));
        CHECK_FALSE(obstacles[0].contains(ant.position));
    }
}
