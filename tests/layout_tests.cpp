#include <doctest/doctest.h>

#include "Layout.h"
#include "RandomSource.h"
#include "SimulationSettings.h"
#include "VectorMath.h"

TEST_CASE("default layout keeps food, nest and obstacles apart")
{
    SimulationSettings settings;
    settings.validateAndClamp();

    for (std::uint32_t seed : {1u, 2u, 3u, 4u})
    {
        CAPTURE(seed);
        MersenneRandom rng(seed);
        Layout layout = LayoutFactory::createDefault(settings, rng);

        CHECK(layout.obstacles.size() <= static_cast<size_t>(settings.layout.obstacleCount));
        CHECK(layout.foodSources.size() <= static_cast<size_t>(settings.layout.maxFoodSources));
        REQUIRE_FALSE(layout.foodSources.empty());

        // the nest can hold exactly the initial food
        CHECK(layout.nest.getMaxCapacity() == layout.totalFood());
        CHECK_FALSE(layout.nest.isFull());

        const sf::Vector2f arenaCenter(settings.width * 0.5f, settings.height * 0.5f);
        for (const auto &food : layout.foodSources)
        {
            CHECK(food.amount >= settings.layout.minFoodAmount);
            CHECK(food.amount <= settings.layout.maxFoodAmount);
            CHECK(food.amount == food.originalAmount);
            CHECK(vec::distance(food.position, arenaCenter) >=
                  food.radius + settings.layout.nestRadius + settings.layout.nestClearance);
            for (const auto &obstacle : layout.obstacles)
                CHECK_FALSE(obstacle.contains(food.position));
        }

        for (const auto &obstacle : layout.obstacles)
        {
            CHECK(obstacle.points().size() == static_cast<size_t>(settings.layout.obstacleVertices));
            CHECK_FALSE(obstacle.contains(layout.nest.getPosition()));
        }

        const sf::Vector2f &nest = layout.nest.getPosition();
        CHECK(nest.x >= 100.0f);
        CHECK(nest.x <= settings.width - 100.0f);
        CHECK(nest.y >= 100.0f);
        CHECK(nest.y <= settings.height - 100.0f);
    }
}

TEST_CASE("obstacles keep their spacing")
{
    SimulationSettings settings;
    MersenneRandom rng(17);
    auto obstacles = LayoutFactory::createObstacles(settings, rng);

    for (size_t i = 0; i < obstacles.size(); ++i)
    {
        for (size_t j = i + 1; j < obstacles.size(); ++j)
        {
            float d = vec::distance(obstacles[i].center(), obstacles[j].center());
            CHECK(d >= obstacles[i].baseRadius() + obstacles[j].baseRadius() + 20.0f);
        }
    }
}

TEST_CASE("same seed, same layout")
{
    SimulationSettings settings;
    MersenneRandom a(99);
    MersenneRandom b(99);
    Layout first = LayoutFactory::createDefault(settings, a);
    Layout second = LayoutFactory::createDefault(settings, b);

    REQUIRE(first.foodSources.size() == second.foodSources.size());
    REQUIRE(first.obstacles.size() == second.obstacles.size());
    CHECK(first.nest.getPosition() == second.nest.getPosition());
    for (size_t i = 0; i < first.foodSources.size(); ++i)
        CHECK(first.foodSources[i].position == second.foodSources[i].position);
    for (size_t i = 0; i < first.obstacles.size(); ++i)
        CHECK(first.obstacles[i].points() == second.obstacles[i].points());
}

TEST_CASE("replacement food keeps clear of the nest and other sources")
{
    SimulationSettings settings;
    MersenneRandom rng(8);
    Layout layout;
    layout.nest = Nest({600.0f, 450.0f}, 40.0f, 1000);
    layout.foodSources.emplace_back(300.0f, 300.0f, 100);

    for (int i = 0; i < 20; ++i)
    {
        std::optional<FoodSource> food = LayoutFactory::placeReplacementFood(settings, layout, rng);
        REQUIRE(food.has_value());
        CHECK(vec::distance(food->position, layout.nest.getPosition()) >= food->radius + 40.0f + 120.0f);
        CHECK(vec::distance(food->position, layout.foodSources[0].position) >=
              food->radius + layout.foodSources[0].radius + 40.0f);
        CHECK(food->position.x >= 80.0f);
        CHECK(food->position.x <= settings.width - 80.0f);
    }
}

TEST_CASE("a packed arena gives no replacement food")
{
    SimulationSettings settings;
    settings.width = 200;
    settings.height = 200;
    MersenneRandom rng(5);

    Layout layout;
    layout.nest = Nest({100.0f, 100.0f}, 40.0f, 10);

    CHECK_FALSE(LayoutFactory::placeReplacementFood(settings, layout, rng).has_value());
}
