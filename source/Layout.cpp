#include "Layout.h"
#include "RandomSource.h"
#include "VectorMath.h"
#include <algorithm>
#include <functional>
#include <iostream>
#include <limits>

int Layout::totalFood() const
{
    int total = 0;
    for (const auto &food : foodSources)
        total += food.originalAmount;
    return total;
}

Layout LayoutFactory::createDefault(const SimulationSettings &settings, RandomSource &rng)
{
    Layout layout;
    layout.obstacles = createObstacles(settings, rng);
    layout.foodSources = createFoodSources(settings, layout.obstacles, rng);

    sf::Vector2f nestPos = placeNest(settings, layout.obstacles, layout.foodSources, rng);
    layout.nest = Nest(nestPos, settings.layout.nestRadius, layout.totalFood());
    return layout;
}

std::vector<Obstacle> LayoutFactory::createObstacles(const SimulationSettings &settings, RandomSource &rng)
{
    const auto &cfg = settings.layout;
    const float w = static_cast<float>(settings.width);
    const float h = static_cast<float>(settings.height);

    std::vector<Obstacle> obstacles;
    obstacles.reserve(cfg.obstacleCount);
    for (int i = 0; i < cfg.obstacleCount; ++i)
    {
        for (int attempt = 0; attempt < MaxAttempts; ++attempt)
        {
            sf::Vector2f center(rng.range(ArenaMargin, w - ArenaMargin), rng.range(ArenaMargin, h - ArenaMargin));
            float radius = rng.range(cfg.obstacleMinRadius, cfg.obstacleMaxRadius);

            bool overlaps = std::any_of(obstacles.begin(), obstacles.end(), [&](const Obstacle &other) {
                return vec::distance(center, other.center()) < radius + other.baseRadius() + 20.0f;
            });
            if (overlaps)
                continue;

            obstacles.emplace_back(center, radius, rng, cfg.obstacleIrregularity, cfg.obstacleVertices);
            break;
        }
    }
    return obstacles;
}

std::vector<FoodSource> LayoutFactory::createFoodSources(const SimulationSettings &settings,
                                                         const std::vector<Obstacle> &obstacles, RandomSource &rng)
{
    const auto &cfg = settings.layout;
    const float w = static_cast<float>(settings.width);
    const float h = static_cast<float>(settings.height);
    const sf::Vector2f arenaCenter(w * 0.5f, h * 0.5f);

    std::vector<FoodSource> foodSources;
    int count = rng.rangeInt(cfg.minFoodSources, cfg.maxFoodSources);
    for (int i = 0; i < count; ++i)
    {
        for (int attempt = 0; attempt < MaxAttempts; ++attempt)
        {
            FoodSource food(rng.range(ArenaMargin, w - ArenaMargin), rng.range(ArenaMargin, h - ArenaMargin),
                            rng.rangeInt(cfg.minFoodAmount, cfg.maxFoodAmount), rng.range(20.0f, 30.0f));

            bool blocked = std::any_of(obstacles.begin(), obstacles.end(), [&](const Obstacle &obstacle) {
                return vec::distance(food.position, obstacle.center()) < food.radius + obstacle.baseRadius() + 30.0f;
            });
            blocked = blocked || std::any_of(foodSources.begin(), foodSources.end(), [&](const FoodSource &other) {
                return vec::distance(food.position, other.position) < food.radius + other.radius + 20.0f;
            });
            // keep the middle of the arena free for the nest
            blocked = blocked ||
                      vec::distance(food.position, arenaCenter) < food.radius + cfg.nestRadius + cfg.nestClearance;
            if (blocked)
                continue;

            foodSources.push_back(food);
            break;
        }
    }
    return foodSources;
}

bool LayoutFactory::nestPositionIsClear(const sf::Vector2f &position, float nestRadius,
                                        const std::vector<Obstacle> &obstacles,
                                        const std::vector<FoodSource> &foodSources)
{
    for (const auto &obstacle : obstacles)
    {
        if (vec::distance(position, obstacle.center()) < nestRadius + obstacle.baseRadius() + 80.0f)
            return false;
    }
    for (const auto &food : foodSources)
    {
        if (vec::distance(position, food.position) < nestRadius + food.radius + 120.0f)
            return false;
    }
    return true;
}

sf::Vector2f LayoutFactory::placeNest(const SimulationSettings &settings, const std::vector<Obstacle> &obstacles,
                                      const std::vector<FoodSource> &foodSources, RandomSource &rng)
{
    const float w = static_cast<float>(settings.width);
    const float h = static_cast<float>(settings.height);
    const float m = ArenaMargin;
    const float nestRadius = settings.layout.nestRadius;

    // center first, then the four corners, then anywhere
    const std::function<sf::Vector2f()> strategies[] = {
        [&] { return sf::Vector2f(w * 0.5f + rng.centered() * 200.0f, h * 0.5f + rng.centered() * 200.0f); },
        [&] { return sf::Vector2f(m + rng.uniform() * 200.0f, m + rng.uniform() * 200.0f); },
        [&] { return sf::Vector2f(w - m - rng.uniform() * 200.0f, m + rng.uniform() * 200.0f); },
        [&] { return sf::Vector2f(m + rng.uniform() * 200.0f, h - m - rng.uniform() * 200.0f); },
        [&] { return sf::Vector2f(w - m - rng.uniform() * 200.0f, h - m - rng.uniform() * 200.0f); },
        [&] { return sf::Vector2f(rng.range(m, w - m), rng.range(m, h - m)); },
    };

    for (const auto &strategy : strategies)
    {
        for (int attempt = 0; attempt < NestAttemptsPerStrategy; ++attempt)
        {
            sf::Vector2f pos = strategy();
            pos.x = std::clamp(pos.x, m, std::max(m, w - m));
            pos.y = std::clamp(pos.y, m, std::max(m, h - m));
            if (nestPositionIsClear(pos, nestRadius, obstacles, foodSources))
                return pos;
        }
    }

    std::cerr << "Warning: no clear spot for the nest, using the least crowded one" << std::endl;
    return leastCrowdedNestPosition(settings, obstacles);
}

sf::Vector2f LayoutFactory::leastCrowdedNestPosition(const SimulationSettings &settings,
                                                     const std::vector<Obstacle> &obstacles)
{
    const float w = static_cast<float>(settings.width);
    const float h = static_cast<float>(settings.height);
    const float nestRadius = settings.layout.nestRadius;

    sf::Vector2f best(w * 0.5f, h * 0.5f);
    float minOverlap = std::numeric_limits<float>::max();
    for (float x = ArenaMargin; x < w - ArenaMargin; x += 50.0f)
    {
        for (float y = ArenaMargin; y < h - ArenaMargin; y += 50.0f)
        {
            float overlap = 0.0f;
            for (const auto &obstacle : obstacles)
            {
                float reach = nestRadius + obstacle.baseRadius();
                float d = vec::distance({x, y}, obstacle.center());
                if (d < reach)
                    overlap += reach - d;
            }
            if (overlap < minOverlap)
            {
                minOverlap = overlap;
                best = {x, y};
            }
        }
    }
    return best;
}

std::optional<FoodSource> LayoutFactory::placeReplacementFood(const SimulationSettings &settings, const Layout &layout,
                                                              RandomSource &rng)
{
    const auto &cfg = settings.layout;
    const float margin = 80.0f;
    const float w = static_cast<float>(settings.width);
    const float h = static_cast<float>(settings.height);

    for (int attempt = 0; attempt < MaxAttempts; ++attempt)
    {
        FoodSource food(rng.range(margin, w - margin), rng.range(margin, h - margin),
                        rng.rangeInt(cfg.minFoodAmount, cfg.maxFoodAmount), rng.range(20.0f, 30.0f));

        bool blocked = std::any_of(layout.obstacles.begin(), layout.obstacles.end(), [&](const Obstacle &obstacle) {
            return vec::distance(food.position, obstacle.center()) < food.radius + obstacle.baseRadius() + 30.0f;
        });
        blocked = blocked || std::any_of(layout.foodSources.begin(), layout.foodSources.end(), [&](const FoodSource &other) {
            return vec::distance(food.position, other.position) < food.radius + other.radius + 40.0f;
        });
        blocked = blocked || vec::distance(food.position, layout.nest.getPosition()) <
                                 food.radius + layout.nest.getRadius() + 120.0f;
        if (!blocked)
            return food;
    }
    return std::nullopt;
}
