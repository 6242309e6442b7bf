#include <doctest/doctest.h>

#include "PheromoneField.h"
#include "VectorMath.h"

#include <cmath>
#include <limits>
#include <vector>

TEST_CASE("pheromone field grid covers the arena")
{
    PheromoneField field(100.0f, 50.0f, 6.0f);
    CHECK(field.getGridWidth() == 17);
    CHECK(field.getGridHeight() == 9);

    PheromoneField tiny(3.0f, 3.0f, 10.0f);
    CHECK(tiny.getGridWidth() == 1);
    CHECK(tiny.getGridHeight() == 1);
}

TEST_CASE("deposit lands in the cell and spreads to its neighbours")
{
    PheromoneField field(60.0f, 60.0f, 6.0f);
    const sf::Vector2f spot(33.0f, 33.0f); // cell (5, 5)

    field.deposit(spot, PheromoneChannel::Home, 10.0f, 2.0f);

    CHECK(field.cell(5, 5, PheromoneChannel::Home) == doctest::Approx(20.0f));
    // axis neighbours: (1 - 1 / 1.5) * 0.3 of the deposit
    CHECK(field.cell(6, 5, PheromoneChannel::Home) == doctest::Approx(2.0f));
    CHECK(field.cell(5, 4, PheromoneChannel::Home) == doctest::Approx(2.0f));
    // diagonals get a little
    float diagonal = field.cell(6, 6, PheromoneChannel::Home);
    CHECK(diagonal > 0.0f);
    CHECK(diagonal < 2.0f);
    // two cells out gets nothing
    CHECK(field.cell(7, 5, PheromoneChannel::Home) == 0.0f);

    // the other channel is untouched, the success grid got 0.1 per unit bonus
    CHECK(field.sample(spot, PheromoneChannel::Food) == 0.0f);
    CHECK(field.success(spot) == doctest::Approx(0.2f));
}

TEST_CASE("deposits saturate at the intensity cap")
{
    PheromoneField field(60.0f, 60.0f, 6.0f);
    for (int i = 0; i < 50; ++i)
        field.deposit({30.0f, 30.0f}, PheromoneChannel::Food, 100.0f, 3.0f);

    CHECK(field.sample({30.0f, 30.0f}, PheromoneChannel::Food) == doctest::Approx(PheromoneField::MaxIntensity));
    CHECK(field.success({30.0f, 30.0f}) <= PheromoneField::MaxSuccess);
}

TEST_CASE("positions outside the arena clamp to the border cells")
{
    PheromoneField field(60.0f, 60.0f, 6.0f);
    field.deposit({-50.0f, -50.0f}, PheromoneChannel::Home, 5.0f);
    CHECK(field.cell(0, 0, PheromoneChannel::Home) == doctest::Approx(5.0f));

    field.deposit({1e9f, 1e9f}, PheromoneChannel::Home, 7.0f);
    CHECK(field.cell(9, 9, PheromoneChannel::Home) == doctest::Approx(7.0f));

    const float nan = std::numeric_limits<float>::quiet_NaN();
    GridIndex idx = field.index({nan, nan});
    CHECK(idx.x == 0);
    CHECK(idx.y == 0);
    CHECK(field.sample({nan, 30.0f}, PheromoneChannel::Home) >= 0.0f);
}

TEST_CASE("evaporation decays every cell and snaps small values to zero")
{
    PheromoneField field(60.0f, 60.0f, 6.0f);
    field.deposit({30.0f, 30.0f}, PheromoneChannel::Home, 10.0f);

    field.evaporate(0.1f);
    CHECK(field.sample({30.0f, 30.0f}, PheromoneChannel::Home) == doctest::Approx(9.0f));

    for (int i = 0; i < 200; ++i)
        field.evaporate(0.1f);

    const float *home = field.getData(PheromoneChannel::Home);
    const float *success = field.getSuccessData();
    for (int i = 0; i < field.getGridWidth() * field.getGridHeight(); ++i)
    {
        CHECK(home[i] == 0.0f);
        CHECK(success[i] >= 0.0f);
    }
}

TEST_CASE("success decays slower than the trails")
{
    PheromoneField field(60.0f, 60.0f, 6.0f);
    field.reinforcePath({{30.0f, 30.0f}}, 10.0f);
    field.deposit({30.0f, 30.0f}, PheromoneChannel::Food, 10.0f);
    REQUIRE(field.success({30.0f, 30.0f}) == doctest::Approx(10.1f));

    field.evaporate(0.5f);
    CHECK(field.sample({30.0f, 30.0f}, PheromoneChannel::Food) == doctest::Approx(5.0f));
    CHECK(field.success({30.0f, 30.0f}) == doctest::Approx(10.1f * 0.85f));
}

TEST_CASE("reinforcing a path raises success along it up to the cap")
{
    PheromoneField field(120.0f, 60.0f, 6.0f);
    std::vector<sf::Vector2f> path = {{10.0f, 10.0f}, {40.0f, 10.0f}, {70.0f, 10.0f}};

    field.reinforcePath(path, 6.0f);
    for (const auto &point : path)
        CHECK(field.success(point) == doctest::Approx(6.0f));
    CHECK(field.success({100.0f, 50.0f}) == 0.0f);

    field.reinforcePath(path, 500.0f);
    CHECK(field.success(path[0]) == doctest::Approx(PheromoneField::MaxSuccess));
}

TEST_CASE("gradient points up the slope and is zero on a flat field")
{
    PheromoneField field(60.0f, 60.0f, 6.0f);
    CHECK(vec::isZero(field.gradient({27.0f, 30.0f}, PheromoneChannel::Home)));

    field.deposit({33.0f, 33.0f}, PheromoneChannel::Home, 50.0f);
    sf::Vector2f g = field.gradient({27.0f, 33.0f}, PheromoneChannel::Home);
    CHECK(g.x > 0.5f);
    CHECK(vec::length(g) == doctest::Approx(1.0f));
}

TEST_CASE("clear empties all three grids")
{
    PheromoneField field(60.0f, 60.0f, 6.0f);
    field.deposit({30.0f, 30.0f}, PheromoneChannel::Home, 10.0f);
    field.deposit({30.0f, 30.0f}, PheromoneChannel::Food, 10.0f);
    field.clear();

    CHECK(field.sample({30.0f, 30.0f}, PheromoneChannel::Home) == 0.0f);
    CHECK(field.sample({30.0f, 30.0f}, PheromoneChannel::Food) == 0.0f);
    CHECK(field.success({30.0f, 30.0f}) == 0.0f);
}
