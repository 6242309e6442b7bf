#pragma once
#include <SFML/System/Vector2.hpp>
#include <memory>
#include <vector>

enum class PheromoneChannel
{
    Home, // laid by exploring ants, leads back to the nest
    Food  // laid by returning ants, leads out to food
};

struct GridIndex
{
    int x = 0;
    int y = 0;
};

// cell grid over the arena holding the two trail channels plus the success grid
// all queries take world positions and clamp into the grid, so none can fail
class PheromoneField
{
public:
    static constexpr float MaxIntensity = 1000.0f;
    static constexpr float MaxSuccess = 100.0f;
    static constexpr float SnapToZero = 0.01f;

    PheromoneField(float width, float height, float cellSize);
    ~PheromoneField();

    PheromoneField(const PheromoneField &) = delete;
    PheromoneField &operator=(const PheromoneField &) = delete;

    // core operations
    void deposit(const sf::Vector2f &position, PheromoneChannel channel, float amount, float successBonus = 1.0f);
    float sample(const sf::Vector2f &position, PheromoneChannel channel) const;
    float success(const sf::Vector2f &position) const;
    sf::Vector2f gradient(const sf::Vector2f &position, PheromoneChannel channel) const;

    // processing
    void evaporate(float rate);
    void reinforcePath(const std::vector<sf::Vector2f> &points, float strength);
    void clear();

    GridIndex index(const sf::Vector2f &position) const;

    // accessors
    int getGridWidth() const { return gridWidth_; }
    int getGridHeight() const { return gridHeight_; }
    float getCellSize() const { return cellSize_; }
    float cell(int gx, int gy, PheromoneChannel channel) const;
    float successCell(int gx, int gy) const;
    const float *getData(PheromoneChannel channel) const;
    const float *getSuccessData() const { return success_.get(); }

private:
    int gridWidth_, gridHeight_;
    float cellSize_;
    std::unique_ptr<float[]> home_;
    std::unique_ptr<float[]> food_;
    std::unique_ptr<float[]> success_; // pathSuccess, display and reinforcement only

    // neighbours further than this (in cells) get nothing from a deposit
    static constexpr float SpreadRadius = 1.5f;
    static constexpr float SpreadShare = 0.3f;

    float *channelData(PheromoneChannel channel);
    const float *channelData(PheromoneChannel channel) const;
    int getIndex(int x, int y) const { return y * gridWidth_ + x; }
    size_t cellCount() const { return static_cast<size_t>(gridWidth_) * static_cast<size_t>(gridHeight_); }
};
