#pragma once
#include <cstdint>
#include <string>

class SimulationSettings
{
public:
    // simulation settings
    int stepsPerFrame = 1;
    int width = 1200;
    int height = 900;
    int numAnts = 500;
    std::uint32_t seed = 0; // 0 = seed from std::random_device

    // field settings
    float cellSize = 6.0f;
    float evaporationRate = 0.01f;
    float displayThreshold = 2.0f; // viewer only, cells below this are not drawn

    // colony upkeep
    bool populationMaintenance = false; // respawn toward numAnts, on by default for mortal colonies
    bool replenishFood = true;          // replace depleted food sources
    bool verbose = false;               // log individual pickups and deliveries

    // per ant behaviour, defaults tuned for a 1200x900 arena at 60 ticks/s
    struct AntSettings
    {
        // sensing
        float sensorRange = 80.0f;
        float sensorNoise = 0.3f;        // fraction of range for position jitter, radians for heading jitter
        float sensorSpreadDegrees = 60.0f; // cone half angle
        float sensorStepDegrees = 15.0f;
        float detectionThreshold = 0.5f;
        float visualRange = 200.0f;      // food inside this is seen directly
        float nestApproachRadius = 100.0f; // nest is steered to directly inside this

        // steering weights
        float returnTrailWeightCap = 2.0f;  // min(cap, strength) on the home trail
        float returnHomingWeight = 0.5f;
        float exploreTrailWeightCap = 3.0f; // min(cap, strength) on the food trail
        float exploreRandomWeight = 0.3f;
        float wanderMomentumWeight = 0.4f;
        float momentumRetain = 0.7f;
        float returnMomentumWeight = 0.4f;
        float exploreMomentumWeight = 0.5f;
        float returnMomentumDamping = 0.3f;

        // obstacle avoidance
        float avoidanceDistance = 12.0f;
        float avoidanceWeight = 0.8f;
        float collisionDistance = 3.0f;
        float bounceFactor = 1.0f;

        // motion
        float maxSpeed = 3.0f;
        float maxTurnRate = 0.3f; // radians per tick
        float exploreSpeed = 3.0f;
        float returnSpeed = 2.5f;
        float acceleration = 0.1f;
        float boundaryMargin = 10.0f;
        float boundaryRestitution = 0.8f;

        // trail laying
        float homeDeposit = 6.0f;
        float foodDeposit = 12.0f;
        float pathPointSpacing = 15.0f;
        int pathCapacity = 100;
        float pickupReinforcement = 3.0f;
        float deliveryReinforcement = 6.0f;

        // mortality
        bool mortal = false;
        float lifespanTicks = 18000.0f; // ~5 minutes at 60 ticks/s
        float lifespanJitterTicks = 3600.0f;
        float energyDecay = 0.02f;
    };
    AntSettings ants;

    // procedural arena generation
    struct LayoutSettings
    {
        int obstacleCount = 8;
        float obstacleMinRadius = 30.0f;
        float obstacleMaxRadius = 60.0f;
        float obstacleIrregularity = 0.2f;
        int obstacleVertices = 18;
        int minFoodSources = 4;
        int maxFoodSources = 6;
        int minFoodAmount = 200;
        int maxFoodAmount = 500;
        float nestRadius = 40.0f;
        float nestClearance = 300.0f; // food keeps this far (plus both radii) from the arena center
    };
    LayoutSettings layout;

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    void validateAndClamp();
};
