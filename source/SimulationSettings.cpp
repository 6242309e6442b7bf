#include "SimulationSettings.h"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <stdexcept>

bool SimulationSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# Ant Foraging Settings\n";
    file << "stepsPerFrame=" << stepsPerFrame << "\n";
    file << "width=" << width << "\n";
    file << "height=" << height << "\n";
    file << "numAnts=" << numAnts << "\n";
    file << "seed=" << seed << "\n";
    file << "cellSize=" << cellSize << "\n";
    file << "evaporationRate=" << evaporationRate << "\n";
    file << "displayThreshold=" << displayThreshold << "\n";
    file << "populationMaintenance=" << (populationMaintenance ? 1 : 0) << "\n";
    file << "replenishFood=" << (replenishFood ? 1 : 0) << "\n";
    file << "verbose=" << (verbose ? 1 : 0) << "\n";

    file << "# ant behaviour\n";
    file << "ants_sensorRange=" << ants.sensorRange << "\n";
    file << "ants_sensorNoise=" << ants.sensorNoise << "\n";
    file << "ants_sensorSpreadDegrees=" << ants.sensorSpreadDegrees << "\n";
    file << "ants_sensorStepDegrees=" << ants.sensorStepDegrees << "\n";
    file << "ants_detectionThreshold=" << ants.detectionThreshold << "\n";
    file << "ants_visualRange=" << ants.visualRange << "\n";
    file << "ants_nestApproachRadius=" << ants.nestApproachRadius << "\n";
    file << "ants_returnTrailWeightCap=" << ants.returnTrailWeightCap << "\n";
    file << "ants_returnHomingWeight=" << ants.returnHomingWeight << "\n";
    file << "ants_exploreTrailWeightCap=" << ants.exploreTrailWeightCap << "\n";
    file << "ants_exploreRandomWeight=" << ants.exploreRandomWeight << "\n";
    file << "ants_wanderMomentumWeight=" << ants.wanderMomentumWeight << "\n";
    file << "ants_momentumRetain=" << ants.momentumRetain << "\n";
    file << "ants_returnMomentumWeight=" << ants.returnMomentumWeight << "\n";
    file << "ants_exploreMomentumWeight=" << ants.exploreMomentumWeight << "\n";
    file << "ants_returnMomentumDamping=" << ants.returnMomentumDamping << "\n";
    file << "ants_avoidanceDistance=" << ants.avoidanceDistance << "\n";
    file << "ants_avoidanceWeight=" << ants.avoidanceWeight << "\n";
    file << "ants_collisionDistance=" << ants.collisionDistance << "\n";
    file << "ants_bounceFactor=" << ants.bounceFactor << "\n";
    file << "ants_maxSpeed=" << ants.maxSpeed << "\n";
    file << "ants_maxTurnRate=" << ants.maxTurnRate << "\n";
    file << "ants_exploreSpeed=" << ants.exploreSpeed << "\n";
    file << "ants_returnSpeed=" << ants.returnSpeed << "\n";
    file << "ants_acceleration=" << ants.acceleration << "\n";
    file << "ants_boundaryMargin=" << ants.boundaryMargin << "\n";
    file << "ants_boundaryRestitution=" << ants.boundaryRestitution << "\n";
    file << "ants_homeDeposit=" << ants.homeDeposit << "\n";
    file << "ants_foodDeposit=" << ants.foodDeposit << "\n";
    file << "ants_pathPointSpacing=" << ants.pathPointSpacing << "\n";
    file << "ants_pathCapacity=" << ants.pathCapacity << "\n";
    file << "ants_pickupReinforcement=" << ants.pickupReinforcement << "\n";
    file << "ants_deliveryReinforcement=" << ants.deliveryReinforcement << "\n";
    file << "ants_mortal=" << (ants.mortal ? 1 : 0) << "\n";
    file << "ants_lifespanTicks=" << ants.lifespanTicks << "\n";
    file << "ants_lifespanJitterTicks=" << ants.lifespanJitterTicks << "\n";
    file << "ants_energyDecay=" << ants.energyDecay << "\n";

    file << "# arena layout\n";
    file << "layout_obstacleCount=" << layout.obstacleCount << "\n";
    file << "layout_obstacleMinRadius=" << layout.obstacleMinRadius << "\n";
    file << "layout_obstacleMaxRadius=" << layout.obstacleMaxRadius << "\n";
    file << "layout_obstacleIrregularity=" << layout.obstacleIrregularity << "\n";
    file << "layout_obstacleVertices=" << layout.obstacleVertices << "\n";
    file << "layout_minFoodSources=" << layout.minFoodSources << "\n";
    file << "layout_maxFoodSources=" << layout.maxFoodSources << "\n";
    file << "layout_minFoodAmount=" << layout.minFoodAmount << "\n";
    file << "layout_maxFoodAmount=" << layout.maxFoodAmount << "\n";
    file << "layout_nestRadius=" << layout.nestRadius << "\n";
    file << "layout_nestClearance=" << layout.nestClearance << "\n";

    return true;
}

bool SimulationSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    bool sawMaintenance = false;
    int lineNumber = 0;
    std::string line;
    while (std::getline(file, line))
    {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
        {
            std::cerr << "Warning: " << filename << ":" << lineNumber << " has no '=', skipped" << std::endl;
            continue;
        }

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        try
        {
            // basic settings
            if (key == "stepsPerFrame")
                stepsPerFrame = std::stoi(value);
            else if (key == "width")
                width = std::stoi(value);
            else if (key == "height")
                height = std::stoi(value);
            else if (key == "numAnts")
                numAnts = std::stoi(value);
            else if (key == "seed")
                seed = static_cast<std::uint32_t>(std::stoul(value));
            else if (key == "cellSize")
                cellSize = std::stof(value);
            else if (key == "evaporationRate")
                evaporationRate = std::stof(value);
            else if (key == "displayThreshold")
                displayThreshold = std::stof(value);
            else if (key == "populationMaintenance")
            {
                populationMaintenance = (std::stoi(value) != 0);
                sawMaintenance = true;
            }
            else if (key == "replenishFood")
                replenishFood = (std::stoi(value) != 0);
            else if (key == "verbose")
                verbose = (std::stoi(value) != 0);
            // ant settings
            else if (key.find("ants_") == 0)
            {
                std::string property = key.substr(5);
                if (property == "sensorRange")
                    ants.sensorRange = std::stof(value);
                else if (property == "sensorNoise")
                    ants.sensorNoise = std::stof(value);
                else if (property == "sensorSpreadDegrees")
                    ants.sensorSpreadDegrees = std::stof(value);
                else if (property == "sensorStepDegrees")
                    ants.sensorStepDegrees = std::stof(value);
                else if (property == "detectionThreshold")
                    ants.detectionThreshold = std::stof(value);
                else if (property == "visualRange")
                    ants.visualRange = std::stof(value);
                else if (property == "nestApproachRadius")
                    ants.nestApproachRadius = std::stof(value);
                else if (property == "returnTrailWeightCap")
                    ants.returnTrailWeightCap = std::stof(value);
                else if (property == "returnHomingWeight")
                    ants.returnHomingWeight = std::stof(value);
                else if (property == "exploreTrailWeightCap")
                    ants.exploreTrailWeightCap = std::stof(value);
                else if (property == "exploreRandomWeight")
                    ants.exploreRandomWeight = std::stof(value);
                else if (property == "wanderMomentumWeight")
                    ants.wanderMomentumWeight = std::stof(value);
                else if (property == "momentumRetain")
                    ants.momentumRetain = std::stof(value);
                else if (property == "returnMomentumWeight")
                    ants.returnMomentumWeight = std::stof(value);
                else if (property == "exploreMomentumWeight")
                    ants.exploreMomentumWeight = std::stof(value);
                else if (property == "returnMomentumDamping")
                    ants.returnMomentumDamping = std::stof(value);
                else if (property == "avoidanceDistance")
                    ants.avoidanceDistance = std::stof(value);
                else if (property == "avoidanceWeight")
                    ants.avoidanceWeight = std::stof(value);
                else if (property == "collisionDistance")
                    ants.collisionDistance = std::stof(value);
                else if (property == "bounceFactor")
                    ants.bounceFactor = std::stof(value);
                else if (property == "maxSpeed")
                    ants.maxSpeed = std::stof(value);
                else if (property == "maxTurnRate")
                    ants.maxTurnRate = std::stof(value);
                else if (property == "exploreSpeed")
                    ants.exploreSpeed = std::stof(value);
                else if (property == "returnSpeed")
                    ants.returnSpeed = std::stof(value);
                else if (property == "acceleration")
                    ants.acceleration = std::stof(value);
                else if (property == "boundaryMargin")
                    ants.boundaryMargin = std::stof(value);
                else if (property == "boundaryRestitution")
                    ants.boundaryRestitution = std::stof(value);
                else if (property == "homeDeposit")
                    ants.homeDeposit = std::stof(value);
                else if (property == "foodDeposit")
                    ants.foodDeposit = std::stof(value);
                else if (property == "pathPointSpacing")
                    ants.pathPointSpacing = std::stof(value);
                else if (property == "pathCapacity")
                    ants.pathCapacity = std::stoi(value);
                else if (property == "pickupReinforcement")
                    ants.pickupReinforcement = std::stof(value);
                else if (property == "deliveryReinforcement")
                    ants.deliveryReinforcement = std::stof(value);
                else if (property == "mortal")
                    ants.mortal = (std::stoi(value) != 0);
                else if (property == "lifespanTicks")
                    ants.lifespanTicks = std::stof(value);
                else if (property == "lifespanJitterTicks")
                    ants.lifespanJitterTicks = std::stof(value);
                else if (property == "energyDecay")
                    ants.energyDecay = std::stof(value);
            }
            // layout settings
            else if (key.find("layout_") == 0)
            {
                std::string property = key.substr(7);
                if (property == "obstacleCount")
                    layout.obstacleCount = std::stoi(value);
                else if (property == "obstacleMinRadius")
                    layout.obstacleMinRadius = std::stof(value);
                else if (property == "obstacleMaxRadius")
                    layout.obstacleMaxRadius = std::stof(value);
                else if (property == "obstacleIrregularity")
                    layout.obstacleIrregularity = std::stof(value);
                else if (property == "obstacleVertices")
                    layout.obstacleVertices = std::stoi(value);
                else if (property == "minFoodSources")
                    layout.minFoodSources = std::stoi(value);
                else if (property == "maxFoodSources")
                    layout.maxFoodSources = std::stoi(value);
                else if (property == "minFoodAmount")
                    layout.minFoodAmount = std::stoi(value);
                else if (property == "maxFoodAmount")
                    layout.maxFoodAmount = std::stoi(value);
                else if (property == "nestRadius")
                    layout.nestRadius = std::stof(value);
                else if (property == "nestClearance")
                    layout.nestClearance = std::stof(value);
            }
        }
        catch (const std::exception &e)
        {
            // stoi/stof throw invalid_argument or out_of_range
            std::cerr << "Warning: " << filename << ":" << lineNumber << " bad value for '" << key
                      << "' (" << e.what() << "), skipped" << std::endl;
        }
    }

    // respawning only makes sense when ants can die
    if (!sawMaintenance)
        populationMaintenance = ants.mortal;

    validateAndClamp();
    return true;
}

void SimulationSettings::validateAndClamp()
{
    stepsPerFrame = std::clamp(stepsPerFrame, 1, 100);
    width = std::clamp(width, 200, 4096);
    height = std::clamp(height, 200, 4096);
    numAnts = std::clamp(numAnts, 0, 20000);
    cellSize = std::clamp(cellSize, 1.0f, 50.0f);
    evaporationRate = std::clamp(evaporationRate, 0.0f, 1.0f);
    displayThreshold = std::clamp(displayThreshold, 0.0f, 1000.0f);

    ants.sensorRange = std::max(1.0f, ants.sensorRange);
    ants.sensorNoise = std::clamp(ants.sensorNoise, 0.0f, 1.0f);
    ants.sensorSpreadDegrees = std::clamp(ants.sensorSpreadDegrees, 0.0f, 180.0f);
    ants.sensorStepDegrees = std::clamp(ants.sensorStepDegrees, 1.0f, 180.0f);
    ants.detectionThreshold = std::max(0.0f, ants.detectionThreshold);
    ants.visualRange = std::max(0.0f, ants.visualRange);
    ants.nestApproachRadius = std::max(1.0f, ants.nestApproachRadius);
    ants.avoidanceDistance = std::max(0.0f, ants.avoidanceDistance);
    ants.collisionDistance = std::max(0.0f, ants.collisionDistance);
    ants.bounceFactor = std::clamp(ants.bounceFactor, 0.1f, 5.0f);
    ants.maxSpeed = std::max(0.1f, ants.maxSpeed);
    ants.maxTurnRate = std::clamp(ants.maxTurnRate, 0.01f, 3.14159265f);
    ants.exploreSpeed = std::clamp(ants.exploreSpeed, 0.1f, ants.maxSpeed * 1.5f);
    ants.returnSpeed = std::clamp(ants.returnSpeed, 0.1f, ants.maxSpeed * 1.5f);
    ants.acceleration = std::max(0.001f, ants.acceleration);
    ants.boundaryMargin = std::max(0.0f, ants.boundaryMargin);
    ants.boundaryRestitution = std::clamp(ants.boundaryRestitution, 0.0f, 1.0f);
    ants.homeDeposit = std::max(0.0f, ants.homeDeposit);
    ants.foodDeposit = std::max(0.0f, ants.foodDeposit);
    ants.pathPointSpacing = std::max(1.0f, ants.pathPointSpacing);
    ants.pathCapacity = std::clamp(ants.pathCapacity, 1, 10000);
    ants.lifespanTicks = std::max(1.0f, ants.lifespanTicks);
    ants.lifespanJitterTicks = std::clamp(ants.lifespanJitterTicks, 0.0f, ants.lifespanTicks);
    ants.energyDecay = std::max(0.0f, ants.energyDecay);

    // the margin must leave room to move in both directions
    float smallest = static_cast<float>(std::min(width, height));
    ants.boundaryMargin = std::min(ants.boundaryMargin, smallest * 0.25f);

    layout.obstacleCount = std::clamp(layout.obstacleCount, 0, 200);
    layout.obstacleMinRadius = std::clamp(layout.obstacleMinRadius, 5.0f, 500.0f);
    layout.obstacleMaxRadius = std::clamp(layout.obstacleMaxRadius, layout.obstacleMinRadius, 500.0f);
    layout.obstacleIrregularity = std::clamp(layout.obstacleIrregularity, 0.0f, 0.9f);
    layout.obstacleVertices = std::clamp(layout.obstacleVertices, 3, 128);
    layout.minFoodSources = std::clamp(layout.minFoodSources, 0, 50);
    layout.maxFoodSources = std::clamp(layout.maxFoodSources, layout.minFoodSources, 50);
    layout.minFoodAmount = std::clamp(layout.minFoodAmount, 1, 100000);
    layout.maxFoodAmount = std::clamp(layout.maxFoodAmount, layout.minFoodAmount, 100000);
    layout.nestRadius = std::clamp(layout.nestRadius, 5.0f, 200.0f);
    layout.nestClearance = std::max(0.0f, layout.nestClearance);
}
