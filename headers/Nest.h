#pragma once
#include <SFML/System/Vector2.hpp>

// capacity bounded food store the colony delivers into
class Nest
{
public:
    Nest(const sf::Vector2f &position = {0.0f, 0.0f}, float radius = 40.0f, int maxCapacity = 0);

    // true (and marks full) when there is no room for another delivery
    bool refuseIfFull();
    void recordEfficiency(float sample);
    // returns the units actually kept, capped at the remaining room
    int store(int units);

    void moveTo(const sf::Vector2f &position) { position_ = position; }
    void setCapacity(int capacity);
    void reset();

    // accessors
    const sf::Vector2f &getPosition() const { return position_; }
    float getRadius() const { return radius_; }
    int getFoodStored() const { return foodStored_; }
    int getMaxCapacity() const { return maxCapacity_; }
    bool isFull() const { return isFull_; }
    float getEfficiency() const { return efficiency_; }
    float fillFraction() const;

private:
    sf::Vector2f position_;
    float radius_;
    int foodStored_ = 0;
    int maxCapacity_;
    bool isFull_ = false; // sticky until reset()
    float efficiency_ = 1.0f;
};
