#include "Nest.h"
#include <algorithm>

Nest::Nest(const sf::Vector2f &position, float radius, int maxCapacity)
    : position_(position), radius_(std::max(radius, 1.0f)), maxCapacity_(std::max(maxCapacity, 0))
{
}

bool Nest::refuseIfFull()
{
    if (foodStored_ >= maxCapacity_)
        isFull_ = true;
    return isFull_;
}

// exponential moving average of delivery quality
void Nest::recordEfficiency(float sample)
{
    efficiency_ = std::clamp(efficiency_ * 0.95f + sample * 0.05f, 0.0f, 2.0f);
}

int Nest::store(int units)
{
    if (units <= 0 || isFull_)
        return 0;

    int before = foodStored_;
    foodStored_ += units;
    if (foodStored_ >= maxCapacity_)
    {
        foodStored_ = maxCapacity_;
        isFull_ = true;
    }
    return foodStored_ - before;
}

void Nest::setCapacity(int capacity)
{
    maxCapacity_ = std::max(capacity, 0);
    // shrinking below the current store keeps the invariant
    if (foodStored_ > 0 && foodStored_ >= maxCapacity_)
    {
        foodStored_ = maxCapacity_;
        isFull_ = true;
    }
}

void Nest::reset()
{
    foodStored_ = 0;
    isFull_ = false;
    efficiency_ = 1.0f;
}

float Nest::fillFraction() const
{
    if (maxCapacity_ <= 0)
        return isFull_ ? 1.0f : 0.0f;
    return static_cast<float>(foodStored_) / static_cast<float>(maxCapacity_);
}
