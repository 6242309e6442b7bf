#include "RandomSource.h"
#include "VectorMath.h"
#include <algorithm>

int RandomSource::rangeInt(int lo, int hi)
{
    if (hi <= lo)
        return lo;
    int span = hi - lo + 1;
    int offset = static_cast<int>(uniform() * static_cast<float>(span));
    // uniform() < 1 but float rounding can still land on span
    return lo + std::min(offset, span - 1);
}

sf::Vector2f RandomSource::unitVector()
{
    return vec::fromAngle(uniform() * 2.0f * PI_F);
}

MersenneRandom::MersenneRandom(std::uint32_t seed)
{
    reseed(seed);
}

float MersenneRandom::uniform()
{
    float u = dist_(gen_);
    // some standard libraries can return the upper bound for float distributions
    return u < 1.0f ? u : 0.0f;
}

void MersenneRandom::reseed(std::uint32_t seed)
{
    if (seed == 0)
    {
        std::random_device rd;
        seed = rd();
        if (seed == 0)
            seed = 1;
    }
    seed_ = seed;
    gen_.seed(seed_);
    dist_.reset();
}
