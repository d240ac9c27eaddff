#include "random-source.hpp"

namespace sqlmut
{
namespace fuzz
{

RandomSource::RandomSource()
    : rng(std::random_device{}())
{
}

RandomSource::RandomSource(uint64_t seed)
    : rng(seed)
{
}

void RandomSource::Seed(uint64_t seed)
{
    this->rng.seed(seed);
}

int64_t RandomSource::Between(int64_t lo, int64_t hi)
{
    std::uniform_int_distribution<int64_t> pick(lo, hi);
    return pick(this->rng);
}

size_t RandomSource::Index(size_t n)
{
    std::uniform_int_distribution<size_t> pick(0, n - 1);
    return pick(this->rng);
}

bool RandomSource::Chance(double p)
{
    std::bernoulli_distribution coin(p);
    return coin(this->rng);
}

}
}
