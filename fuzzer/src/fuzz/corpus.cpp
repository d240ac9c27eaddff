#include "corpus.hpp"

#include <stdexcept>

namespace sqlmut
{
namespace fuzz
{

Corpus::Corpus(const std::vector<std::string> &seeds)
    : seeds(seeds),
      population(seeds),
      seed_cursor(0)
{
}

void Corpus::Add(const std::string &entry)
{
    this->population.push_back(entry);
}

const std::string *Corpus::Get(size_t i) const
{
    if (i >= this->population.size())
    {
        return nullptr;
    }
    return &this->population[i];
}

const std::string &Corpus::Pick(RandomSource &random) const
{
    return random.Pick(this->population);
}

bool Corpus::HasPendingSeed() const
{
    return this->seed_cursor < this->seeds.size();
}

const std::string &Corpus::NextSeed()
{
    if (!this->HasPendingSeed())
    {
        throw std::out_of_range("all seeds were already dispensed");
    }
    return this->seeds[this->seed_cursor++];
}

void Corpus::Reset()
{
    this->population = this->seeds;
    this->seed_cursor = 0;
}

CorpusState Corpus::State() const
{
    return this->HasPendingSeed() ? CorpusState::kSeeding : CorpusState::kMutating;
}

size_t Corpus::Size() const
{
    return this->population.size();
}

size_t Corpus::SeedCount() const
{
    return this->seeds.size();
}

size_t Corpus::SeedCursor() const
{
    return this->seed_cursor;
}

}
}
