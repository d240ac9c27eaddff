#include "mutation-engine.hpp"

#include "errors.hpp"
#include "flags.hpp"

#include <iostream>
#include <sstream>
#include <utility>

namespace f = sqlmut::flags;

namespace sqlmut
{
namespace fuzz
{

/**
 * Rejects settings under which CreateCandidate() is undefined.
 * Runs before any member is constructed.
 */
static const std::vector<std::string> &validated(
    const std::vector<std::string> &seeds,
    int32_t min_mutations,
    int32_t max_mutations)
{
    if (seeds.empty())
    {
        throw InvalidConfiguration("seed list must not be empty");
    }

    if (min_mutations < 0)
    {
        std::ostringstream msg;
        msg << "min_mutations must be non-negative, got " << min_mutations;
        throw InvalidConfiguration(msg.str());
    }

    if (max_mutations < min_mutations)
    {
        std::ostringstream msg;
        msg << "max_mutations (" << max_mutations << ") is less than min_mutations ("
            << min_mutations << ")";
        throw InvalidConfiguration(msg.str());
    }

    return seeds;
}

MutationEngine::MutationEngine(
    const std::vector<std::string> &seeds,
    int32_t min_mutations,
    int32_t max_mutations,
    RandomSource random,
    Registry registry)
    : corpus(validated(seeds, min_mutations, max_mutations)),
      min_mutations(min_mutations),
      max_mutations(max_mutations),
      random(std::move(random)),
      registry(std::move(registry))
{
}

std::string MutationEngine::ProduceNext()
{
    if (this->corpus.HasPendingSeed())
    {
        this->last_input = this->corpus.NextSeed();

        if (f::FLAG_debug && !this->corpus.HasPendingSeed())
        {
            std::cout << "DEBUG all " << this->corpus.SeedCount()
                      << " seeds dispensed, now mutating" << std::endl;
        }
    }
    else
    {
        this->last_input = this->CreateCandidate();
    }
    return this->last_input;
}

std::string MutationEngine::CreateCandidate()
{
    std::string candidate = this->corpus.Pick(this->random);
    int64_t trials = this->random.Between(this->min_mutations, this->max_mutations);

    for (int64_t i = 0; i < trials; i++)
    {
        candidate = this->Mutate(candidate);
    }

    return candidate;
}

std::string MutationEngine::Mutate(const std::string &input)
{
    return this->registry.Mutate(input, this->random);
}

void MutationEngine::AddSeed(const std::string &candidate)
{
    this->corpus.Add(candidate);

    if (f::FLAG_debug)
    {
        std::cout << "DEBUG new seed has been added to the corpus (size="
                  << this->corpus.Size() << ")" << std::endl;
    }
}

void MutationEngine::Reset()
{
    this->corpus.Reset();
    this->last_input.clear();
}

void MutationEngine::SetRegistry(const Registry &registry)
{
    this->registry = registry;
}

}
}
