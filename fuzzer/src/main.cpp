#include <iostream>
#include <cstdint>

#include "argument-parser.hpp"
#include "flags.hpp"
#include "util.hpp"
#include "fuzz/errors.hpp"
#include "fuzz/mutation-engine.hpp"

namespace f = sqlmut::flags;
namespace fz = sqlmut::fuzz;


int main(int argc, char* argv[])
{
    // Read and store our arguments.
    sqlmut::ParsedArguments args = sqlmut::ParsedArguments::Parse(argc, argv);

    fz::RandomSource random;
    if (args.rng_seed > 0)
    {
        random.Seed(args.rng_seed);
    }

    try
    {
        fz::MutationEngine engine(
            args.seeds,
            args.min_mutations,
            args.max_mutations,
            random,
            fz::Registry::Named(args.mode)
        );

        if (f::FLAG_debug)
        {
            std::cout << "DEBUG Using " << engine.GetRegistry().Size() << " operators:";
            for (fz::Operator op : engine.GetRegistry().Operators())
            {
                std::cout << " " << fz::OperatorName(op);
            }
            std::cout << std::endl;
        }

        for (uint64_t i = 0; i < args.count; i++)
        {
            std::string candidate = engine.ProduceNext();
            if (args.raw)
            {
                std::cout << candidate << "\n";
            }
            else
            {
                std::cout << sqlmut::escape_for_display(candidate) << "\n";
            }
        }
        std::cout << std::flush;
    }
    catch (const fz::InvalidConfiguration &e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
