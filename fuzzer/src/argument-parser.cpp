#include <cstdlib>
#include <string>
#include <iostream>

#include "argument-parser.hpp"
#include "cxxopts.hpp"
#include "flags.hpp"
#include "version.hpp"
#include "util.hpp"

using namespace std;

namespace sqlmut
{

ParsedArguments ParsedArguments::Parse(int argc, char **argv)
{
    ParsedArguments ret;

    cxxopts::Options options(argv[0], "Mutation-based fuzz input generator for SQL-like text");
    options.add_options()
        ("v,version", "Print version", cxxopts::value<bool>()->default_value("false"))
        ("textseed", "Text seeds for the fuzzer, separated by |||", cxxopts::value<std::string>()->default_value(""))
        ("n,count", "How many candidates to print", cxxopts::value<uint64_t>()->default_value("100"))
        ("min", "Minimum mutations per candidate", cxxopts::value<int32_t>()->default_value("2"))
        ("max", "Maximum mutations per candidate", cxxopts::value<int32_t>()->default_value("10"))
        ("m,mode", "Operators to use: generic, sql, or combined", cxxopts::value<std::string>()->default_value("generic"))
        ("s,seed", "Seed for random number generator", cxxopts::value<uint64_t>()->default_value("0"))
        ("raw", "Print candidates without escaping", cxxopts::value<bool>()->default_value("false"))
        ("debug", "Enable debug mode", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "Print help", cxxopts::value<bool>()->default_value("false"));

    cxxopts::ParseResult parsed = options.parse(argc, argv);

    if (parsed["help"].as<bool>())
    {
        std::cout << options.help() << std::endl;
        exit(0);
    }

    if (parsed["version"].as<bool>())
    {
        std::cout << "sqlmut v" << SQLMUT_VERSION << std::endl;
        exit(0);
    }

    sqlmut::flags::FLAG_debug = parsed["debug"].as<bool>();

    ret.seeds = split_on(parsed["textseed"].as<std::string>(), "|||");
    if (ret.seeds.size() == 0)
    {
        std::cerr << "ERROR: at least one --textseed is required" << std::endl;
        std::cerr << std::endl;
        std::cerr << options.help() << std::endl;
        exit(1);
    }

    if (sqlmut::flags::FLAG_debug)
    {
        for (const std::string &seed : ret.seeds)
        {
            std::cout << "DEBUG using text seed: " << escape_for_display(seed) << std::endl;
        }
    }

    ret.count = parsed["count"].as<uint64_t>();
    ret.min_mutations = parsed["min"].as<int32_t>();
    ret.max_mutations = parsed["max"].as<int32_t>();

    if (ret.min_mutations < 0 || ret.max_mutations < ret.min_mutations)
    {
        std::cerr << "ERROR: mutation bounds must satisfy 0 <= min <= max" << std::endl;
        std::cerr << std::endl;
        std::cerr << options.help() << std::endl;
        exit(1);
    }

    ret.mode = parsed["mode"].as<std::string>();
    if (ret.mode != "generic" && ret.mode != "sql" && ret.mode != "combined")
    {
        std::cerr << "ERROR: unknown mode argument: " << ret.mode << std::endl;
        exit(1);
    }

    ret.raw = parsed["raw"].as<bool>();

    ret.rng_seed = parsed["seed"].as<uint64_t>();
    if (ret.rng_seed > 0 && sqlmut::flags::FLAG_debug)
    {
        std::cout << "DEBUG Seeding random number generator with " << ret.rng_seed << std::endl;
    }

    return ret;
}

}
