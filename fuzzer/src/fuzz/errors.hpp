// errors.hpp
//
// Author: Robert McLaughlin <robert349@ucsb.edu>
//
// Exceptions raised by the mutation engine.
//

#pragma once

#include <stdexcept>
#include <string>

namespace sqlmut
{
namespace fuzz
{

/**
 * Raised when an engine or operator registry is constructed
 * with settings that would make candidate creation undefined.
 */
class InvalidConfiguration : public std::invalid_argument
{
public:
    explicit InvalidConfiguration(const std::string &what)
        : std::invalid_argument(what)
    {}
};

}
}
