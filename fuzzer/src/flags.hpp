// flags.hpp
//
// Author: Robert McLaughlin <robert349@ucsb.edu>
//
// Makes global flags available

#pragma once

#include <cstdint>

namespace sqlmut
{
namespace flags
{

/**
 * Enables debug output
 */
extern bool FLAG_debug;

}
}
