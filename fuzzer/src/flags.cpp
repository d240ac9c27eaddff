#include "flags.hpp"

namespace sqlmut
{
namespace flags
{

bool FLAG_debug = false;

}
}
