#include "to_string.hh"

#include <clean-ring/macros.hh>

std::string cr::to_string(sequence_direction dir)
{
    switch (dir)
    {
    case sequence_direction::original:
        return "original";
    case sequence_direction::reverse:
        return "reverse";
    }
    CR_BUILTIN_UNREACHABLE;
}
