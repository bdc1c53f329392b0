#pragma once
#include <array>

using Rgb = std::array<double, 3>;

inline bool IsUnitRgb(const Rgb& c)
{
    for (double v : c)
        if (!(v >= 0.0 && v <= 1.0)) return false;
    return true;
}
