#pragma once

#include <vector>

#include "ColorTypes.h"

namespace ColorStatistics {

// Channel-wise arithmetic mean. Returns false (and logs) on an empty list;
// out is left untouched in that case.
bool average(const std::vector<Color>& colors, ColorF& out);
bool average(const std::vector<ColorF>& colors, ColorF& out);

// Channel-wise population standard deviation (sum of squares divided by N).
bool standardDeviation(const std::vector<Color>& colors, ColorF& out);
bool standardDeviation(const std::vector<ColorF>& colors, ColorF& out);

// Rounds half up on every channel: 2.5 -> 3, -127.5 -> -127.
int roundChannel(double value);
Color roundColor(const ColorF& color);

}
