#include "ColorStatistics.h"
#include "Globals.h"

#include <cmath>

namespace {

template <typename T>
bool averageOf(const std::vector<T>& colors, ColorF& out) {
    if (colors.empty()) {
        LOG_ERROR("[ColorStatistics] average of an empty color list\n");
        return false;
    }

    ColorF sum;
    for (const T& c : colors) {
        sum.r += c.r;
        sum.g += c.g;
        sum.b += c.b;
    }
    const double n = static_cast<double>(colors.size());
    out = ColorF(sum.r / n, sum.g / n, sum.b / n);
    return true;
}

template <typename T>
bool standardDeviationOf(const std::vector<T>& colors, ColorF& out) {
    if (colors.empty()) {
        LOG_ERROR("[ColorStatistics] standardDeviation of an empty color list\n");
        return false;
    }

    ColorF avg;
    if (!averageOf(colors, avg)) {
        return false;
    }

    ColorF sumOfDiffsSquared;
    for (const T& c : colors) {
        sumOfDiffsSquared.r += (avg.r - c.r) * (avg.r - c.r);
        sumOfDiffsSquared.g += (avg.g - c.g) * (avg.g - c.g);
        sumOfDiffsSquared.b += (avg.b - c.b) * (avg.b - c.b);
    }
    const double n = static_cast<double>(colors.size());
    out = ColorF(std::sqrt(sumOfDiffsSquared.r / n),
                 std::sqrt(sumOfDiffsSquared.g / n),
                 std::sqrt(sumOfDiffsSquared.b / n));
    return true;
}

} // namespace

namespace ColorStatistics {

bool average(const std::vector<Color>& colors, ColorF& out) {
    return averageOf(colors, out);
}

bool average(const std::vector<ColorF>& colors, ColorF& out) {
    return averageOf(colors, out);
}

bool standardDeviation(const std::vector<Color>& colors, ColorF& out) {
    return standardDeviationOf(colors, out);
}

bool standardDeviation(const std::vector<ColorF>& colors, ColorF& out) {
    return standardDeviationOf(colors, out);
}

int roundChannel(double value) {
    return static_cast<int>(std::floor(value + 0.5));
}

Color roundColor(const ColorF& color) {
    return Color(roundChannel(color.r), roundChannel(color.g), roundChannel(color.b));
}

}
