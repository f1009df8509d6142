#include "ColorStabilizer.h"
#include "ColorStatistics.h"

#ifndef COLOR_STABILIZER_DEBUG
#define COLOR_STABILIZER_DEBUG 0
#endif

#if COLOR_STABILIZER_DEBUG
#define CS_LOG(...) PF(__VA_ARGS__)
#else
#define CS_LOG(...) do {} while (0)
#endif

ColorStabilizer::ColorStabilizer(uint16_t stability, float threshold)
    : _stability(stability ? stability : 1),
      _threshold(threshold) {
    _rawColors.reserve(_stability);
    _avgColors.reserve(_stability);
}

bool ColorStabilizer::addSample(const Color& sample, bool& changed) {
    changed = false;

    _rawColors.push_back(sample);
    ColorF currAvg;
    if (!ColorStatistics::average(_rawColors, currAvg)) {
        _rawColors.pop_back();
        return false;
    }
    _avgColors.push_back(currAvg);

    // not enough data points yet to judge stability
    if (_avgColors.size() < _stability) {
        return true;
    }

    ColorF stdev;
    if (!ColorStatistics::standardDeviation(_avgColors, stdev)) {
        return false;
    }

    // round at the last moment to keep the statistical error small
    const Color rounded = ColorStatistics::roundColor(currAvg);
    Color next = _stableColor;
    if (stdev.r < _threshold) next.r = rounded.r;
    if (stdev.g < _threshold) next.g = rounded.g;
    if (stdev.b < _threshold) next.b = rounded.b;

    CS_LOG("[ColorStabilizer] avg=(%.2f,%.2f,%.2f) sd=(%.2f,%.2f,%.2f)\n",
           currAvg.r, currAvg.g, currAvg.b, stdev.r, stdev.g, stdev.b);

    evictOldest();

    if (next != _stableColor) {
        _stableColor = next;
        changed = true;
    }
    return true;
}

void ColorStabilizer::evictOldest() {
    const size_t keep = _stability - 1;
    if (_rawColors.size() > keep) {
        _rawColors.erase(_rawColors.begin(), _rawColors.begin() + (_rawColors.size() - keep));
    }
    if (_avgColors.size() > keep) {
        _avgColors.erase(_avgColors.begin(), _avgColors.begin() + (_avgColors.size() - keep));
    }
}

const Color& ColorStabilizer::stableColor() const {
    return _stableColor;
}

void ColorStabilizer::setStability(uint16_t stability) {
    _stability = stability ? stability : 1;
}

uint16_t ColorStabilizer::stability() const {
    return _stability;
}

void ColorStabilizer::setThreshold(float threshold) {
    _threshold = threshold;
}

float ColorStabilizer::threshold() const {
    return _threshold;
}

size_t ColorStabilizer::windowSize() const {
    return _rawColors.size();
}

void ColorStabilizer::reset() {
    _rawColors.clear();
    _avgColors.clear();
    _stableColor = Color();
}
