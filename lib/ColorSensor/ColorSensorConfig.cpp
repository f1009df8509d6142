#include "ColorSensorConfig.h"

#include <cmath>

bool ColorSensorConfig::isValid() const {
    if (stability < 1) {
        return false;
    }
    if (!std::isfinite(sampleFrequencyHz) || sampleFrequencyHz < 0.0f) {
        return false;
    }
    if (!std::isfinite(stabilityThreshold) || stabilityThreshold <= 0.0f) {
        return false;
    }
    return true;
}
