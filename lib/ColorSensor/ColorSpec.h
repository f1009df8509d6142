#pragma once

#include "ColorTypes.h"

// Inclusive range [value - tolerance, value + tolerance] on one channel.
struct ToleranceChannel {
    int value = 0;
    int tolerance = 0;

    ToleranceChannel() = default;
    ToleranceChannel(int v, int tol) : value(v), tolerance(tol) {}

    bool contains(int channel) const {
        return channel >= value - tolerance && channel <= value + tolerance;
    }
};

/**
 * @brief Tolerance region ("color spec") used to classify a color
 *
 * A plain value: built explicitly by the caller or derived from a scan.
 * Registering handlers for it goes through ColorSensorController::newSpec().
 */
struct ColorSpec {
    ToleranceChannel r;
    ToleranceChannel g;
    ToleranceChannel b;

    ColorSpec() = default;
    ColorSpec(const ToleranceChannel& red, const ToleranceChannel& green, const ToleranceChannel& blue)
        : r(red), g(green), b(blue) {}

    /**
     * @brief Check whether a color falls inside the region
     * @return true when every channel lies within value +/- tolerance (both ends inclusive)
     */
    bool isMatch(const Color& color) const {
        return r.contains(color.r) && g.contains(color.g) && b.contains(color.b);
    }
};

inline bool operator==(const ToleranceChannel& a, const ToleranceChannel& b) {
    return a.value == b.value && a.tolerance == b.tolerance;
}

inline bool operator!=(const ToleranceChannel& a, const ToleranceChannel& b) {
    return !(a == b);
}

inline bool operator==(const ColorSpec& a, const ColorSpec& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const ColorSpec& a, const ColorSpec& b) {
    return !(a == b);
}

// Handle under which a spec is known to the event registry; 0 = not registered.
typedef uint16_t SpecId;
constexpr SpecId kNoSpecId = 0;
