#pragma once

#include <Arduino.h>

// One RGB reading. Channels are 0..255 as delivered by the sensor; the range
// is not enforced here.
struct Color {
    int r = 0;
    int g = 0;
    int b = 0;

    Color() = default;
    Color(int red, int green, int blue) : r(red), g(green), b(blue) {}

    // {0,0,0} is what the sensor reports while it is off or still starting up.
    bool isOff() const { return r == 0 && g == 0 && b == 0; }
};

inline bool operator==(const Color& a, const Color& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const Color& a, const Color& b) {
    return !(a == b);
}

// Per-channel real values: running averages and deviations.
struct ColorF {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    ColorF() = default;
    ColorF(double red, double green, double blue) : r(red), g(green), b(blue) {}
    ColorF(const Color& c) : r(c.r), g(c.g), b(c.b) {}
};
