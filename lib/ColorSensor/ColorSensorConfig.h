#pragma once

#include <Arduino.h>

#include "Globals.h"

struct ColorSensorConfig {
    // samples whose running averages must agree before a new stable color is accepted
    uint16_t stability = STABLECOLOR_DEFAULT_STABILITY;
    // 0 = sample only inside getColor(); > 0 = sample on a timer at this rate
    float sampleFrequencyHz = STABLECOLOR_DEFAULT_SAMPLE_FREQUENCY_HZ;
    // per-channel standard deviation of the running averages that still counts as stable
    float stabilityThreshold = STABLECOLOR_DEFAULT_STABILITY_THRESHOLD;

    // Every sample is stable immediately and nothing runs in the background.
    static ColorSensorConfig onDemand() {
        ColorSensorConfig config;
        config.stability = 1;
        config.sampleFrequencyHz = 0.0f;
        return config;
    }

    bool isValid() const;
};
