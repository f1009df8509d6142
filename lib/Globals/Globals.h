#pragma once

#include <Arduino.h>

// === Logging ===
// PF/PL write straight to the serial port, the LOG_* family is filtered by level.

#define PF(...) Serial.printf(__VA_ARGS__)
#define PL(x)   Serial.println(x)

#define STABLECOLOR_LOG_LEVEL_NONE  0
#define STABLECOLOR_LOG_LEVEL_ERROR 1
#define STABLECOLOR_LOG_LEVEL_WARN  2
#define STABLECOLOR_LOG_LEVEL_INFO  3
#define STABLECOLOR_LOG_LEVEL_DEBUG 4

#ifndef STABLECOLOR_LOG_LEVEL
#define STABLECOLOR_LOG_LEVEL STABLECOLOR_LOG_LEVEL_INFO
#endif

#if STABLECOLOR_LOG_LEVEL >= STABLECOLOR_LOG_LEVEL_ERROR
#define LOG_ERROR(...) do { Serial.print("E "); PF(__VA_ARGS__); } while (0)
#else
#define LOG_ERROR(...) do {} while (0)
#endif

#if STABLECOLOR_LOG_LEVEL >= STABLECOLOR_LOG_LEVEL_WARN
#define LOG_WARN(...) do { Serial.print("W "); PF(__VA_ARGS__); } while (0)
#else
#define LOG_WARN(...) do {} while (0)
#endif

#if STABLECOLOR_LOG_LEVEL >= STABLECOLOR_LOG_LEVEL_INFO
#define LOG_INFO(...) do { Serial.print("I "); PF(__VA_ARGS__); } while (0)
#else
#define LOG_INFO(...) do {} while (0)
#endif

#if STABLECOLOR_LOG_LEVEL >= STABLECOLOR_LOG_LEVEL_DEBUG
#define LOG_DEBUG(...) do { Serial.print("D "); PF(__VA_ARGS__); } while (0)
#else
#define LOG_DEBUG(...) do {} while (0)
#endif

// === Defaults ===

#ifndef STABLECOLOR_DEFAULT_STABILITY
#define STABLECOLOR_DEFAULT_STABILITY 20           // samples in the rolling window
#endif

#ifndef STABLECOLOR_DEFAULT_SAMPLE_FREQUENCY_HZ
#define STABLECOLOR_DEFAULT_SAMPLE_FREQUENCY_HZ 10.0f
#endif

#ifndef STABLECOLOR_DEFAULT_STABILITY_THRESHOLD
#define STABLECOLOR_DEFAULT_STABILITY_THRESHOLD 3.0f  // max stdev of the running averages
#endif

#ifndef STABLECOLOR_DEFAULT_SCAN_FREQUENCY_HZ
#define STABLECOLOR_DEFAULT_SCAN_FREQUENCY_HZ 10.0f
#endif

#define SECONDS_TICK 1000
