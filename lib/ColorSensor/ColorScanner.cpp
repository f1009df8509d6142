#include "ColorScanner.h"
#include "ColorSensorController.h"
#include "ColorStatistics.h"
#include "TimerManager.h"

#include <algorithm>

#ifndef COLOR_SCAN_DEBUG
#define COLOR_SCAN_DEBUG 0
#endif

#if COLOR_SCAN_DEBUG
#define SCAN_LOG(...) PF(__VA_ARGS__)
#else
#define SCAN_LOG(...) do {} while (0)
#endif

namespace {

ToleranceChannel deriveChannel(int min, int max) {
    const double mid = (max + min) / 2.0;
    return ToleranceChannel(ColorStatistics::roundChannel(mid),
                            ColorStatistics::roundChannel(max - mid));
}

} // namespace

ColorScanner::ColorScanner(ColorSensorController& controller)
    : _controller(controller),
      _enabled(false),
      _count(0) {
    resetRange();
}

ColorScanner::~ColorScanner() {
    TimerManager::instance().cancel(ColorScanner::trampoline, this);
}

void ColorScanner::trampoline(void* context) {
    static_cast<ColorScanner*>(context)->update();
}

void ColorScanner::resetRange() {
    _r = ChannelRange{255, 0};
    _g = ChannelRange{255, 0};
    _b = ChannelRange{255, 0};
}

bool ColorScanner::start(float frequencyHz) {
    if (!(frequencyHz > 0.0f)) {
        frequencyHz = STABLECOLOR_DEFAULT_SCAN_FREQUENCY_HZ;
    }

    _enabled = true;
    _count = 0;
    resetRange();
    LOG_INFO("[ColorScanner] Scan started at %.1f Hz\n", frequencyHz);

    update();

    const uint32_t periodMs = TimerManager::periodFromHz(frequencyHz);
    if (!TimerManager::instance().restart(periodMs, 0, ColorScanner::trampoline, this)) {
        LOG_WARN("[ColorScanner] Failed to schedule scan tick (%lu ms)\n", (unsigned long)periodMs);
        return false;
    }
    return true;
}

void ColorScanner::stop() {
    _enabled = false;
    LOG_INFO("[ColorScanner] Scan stopped after %lu samples\n", (unsigned long)_count);
}

void ColorScanner::update() {
    if (!_enabled) {
        TimerManager::instance().cancel(ColorScanner::trampoline, this);
        return;
    }

    Color c;
    if (!_controller.getColor(c)) {
        return;
    }

    // skip "off": it is a start-up value and would blow up the tolerances
    if (c.isOff()) {
        SCAN_LOG("[ColorScanner] off color skipped\n");
        return;
    }

    _r.min = std::min(_r.min, c.r);
    _g.min = std::min(_g.min, c.g);
    _b.min = std::min(_b.min, c.b);
    _r.max = std::max(_r.max, c.r);
    _g.max = std::max(_g.max, c.g);
    _b.max = std::max(_b.max, c.b);
    _count++;

    SCAN_LOG("[ColorScanner] #%lu (%d,%d,%d)\n", (unsigned long)_count, c.r, c.g, c.b);
}

bool ColorScanner::getColorSpec(ColorSpec& out) const {
    if (_count == 0) {
        LOG_WARN("[ColorScanner] No samples scanned; returning empty spec\n");
        out = ColorSpec();
        return false;
    }

    out = ColorSpec(deriveChannel(_r.min, _r.max),
                    deriveChannel(_g.min, _g.max),
                    deriveChannel(_b.min, _b.max));
    return true;
}

uint32_t ColorScanner::getCount() const {
    return _count;
}

bool ColorScanner::isRunning() const {
    return _enabled;
}
