#ifndef COLOR_SCANNER_H
#define COLOR_SCANNER_H

#include "ColorSpec.h"
#include "ColorTypes.h"
#include "Globals.h"

class ColorSensorController;

/**
 * @brief Calibration pass that derives a ColorSpec from observed stable colors
 *
 * While running, every tick reads the controller's stable color and widens a
 * per-channel min/max range. The off color {0,0,0} is skipped completely.
 * Ticks come from TimerManager; update() may also be called directly.
 */
class ColorScanner {
public:
    /**
     * @brief Constructor
     * @param controller Source of the stable color; must outlive the scanner
     */
    explicit ColorScanner(ColorSensorController& controller);
    ~ColorScanner();

    ColorScanner(const ColorScanner&) = delete;
    ColorScanner& operator=(const ColorScanner&) = delete;

    /**
     * @brief Reset the accumulated range and start ticking
     * @param frequencyHz Tick rate; values <= 0 select the default of 10 Hz
     * @return false if the tick timer could not be scheduled
     *
     * The first tick happens immediately.
     */
    bool start(float frequencyHz = STABLECOLOR_DEFAULT_SCAN_FREQUENCY_HZ);

    /**
     * @brief Stop accumulating; the timer is released on its next tick
     */
    void stop();

    /**
     * @brief Take one scan sample (timer callback)
     */
    void update();

    /**
     * @brief Derive the color spec covering everything seen so far
     * @param out value = round((max+min)/2), tolerance = round(max - (max+min)/2)
     * @return false when no sample was accepted; out is then the all-zero spec
     *
     * The tolerance is measured from the midpoint, so a single observed value
     * yields tolerance 0.
     */
    bool getColorSpec(ColorSpec& out) const;

    /**
     * @brief Number of non-off samples accumulated
     */
    uint32_t getCount() const;

    bool isRunning() const;

private:
    struct ChannelRange {
        int min;
        int max;
    };

    static void trampoline(void* context);
    void resetRange();

    ColorSensorController& _controller;
    bool _enabled;
    uint32_t _count;
    ChannelRange _r;
    ChannelRange _g;
    ChannelRange _b;
};

#endif // COLOR_SCANNER_H
