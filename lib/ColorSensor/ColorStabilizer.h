#ifndef COLOR_STABILIZER_H
#define COLOR_STABILIZER_H

#include <vector>

#include "ColorTypes.h"
#include "Globals.h"

/**
 * @brief Debounces raw sensor readings into a "stable color"
 *
 * Keeps a sliding window of raw samples and the running average taken after
 * each of them. Once the window holds `stability` averages, a channel of the
 * stable color follows the running average only while the standard deviation
 * of those averages stays below the threshold; otherwise that channel keeps
 * its previous value.
 *
 * The stable color starts at {0,0,0}.
 */
class ColorStabilizer {
public:
    /**
     * @brief Constructor
     * @param stability Window length in samples (minimum 1)
     * @param threshold Standard deviation below which a channel counts as settled
     */
    explicit ColorStabilizer(uint16_t stability = 1,
                             float threshold = STABLECOLOR_DEFAULT_STABILITY_THRESHOLD);

    /**
     * @brief Feed one raw sample through the window
     * @param sample Instantaneous reading
     * @param changed Set to true when the stable color differs from the previous one
     * @return false if the window statistics could not be computed
     */
    bool addSample(const Color& sample, bool& changed);

    /**
     * @brief Get the last published stable color
     */
    const Color& stableColor() const;

    /**
     * @brief Change the window length; accumulated samples are kept
     */
    void setStability(uint16_t stability);
    uint16_t stability() const;

    void setThreshold(float threshold);
    float threshold() const;

    /**
     * @brief Number of samples currently held in the window
     */
    size_t windowSize() const;

    /**
     * @brief Drop the window and return to {0,0,0}
     */
    void reset();

private:
    uint16_t _stability;
    float _threshold;
    std::vector<Color> _rawColors;   // oldest first
    std::vector<ColorF> _avgColors;  // running average after each raw sample
    Color _stableColor;

    void evictOldest();
};

#endif // COLOR_STABILIZER_H
