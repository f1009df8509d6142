#ifndef COLOR_SENSOR_CONTROLLER_H
#define COLOR_SENSOR_CONTROLLER_H

#include "ColorEventRegistry.h"
#include "ColorScanner.h"
#include "ColorSensorConfig.h"
#include "ColorSpec.h"
#include "ColorStabilizer.h"
#include "ColorTypes.h"

// Returns the instantaneous reading of the RGB sensor.
typedef Color (*ColorSampleFn)(void* context);

class ColorSensorController;

/**
 * @brief A color spec known to a controller
 *
 * Returned by ColorSensorController::newSpec(). The controller must outlive
 * every RegisteredSpec it hands out.
 */
class RegisteredSpec {
public:
    RegisteredSpec() = default;

    SpecId id() const { return id_; }
    const ColorSpec& region() const { return region_; }
    bool isValid() const { return controller_ != nullptr && id_ != kNoSpecId; }

    bool isMatch(const Color& color) const { return region_.isMatch(color); }

    /**
     * @brief Match against the controller's current stable color
     *
     * With on-demand sampling this pulls one sample first.
     */
    bool isMatch() const;

    /**
     * @brief Register a handler for stable colors entering this spec
     * @param handler Callback; nullptr removes every handler of this spec
     * @return Handler id, 0 after a removal
     *
     * Inside a handler, isMatch() and getColor() report the color being
     * dispatched; no new sample is pulled until every handler has run.
     */
    uint32_t whenMatches(MatchHandler handler, void* user = nullptr) const;

private:
    friend class ColorSensorController;
    RegisteredSpec(ColorSensorController* controller, SpecId id, const ColorSpec& region)
        : controller_(controller), id_(id), region_(region) {}

    ColorSensorController* controller_ = nullptr;
    SpecId id_ = kNoSpecId;
    ColorSpec region_;
};

/**
 * @brief Stabilized color sensor with spec matching, match events and scanning
 *
 * Owns the rolling window, the stable color, the handler registry and one
 * built-in scanner. Timed work runs on TimerManager, so the host must call
 * TimerManager::instance().update() from loop().
 */
class ColorSensorController {
public:
    /**
     * @brief Constructor
     * @param sampleFn Sensor read function; required before any color is read
     * @param sampleContext Passed back to sampleFn
     *
     * Starts with ColorSensorConfig::onDemand().
     */
    explicit ColorSensorController(ColorSampleFn sampleFn = nullptr, void* sampleContext = nullptr);
    ~ColorSensorController();

    ColorSensorController(const ColorSensorController&) = delete;
    ColorSensorController& operator=(const ColorSensorController&) = delete;

    /**
     * @brief Apply stability/frequency and (re)start autonomous sampling
     * @return false if the config is invalid (previous one stays active) or sampling could not start
     */
    bool configure(const ColorSensorConfig& config);
    const ColorSensorConfig& config() const;

    /**
     * @brief Get the current stable color
     * @return false when no sample source is wired
     */
    bool getColor(Color& out);

    /**
     * @brief Check the current stable color against a spec
     */
    bool isMatching(const ColorSpec& spec);

    /**
     * @brief Create a spec handle that can carry match handlers
     */
    RegisteredSpec newSpec(const ColorSpec& region);

    uint32_t whenMatches(const RegisteredSpec& spec, MatchHandler handler, void* user = nullptr);

    /**
     * @brief (Re)start the built-in scanner
     */
    ColorScanner& startScan(float frequencyHz = STABLECOLOR_DEFAULT_SCAN_FREQUENCY_HZ);
    ColorScanner& scanner();

    /**
     * @brief Pull one raw sample, update the stable color and fire matching handlers on change
     * @return false without a sample source, or when called from inside a match handler
     */
    bool collectSample();

    bool isSampling() const;
    const ColorStabilizer& stabilizer() const;
    const ColorEventRegistry& events() const;

    void showStatus() const;

private:
    static void samplingTrampoline(void* context);
    void applyConfig(const ColorSensorConfig& config);

    ColorSampleFn sampleFn_;
    void* sampleContext_;
    ColorSensorConfig config_;
    ColorStabilizer stabilizer_;
    ColorEventRegistry events_;
    ColorScanner scanner_;
    SpecId nextSpecId_ = 1;
    bool dispatching_ = false;
};

#endif // COLOR_SENSOR_CONTROLLER_H
