#include "ColorSensorController.h"
#include "TimerManager.h"

#ifndef COLOR_SENSOR_DEBUG
#define COLOR_SENSOR_DEBUG 0
#endif

#if COLOR_SENSOR_DEBUG
#define SENSOR_LOG(...) PF(__VA_ARGS__)
#else
#define SENSOR_LOG(...) do {} while (0)
#endif

// ============================================================
// RegisteredSpec
// ============================================================
bool RegisteredSpec::isMatch() const {
    if (!controller_) {
        LOG_ERROR("[ColorSensor] isMatch on a spec without controller\n");
        return false;
    }
    return controller_->isMatching(region_);
}

uint32_t RegisteredSpec::whenMatches(MatchHandler handler, void* user) const {
    if (!controller_) {
        LOG_ERROR("[ColorSensor] whenMatches on a spec without controller\n");
        return 0;
    }
    return controller_->whenMatches(*this, handler, user);
}

// ============================================================
// ColorSensorController
// ============================================================
ColorSensorController::ColorSensorController(ColorSampleFn sampleFn, void* sampleContext)
    : sampleFn_(sampleFn),
      sampleContext_(sampleContext),
      config_(ColorSensorConfig::onDemand()),
      stabilizer_(config_.stability, config_.stabilityThreshold),
      scanner_(*this) {
}

ColorSensorController::~ColorSensorController() {
    TimerManager::instance().cancel(ColorSensorController::samplingTrampoline, this);
}

void ColorSensorController::samplingTrampoline(void* context) {
    static_cast<ColorSensorController*>(context)->collectSample();
}

bool ColorSensorController::configure(const ColorSensorConfig& config) {
    if (!config.isValid()) {
        LOG_WARN("[ColorSensor] Rejected config stability=%u frequency=%.2f threshold=%.2f\n",
                 (unsigned)config.stability, config.sampleFrequencyHz, config.stabilityThreshold);
        return false;
    }

    auto& tm = TimerManager::instance();
    if (config.sampleFrequencyHz <= 0.0f) {
        tm.cancel(ColorSensorController::samplingTrampoline, this);
        applyConfig(config);
        LOG_INFO("[ColorSensor] stability=%u, sampling on demand\n", (unsigned)config_.stability);
        return true;
    }

    if (!sampleFn_) {
        LOG_ERROR("[ColorSensor] no sample source wired; pass a ColorSampleFn to the controller\n");
        return false;
    }

    // schedule first: a full timer table must leave the previous mode untouched
    const uint32_t periodMs = TimerManager::periodFromHz(config.sampleFrequencyHz);
    if (!tm.restart(periodMs, 0, ColorSensorController::samplingTrampoline, this)) {
        LOG_WARN("[ColorSensor] Failed to schedule sampling every %lu ms, keeping previous config\n",
                 (unsigned long)periodMs);
        if (config_.sampleFrequencyHz > 0.0f &&
            !tm.create(TimerManager::periodFromHz(config_.sampleFrequencyHz), 0,
                       ColorSensorController::samplingTrampoline, this)) {
            LOG_ERROR("[ColorSensor] previous sampling timer lost, falling back to on-demand\n");
            config_.sampleFrequencyHz = 0.0f;
        }
        return false;
    }

    applyConfig(config);
    LOG_INFO("[ColorSensor] stability=%u, sampling every %lu ms\n",
             (unsigned)config_.stability, (unsigned long)periodMs);
    return collectSample();
}

void ColorSensorController::applyConfig(const ColorSensorConfig& config) {
    config_ = config;
    stabilizer_.setStability(config_.stability);
    stabilizer_.setThreshold(config_.stabilityThreshold);
}

const ColorSensorConfig& ColorSensorController::config() const {
    return config_;
}

bool ColorSensorController::collectSample() {
    if (!sampleFn_) {
        LOG_ERROR("[ColorSensor] no sample source wired; pass a ColorSampleFn to the controller\n");
        return false;
    }

    if (dispatching_) {
        LOG_WARN("[ColorSensor] sample requested from a match handler, ignored\n");
        return false;
    }

    const Color sample = sampleFn_(sampleContext_);
    bool changed = false;
    if (!stabilizer_.addSample(sample, changed)) {
        LOG_ERROR("[ColorSensor] sample (%d,%d,%d) rejected by stabilizer\n", sample.r, sample.g, sample.b);
        return false;
    }

    if (changed) {
        const Color published = stabilizer_.stableColor();
        SENSOR_LOG("[ColorSensor] stable color -> (%d,%d,%d)\n", published.r, published.g, published.b);
        dispatching_ = true;
        events_.dispatch(published);
        dispatching_ = false;
    }
    return true;
}

bool ColorSensorController::getColor(Color& out) {
    if (!sampleFn_) {
        LOG_ERROR("[ColorSensor] no sample source wired; pass a ColorSampleFn to the controller\n");
        return false;
    }
    // inside a handler the color being dispatched is the answer
    if (config_.sampleFrequencyHz <= 0.0f && !dispatching_ && !collectSample()) {
        return false;
    }
    out = stabilizer_.stableColor();
    return true;
}

bool ColorSensorController::isMatching(const ColorSpec& spec) {
    Color c;
    if (!getColor(c)) {
        return false;
    }
    return spec.isMatch(c);
}

RegisteredSpec ColorSensorController::newSpec(const ColorSpec& region) {
    if (nextSpecId_ == kNoSpecId) {
        nextSpecId_++;
    }
    return RegisteredSpec(this, nextSpecId_++, region);
}

uint32_t ColorSensorController::whenMatches(const RegisteredSpec& spec, MatchHandler handler, void* user) {
    if (spec.controller_ != this) {
        LOG_WARN("[ColorSensor] whenMatches with a spec of another controller\n");
        return 0;
    }
    return events_.registerHandler(spec.id(), spec.region(), handler, user);
}

ColorScanner& ColorSensorController::startScan(float frequencyHz) {
    if (!scanner_.start(frequencyHz)) {
        LOG_WARN("[ColorSensor] Scan runs without timer; call scanner().update() to feed it\n");
    }
    return scanner_;
}

ColorScanner& ColorSensorController::scanner() {
    return scanner_;
}

bool ColorSensorController::isSampling() const {
    return TimerManager::instance().isActive(ColorSensorController::samplingTrampoline,
                                             const_cast<ColorSensorController*>(this));
}

const ColorStabilizer& ColorSensorController::stabilizer() const {
    return stabilizer_;
}

const ColorEventRegistry& ColorSensorController::events() const {
    return events_;
}

void ColorSensorController::showStatus() const {
    const Color& c = stabilizer_.stableColor();
    LOG_INFO("[ColorSensor] stable=(%d,%d,%d) window=%u/%u threshold=%.2f\n",
             c.r, c.g, c.b,
             (unsigned)stabilizer_.windowSize(), (unsigned)config_.stability,
             config_.stabilityThreshold);
    LOG_INFO("[ColorSensor] sampling=%s (%.1f Hz) specs=%u scan=%s count=%lu\n",
             isSampling() ? "timer" : "on-demand",
             config_.sampleFrequencyHz,
             (unsigned)events_.specCount(),
             scanner_.isRunning() ? "running" : "idle",
             (unsigned long)scanner_.getCount());
    TimerManager::instance().showAvailableTimers(true);
}
