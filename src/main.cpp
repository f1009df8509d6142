#include <Arduino.h>
#include <Adafruit_TCS34725.h>
#include <Wire.h>

#include "ColorSensorController.h"
#include "ColorSensorJson.h"
#include "Globals.h"
#include "TimerManager.h"

// Boot sequence: scan the surface under the robot for a few seconds, turn the
// result into a color spec and report every time the stable color enters it.

namespace {

constexpr uint32_t kCalibrationMs = 5 * SECONDS_TICK;
constexpr uint32_t kStatusMs = 30 * SECONDS_TICK;

Adafruit_TCS34725 tcs(TCS34725_INTEGRATIONTIME_50MS, TCS34725_GAIN_4X);
bool s_tcsReady = false;

Color readSensor(void*) {
    if (!s_tcsReady) {
        return Color();
    }
    float r, g, b;
    tcs.getRGB(&r, &g, &b);
    return Color(static_cast<int>(r + 0.5f), static_cast<int>(g + 0.5f), static_cast<int>(b + 0.5f));
}

ColorSensorController colorSensor(readSensor);
RegisteredSpec s_surface;

void onSurface(MatchDone done, const Color& color, const ColorSpec&, void*) {
    PF("[Main] on calibrated surface: %s\n", ColorSensorJson::buildColorJson(color).c_str());
    done();
}

void finishCalibration(void*) {
    ColorScanner& scan = colorSensor.scanner();
    scan.stop();
    PF("[Main] scan %s\n", ColorSensorJson::buildScanReportJson(scan).c_str());

    ColorSpec spec;
    if (!scan.getColorSpec(spec)) {
        LOG_WARN("[Main] calibration saw no color, no surface spec registered\n");
        return;
    }
    s_surface = colorSensor.newSpec(spec);
    s_surface.whenMatches(onSurface);
}

void showStatus(void*) {
    colorSensor.showStatus();
}

} // namespace

void setup() {
    Serial.begin(115200);
    while (!Serial && millis() < 3000) { delay(10); }
    PL("\n[Main] StableColor booting...");

    s_tcsReady = tcs.begin();
    if (!s_tcsReady) {
        LOG_ERROR("[Main] TCS34725 not found\n");
    }

    ColorSensorConfig config;  // stability 20 @ 10 Hz
    if (!colorSensor.configure(config)) {
        LOG_ERROR("[Main] color sensor configuration failed\n");
    }

    colorSensor.startScan();
    auto& tm = TimerManager::instance();
    if (!tm.create(kCalibrationMs, 1, finishCalibration)) {
        LOG_ERROR("[Main] Failed to schedule end of calibration\n");
    }
    if (!tm.create(kStatusMs, 0, showStatus)) {
        LOG_WARN("[Main] Failed to schedule status report\n");
    }

    PL("[Main] Setup ready.");
}

void loop() {
    TimerManager::instance().update();
}
