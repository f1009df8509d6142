#pragma once

#include <Arduino.h>
#include <ArduinoJson.h>

#include "ColorScanner.h"
#include "ColorSensorConfig.h"
#include "ColorSpec.h"
#include "ColorTypes.h"

namespace ColorSensorJson {

// {"stability":20,"frequency":10,"threshold":3.0}; absent keys keep the value already in config.
bool parseConfig(JsonVariantConst body, ColorSensorConfig& config, String& errorMessage);

// {"r":{"value":255,"tolerance":10},"g":{...},"b":{...}}; all channels required.
bool parseSpec(JsonVariantConst body, ColorSpec& spec, String& errorMessage);

String buildColorJson(const Color& color);
String buildSpecJson(const ColorSpec& spec);

// Derived spec plus "count" and "running"; "spec" is null while nothing was scanned.
String buildScanReportJson(const ColorScanner& scanner);

}
