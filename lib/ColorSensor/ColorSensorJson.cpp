#include "ColorSensorJson.h"

#include <cmath>

namespace {

constexpr size_t kDocCapacity = 512;
constexpr const char* kChannelNames[] = {"r", "g", "b"};

bool parseChannel(JsonObjectConst obj, const char* name, ToleranceChannel& out, String& errorMessage) {
    JsonVariantConst channel = obj[name];
    if (!channel.is<JsonObjectConst>()) {
        errorMessage = String(F("missing channel ")) + name;
        return false;
    }
    JsonVariantConst value = channel["value"];
    JsonVariantConst tolerance = channel["tolerance"];
    if (!value.is<int>() || !tolerance.is<int>()) {
        errorMessage = String(F("channel ")) + name + F(" needs integer value and tolerance");
        return false;
    }
    if (tolerance.as<int>() < 0) {
        errorMessage = String(F("negative tolerance on channel ")) + name;
        return false;
    }
    out = ToleranceChannel(value.as<int>(), tolerance.as<int>());
    return true;
}

void writeChannel(JsonObject parent, const char* name, const ToleranceChannel& channel) {
    JsonObject obj = parent.createNestedObject(name);
    obj["value"] = channel.value;
    obj["tolerance"] = channel.tolerance;
}

void writeSpec(JsonObject obj, const ColorSpec& spec) {
    writeChannel(obj, kChannelNames[0], spec.r);
    writeChannel(obj, kChannelNames[1], spec.g);
    writeChannel(obj, kChannelNames[2], spec.b);
}

} // namespace

namespace ColorSensorJson {

bool parseConfig(JsonVariantConst body, ColorSensorConfig& config, String& errorMessage) {
    if (!body.is<JsonObjectConst>()) {
        errorMessage = F("invalid payload");
        return false;
    }
    JsonObjectConst obj = body.as<JsonObjectConst>();

    ColorSensorConfig next = config;

    JsonVariantConst stability = obj["stability"];
    if (!stability.isNull()) {
        if (!stability.is<int>() || stability.as<int>() < 1 || stability.as<int>() > 0xFFFF) {
            errorMessage = F("stability must be an integer >= 1");
            return false;
        }
        next.stability = static_cast<uint16_t>(stability.as<int>());
    }

    JsonVariantConst frequency = obj["frequency"];
    if (!frequency.isNull()) {
        if (!frequency.is<float>() || !(frequency.as<float>() >= 0.0f)) {
            errorMessage = F("frequency must be a number >= 0");
            return false;
        }
        next.sampleFrequencyHz = frequency.as<float>();
    }

    JsonVariantConst threshold = obj["threshold"];
    if (!threshold.isNull()) {
        if (!threshold.is<float>() || !(threshold.as<float>() > 0.0f)) {
            errorMessage = F("threshold must be a number > 0");
            return false;
        }
        next.stabilityThreshold = threshold.as<float>();
    }

    if (!next.isValid()) {
        errorMessage = F("invalid configuration");
        return false;
    }

    config = next;
    return true;
}

bool parseSpec(JsonVariantConst body, ColorSpec& spec, String& errorMessage) {
    if (!body.is<JsonObjectConst>()) {
        errorMessage = F("invalid payload");
        return false;
    }
    JsonObjectConst obj = body.as<JsonObjectConst>();

    ColorSpec parsed;
    if (!parseChannel(obj, kChannelNames[0], parsed.r, errorMessage) ||
        !parseChannel(obj, kChannelNames[1], parsed.g, errorMessage) ||
        !parseChannel(obj, kChannelNames[2], parsed.b, errorMessage)) {
        return false;
    }
    spec = parsed;
    return true;
}

String buildColorJson(const Color& color) {
    DynamicJsonDocument doc(kDocCapacity);
    doc["r"] = color.r;
    doc["g"] = color.g;
    doc["b"] = color.b;
    String out;
    serializeJson(doc, out);
    return out;
}

String buildSpecJson(const ColorSpec& spec) {
    DynamicJsonDocument doc(kDocCapacity);
    writeSpec(doc.to<JsonObject>(), spec);
    String out;
    serializeJson(doc, out);
    return out;
}

String buildScanReportJson(const ColorScanner& scanner) {
    DynamicJsonDocument doc(kDocCapacity);
    doc["count"] = scanner.getCount();
    doc["running"] = scanner.isRunning();

    ColorSpec spec;
    if (scanner.getColorSpec(spec)) {
        writeSpec(doc.createNestedObject("spec"), spec);
    } else {
        doc["spec"] = nullptr;
    }

    String out;
    serializeJson(doc, out);
    return out;
}

}
