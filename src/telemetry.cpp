/**
 * @file telemetry.cpp
 * @brief Telemetry decoding and calibration
 */

#include <math.h>
#include <string.h>
#include "telemetry.h"
#include "cw_debug.h"

#define KELVIN_AT_25C           298.15
#define KELVIN_OFFSET           273.15

/* ==========================================================================
 * CONSTANTS AND SENSOR SET
 * ========================================================================== */

void telemetry_defaultConstants(ElectricalConstants* constants) {
    constants->zenerVoltage = 3.0;
    constants->ldrMaxResistance = 1500.0;
    constants->ldrPullUpResistance = 56.0;
    constants->rainBeta = 3450.0;
    constants->rainResAt25 = 1.0;
    constants->rainPullUpResistance = 1.0;
}

static uint16_t readWord(const uint8_t* p) {
    return (uint16_t)((p[0] << 8) | p[1]);
}

bool telemetry_decodeElectricalConstants(const Frame* frame, ElectricalConstants* constants) {
    const uint8_t* block = frame_block(frame, 0);
    if (block == nullptr || block[0] != '!' || block[1] != 'M') {
        return false;
    }

    const uint8_t* w = &block[CW_CONSTANTS_OFFSET];
    ElectricalConstants parsed;
    parsed.zenerVoltage = readWord(&w[0]) / 100.0;
    parsed.ldrMaxResistance = readWord(&w[2]);
    parsed.ldrPullUpResistance = readWord(&w[4]) / 10.0;
    parsed.rainBeta = readWord(&w[6]);
    parsed.rainResAt25 = readWord(&w[8]) / 10.0;
    parsed.rainPullUpResistance = readWord(&w[10]) / 10.0;

    // Zero would divide by zero in the conversions
    if (parsed.zenerVoltage <= 0.0 || parsed.ldrMaxResistance <= 0.0 ||
        parsed.rainBeta <= 0.0 || parsed.rainResAt25 <= 0.0) {
        CW_LOG_WARNING("Telemetry: implausible electrical constants");
        return false;
    }

    *constants = parsed;
    return true;
}

static SensorSpec makeSpec(const char* name, const char* prefix, SensorKind kind,
                           double c0, double c1, double c2,
                           int32_t rawMin, int32_t rawMax,
                           double valueMin, double valueMax, const char* unit) {
    SensorSpec spec;
    spec.name = name;
    spec.prefix = prefix;
    spec.kind = kind;
    spec.c0 = c0;
    spec.c1 = c1;
    spec.c2 = c2;
    spec.rawMin = rawMin;
    spec.rawMax = rawMax;
    spec.hasAbsentRaw = false;
    spec.absentRaw = 0;
    spec.valueMin = valueMin;
    spec.valueMax = valueMax;
    spec.unit = unit;
    return spec;
}

static SensorSpec withAbsent(SensorSpec spec, int32_t absentRaw) {
    spec.hasAbsentRaw = true;
    spec.absentRaw = absentRaw;
    return spec;
}

void telemetry_buildSensorSet(const ElectricalConstants* c, AnemometerType anemometer, SensorSet* set) {
    set->skyTemperature = makeSpec("sky_temperature", "!1", SENSOR_KIND_LINEAR,
                                   0.01, 0.0, 0.0, -10000, 10000, -100.0, 100.0, "C");
    set->irSensorTemperature = makeSpec("ir_sensor_temperature", "!2", SENSOR_KIND_LINEAR,
                                        0.01, 0.0, 0.0, -10000, 10000, -100.0, 100.0, "C");
    set->rainFrequency = makeSpec("rain_frequency", "!R", SENSOR_KIND_LINEAR,
                                  1.0, 0.0, 0.0, 0, CW_RAIN_FREQ_MAX, 0.0, CW_RAIN_FREQ_MAX, "Hz");

    // C! channels are 10-bit ADC counts, 0 and 1023 are clamped off
    set->rainSensorTemperature = makeSpec("rain_sensor_temperature", "!5", SENSOR_KIND_THERMISTOR,
                                          c->rainPullUpResistance, c->rainResAt25, c->rainBeta,
                                          1, CW_ADC_MAX - 1, -60.0, 120.0, "C");
    set->ambientLight = makeSpec("ambient_light", "!4", SENSOR_KIND_LDR,
                                 c->ldrPullUpResistance, c->ldrMaxResistance, 0.0,
                                 1, CW_ADC_MAX - 1, 0.0, 1.0, "");
    set->supplyVoltage = makeSpec("supply_voltage", "!6", SENSOR_KIND_SUPPLY,
                                  c->zenerVoltage, 0.0, 0.0, 1, CW_ADC_MAX, 0.0, 30.0, "V");
    set->lightFrequency = withAbsent(makeSpec("light_frequency", "!8", SENSOR_KIND_LINEAR,
                                              1.0, 0.0, 0.0, 1, 2000000000, 0.0, 2000000000.0, "Hz"), 0);

    set->ambientTemperature[0] = withAbsent(makeSpec("ambient_temperature", "!th", SENSOR_KIND_LINEAR,
                                                     175.72 / 65536.0, -46.85, 0.0,
                                                     0, 65534, -70.0, 70.0, "C"), 65535);
    set->ambientTemperature[1] = withAbsent(makeSpec("ambient_temperature", "!t", SENSOR_KIND_LINEAR,
                                                     1.7572, -46.85, 0.0,
                                                     0, 99, -70.0, 70.0, "C"), 100);

    set->relativeHumidity[0] = withAbsent(makeSpec("relative_humidity", "!hh", SENSOR_KIND_LINEAR,
                                                   125.0 / 65536.0, -6.0, 0.0,
                                                   0, 65534, 0.0, 100.0, "%"), 65535);
    set->relativeHumidity[1] = withAbsent(makeSpec("relative_humidity", "!h", SENSOR_KIND_LINEAR,
                                                   1.25, -6.0, 0.0,
                                                   0, 99, 0.0, 100.0, "%"), 100);

    if (anemometer == ANEMOMETER_BLACK) {
        set->windSpeed = makeSpec("wind_speed", "!w", SENSOR_KIND_ANEMOMETER,
                                  0.84, 3.0, 0.0, 0, 255, 0.0, 250.0, "km/h");
    } else {
        set->windSpeed = makeSpec("wind_speed", "!w", SENSOR_KIND_LINEAR,
                                  1.0, 0.0, 0.0, 0, 255, 0.0, 250.0, "km/h");
    }

    set->pressure = withAbsent(makeSpec("pressure", "!p", SENSOR_KIND_LINEAR,
                                        1.0 / 16.0, 0.0, 0.0, 0, 65534, 300.0, 1100.0, "hPa"), 65535);
}

/* ==========================================================================
 * CONVERSION
 * ========================================================================== */

// Resistance of the lower leg of a divider read by the 10-bit ADC
static double dividerResistance(double pullUp, int32_t raw) {
    return pullUp / (((double)CW_ADC_MAX / raw) - 1.0);
}

double telemetry_convert(const SensorSpec* spec, int32_t raw) {
    switch (spec->kind) {
        case SENSOR_KIND_LINEAR:
            return raw * spec->c0 + spec->c1;

        case SENSOR_KIND_ANEMOMETER:
            return (raw > 0) ? raw * spec->c0 + spec->c1 : 0.0;

        case SENSOR_KIND_THERMISTOR: {
            double r = log(dividerResistance(spec->c0, raw) / spec->c1);
            return 1.0 / (r / spec->c2 + 1.0 / KELVIN_AT_25C) - KELVIN_OFFSET;
        }

        case SENSOR_KIND_LDR:
            return 1.0 - dividerResistance(spec->c0, raw) / spec->c1;

        case SENSOR_KIND_SUPPLY:
            return (double)CW_ADC_MAX * spec->c0 / raw;
    }
    return NAN;
}

static void beginReading(const SensorSpec* spec, TelemetryReading* reading) {
    memset(reading, 0, sizeof(*reading));
    strncpy(reading->name, spec->name, sizeof(reading->name) - 1);
    reading->unit = spec->unit;
}

void telemetry_absent(const SensorSpec* spec, TelemetryReading* reading) {
    beginReading(spec, reading);
    reading->value = NAN;
    reading->validity = READING_SENSOR_ABSENT;
}

void telemetry_fromRaw(const SensorSpec* spec, int32_t raw, TelemetryReading* reading) {
    if (spec->hasAbsentRaw && raw == spec->absentRaw) {
        telemetry_absent(spec, reading);
        reading->raw = raw;
        return;
    }

    beginReading(spec, reading);
    reading->raw = raw;

    bool outOfRange = false;
    int32_t clamped = raw;
    if (clamped < spec->rawMin) {
        clamped = spec->rawMin;
        outOfRange = true;
    } else if (clamped > spec->rawMax) {
        clamped = spec->rawMax;
        outOfRange = true;
    }

    double value = telemetry_convert(spec, clamped);
    if (isnan(value)) {
        value = spec->valueMin;
        outOfRange = true;
    } else if (value < spec->valueMin) {
        value = spec->valueMin;
        outOfRange = true;
    } else if (value > spec->valueMax) {
        value = spec->valueMax;
        outOfRange = true;
    }

    reading->value = value;
    reading->validity = outOfRange ? READING_OUT_OF_RANGE : READING_VALID;
}

bool telemetry_decode(const Frame* frame, const SensorSpec* spec, TelemetryReading* reading) {
    return telemetry_decodeVariants(frame, spec, 1, reading);
}

bool telemetry_decodeVariants(const Frame* frame, const SensorSpec* specs, size_t count,
                              TelemetryReading* reading) {
    if (frame == nullptr || !frame->valid || count == 0) {
        return false;
    }

    for (size_t i = 0; i < count; i++) {
        int32_t raw;
        if (frame_findInt(frame, specs[i].prefix, &raw)) {
            telemetry_fromRaw(&specs[i], raw, reading);
            return true;
        }
    }

    telemetry_absent(&specs[0], reading);
    return true;
}

/* ==========================================================================
 * SNAPSHOT
 * ========================================================================== */

const TelemetryReading* TelemetrySnapshot::find(const char* name) const {
    for (size_t i = 0; i < count; i++) {
        if (strcmp(readings[i].name, name) == 0) {
            return &readings[i];
        }
    }
    return nullptr;
}

bool telemetry_addReading(TelemetrySnapshot* snapshot, const TelemetryReading* reading) {
    if (snapshot->count >= TELEMETRY_MAX_READINGS) {
        return false;
    }
    snapshot->readings[snapshot->count++] = *reading;
    return true;
}

const char* telemetry_validityName(ReadingValidity validity) {
    switch (validity) {
        case READING_VALID:         return "valid";
        case READING_SENSOR_ABSENT: return "absent";
        case READING_OUT_OF_RANGE:  return "out-of-range";
    }
    return "unknown";
}
