/**
 * @file telemetry.h
 * @brief Raw CloudWatcher readings to calibrated engineering units
 *
 * Sensors are described by data (SensorSpec), not code. Each spec names the
 * response tag that carries the raw count, the conversion kind with its
 * constants and the valid raw and value ranges.
 *
 * Validity rules:
 * - tag missing from the frame, or raw equal to the absent sentinel:
 *   READING_SENSOR_ABSENT
 * - raw or value outside its range: clamped, READING_OUT_OF_RANGE
 */

#ifndef TELEMETRY_H
#define TELEMETRY_H

#include <stdint.h>
#include <stddef.h>
#include "frame_codec.h"
#include "config_manager.h"

/* ==========================================================================
 * SENSOR DESCRIPTION
 * ========================================================================== */

#define TELEMETRY_NAME_MAX          24
#define TELEMETRY_MAX_READINGS      16

enum ReadingValidity {
    READING_VALID = 0,
    READING_SENSOR_ABSENT,
    READING_OUT_OF_RANGE
};

enum SensorKind {
    SENSOR_KIND_LINEAR = 0,         // raw * c0 + c1
    SENSOR_KIND_ANEMOMETER,         // raw > 0 ? raw * c0 + c1 : 0
    SENSOR_KIND_THERMISTOR,         // NTC beta equation, c0 pull-up, c1 R25, c2 beta
    SENSOR_KIND_LDR,                // Relative light, c0 pull-up, c1 LDR max resistance
    SENSOR_KIND_SUPPLY              // Supply voltage from zener reading, c0 zener volts
};

struct SensorSpec {
    const char* name;
    const char* prefix;             // Response tag, e.g. "!th"
    SensorKind  kind;
    double      c0;
    double      c1;
    double      c2;
    int32_t     rawMin;
    int32_t     rawMax;
    bool        hasAbsentRaw;
    int32_t     absentRaw;          // Raw value the device sends for "not fitted"
    double      valueMin;
    double      valueMax;
    const char* unit;
};

/* ==========================================================================
 * READINGS
 * ========================================================================== */

struct TelemetryReading {
    char            name[TELEMETRY_NAME_MAX];
    int32_t         raw;
    double          value;
    const char*     unit;
    ReadingValidity validity;
};

struct TelemetrySnapshot {
    TelemetryReading readings[TELEMETRY_MAX_READINGS];
    size_t           count;
    uint32_t         timestampMs;

    /**
     * Reading by sensor name, nullptr if not in the snapshot
     */
    const TelemetryReading* find(const char* name) const;
};

/**
 * Calibration constants reported by M!
 */
struct ElectricalConstants {
    double zenerVoltage;            // Volts
    double ldrMaxResistance;        // kOhm
    double ldrPullUpResistance;     // kOhm
    double rainBeta;
    double rainResAt25;             // kOhm
    double rainPullUpResistance;    // kOhm
};

/* ==========================================================================
 * SENSOR SET
 * ========================================================================== */

/**
 * Specs for one CloudWatcher, rebuilt whenever the constants change
 */
struct SensorSet {
    SensorSpec skyTemperature;
    SensorSpec irSensorTemperature;
    SensorSpec rainFrequency;
    SensorSpec rainSensorTemperature;
    SensorSpec ambientLight;
    SensorSpec supplyVoltage;
    SensorSpec lightFrequency;
    SensorSpec ambientTemperature[2];   // High precision first
    SensorSpec relativeHumidity[2];     // High precision first
    SensorSpec windSpeed;
    SensorSpec pressure;
};

void telemetry_defaultConstants(ElectricalConstants* constants);

// First byte of the six M! words; byte 2 follows the tag and carries no data
#define CW_CONSTANTS_OFFSET     3

/**
 * Parse the binary M! block: six big-endian words in bytes 3..14
 */
bool telemetry_decodeElectricalConstants(const Frame* frame, ElectricalConstants* constants);

void telemetry_buildSensorSet(const ElectricalConstants* constants, AnemometerType anemometer,
                              SensorSet* set);

/* ==========================================================================
 * DECODING
 * ========================================================================== */

/**
 * Convert a raw count with the spec's conversion, without range checks
 */
double telemetry_convert(const SensorSpec* spec, int32_t raw);

/**
 * Convert a raw count and apply the validity rules
 */
void telemetry_fromRaw(const SensorSpec* spec, int32_t raw, TelemetryReading* reading);

/**
 * Decode one sensor from a validated frame
 * @return false, leaving reading untouched, if the frame is not valid
 */
bool telemetry_decode(const Frame* frame, const SensorSpec* spec, TelemetryReading* reading);

/**
 * Decode one channel that has several tag variants; the first variant
 * present in the frame wins. Absent readings carry variant 0's name.
 * @return false, leaving reading untouched, if the frame is not valid
 */
bool telemetry_decodeVariants(const Frame* frame, const SensorSpec* specs, size_t count,
                              TelemetryReading* reading);

/**
 * Reading for a sensor that cannot be queried at all
 */
void telemetry_absent(const SensorSpec* spec, TelemetryReading* reading);

/**
 * Append a reading; false when the snapshot is full
 */
bool telemetry_addReading(TelemetrySnapshot* snapshot, const TelemetryReading* reading);

const char* telemetry_validityName(ReadingValidity validity);

#endif /* TELEMETRY_H */
