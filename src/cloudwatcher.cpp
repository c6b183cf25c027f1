/**
 * @file cloudwatcher.cpp
 * @brief CloudWatcher device session implementation
 */

#include <stdio.h>
#include <string.h>
#include <ctype.h>
#include "cloudwatcher.h"
#include "cw_debug.h"
#include "cw_time.h"

uint16_t cw_parseFirmwareLevel(const char* version) {
    const char* p = version;
    uint32_t major = 0;
    uint32_t minor = 0;

    if (!isdigit((unsigned char)*p)) {
        return 0;
    }
    while (isdigit((unsigned char)*p)) {
        major = major * 10 + (uint32_t)(*p - '0');
        p++;
        if (major > 600) {
            return 0;
        }
    }
    if (*p == '.') {
        p++;
        // Two fractional digits: "5.6" is 560, "5.89" is 589
        for (int i = 0; i < 2; i++) {
            minor *= 10;
            if (isdigit((unsigned char)*p)) {
                minor += (uint32_t)(*p - '0');
                p++;
            }
        }
    }
    return (uint16_t)(major * 100 + minor);
}

CloudWatcher::CloudWatcher(SerialPort& port, const CwConfig& config, const CommandTable* table)
    : _port(port)
    , _config(config)
    , _engine(port, _config, table)
    , _open(false)
{
    memset(&_info, 0, sizeof(_info));
    _info.serialNumber = -1;
    telemetry_defaultConstants(&_info.constants);
    telemetry_buildSensorSet(&_info.constants, _config.anemometer, &_sensors);
}

CloudWatcher::~CloudWatcher() {
    close();
}

CwError CloudWatcher::open() {
    if (_open) {
        return CW_OK;
    }
    if (!cwConfig_validate(&_config)) {
        CW_LOG_ERROR("CW: invalid configuration");
        return CW_ERR_INVALID_ARG;
    }

    CwError err = _port.open(_config.port, _config.baud);
    if (err != CW_OK) {
        return err;
    }
    _open = true;
    _engine.resetStats();

    err = readIdentity();
    if (err != CW_OK) {
        CW_LOG_ERROR("CW: device identification failed: %s", cwError_toString(err));
        close();
        return err;
    }

    CW_LOG_INFO("CW: %s firmware %s, serial %d, anemometer %s",
                _info.name, _info.version, (int)_info.serialNumber,
                _info.anemometerPresent ? "yes" : "no");
    return CW_OK;
}

void CloudWatcher::close() {
    if (_port.isOpen()) {
        _port.close();
    }
    _open = false;
}

CwError CloudWatcher::readIdentity() {
    memset(&_info, 0, sizeof(_info));
    _info.serialNumber = -1;
    telemetry_defaultConstants(&_info.constants);

    CwError err = getFirmwareVersion(_info.version, sizeof(_info.version));
    if (err != CW_OK) {
        return err;
    }
    _info.firmwareLevel = cw_parseFirmwareLevel(_info.version);

    err = getInternalName(_info.name, sizeof(_info.name));
    if (err != CW_OK) {
        return err;
    }
    if (strcmp(_info.name, "CloudWatcher") != 0 && strcmp(_info.name, "PocketCW") != 0) {
        CW_LOG_ERROR("CW: '%s' is not a CloudWatcher", _info.name);
        return CW_ERR_UNEXPECTED_RESPONSE;
    }

    if (_info.firmwareLevel >= CW_FW_ELECTRICAL_CONSTANTS) {
        err = getSerialNumber(&_info.serialNumber);
        if (err != CW_OK) {
            return err;
        }

        ElectricalConstants constants;
        err = getElectricalConstants(&constants);
        if (err == CW_OK) {
            _info.constants = constants;
        } else if (err == CW_ERR_UNEXPECTED_RESPONSE) {
            CW_LOG_WARNING("CW: using default electrical constants");
        } else {
            return err;
        }
    }

    if (_info.firmwareLevel >= CW_FW_ANEMOMETER) {
        err = isAnemometerPresent(&_info.anemometerPresent);
        if (err != CW_OK) {
            return err;
        }
    }

    telemetry_buildSensorSet(&_info.constants, _config.anemometer, &_sensors);
    return CW_OK;
}

/* ==========================================================================
 * COMMAND HELPERS
 * ========================================================================== */

CwError CloudWatcher::run(CwCommandId id, Frame* frame, const char* args) {
    if (!_open) {
        return CW_ERR_NOT_OPEN;
    }

    CwError err = _engine.execute(id, frame, args);
    if (err == CW_ERR_IO) {
        CW_LOG_ERROR("CW: link lost, closing session");
        close();
    }
    return err;
}

CwError CloudWatcher::runInt(CwCommandId id, const char* prefix, int32_t* value, const char* args) {
    Frame frame;
    CwError err = run(id, &frame, args);
    if (err != CW_OK) {
        return err;
    }
    if (!frame_findInt(&frame, prefix, value)) {
        CW_LOG_WARNING("CW: no %s value in answer", prefix);
        return CW_ERR_UNEXPECTED_RESPONSE;
    }
    return CW_OK;
}

/* ==========================================================================
 * IDENTITY
 * ========================================================================== */

CwError CloudWatcher::getInternalName(char* out, size_t maxLen) {
    Frame frame;
    CwError err = run(CW_CMD_INTERNAL_NAME, &frame);
    if (err != CW_OK) {
        return err;
    }
    return frame_blockText(&frame, 0, "!N", out, maxLen) ? CW_OK : CW_ERR_UNEXPECTED_RESPONSE;
}

CwError CloudWatcher::getFirmwareVersion(char* out, size_t maxLen) {
    Frame frame;
    CwError err = run(CW_CMD_FIRMWARE_VERSION, &frame);
    if (err != CW_OK) {
        return err;
    }
    return frame_blockText(&frame, 0, "!V", out, maxLen) ? CW_OK : CW_ERR_UNEXPECTED_RESPONSE;
}

CwError CloudWatcher::getSerialNumber(int32_t* serial) {
    return runInt(CW_CMD_SERIAL_NUMBER, "!K", serial);
}

CwError CloudWatcher::getElectricalConstants(ElectricalConstants* constants) {
    Frame frame;
    CwError err = run(CW_CMD_ELECTRICAL_CONSTANTS, &frame);
    if (err != CW_OK) {
        return err;
    }
    return telemetry_decodeElectricalConstants(&frame, constants) ? CW_OK : CW_ERR_UNEXPECTED_RESPONSE;
}

CwError CloudWatcher::isAnemometerPresent(bool* present) {
    int32_t value = 0;
    CwError err = runInt(CW_CMD_ANEMOMETER_PRESENT, "!v", &value);
    if (err == CW_OK) {
        *present = (value == 1);
    }
    return err;
}

CwError CloudWatcher::getInternalErrors(InternalErrors* errors) {
    Frame frame;
    CwError err = run(CW_CMD_INTERNAL_ERRORS, &frame);
    if (err != CW_OK) {
        return err;
    }

    if (!frame_blockInt(&frame, 0, "!E1", &errors->firstAddressByte) ||
        !frame_blockInt(&frame, 1, "!E2", &errors->commandByte) ||
        !frame_blockInt(&frame, 2, "!E3", &errors->secondAddressByte) ||
        !frame_blockInt(&frame, 3, "!E4", &errors->pecByte)) {
        return CW_ERR_UNEXPECTED_RESPONSE;
    }
    return CW_OK;
}

CwError CloudWatcher::resetBuffers() {
    Frame frame;
    return run(CW_CMD_RESET_BUFFERS, &frame);
}

/* ==========================================================================
 * ACTUATORS
 * ========================================================================== */

#define SWITCH_OPEN_TEXT        "Switch Open"
#define SWITCH_CLOSED_TEXT      "Switch Close"

// True when block 0 is `tag` followed by exactly `expected`
static bool switchTextIs(const Frame* frame, const char* tag, const char* expected) {
    char text[CW_BLOCK_SIZE + 1];
    if (!frame_blockText(frame, 0, tag, text, sizeof(text))) {
        return false;
    }
    return strcmp(text, expected) == 0;
}

CwError CloudWatcher::getSwitchStatus(bool* switchOpen) {
    Frame frame;
    CwError err = run(CW_CMD_SWITCH_STATUS, &frame);
    if (err != CW_OK) {
        return err;
    }

    if (switchTextIs(&frame, "!X", SWITCH_OPEN_TEXT)) {
        *switchOpen = true;
    } else if (switchTextIs(&frame, "!Y", SWITCH_CLOSED_TEXT)) {
        *switchOpen = false;
    } else {
        CW_LOG_ERROR("CW: invalid switch status '%.*s'", (int)CW_BLOCK_SIZE, (const char*)frame.raw);
        return CW_ERR_UNEXPECTED_RESPONSE;
    }
    return CW_OK;
}

CwError CloudWatcher::openSwitch() {
    Frame frame;
    CwError err = run(CW_CMD_SWITCH_OPEN, &frame);
    if (err != CW_OK) {
        return err;
    }
    if (!switchTextIs(&frame, "!X", SWITCH_OPEN_TEXT)) {
        CW_LOG_ERROR("CW: switch did not report open");
        return CW_ERR_UNEXPECTED_RESPONSE;
    }
    return CW_OK;
}

CwError CloudWatcher::closeSwitch() {
    Frame frame;
    CwError err = run(CW_CMD_SWITCH_CLOSE, &frame);
    if (err != CW_OK) {
        return err;
    }
    if (!switchTextIs(&frame, "!Y", SWITCH_CLOSED_TEXT)) {
        CW_LOG_ERROR("CW: switch did not report closed");
        return CW_ERR_UNEXPECTED_RESPONSE;
    }
    return CW_OK;
}

CwError CloudWatcher::getHeaterPwm(uint16_t* duty) {
    int32_t value = 0;
    CwError err = runInt(CW_CMD_GET_PWM, "!Q", &value);
    if (err != CW_OK) {
        return err;
    }
    if (value < 0 || value > CW_PWM_MAX) {
        return CW_ERR_UNEXPECTED_RESPONSE;
    }
    *duty = (uint16_t)value;
    return CW_OK;
}

CwError CloudWatcher::setHeaterPwm(uint16_t duty, uint16_t* applied) {
    if (duty > CW_PWM_MAX) {
        return CW_ERR_INVALID_ARG;
    }

    char args[8];
    snprintf(args, sizeof(args), "%04u", (unsigned)duty);

    int32_t value = 0;
    CwError err = runInt(CW_CMD_SET_PWM, "!Q", &value, args);
    if (err != CW_OK) {
        return err;
    }
    if (value != duty) {
        CW_LOG_WARNING("CW: heater PWM %u requested, device reports %d", (unsigned)duty, (int)value);
    }
    if (applied != nullptr) {
        *applied = (uint16_t)value;
    }
    return CW_OK;
}

/* ==========================================================================
 * TELEMETRY
 * ========================================================================== */

CwError CloudWatcher::readSensor(CwCommandId id, const SensorSpec* specs, size_t count,
                                 TelemetryReading* reading) {
    Frame frame;
    CwError err = run(id, &frame);
    if (err != CW_OK) {
        return err;
    }
    if (!telemetry_decodeVariants(&frame, specs, count, reading)) {
        return CW_ERR_MALFORMED;
    }
    return CW_OK;
}

CwError CloudWatcher::addChannel(TelemetrySnapshot* snapshot, CwCommandId id, const SensorSpec* specs,
                                 size_t count, uint16_t minLevel) {
    TelemetryReading reading;

    if (_info.firmwareLevel < minLevel) {
        telemetry_absent(&specs[0], &reading);
    } else {
        CwError err = readSensor(id, specs, count, &reading);
        if (err != CW_OK) {
            return err;
        }
    }

    telemetry_addReading(snapshot, &reading);
    return CW_OK;
}

CwError CloudWatcher::readValues(TelemetrySnapshot* snapshot) {
    Frame frame;
    CwError err = run(CW_CMD_VALUES, &frame);
    if (err != CW_OK) {
        return err;
    }

    const SensorSpec* specs[] = {
        &_sensors.rainSensorTemperature,
        &_sensors.ambientLight,
        &_sensors.supplyVoltage,
        &_sensors.lightFrequency
    };

    for (size_t i = 0; i < sizeof(specs) / sizeof(specs[0]); i++) {
        TelemetryReading reading;
        if (!telemetry_decode(&frame, specs[i], &reading)) {
            return CW_ERR_MALFORMED;
        }
        telemetry_addReading(snapshot, &reading);
    }
    return CW_OK;
}

CwError CloudWatcher::readTelemetry(TelemetrySnapshot* snapshot) {
    memset(snapshot, 0, sizeof(*snapshot));
    snapshot->timestampMs = cw_millis();

    CwError err = addChannel(snapshot, CW_CMD_SKY_IR_TEMP, &_sensors.skyTemperature, 1, 0);
    if (err == CW_OK) {
        err = addChannel(snapshot, CW_CMD_IR_SENSOR_TEMP, &_sensors.irSensorTemperature, 1, 0);
    }
    if (err == CW_OK) {
        err = addChannel(snapshot, CW_CMD_RAIN_FREQUENCY, &_sensors.rainFrequency, 1, 0);
    }
    if (err == CW_OK) {
        err = readValues(snapshot);
    }
    if (err == CW_OK) {
        err = addChannel(snapshot, CW_CMD_TEMPERATURE, _sensors.ambientTemperature, 2,
                         CW_FW_HUMIDITY_TEMPERATURE);
    }
    if (err == CW_OK) {
        err = addChannel(snapshot, CW_CMD_HUMIDITY, _sensors.relativeHumidity, 2,
                         CW_FW_HUMIDITY_TEMPERATURE);
    }
    if (err == CW_OK) {
        if (_info.anemometerPresent) {
            err = addChannel(snapshot, CW_CMD_WIND_SPEED, &_sensors.windSpeed, 1, CW_FW_ANEMOMETER);
        } else {
            TelemetryReading reading;
            telemetry_absent(&_sensors.windSpeed, &reading);
            telemetry_addReading(snapshot, &reading);
        }
    }
    if (err == CW_OK) {
        err = addChannel(snapshot, CW_CMD_PRESSURE, &_sensors.pressure, 1, CW_FW_PRESSURE);
    }

    if (err != CW_OK) {
        CW_LOG_WARNING("CW: telemetry snapshot failed: %s", cwError_toString(err));
    }
    return err;
}
