/**
 * @file cloudwatcher.h
 * @brief CloudWatcher device session
 *
 * Owns the serial port from open() until close() or destruction and
 * exposes the instrument's command set on top of the protocol engine.
 * An I/O error ends the session; later calls return CW_ERR_NOT_OPEN
 * until open() succeeds again.
 */

#ifndef CLOUDWATCHER_H
#define CLOUDWATCHER_H

#include <stdint.h>
#include <stddef.h>
#include "cw_error.h"
#include "config_manager.h"
#include "serial_port.h"
#include "protocol_engine.h"
#include "telemetry.h"

/* ==========================================================================
 * DATA STRUCTURES
 * ========================================================================== */

#define CW_TEXT_MAX                 16

struct DeviceInfo {
    char     name[CW_TEXT_MAX];         // "CloudWatcher" or "PocketCW"
    char     version[CW_TEXT_MAX];      // As reported, e.g. "5.89"
    uint16_t firmwareLevel;             // Version x100, e.g. 589
    int32_t  serialNumber;              // -1 when the firmware cannot report it
    bool     anemometerPresent;
    ElectricalConstants constants;
};

/**
 * IR sensor bus error counters (D!)
 */
struct InternalErrors {
    int32_t firstAddressByte;
    int32_t commandByte;
    int32_t secondAddressByte;
    int32_t pecByte;
};

/* ==========================================================================
 * SESSION CLASS
 * ========================================================================== */

class CloudWatcher {
public:
    /**
     * @param port Transport, not owned; must outlive the session
     * @param config Copied
     * @param table Command table, nullptr for the built-in one
     */
    CloudWatcher(SerialPort& port, const CwConfig& config, const CommandTable* table = nullptr);
    ~CloudWatcher();

    /**
     * Acquire the port and read the device identity and constants
     */
    CwError open();
    void close();
    bool isOpen() const { return _open; }

    const DeviceInfo& info() const { return _info; }
    const SensorSet& sensors() const { return _sensors; }
    ProtocolEngine& engine() { return _engine; }
    const CwConfig& config() const { return _config; }

    /* Identity */
    CwError getInternalName(char* out, size_t maxLen);
    CwError getFirmwareVersion(char* out, size_t maxLen);
    CwError getSerialNumber(int32_t* serial);
    CwError getElectricalConstants(ElectricalConstants* constants);
    CwError isAnemometerPresent(bool* present);
    CwError getInternalErrors(InternalErrors* errors);

    /**
     * Clear the device's serial buffers (z!)
     */
    CwError resetBuffers();

    /* Relay switch */
    CwError getSwitchStatus(bool* switchOpen);
    CwError openSwitch();
    CwError closeSwitch();

    /* Rain sensor heater */
    CwError getHeaterPwm(uint16_t* duty);

    /**
     * @param duty 0..1023
     * @param applied Optional, duty cycle echoed by the device
     */
    CwError setHeaterPwm(uint16_t duty, uint16_t* applied = nullptr);

    /**
     * Read one sensor channel
     */
    CwError readSensor(CwCommandId id, const SensorSpec* specs, size_t count, TelemetryReading* reading);

    /**
     * Read every sensor. Sensors the device lacks are reported as
     * READING_SENSOR_ABSENT; any protocol error fails the whole snapshot.
     */
    CwError readTelemetry(TelemetrySnapshot* snapshot);

private:
    CloudWatcher(const CloudWatcher&);
    CloudWatcher& operator=(const CloudWatcher&);

    CwError run(CwCommandId id, Frame* frame, const char* args = nullptr);
    CwError runInt(CwCommandId id, const char* prefix, int32_t* value, const char* args = nullptr);
    CwError readIdentity();
    CwError readValues(TelemetrySnapshot* snapshot);
    CwError addChannel(TelemetrySnapshot* snapshot, CwCommandId id, const SensorSpec* specs,
                       size_t count, uint16_t minLevel);

    SerialPort&     _port;
    CwConfig        _config;
    ProtocolEngine  _engine;
    DeviceInfo      _info;
    SensorSet       _sensors;
    bool            _open;
};

/**
 * Parse a firmware version string ("5.89") into version x100
 */
uint16_t cw_parseFirmwareLevel(const char* version);

#endif /* CLOUDWATCHER_H */
