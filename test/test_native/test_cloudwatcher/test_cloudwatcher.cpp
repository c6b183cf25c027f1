/**
 * @file test_cloudwatcher.cpp
 * @brief Unit tests for the CloudWatcher session against a simulated device
 *
 * Run with: ctest -R test_cloudwatcher
 */

#include <unity.h>
#include <math.h>
#include <stdio.h>
#include <string.h>
#include "cloudwatcher.h"
#include "mock_serial_port.h"

static MockSerialPort port;
static ConfigManager configManager;

static void replyConstants(void) {
    const uint8_t words[12] = {
        0x01, 0x36,     // Zener 3.10 V
        0x05, 0xDC,     // LDR max 1500 kOhm
        0x02, 0x30,     // LDR pull-up 56.0 kOhm
        0x0D, 0x7A,     // Beta 3450
        0x00, 0x0A,     // R25 1.0 kOhm
        0x00, 0x0A      // Rain pull-up 1.0 kOhm
    };
    uint8_t raw[2 * CW_BLOCK_SIZE];
    memset(raw, ' ', CW_BLOCK_SIZE);
    raw[0] = '!';
    raw[1] = 'M';
    memcpy(&raw[CW_CONSTANTS_OFFSET], words, sizeof(words));
    memcpy(&raw[CW_BLOCK_SIZE], CW_HANDSHAKE_BLOCK, CW_BLOCK_SIZE);
    port.setReplyRaw("M!", raw, sizeof(raw));
}

// Current firmware with every sensor fitted
static void simulateDevice(const char* version) {
    char block[CW_BLOCK_SIZE + 1];
    snprintf(block, sizeof(block), "!V %s", version);
    port.setReply("B!", block);
    port.setReply("A!", "!N CloudWatcher");
    port.setReply("K!", "!K 1234");
    replyConstants();
    port.setReply("v!", "!v 1");

    port.setReply("S!", "!1 -1523");
    port.setReply("T!", "!2 1850");
    port.setReply("E!", "!R 2600");
    const char* values[] = { "!6 341", "!4 512", "!5 512", "!8 4000" };
    port.setReply("C!", values, 4);
    port.setReply("t!", "!th 26000");
    port.setReply("h!", "!hh 40000");
    port.setReply("V!", "!w 10");
    port.setReply("p!", "!p 16200");
}

void setUp(void) {
    port.reset();
    configManager.setDefaults();
    configManager.setOption("port", "/dev/ttyMOCK");
}

void tearDown(void) {
}

// =============================================================================
// SESSION LIFECYCLE
// =============================================================================

void test_open_reads_identity(void) {
    simulateDevice("5.89");
    CloudWatcher cw(port, configManager.get());

    TEST_ASSERT_EQUAL(CW_OK, cw.open());
    TEST_ASSERT_TRUE(cw.isOpen());
    TEST_ASSERT_EQUAL_STRING("/dev/ttyMOCK", port.lastPath);
    TEST_ASSERT_EQUAL_STRING("CloudWatcher", cw.info().name);
    TEST_ASSERT_EQUAL_STRING("5.89", cw.info().version);
    TEST_ASSERT_EQUAL(589, cw.info().firmwareLevel);
    TEST_ASSERT_EQUAL_INT32(1234, cw.info().serialNumber);
    TEST_ASSERT_TRUE(cw.info().anemometerPresent);
    TEST_ASSERT_FLOAT_WITHIN(0.001, 3.10, cw.info().constants.zenerVoltage);
}

void test_open_old_firmware_skips_newer_commands(void) {
    simulateDevice("2.50");
    CloudWatcher cw(port, configManager.get());

    TEST_ASSERT_EQUAL(CW_OK, cw.open());
    TEST_ASSERT_EQUAL(250, cw.info().firmwareLevel);
    TEST_ASSERT_EQUAL_INT32(-1, cw.info().serialNumber);
    TEST_ASSERT_FALSE(cw.info().anemometerPresent);
    TEST_ASSERT_EQUAL(0, port.countWrites("K!"));
    TEST_ASSERT_EQUAL(0, port.countWrites("M!"));
    TEST_ASSERT_EQUAL(0, port.countWrites("v!"));
}

void test_open_rejects_other_device(void) {
    simulateDevice("5.89");
    port.setReply("A!", "!N Lacrosse");
    CloudWatcher cw(port, configManager.get());

    TEST_ASSERT_EQUAL(CW_ERR_UNEXPECTED_RESPONSE, cw.open());
    TEST_ASSERT_FALSE(cw.isOpen());
    TEST_ASSERT_FALSE(port.isOpen());
}

void test_open_locked_port(void) {
    port.lockedByOther = true;
    CloudWatcher cw(port, configManager.get());

    TEST_ASSERT_EQUAL(CW_ERR_PORT_LOCKED, cw.open());
    TEST_ASSERT_FALSE(cw.isOpen());
    TEST_ASSERT_EQUAL(0, port.writeCount);
}

void test_open_rejects_invalid_config(void) {
    configManager.get().baud = 1234;
    CloudWatcher cw(port, configManager.get());

    TEST_ASSERT_EQUAL(CW_ERR_INVALID_ARG, cw.open());
    TEST_ASSERT_EQUAL(0, port.openCount);
}

void test_io_error_closes_session(void) {
    simulateDevice("5.89");
    CloudWatcher cw(port, configManager.get());
    TEST_ASSERT_EQUAL(CW_OK, cw.open());

    int32_t serial = 0;
    port.failNextWrite(CW_ERR_IO);
    TEST_ASSERT_EQUAL(CW_ERR_IO, cw.getSerialNumber(&serial));
    TEST_ASSERT_FALSE(cw.isOpen());
    TEST_ASSERT_EQUAL(1, port.closeCount);
    TEST_ASSERT_EQUAL(CW_ERR_NOT_OPEN, cw.getSerialNumber(&serial));

    TEST_ASSERT_EQUAL(CW_OK, cw.open());
    TEST_ASSERT_EQUAL(CW_OK, cw.getSerialNumber(&serial));
}

void test_calls_before_open_fail(void) {
    CloudWatcher cw(port, configManager.get());
    bool present = false;
    TEST_ASSERT_EQUAL(CW_ERR_NOT_OPEN, cw.isAnemometerPresent(&present));
    TEST_ASSERT_EQUAL(0, port.writeCount);
}

// =============================================================================
// ACTUATORS
// =============================================================================

void test_switch_status_and_control(void) {
    simulateDevice("5.89");
    port.setReply("F!", "!X Switch Open");
    port.setReply("G!", "!X Switch Open");
    port.setReply("H!", "!Y Switch Close");
    CloudWatcher cw(port, configManager.get());
    TEST_ASSERT_EQUAL(CW_OK, cw.open());

    bool switchOpen = false;
    TEST_ASSERT_EQUAL(CW_OK, cw.getSwitchStatus(&switchOpen));
    TEST_ASSERT_TRUE(switchOpen);

    port.setReply("F!", "!Y Switch Close");
    TEST_ASSERT_EQUAL(CW_OK, cw.getSwitchStatus(&switchOpen));
    TEST_ASSERT_FALSE(switchOpen);

    TEST_ASSERT_EQUAL(CW_OK, cw.openSwitch());
    TEST_ASSERT_EQUAL(CW_OK, cw.closeSwitch());
    TEST_ASSERT_EQUAL(1, port.countWrites("G!"));
    TEST_ASSERT_EQUAL(1, port.countWrites("H!"));
}

void test_switch_status_text_is_checked(void) {
    simulateDevice("5.89");
    CloudWatcher cw(port, configManager.get());
    TEST_ASSERT_EQUAL(CW_OK, cw.open());

    bool switchOpen = false;
    port.setReply("F!", "!X Switch Close");
    TEST_ASSERT_EQUAL(CW_ERR_UNEXPECTED_RESPONSE, cw.getSwitchStatus(&switchOpen));

    port.setReply("F!", "!Y");
    TEST_ASSERT_EQUAL(CW_ERR_UNEXPECTED_RESPONSE, cw.getSwitchStatus(&switchOpen));

    port.setReply("G!", "!X Busy");
    TEST_ASSERT_EQUAL(CW_ERR_UNEXPECTED_RESPONSE, cw.openSwitch());

    // A bad status is a device answer, not a link failure
    TEST_ASSERT_TRUE(cw.isOpen());
}

void test_heater_pwm(void) {
    simulateDevice("5.89");
    port.setReply("P0512!", "!Q 512");
    port.setReply("Q!", "!Q 300");
    CloudWatcher cw(port, configManager.get());
    TEST_ASSERT_EQUAL(CW_OK, cw.open());

    uint16_t applied = 0;
    TEST_ASSERT_EQUAL(CW_OK, cw.setHeaterPwm(512, &applied));
    TEST_ASSERT_EQUAL(512, applied);
    TEST_ASSERT_EQUAL(1, port.countWrites("P0512!"));

    uint16_t duty = 0;
    TEST_ASSERT_EQUAL(CW_OK, cw.getHeaterPwm(&duty));
    TEST_ASSERT_EQUAL(300, duty);
}

void test_heater_pwm_out_of_range_not_sent(void) {
    simulateDevice("5.89");
    CloudWatcher cw(port, configManager.get());
    TEST_ASSERT_EQUAL(CW_OK, cw.open());
    int writes = port.writeCount;

    TEST_ASSERT_EQUAL(CW_ERR_INVALID_ARG, cw.setHeaterPwm(CW_PWM_MAX + 1));
    TEST_ASSERT_EQUAL(writes, port.writeCount);
}

void test_internal_errors(void) {
    simulateDevice("5.89");
    const char* blocks[] = { "!E1 1", "!E2 2", "!E3 0", "!E4 5" };
    port.setReply("D!", blocks, 4);
    CloudWatcher cw(port, configManager.get());
    TEST_ASSERT_EQUAL(CW_OK, cw.open());

    InternalErrors errors;
    TEST_ASSERT_EQUAL(CW_OK, cw.getInternalErrors(&errors));
    TEST_ASSERT_EQUAL_INT32(1, errors.firstAddressByte);
    TEST_ASSERT_EQUAL_INT32(2, errors.commandByte);
    TEST_ASSERT_EQUAL_INT32(0, errors.secondAddressByte);
    TEST_ASSERT_EQUAL_INT32(5, errors.pecByte);
}

void test_reset_buffers(void) {
    simulateDevice("5.89");
    port.setReplyRaw("z!", CW_HANDSHAKE_BLOCK, CW_BLOCK_SIZE);
    CloudWatcher cw(port, configManager.get());
    TEST_ASSERT_EQUAL(CW_OK, cw.open());

    TEST_ASSERT_EQUAL(CW_OK, cw.resetBuffers());
}

// =============================================================================
// TELEMETRY
// =============================================================================

void test_read_single_channel(void) {
    simulateDevice("5.89");
    CloudWatcher cw(port, configManager.get());
    TEST_ASSERT_EQUAL(CW_OK, cw.open());
    size_t first = port.writeLogCount;

    TelemetryReading reading;
    TEST_ASSERT_EQUAL(CW_OK, cw.readSensor(CW_CMD_SKY_IR_TEMP, &cw.sensors().skyTemperature, 1, &reading));
    TEST_ASSERT_EQUAL(READING_VALID, reading.validity);
    TEST_ASSERT_FLOAT_WITHIN(0.001, -15.23, reading.value);

    // High precision variant wins over the plain one
    TEST_ASSERT_EQUAL(CW_OK, cw.readSensor(CW_CMD_HUMIDITY, cw.sensors().relativeHumidity, 2, &reading));
    TEST_ASSERT_EQUAL_STRING("relative_humidity", reading.name);
    TEST_ASSERT_FLOAT_WITHIN(0.01, 40000 * 125.0 / 65536.0 - 6.0, reading.value);

    TEST_ASSERT_EQUAL(2, port.writeLogCount - first);
}

void test_full_snapshot(void) {
    simulateDevice("5.89");
    CloudWatcher cw(port, configManager.get());
    TEST_ASSERT_EQUAL(CW_OK, cw.open());

    TelemetrySnapshot snapshot;
    TEST_ASSERT_EQUAL(CW_OK, cw.readTelemetry(&snapshot));
    TEST_ASSERT_EQUAL(11, snapshot.count);

    const TelemetryReading* sky = snapshot.find("sky_temperature");
    TEST_ASSERT_NOT_NULL(sky);
    TEST_ASSERT_FLOAT_WITHIN(0.001, -15.23, sky->value);

    const TelemetryReading* rain = snapshot.find("rain_frequency");
    TEST_ASSERT_NOT_NULL(rain);
    TEST_ASSERT_EQUAL(READING_VALID, rain->validity);
    TEST_ASSERT_EQUAL_INT32(2600, rain->raw);

    const TelemetryReading* supply = snapshot.find("supply_voltage");
    TEST_ASSERT_NOT_NULL(supply);
    TEST_ASSERT_FLOAT_WITHIN(0.01, 1023.0 * 3.10 / 341.0, supply->value);

    const TelemetryReading* humidity = snapshot.find("relative_humidity");
    TEST_ASSERT_NOT_NULL(humidity);
    TEST_ASSERT_FLOAT_WITHIN(0.01, 40000 * 125.0 / 65536.0 - 6.0, humidity->value);

    const TelemetryReading* wind = snapshot.find("wind_speed");
    TEST_ASSERT_NOT_NULL(wind);
    TEST_ASSERT_FLOAT_WITHIN(0.001, 11.4, wind->value);

    const TelemetryReading* pressure = snapshot.find("pressure");
    TEST_ASSERT_NOT_NULL(pressure);
    TEST_ASSERT_FLOAT_WITHIN(0.001, 1012.5, pressure->value);
}

void test_snapshot_command_order(void) {
    simulateDevice("5.89");
    CloudWatcher cw(port, configManager.get());
    TEST_ASSERT_EQUAL(CW_OK, cw.open());
    size_t first = port.writeLogCount;

    TelemetrySnapshot snapshot;
    TEST_ASSERT_EQUAL(CW_OK, cw.readTelemetry(&snapshot));

    const char* expected[] = { "S!", "T!", "E!", "C!", "t!", "h!", "V!", "p!" };
    TEST_ASSERT_EQUAL(8, port.writeLogCount - first);
    for (size_t i = 0; i < 8; i++) {
        TEST_ASSERT_EQUAL_MEMORY(expected[i], port.writeLog[first + i].data, 2);
    }
}

void test_snapshot_old_firmware_reports_absent(void) {
    simulateDevice("5.50");
    port.setReply("v!", "!v 0");
    const char* values[] = { "!6 341", "!4 512", "!5 512" };
    port.setReply("C!", values, 3);
    CloudWatcher cw(port, configManager.get());
    TEST_ASSERT_EQUAL(CW_OK, cw.open());

    TelemetrySnapshot snapshot;
    TEST_ASSERT_EQUAL(CW_OK, cw.readTelemetry(&snapshot));
    TEST_ASSERT_EQUAL(11, snapshot.count);
    TEST_ASSERT_EQUAL(READING_SENSOR_ABSENT, snapshot.find("ambient_temperature")->validity);
    TEST_ASSERT_EQUAL(READING_SENSOR_ABSENT, snapshot.find("relative_humidity")->validity);
    TEST_ASSERT_EQUAL(READING_SENSOR_ABSENT, snapshot.find("wind_speed")->validity);
    TEST_ASSERT_EQUAL(READING_SENSOR_ABSENT, snapshot.find("pressure")->validity);
    TEST_ASSERT_EQUAL(READING_SENSOR_ABSENT, snapshot.find("light_frequency")->validity);
    TEST_ASSERT_EQUAL(READING_VALID, snapshot.find("ambient_light")->validity);
    TEST_ASSERT_EQUAL(0, port.countWrites("t!"));
    TEST_ASSERT_EQUAL(0, port.countWrites("V!"));
    TEST_ASSERT_EQUAL(0, port.countWrites("p!"));
}

void test_snapshot_absent_sensor_sentinel(void) {
    simulateDevice("5.89");
    port.setReply("p!", "!p 65535");
    CloudWatcher cw(port, configManager.get());
    TEST_ASSERT_EQUAL(CW_OK, cw.open());

    TelemetrySnapshot snapshot;
    TEST_ASSERT_EQUAL(CW_OK, cw.readTelemetry(&snapshot));
    const TelemetryReading* pressure = snapshot.find("pressure");
    TEST_ASSERT_EQUAL(READING_SENSOR_ABSENT, pressure->validity);
    TEST_ASSERT_TRUE(isnan(pressure->value));
}

void test_snapshot_fails_on_silent_channel(void) {
    simulateDevice("5.89");
    CloudWatcher cw(port, configManager.get());
    TEST_ASSERT_EQUAL(CW_OK, cw.open());

    port.setReplyRaw("E!", CW_HANDSHAKE_BLOCK, 0);
    TelemetrySnapshot snapshot;
    TEST_ASSERT_EQUAL(CW_ERR_DEVICE_UNRESPONSIVE, cw.readTelemetry(&snapshot));
    TEST_ASSERT_TRUE(cw.isOpen());
}

// =============================================================================
// FIRMWARE VERSION PARSING
// =============================================================================

void test_parse_firmware_level(void) {
    TEST_ASSERT_EQUAL(589, cw_parseFirmwareLevel("5.89"));
    TEST_ASSERT_EQUAL(560, cw_parseFirmwareLevel("5.6"));
    TEST_ASSERT_EQUAL(300, cw_parseFirmwareLevel("3"));
    TEST_ASSERT_EQUAL(0, cw_parseFirmwareLevel("v5"));
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Session
    RUN_TEST(test_open_reads_identity);
    RUN_TEST(test_open_old_firmware_skips_newer_commands);
    RUN_TEST(test_open_rejects_other_device);
    RUN_TEST(test_open_locked_port);
    RUN_TEST(test_open_rejects_invalid_config);
    RUN_TEST(test_io_error_closes_session);
    RUN_TEST(test_calls_before_open_fail);

    // Actuators
    RUN_TEST(test_switch_status_and_control);
    RUN_TEST(test_switch_status_text_is_checked);
    RUN_TEST(test_heater_pwm);
    RUN_TEST(test_heater_pwm_out_of_range_not_sent);
    RUN_TEST(test_internal_errors);
    RUN_TEST(test_reset_buffers);

    // Telemetry
    RUN_TEST(test_read_single_channel);
    RUN_TEST(test_full_snapshot);
    RUN_TEST(test_snapshot_command_order);
    RUN_TEST(test_snapshot_old_firmware_reports_absent);
    RUN_TEST(test_snapshot_absent_sensor_sentinel);
    RUN_TEST(test_snapshot_fails_on_silent_channel);

    // Version parsing
    RUN_TEST(test_parse_firmware_level);

    return UNITY_END();
}
