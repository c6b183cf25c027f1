/**
 * @file command_table.h
 * @brief CloudWatcher command definitions
 *
 * Commands are single ASCII tokens, optional fixed-length arguments and a
 * '!' terminator. Answers are 15-byte blocks closed by the handshake
 * block. The engine only sees this table, so alternative command sets can
 * be injected without touching it.
 *
 *   Token  Answer                          Blocks
 *   A!     !N internal name                1
 *   B!     !V firmware version             1
 *   C!     !6 !4 !5 !3 [!8] values         variable (3..6)
 *   D!     !E1..!E4 internal errors        4
 *   E!     !R rain frequency               1
 *   F!     !X open / !Y closed             1
 *   G!     !X switch opened                1
 *   H!     !Y switch closed                1
 *   P####! !Q heater PWM set               1
 *   Q!     !Q heater PWM                   1
 *   S!     !1 sky IR temperature           1
 *   T!     !2 IR sensor temperature        1
 *   K!     !K serial number                1
 *   M!     !M electrical constants         1
 *   v!     !v anemometer present           1
 *   V!     !w wind speed                   1
 *   h!     !h / !hh relative humidity      1
 *   t!     !t / !th ambient temperature    1
 *   p!     !p pressure                     1
 *   z!     handshake only                  0
 */

#ifndef COMMAND_TABLE_H
#define COMMAND_TABLE_H

#include <stdint.h>
#include <stddef.h>
#include "cw_config.h"

/* ==========================================================================
 * COMMAND IDENTIFIERS
 * ========================================================================== */

enum CwCommandId {
    CW_CMD_INTERNAL_NAME = 0,
    CW_CMD_FIRMWARE_VERSION,
    CW_CMD_VALUES,
    CW_CMD_INTERNAL_ERRORS,
    CW_CMD_RAIN_FREQUENCY,
    CW_CMD_SWITCH_STATUS,
    CW_CMD_SWITCH_OPEN,
    CW_CMD_SWITCH_CLOSE,
    CW_CMD_SET_PWM,
    CW_CMD_GET_PWM,
    CW_CMD_SKY_IR_TEMP,
    CW_CMD_IR_SENSOR_TEMP,
    CW_CMD_SERIAL_NUMBER,
    CW_CMD_ELECTRICAL_CONSTANTS,
    CW_CMD_ANEMOMETER_PRESENT,
    CW_CMD_WIND_SPEED,
    CW_CMD_HUMIDITY,
    CW_CMD_TEMPERATURE,
    CW_CMD_PRESSURE,
    CW_CMD_RESET_BUFFERS,
    CW_CMD_COUNT
};

enum CwResponseShape {
    CW_RESPONSE_FIXED = 0,          // Exactly dataBlocks blocks, then handshake
    CW_RESPONSE_DELIMITED           // minBlocks..dataBlocks blocks, read until handshake
};

struct CommandDef {
    CwCommandId     id;
    const char*     token;          // ASCII token without terminator
    uint8_t         argLen;         // Required argument characters
    CwResponseShape shape;
    uint8_t         dataBlocks;     // Fixed count or maximum
    uint8_t         minBlocks;      // Delimited only: a handshake before this many is stale
    const char*     responsePrefix; // First block must start with it (nullptr = any '!')
    uint32_t        timeoutMs;      // 0 = session read timeout
};

struct CommandTable {
    const CommandDef* entries;
    size_t            count;
};

/**
 * One command ready to send: a definition plus its argument characters
 */
struct Command {
    const CommandDef* def;
    uint8_t           args[CW_MAX_COMMAND_ARGS];
    uint8_t           argLen;
};

/**
 * Built-in table for the CloudWatcher RS-232 command set
 */
const CommandTable* cw_default_command_table(void);

const CommandDef* commandTable_find(const CommandTable* table, CwCommandId id);

/**
 * Build a command from a definition
 * @param args Argument characters, may be nullptr when argLen is 0
 * @return false if the argument length does not match the definition
 */
bool command_make(Command* cmd, const CommandDef* def, const char* args);

#endif /* COMMAND_TABLE_H */
