/**
 * @file command_table.cpp
 * @brief Default CloudWatcher command table
 */

#include <string.h>
#include "command_table.h"

static const CommandDef defaultCommands[] = {
    // id                           token  args shape                  blocks min  prefix   timeout
    { CW_CMD_INTERNAL_NAME,         "A",   0,   CW_RESPONSE_FIXED,     1,     1,   "!N",    0 },
    { CW_CMD_FIRMWARE_VERSION,      "B",   0,   CW_RESPONSE_FIXED,     1,     1,   "!V",    0 },
    { CW_CMD_VALUES,                "C",   0,   CW_RESPONSE_DELIMITED, CW_MAX_DATA_BLOCKS, 3,   nullptr, 0 },
    { CW_CMD_INTERNAL_ERRORS,       "D",   0,   CW_RESPONSE_FIXED,     4,     4,   "!E1",   0 },
    { CW_CMD_RAIN_FREQUENCY,        "E",   0,   CW_RESPONSE_FIXED,     1,     1,   "!R",    0 },
    { CW_CMD_SWITCH_STATUS,         "F",   0,   CW_RESPONSE_FIXED,     1,     1,   nullptr, 0 },
    { CW_CMD_SWITCH_OPEN,           "G",   0,   CW_RESPONSE_FIXED,     1,     1,   "!X",    0 },
    { CW_CMD_SWITCH_CLOSE,          "H",   0,   CW_RESPONSE_FIXED,     1,     1,   "!Y",    0 },
    { CW_CMD_SET_PWM,               "P",   4,   CW_RESPONSE_FIXED,     1,     1,   "!Q",    0 },
    { CW_CMD_GET_PWM,               "Q",   0,   CW_RESPONSE_FIXED,     1,     1,   "!Q",    0 },
    { CW_CMD_SKY_IR_TEMP,           "S",   0,   CW_RESPONSE_FIXED,     1,     1,   "!1",    0 },
    { CW_CMD_IR_SENSOR_TEMP,        "T",   0,   CW_RESPONSE_FIXED,     1,     1,   "!2",    0 },
    { CW_CMD_SERIAL_NUMBER,         "K",   0,   CW_RESPONSE_FIXED,     1,     1,   "!K",    0 },
    { CW_CMD_ELECTRICAL_CONSTANTS,  "M",   0,   CW_RESPONSE_FIXED,     1,     1,   "!M",    0 },
    { CW_CMD_ANEMOMETER_PRESENT,    "v",   0,   CW_RESPONSE_FIXED,     1,     1,   "!v",    0 },
    { CW_CMD_WIND_SPEED,            "V",   0,   CW_RESPONSE_FIXED,     1,     1,   "!w",    0 },
    { CW_CMD_HUMIDITY,              "h",   0,   CW_RESPONSE_FIXED,     1,     1,   "!h",    0 },
    { CW_CMD_TEMPERATURE,           "t",   0,   CW_RESPONSE_FIXED,     1,     1,   "!t",    0 },
    { CW_CMD_PRESSURE,              "p",   0,   CW_RESPONSE_FIXED,     1,     1,   "!p",    0 },
    { CW_CMD_RESET_BUFFERS,         "z",   0,   CW_RESPONSE_FIXED,     0,     0,   nullptr, 0 },
};

static const CommandTable defaultTable = {
    defaultCommands,
    sizeof(defaultCommands) / sizeof(defaultCommands[0])
};

const CommandTable* cw_default_command_table(void) {
    return &defaultTable;
}

const CommandDef* commandTable_find(const CommandTable* table, CwCommandId id) {
    if (table == nullptr) {
        return nullptr;
    }
    for (size_t i = 0; i < table->count; i++) {
        if (table->entries[i].id == id) {
            return &table->entries[i];
        }
    }
    return nullptr;
}

bool command_make(Command* cmd, const CommandDef* def, const char* args) {
    if (cmd == nullptr || def == nullptr || def->argLen > CW_MAX_COMMAND_ARGS) {
        return false;
    }

    size_t len = (args != nullptr) ? strlen(args) : 0;
    if (len != def->argLen) {
        return false;
    }

    memset(cmd, 0, sizeof(*cmd));
    cmd->def = def;
    cmd->argLen = (uint8_t)len;
    if (len > 0) {
        memcpy(cmd->args, args, len);
    }
    return true;
}
