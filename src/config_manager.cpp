/**
 * @file config_manager.cpp
 * @brief Runtime configuration implementation
 */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>
#include <errno.h>
#include "config_manager.h"
#include "cw_debug.h"

static const uint32_t supportedBauds[] = {
    1200, 2400, 4800, 9600, 19200, 38400, 57600, 115200
};

static bool isSupportedBaud(uint32_t baud) {
    for (size_t i = 0; i < sizeof(supportedBauds) / sizeof(supportedBauds[0]); i++) {
        if (supportedBauds[i] == baud) {
            return true;
        }
    }
    return false;
}

static bool parseUnsigned(const char* text, uint32_t* out) {
    if (text == nullptr || *text == '\0' || *text == '-') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long value = strtoul(text, &end, 10);
    if (errno != 0 || *end != '\0' || value > 0xFFFFFFFFUL) {
        return false;
    }
    *out = (uint32_t)value;
    return true;
}

// Trim leading and trailing whitespace in place
static char* trim(char* s) {
    while (isspace((unsigned char)*s)) {
        s++;
    }
    char* end = s + strlen(s);
    while (end > s && isspace((unsigned char)end[-1])) {
        *--end = '\0';
    }
    return s;
}

bool cwConfig_validate(const CwConfig* config) {
    if (config->port[0] == '\0') {
        return false;
    }
    if (!isSupportedBaud(config->baud)) {
        return false;
    }
    if (config->readTimeoutMs < CW_MIN_TIMEOUT_MS || config->readTimeoutMs > CW_MAX_TIMEOUT_MS) {
        return false;
    }
    if (config->writeTimeoutMs < CW_MIN_TIMEOUT_MS || config->writeTimeoutMs > CW_MAX_TIMEOUT_MS) {
        return false;
    }
    if (config->retryCount > CW_MAX_RETRY_COUNT) {
        return false;
    }
    return config->anemometer == ANEMOMETER_BLACK || config->anemometer == ANEMOMETER_GREY;
}

ConfigManager::ConfigManager() {
    setDefaults();
}

void ConfigManager::setDefaults() {
    memset(&_config, 0, sizeof(_config));
    strncpy(_config.port, CW_DEFAULT_PORT, sizeof(_config.port) - 1);
    _config.baud = CW_DEFAULT_BAUD;
    _config.readTimeoutMs = CW_DEFAULT_READ_TIMEOUT_MS;
    _config.writeTimeoutMs = CW_DEFAULT_WRITE_TIMEOUT_MS;
    _config.retryCount = CW_DEFAULT_RETRY_COUNT;
    _config.anemometer = ANEMOMETER_BLACK;
}

CwError ConfigManager::setOption(const char* key, const char* value) {
    uint32_t number = 0;

    if (strcmp(key, "port") == 0) {
        if (value[0] == '\0' || strlen(value) >= sizeof(_config.port)) {
            CW_LOG_ERROR("Config: invalid port '%s'", value);
            return CW_ERR_INVALID_ARG;
        }
        strncpy(_config.port, value, sizeof(_config.port) - 1);
        _config.port[sizeof(_config.port) - 1] = '\0';
        return CW_OK;
    }

    if (strcmp(key, "anemometer") == 0) {
        if (strcmp(value, "black") == 0) {
            _config.anemometer = ANEMOMETER_BLACK;
        } else if (strcmp(value, "grey") == 0 || strcmp(value, "gray") == 0) {
            _config.anemometer = ANEMOMETER_GREY;
        } else {
            CW_LOG_ERROR("Config: unknown anemometer model '%s'", value);
            return CW_ERR_INVALID_ARG;
        }
        return CW_OK;
    }

    if (!parseUnsigned(value, &number)) {
        CW_LOG_ERROR("Config: '%s' needs a number, got '%s'", key, value);
        return CW_ERR_INVALID_ARG;
    }

    if (strcmp(key, "baud") == 0) {
        if (!isSupportedBaud(number)) {
            CW_LOG_ERROR("Config: unsupported baud rate %u", number);
            return CW_ERR_INVALID_ARG;
        }
        _config.baud = number;
    } else if (strcmp(key, "read_timeout") == 0 || strcmp(key, "write_timeout") == 0) {
        if (number < CW_MIN_TIMEOUT_MS || number > CW_MAX_TIMEOUT_MS) {
            CW_LOG_ERROR("Config: %s must be %d..%d ms", key, CW_MIN_TIMEOUT_MS, CW_MAX_TIMEOUT_MS);
            return CW_ERR_INVALID_ARG;
        }
        if (key[0] == 'r') {
            _config.readTimeoutMs = number;
        } else {
            _config.writeTimeoutMs = number;
        }
    } else if (strcmp(key, "retry_count") == 0) {
        if (number > CW_MAX_RETRY_COUNT) {
            CW_LOG_ERROR("Config: retry_count must be 0..%d", CW_MAX_RETRY_COUNT);
            return CW_ERR_INVALID_ARG;
        }
        _config.retryCount = (uint8_t)number;
    } else {
        CW_LOG_ERROR("Config: unknown option '%s'", key);
        return CW_ERR_INVALID_ARG;
    }

    return CW_OK;
}

CwError ConfigManager::loadFile(const char* path) {
    FILE* fp = fopen(path, "r");
    if (fp == nullptr) {
        CW_LOG_ERROR("Config: cannot open %s: %s", path, strerror(errno));
        return CW_ERR_IO;
    }

    char line[256];
    int lineNo = 0;
    CwError result = CW_OK;

    while (fgets(line, sizeof(line), fp) != nullptr) {
        lineNo++;

        char* hash = strchr(line, '#');
        if (hash != nullptr) {
            *hash = '\0';
        }
        char* text = trim(line);
        if (*text == '\0') {
            continue;
        }

        char* eq = strchr(text, '=');
        if (eq == nullptr) {
            CW_LOG_ERROR("Config: %s:%d: expected key = value", path, lineNo);
            result = CW_ERR_INVALID_ARG;
            break;
        }
        *eq = '\0';

        result = setOption(trim(text), trim(eq + 1));
        if (result != CW_OK) {
            CW_LOG_ERROR("Config: %s:%d rejected", path, lineNo);
            break;
        }
    }

    if (result == CW_OK && ferror(fp)) {
        result = CW_ERR_IO;
    }
    fclose(fp);
    return result;
}

bool ConfigManager::validate() const {
    return cwConfig_validate(&_config);
}
