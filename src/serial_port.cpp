/**
 * @file serial_port.cpp
 * @brief Transport helpers shared by all SerialPort implementations
 */

#include <string.h>
#include "serial_port.h"
#include "cw_time.h"

CwError SerialPort::readUntil(const uint8_t* delim, size_t delimLen,
                              uint8_t* buf, size_t maxLen, size_t* outLen,
                              uint32_t timeoutMs) {
    uint32_t start = cw_millis();
    size_t len = 0;
    *outLen = 0;

    while (len < maxLen) {
        uint32_t remaining = cw_remaining(start, timeoutMs);
        if (remaining == 0) {
            return CW_ERR_TIMEOUT;
        }

        CwError err = readExact(&buf[len], 1, remaining);
        if (err != CW_OK) {
            return err;
        }
        len++;
        *outLen = len;

        if (len >= delimLen && memcmp(&buf[len - delimLen], delim, delimLen) == 0) {
            return CW_OK;
        }
    }

    return CW_ERR_MALFORMED;
}
