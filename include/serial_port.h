/**
 * @file serial_port.h
 * @brief Byte-oriented duplex transport used by the protocol engine
 *
 * Every read and write carries its own deadline. Implementations have no
 * knowledge of the CloudWatcher protocol.
 */

#ifndef SERIAL_PORT_H
#define SERIAL_PORT_H

#include <stdint.h>
#include <stddef.h>
#include "cw_error.h"

class SerialPort {
public:
    virtual ~SerialPort() {}

    /**
     * Acquire the port exclusively and configure it
     * @return CW_ERR_PORT_LOCKED if another process holds it
     */
    virtual CwError open(const char* path, uint32_t baud) = 0;

    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /**
     * Write all bytes before the deadline
     */
    virtual CwError write(const uint8_t* data, size_t len, uint32_t timeoutMs) = 0;

    /**
     * Read exactly len bytes before the deadline.
     * Bytes consumed before a timeout are discarded.
     */
    virtual CwError readExact(uint8_t* buf, size_t len, uint32_t timeoutMs) = 0;

    /**
     * Read until the received data ends with the delimiter.
     * @param outLen Bytes stored in buf, delimiter included
     * @return CW_ERR_MALFORMED if maxLen bytes arrive without the delimiter
     */
    virtual CwError readUntil(const uint8_t* delim, size_t delimLen,
                              uint8_t* buf, size_t maxLen, size_t* outLen,
                              uint32_t timeoutMs);

    /**
     * Drop anything waiting in the receive buffer
     */
    virtual void flushInput() = 0;

    virtual CwError setBaudRate(uint32_t baud) = 0;

    virtual uint32_t baudRate() const = 0;
};

#endif /* SERIAL_PORT_H */
