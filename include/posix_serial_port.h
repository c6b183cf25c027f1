/**
 * @file posix_serial_port.h
 * @brief termios serial port for Linux hosts
 *
 * Raw 8N1, no flow control. The port is locked with flock() and
 * TIOCEXCL while open so a second driver instance fails fast instead of
 * interleaving bytes.
 */

#ifndef POSIX_SERIAL_PORT_H
#define POSIX_SERIAL_PORT_H

#include "serial_port.h"

class PosixSerialPort : public SerialPort {
public:
    PosixSerialPort();
    ~PosixSerialPort() override;

    CwError open(const char* path, uint32_t baud) override;
    void close() override;
    bool isOpen() const override { return _fd >= 0; }

    CwError write(const uint8_t* data, size_t len, uint32_t timeoutMs) override;
    CwError readExact(uint8_t* buf, size_t len, uint32_t timeoutMs) override;
    void flushInput() override;

    CwError setBaudRate(uint32_t baud) override;
    uint32_t baudRate() const override { return _baud; }

private:
    // Not copyable, owns the descriptor
    PosixSerialPort(const PosixSerialPort&);
    PosixSerialPort& operator=(const PosixSerialPort&);

    CwError waitFor(short events, uint32_t timeoutMs);

    int      _fd;
    uint32_t _baud;
};

#endif /* POSIX_SERIAL_PORT_H */
