/**
 * @file posix_serial_port.cpp
 * @brief termios serial port implementation
 */

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include "posix_serial_port.h"
#include "cw_debug.h"
#include "cw_time.h"

static bool baudToSpeed(uint32_t baud, speed_t* speed) {
    switch (baud) {
        case 1200:   *speed = B1200;   return true;
        case 2400:   *speed = B2400;   return true;
        case 4800:   *speed = B4800;   return true;
        case 9600:   *speed = B9600;   return true;
        case 19200:  *speed = B19200;  return true;
        case 38400:  *speed = B38400;  return true;
        case 57600:  *speed = B57600;  return true;
        case 115200: *speed = B115200; return true;
        default:     return false;
    }
}

PosixSerialPort::PosixSerialPort()
    : _fd(-1)
    , _baud(0)
{
}

PosixSerialPort::~PosixSerialPort() {
    close();
}

CwError PosixSerialPort::open(const char* path, uint32_t baud) {
    if (_fd >= 0) {
        close();
    }

    speed_t speed;
    if (!baudToSpeed(baud, &speed)) {
        CW_LOG_ERROR("Serial: unsupported baud %u", baud);
        return CW_ERR_INVALID_ARG;
    }

    int fd = ::open(path, O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        CW_LOG_ERROR("Serial: open %s failed: %s", path, strerror(errno));
        return (errno == EBUSY) ? CW_ERR_PORT_LOCKED : CW_ERR_IO;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        CwError err = (errno == EWOULDBLOCK) ? CW_ERR_PORT_LOCKED : CW_ERR_IO;
        CW_LOG_ERROR("Serial: %s is in use by another process", path);
        ::close(fd);
        return err;
    }

    if (ioctl(fd, TIOCEXCL) != 0) {
        CW_LOG_WARNING("Serial: TIOCEXCL failed on %s: %s", path, strerror(errno));
    }

    struct termios tio;
    if (tcgetattr(fd, &tio) != 0) {
        CW_LOG_ERROR("Serial: tcgetattr failed: %s", strerror(errno));
        ::close(fd);
        return CW_ERR_IO;
    }

    cfmakeraw(&tio);
    tio.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
    tio.c_cflag |= CS8 | CLOCAL | CREAD;
    tio.c_iflag &= ~(IXON | IXOFF | IXANY);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    if (tcsetattr(fd, TCSANOW, &tio) != 0) {
        CW_LOG_ERROR("Serial: tcsetattr failed: %s", strerror(errno));
        ::close(fd);
        return CW_ERR_IO;
    }

    tcflush(fd, TCIOFLUSH);

    _fd = fd;
    _baud = baud;
    CW_LOG_INFO("Serial: opened %s at %u baud", path, baud);
    return CW_OK;
}

void PosixSerialPort::close() {
    if (_fd < 0) {
        return;
    }
    ioctl(_fd, TIOCNXCL);
    flock(_fd, LOCK_UN);
    ::close(_fd);
    _fd = -1;
    CW_LOG_DEBUG("Serial: closed");
}

CwError PosixSerialPort::waitFor(short events, uint32_t timeoutMs) {
    struct pollfd pfd;
    pfd.fd = _fd;
    pfd.events = events;
    pfd.revents = 0;

    int rc;
    do {
        rc = poll(&pfd, 1, (int)timeoutMs);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        CW_LOG_ERROR("Serial: poll failed: %s", strerror(errno));
        return CW_ERR_IO;
    }
    if (rc == 0) {
        return CW_ERR_TIMEOUT;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        CW_LOG_ERROR("Serial: device disconnected");
        return CW_ERR_IO;
    }
    return CW_OK;
}

CwError PosixSerialPort::write(const uint8_t* data, size_t len, uint32_t timeoutMs) {
    if (_fd < 0) {
        return CW_ERR_NOT_OPEN;
    }

    uint32_t start = cw_millis();
    size_t sent = 0;

    while (sent < len) {
        CwError err = waitFor(POLLOUT, cw_remaining(start, timeoutMs));
        if (err != CW_OK) {
            return err;
        }

        ssize_t n = ::write(_fd, &data[sent], len - sent);
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }
            CW_LOG_ERROR("Serial: write failed: %s", strerror(errno));
            return CW_ERR_IO;
        }
        sent += (size_t)n;
    }

    // Wait for the bytes to leave the UART before the response deadline starts
    if (tcdrain(_fd) != 0) {
        CW_LOG_ERROR("Serial: tcdrain failed: %s", strerror(errno));
        return CW_ERR_IO;
    }
    return CW_OK;
}

CwError PosixSerialPort::readExact(uint8_t* buf, size_t len, uint32_t timeoutMs) {
    if (_fd < 0) {
        return CW_ERR_NOT_OPEN;
    }

    uint32_t start = cw_millis();
    size_t got = 0;

    while (got < len) {
        uint32_t remaining = cw_remaining(start, timeoutMs);
        if (remaining == 0) {
            return CW_ERR_TIMEOUT;
        }

        CwError err = waitFor(POLLIN, remaining);
        if (err != CW_OK) {
            return err;
        }

        ssize_t n = ::read(_fd, &buf[got], len - got);
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }
            CW_LOG_ERROR("Serial: read failed: %s", strerror(errno));
            return CW_ERR_IO;
        }
        if (n == 0) {
            // Readable with no data means the line went away
            CW_LOG_ERROR("Serial: end of file on read");
            return CW_ERR_IO;
        }
        got += (size_t)n;
    }

    return CW_OK;
}

void PosixSerialPort::flushInput() {
    if (_fd >= 0) {
        tcflush(_fd, TCIFLUSH);
    }
}

CwError PosixSerialPort::setBaudRate(uint32_t baud) {
    if (_fd < 0) {
        return CW_ERR_NOT_OPEN;
    }

    speed_t speed;
    if (!baudToSpeed(baud, &speed)) {
        return CW_ERR_INVALID_ARG;
    }

    struct termios tio;
    if (tcgetattr(_fd, &tio) != 0) {
        return CW_ERR_IO;
    }
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);
    if (tcsetattr(_fd, TCSADRAIN, &tio) != 0) {
        CW_LOG_ERROR("Serial: cannot switch to %u baud: %s", baud, strerror(errno));
        return CW_ERR_IO;
    }

    _baud = baud;
    CW_LOG_DEBUG("Serial: baud now %u", baud);
    return CW_OK;
}
