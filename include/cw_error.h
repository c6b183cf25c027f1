/**
 * @file cw_error.h
 * @brief Error codes shared by every CloudWatcher driver layer
 */

#ifndef CW_ERROR_H
#define CW_ERROR_H

enum CwError {
    CW_OK = 0,
    CW_ERR_IO,                      // Transport failure, fatal to the session
    CW_ERR_TIMEOUT,                 // Deadline elapsed without the expected bytes
    CW_ERR_MALFORMED,               // Response failed structural validation
    CW_ERR_BUSY,                    // Another command or an upgrade holds the session
    CW_ERR_DEVICE_UNRESPONSIVE,     // Timed out on the retried round-trip too
    CW_ERR_PROTOCOL_FAILURE,        // Malformed retries exhausted
    CW_ERR_UPGRADE_ABORTED,         // Firmware transfer stopped, old image still active
    CW_ERR_PORT_LOCKED,             // Serial port held by another process
    CW_ERR_NOT_OPEN,                // Session or port not open
    CW_ERR_INVALID_ARG,             // Caller supplied an out-of-range value
    CW_ERR_UNEXPECTED_RESPONSE      // Well-formed answer with unexpected content
};

/**
 * Human readable name of an error code
 */
const char* cwError_toString(CwError err);

#endif /* CW_ERROR_H */
