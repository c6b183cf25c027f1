/**
 * @file cw_config.h
 * @brief Compile-time configuration for the CloudWatcher host driver
 *
 * Every default can be overridden from the build line, e.g.
 * -DCW_DEFAULT_READ_TIMEOUT_MS=3000. Runtime values live in CwConfig
 * (see config_manager.h).
 */

#ifndef CW_CONFIG_H
#define CW_CONFIG_H

#include <stdint.h>

/* ==========================================================================
 * DRIVER VERSION
 * ========================================================================== */

#define CW_DRIVER_VERSION_MAJOR     1
#define CW_DRIVER_VERSION_MINOR     0
#define CW_DRIVER_VERSION_PATCH     0
#define CW_DRIVER_VERSION_STRING    "1.0.0"

/* ==========================================================================
 * LOGGING
 * ========================================================================== */

#ifndef CW_USE_SYSLOG
#define CW_USE_SYSLOG               0
#endif

#ifndef CW_USE_STDERR
#define CW_USE_STDERR               1
#endif

/* ==========================================================================
 * SERIAL LINK DEFAULTS
 * ========================================================================== */

#ifndef CW_DEFAULT_PORT
#define CW_DEFAULT_PORT             "/dev/ttyUSB0"
#endif

#ifndef CW_DEFAULT_BAUD
#define CW_DEFAULT_BAUD             9600
#endif

#ifndef CW_DEFAULT_READ_TIMEOUT_MS
#define CW_DEFAULT_READ_TIMEOUT_MS  2000
#endif

#ifndef CW_DEFAULT_WRITE_TIMEOUT_MS
#define CW_DEFAULT_WRITE_TIMEOUT_MS 1000
#endif

#ifndef CW_DEFAULT_RETRY_COUNT
#define CW_DEFAULT_RETRY_COUNT      3
#endif

#define CW_MAX_RETRY_COUNT          10
#define CW_MIN_TIMEOUT_MS           10
#define CW_MAX_TIMEOUT_MS           60000
#define CW_PORT_PATH_MAX            128

/* ==========================================================================
 * RESPONSE FRAMING
 * ========================================================================== */

#define CW_BLOCK_SIZE               15      // Every response block is 15 bytes
#define CW_MAX_DATA_BLOCKS          6       // Longest answer (C!) before the handshake
#define CW_MAX_FRAME_SIZE           ((CW_MAX_DATA_BLOCKS + 1) * CW_BLOCK_SIZE)
#define CW_COMMAND_TERMINATOR       '!'
#define CW_MAX_COMMAND_ARGS         8
#define CW_MAX_COMMAND_SIZE         16

/* ==========================================================================
 * DEVICE LIMITS
 * ========================================================================== */

#define CW_PWM_MAX                  1023
#define CW_ADC_MAX                  1023    // 10-bit readings in C! answers
#define CW_RAIN_FREQ_MAX            6000

// Firmware levels that introduced optional commands (x100)
#define CW_FW_ELECTRICAL_CONSTANTS  300
#define CW_FW_ANEMOMETER            500
#define CW_FW_HUMIDITY_TEMPERATURE  560
#define CW_FW_PRESSURE              580

/* ==========================================================================
 * FIRMWARE UPGRADE
 * ========================================================================== */

#ifndef CW_UPGRADE_BAUD
#define CW_UPGRADE_BAUD             57600
#endif

#ifndef CW_UPGRADE_BLOCK_SIZE
#define CW_UPGRADE_BLOCK_SIZE       128
#endif

#define CW_UPGRADE_MAX_BLOCK_SIZE   512
#define CW_UPGRADE_MAX_IMAGE_SIZE   (128 * 1024)
#define CW_UPGRADE_MAX_BLOCKS       0xFFFF      // Block count and index are 16-bit on the wire
#define CW_UPGRADE_BLOCK_TIMEOUT_MS 2000
#define CW_UPGRADE_MAX_BLOCK_RETRIES 3
#define CW_UPGRADE_HANDSHAKE_TIMEOUT_MS 5000
#define CW_UPGRADE_HANDSHAKE_RETRIES 3
#define CW_UPGRADE_VERIFY_TIMEOUT_MS 10000
#define CW_UPGRADE_COMMIT_TIMEOUT_MS 5000
#define CW_UPGRADE_COMMAND_GAP_MS   200

#endif /* CW_CONFIG_H */
