/**
 * @file config_manager.h
 * @brief Runtime configuration for a CloudWatcher session
 *
 * Starts from the compile-time defaults in cw_config.h. Options can be
 * changed one at a time or loaded from a "key = value" file:
 *
 *     # CloudWatcher on the observatory roof
 *     port          = /dev/ttyUSB1
 *     baud          = 9600
 *     read_timeout  = 2000
 *     write_timeout = 1000
 *     retry_count   = 3
 *     anemometer    = black
 */

#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include <stdint.h>
#include <stdbool.h>
#include "cw_config.h"
#include "cw_error.h"

/* ==========================================================================
 * DATA STRUCTURES
 * ========================================================================== */

enum AnemometerType {
    ANEMOMETER_BLACK = 0,           // Older model, needs the 0.84x+3 correction
    ANEMOMETER_GREY                 // Reports km/h directly
};

struct CwConfig {
    char     port[CW_PORT_PATH_MAX];    // Serial device path
    uint32_t baud;                      // Session baud rate
    uint32_t readTimeoutMs;             // Default response deadline
    uint32_t writeTimeoutMs;            // Command write deadline
    uint8_t  retryCount;                // Extra round-trips on malformed frames
    AnemometerType anemometer;          // Wind speed conversion model
};

/* ==========================================================================
 * CONFIG MANAGER CLASS
 * ========================================================================== */

class ConfigManager {
public:
    ConfigManager();

    /**
     * Restore every option to its compile-time default
     */
    void setDefaults();

    /**
     * Set one option from its textual value
     * @param key Option name (port, baud, read_timeout, write_timeout,
     *            retry_count, anemometer)
     * @param value Option value
     * @return CW_OK, or CW_ERR_INVALID_ARG for an unknown key or bad value
     */
    CwError setOption(const char* key, const char* value);

    /**
     * Load options from a file. Blank lines and '#' comments are skipped.
     * Options set before the first bad line stay applied.
     * @return CW_ERR_IO if the file cannot be read, CW_ERR_INVALID_ARG on
     *         the first invalid line
     */
    CwError loadFile(const char* path);

    bool validate() const;

    const CwConfig& get() const { return _config; }
    CwConfig& get() { return _config; }

private:
    CwConfig _config;
};

/**
 * Check a configuration against the supported ranges
 */
bool cwConfig_validate(const CwConfig* config);

#endif /* CONFIG_MANAGER_H */
