/**
 * @file main.cpp
 * @brief CloudWatcher polling tool
 *
 * Usage: cloudwatcher_poll [config-file] [interval-seconds]
 *
 * Operation:
 * 1. Load the configuration file (defaults when omitted)
 * 2. Open the serial port and identify the device
 * 3. Read a telemetry snapshot and print one line per sensor
 * 4. Sleep for the interval and repeat until SIGINT/SIGTERM
 *
 * A link error ends the session; the tool reopens it on the next cycle.
 */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <signal.h>

#include "cw_config.h"
#include "cw_debug.h"
#include "cw_time.h"
#include "config_manager.h"
#include "posix_serial_port.h"
#include "cloudwatcher.h"

#define POLL_DEFAULT_INTERVAL_S     10
#define POLL_MAX_INTERVAL_S         3600

static volatile sig_atomic_t stopRequested = 0;

// Function prototypes
static void onSignal(int sig);
static bool parseInterval(const char* text, uint32_t* seconds);
static void printInfo(const DeviceInfo& info);
static void printSnapshot(const TelemetrySnapshot& snapshot);
static void sleepInterruptible(uint32_t seconds);

int main(int argc, char** argv) {
    ConfigManager configManager;
    uint32_t intervalS = POLL_DEFAULT_INTERVAL_S;

    CW_LOG_INIT();

    if (argc > 3) {
        fprintf(stderr, "usage: %s [config-file] [interval-seconds]\n", argv[0]);
        return EXIT_FAILURE;
    }
    if (argc >= 2) {
        CwError err = configManager.loadFile(argv[1]);
        if (err != CW_OK) {
            fprintf(stderr, "%s: %s\n", argv[1], cwError_toString(err));
            return EXIT_FAILURE;
        }
    }
    if (argc == 3 && !parseInterval(argv[2], &intervalS)) {
        fprintf(stderr, "interval must be 1..%d seconds\n", POLL_MAX_INTERVAL_S);
        return EXIT_FAILURE;
    }

    signal(SIGINT, onSignal);
    signal(SIGTERM, onSignal);

    PosixSerialPort port;
    CloudWatcher cw(port, configManager.get());

    CW_LOG_INFO("cloudwatcher_poll %s on %s", CW_DRIVER_VERSION_STRING, configManager.get().port);

    int exitCode = EXIT_SUCCESS;
    while (!stopRequested) {
        if (!cw.isOpen()) {
            CwError err = cw.open();
            if (err == CW_ERR_PORT_LOCKED || err == CW_ERR_INVALID_ARG ||
                err == CW_ERR_UNEXPECTED_RESPONSE) {
                // Retrying cannot fix these
                fprintf(stderr, "open %s: %s\n", configManager.get().port, cwError_toString(err));
                exitCode = EXIT_FAILURE;
                break;
            }
            if (err != CW_OK) {
                CW_LOG_WARNING("open failed: %s, retrying in %u s",
                               cwError_toString(err), (unsigned)intervalS);
                sleepInterruptible(intervalS);
                continue;
            }
            printInfo(cw.info());
        }

        TelemetrySnapshot snapshot;
        CwError err = cw.readTelemetry(&snapshot);
        if (err == CW_OK) {
            printSnapshot(snapshot);
        } else {
            CW_LOG_WARNING("snapshot failed: %s", cwError_toString(err));
        }

        sleepInterruptible(intervalS);
    }

    cw.close();
    CW_LOG_FLUSH();
    return exitCode;
}

static void onSignal(int sig) {
    (void)sig;
    stopRequested = 1;
}

static bool parseInterval(const char* text, uint32_t* seconds) {
    char* end = nullptr;
    long value = strtol(text, &end, 10);
    if (end == text || *end != '\0' || value < 1 || value > POLL_MAX_INTERVAL_S) {
        return false;
    }
    *seconds = (uint32_t)value;
    return true;
}

static void printInfo(const DeviceInfo& info) {
    printf("# %s firmware %s", info.name, info.version);
    if (info.serialNumber >= 0) {
        printf(" serial %d", (int)info.serialNumber);
    }
    printf(" anemometer %s\n", info.anemometerPresent ? "yes" : "no");
    fflush(stdout);
}

static void printSnapshot(const TelemetrySnapshot& snapshot) {
    for (size_t i = 0; i < snapshot.count; i++) {
        const TelemetryReading& r = snapshot.readings[i];
        if (r.validity == READING_SENSOR_ABSENT) {
            printf("%u %-24s %12s\n", (unsigned)snapshot.timestampMs, r.name, "-");
        } else {
            printf("%u %-24s %12.2f %-5s %s\n", (unsigned)snapshot.timestampMs, r.name,
                   r.value, r.unit, telemetry_validityName(r.validity));
        }
    }
    fflush(stdout);
}

static void sleepInterruptible(uint32_t seconds) {
    for (uint32_t i = 0; i < seconds * 10 && !stopRequested; i++) {
        cw_delay(100);
    }
}
