/**
 * @file upgrade_main.cpp
 * @brief CloudWatcher firmware upgrade tool
 *
 * Usage: cloudwatcher_upgrade <config-file> <firmware-image>
 *
 * Operation:
 * 1. Load the configuration and the firmware image
 * 2. Open the session and identify the device
 * 3. Run the upgrade, printing progress as blocks are acknowledged
 * 4. SIGINT aborts the transfer; the device keeps its running firmware
 *
 * Exit status is 0 only when the bootloader committed the new image.
 */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <signal.h>
#include <errno.h>

#include "cw_config.h"
#include "cw_debug.h"
#include "config_manager.h"
#include "posix_serial_port.h"
#include "cloudwatcher.h"
#include "firmware_upgrade.h"

static FirmwareUpgrade* activeUpgrade = nullptr;

// Function prototypes
static void onSignal(int sig);
static uint8_t* loadImage(const char* path, size_t* len);
static void onProgress(const UpgradeStatus* status, void* user_data);
static const char* causeName(UpgradeCause cause);

int main(int argc, char** argv) {
    if (argc != 3) {
        fprintf(stderr, "usage: %s <config-file> <firmware-image>\n", argv[0]);
        return EXIT_FAILURE;
    }

    CW_LOG_INIT();

    ConfigManager configManager;
    CwError err = configManager.loadFile(argv[1]);
    if (err != CW_OK) {
        fprintf(stderr, "%s: %s\n", argv[1], cwError_toString(err));
        return EXIT_FAILURE;
    }

    size_t imageLen = 0;
    uint8_t* image = loadImage(argv[2], &imageLen);
    if (image == nullptr) {
        return EXIT_FAILURE;
    }

    PosixSerialPort port;
    CloudWatcher cw(port, configManager.get());
    err = cw.open();
    if (err != CW_OK) {
        fprintf(stderr, "open %s: %s\n", configManager.get().port, cwError_toString(err));
        delete[] image;
        return EXIT_FAILURE;
    }
    printf("%s firmware %s -> %s (%u bytes)\n", cw.info().name, cw.info().version,
           argv[2], (unsigned)imageLen);

    FirmwareUpgrade upgrade(cw.engine());
    err = upgrade.begin(image, imageLen);
    delete[] image;
    if (err != CW_OK) {
        fprintf(stderr, "upgrade: %s\n", cwError_toString(err));
        return EXIT_FAILURE;
    }

    activeUpgrade = &upgrade;
    signal(SIGINT, onSignal);
    signal(SIGTERM, onSignal);

    int lastProgress = -1;
    UpgradeStatus status = upgrade.run(onProgress, &lastProgress);
    activeUpgrade = nullptr;
    printf("\n");

    cw.close();
    CW_LOG_FLUSH();

    if (status.state != UPGRADE_STATE_DONE) {
        fprintf(stderr, "upgrade aborted (%s), %u of %u blocks acknowledged\n",
                causeName(status.cause), (unsigned)status.blocksAcked, (unsigned)status.totalBlocks);
        return EXIT_FAILURE;
    }

    printf("upgrade complete, %u blocks, %u retries\n",
           (unsigned)status.totalBlocks, (unsigned)status.retries);
    return EXIT_SUCCESS;
}

static void onSignal(int sig) {
    (void)sig;
    // abort() only sets a flag checked by the next step
    if (activeUpgrade != nullptr) {
        activeUpgrade->abort();
    }
}

static uint8_t* loadImage(const char* path, size_t* len) {
    FILE* fp = fopen(path, "rb");
    if (fp == nullptr) {
        fprintf(stderr, "%s: %s\n", path, strerror(errno));
        return nullptr;
    }

    long size = -1;
    if (fseek(fp, 0, SEEK_END) == 0) {
        size = ftell(fp);
    }
    if (size <= 0 || size > CW_UPGRADE_MAX_IMAGE_SIZE || fseek(fp, 0, SEEK_SET) != 0) {
        fprintf(stderr, "%s: image must be 1..%d bytes\n", path, CW_UPGRADE_MAX_IMAGE_SIZE);
        fclose(fp);
        return nullptr;
    }

    uint8_t* image = new uint8_t[size];
    if (fread(image, 1, (size_t)size, fp) != (size_t)size) {
        fprintf(stderr, "%s: short read\n", path);
        delete[] image;
        fclose(fp);
        return nullptr;
    }
    fclose(fp);

    *len = (size_t)size;
    return image;
}

static void onProgress(const UpgradeStatus* status, void* user_data) {
    int* lastProgress = (int*)user_data;
    if (status->progress != *lastProgress) {
        *lastProgress = status->progress;
        printf("\r%3u%% (%u/%u)", (unsigned)status->progress,
               (unsigned)status->blocksAcked, (unsigned)status->totalBlocks);
        fflush(stdout);
    }
}

static const char* causeName(UpgradeCause cause) {
    switch (cause) {
        case UPGRADE_CAUSE_NONE:                return "none";
        case UPGRADE_CAUSE_HANDSHAKE_TIMEOUT:   return "no bootloader";
        case UPGRADE_CAUSE_HEADER_REJECTED:     return "header rejected";
        case UPGRADE_CAUSE_BLOCK_RETRIES:       return "block retries exhausted";
        case UPGRADE_CAUSE_VERIFY_MISMATCH:     return "CRC mismatch";
        case UPGRADE_CAUSE_VERIFY_TIMEOUT:      return "no verify answer";
        case UPGRADE_CAUSE_COMMIT_FAILED:       return "commit failed";
        case UPGRADE_CAUSE_IO:                  return "link error";
        case UPGRADE_CAUSE_USER_ABORT:          return "interrupted";
    }
    return "unknown";
}
