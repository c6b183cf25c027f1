/**
 * @file firmware_upgrade.h
 * @brief CloudWatcher firmware upgrade over the serial link
 *
 * Protocol:
 * 1. Host sends the reboot sequence B! O! O! T! at session baud
 * 2. Host switches to the bootloader baud; bootloader sends 'c', host
 *    answers 'd'
 * 3. Host sends the image header, bootloader ACKs
 * 4. Host sends each block, bootloader ACKs or NACKs it. A NACKed or
 *    unanswered block is resent, never the next one
 * 5. Host asks for the bootloader's CRC32 of the staged image and
 *    compares it with its own
 * 6. Host sends commit, bootloader ACKs and boots the new image
 *
 * Any failure sends CAN so the bootloader drops the staged image and
 * keeps the running firmware.
 *
 * Frames (multi-byte fields big-endian):
 *   Header  SOH 'H' size[4] blocks[2] blockSize[2] crc32[4] crc16[2]
 *   Block   STX index[2] len[2] data[len] crc16[2]   (crc over index..data)
 *   Verify  ENQ 'V'            -> 'V' crc32[4]
 *   Commit  EOT 'G'            -> ACK
 *   Abort   CAN
 */

#ifndef FIRMWARE_UPGRADE_H
#define FIRMWARE_UPGRADE_H

#include <stdint.h>
#include <stddef.h>
#include <signal.h>
#include "cw_config.h"
#include "cw_error.h"
#include "protocol_engine.h"

/* ==========================================================================
 * LINK BYTES
 * ========================================================================== */

#define UPGRADE_SOH                 0x01
#define UPGRADE_STX                 0x02
#define UPGRADE_EOT                 0x04
#define UPGRADE_ENQ                 0x05
#define UPGRADE_ACK                 0x06
#define UPGRADE_NACK                0x15
#define UPGRADE_CAN                 0x18
#define UPGRADE_HELLO               'c'     // Bootloader ready
#define UPGRADE_HELLO_REPLY         'd'     // Host present
#define UPGRADE_HEADER              'H'
#define UPGRADE_VERIFY              'V'
#define UPGRADE_COMMIT              'G'

#define UPGRADE_HEADER_FRAME_SIZE   16
#define UPGRADE_BLOCK_OVERHEAD      7       // STX + index + len + crc16
#define UPGRADE_MAX_STRAY_BYTES     64      // Noise tolerated while waiting for the hello

/* ==========================================================================
 * STATE MACHINE
 * ========================================================================== */

enum UpgradeState {
    UPGRADE_STATE_IDLE = 0,
    UPGRADE_STATE_HANDSHAKE_SENT,           // Reboot sequence sent, waiting for 'c'
    UPGRADE_STATE_BOOTLOADER_CONFIRMED,     // Handshake done, header next
    UPGRADE_STATE_TRANSFERRING,             // Sending blocks
    UPGRADE_STATE_VERIFYING,                // All blocks ACKed, comparing CRC
    UPGRADE_STATE_COMMITTING,               // CRC matched, commit sent
    UPGRADE_STATE_DONE,
    UPGRADE_STATE_ABORTED
};

enum UpgradeCause {
    UPGRADE_CAUSE_NONE = 0,
    UPGRADE_CAUSE_HANDSHAKE_TIMEOUT,
    UPGRADE_CAUSE_HEADER_REJECTED,
    UPGRADE_CAUSE_BLOCK_RETRIES,            // Block NACKed or unanswered too often
    UPGRADE_CAUSE_VERIFY_MISMATCH,
    UPGRADE_CAUSE_VERIFY_TIMEOUT,
    UPGRADE_CAUSE_COMMIT_FAILED,
    UPGRADE_CAUSE_IO,
    UPGRADE_CAUSE_USER_ABORT
};

enum BlockAckState {
    BLOCK_PENDING = 0,
    BLOCK_ACKED,
    BLOCK_NACKED,
    BLOCK_TIMED_OUT
};

struct UpgradeConfig {
    uint32_t upgradeBaud;
    uint16_t blockSize;
    uint32_t blockTimeoutMs;
    uint8_t  maxBlockRetries;           // Resends per block after the first try
    uint32_t handshakeTimeoutMs;
    uint8_t  handshakeRetries;
    uint32_t verifyTimeoutMs;
    uint32_t commitTimeoutMs;
    uint32_t commandGapMs;              // Pause between reboot sequence commands
};

struct UpgradeStatus {
    UpgradeState state;
    UpgradeState abortedIn;             // Phase the transfer was in when it aborted
    UpgradeCause cause;
    CwError      error;                 // CW_ERR_UPGRADE_ABORTED once aborted
    uint32_t     blocksAcked;
    uint32_t     totalBlocks;
    uint32_t     retries;
    uint8_t      progress;              // 0-100
};

/**
 * Progress callback
 * @param status Current status
 * @param user_data User context
 */
typedef void (*upgrade_progress_cb_t)(const UpgradeStatus* status, void* user_data);

void upgradeConfig_setDefaults(UpgradeConfig* config);

/* ==========================================================================
 * UPGRADE CLASS
 * ========================================================================== */

class FirmwareUpgrade {
public:
    /**
     * @param config Link parameters, nullptr for defaults
     */
    FirmwareUpgrade(ProtocolEngine& engine, const UpgradeConfig* config = nullptr);
    ~FirmwareUpgrade();

    /**
     * Take the session and start a transfer. The image is copied.
     * @return CW_ERR_BUSY if a command or another upgrade holds the session,
     *         CW_ERR_INVALID_ARG for an empty or oversized image
     */
    CwError begin(const uint8_t* image, size_t len);

    /**
     * Advance the state machine by one exchange
     */
    UpgradeStatus step();

    /**
     * Request an abort, honored at the next step. No effect once the
     * transfer is done or aborted. Async-signal-safe.
     */
    void abort();

    /**
     * Step until done or aborted
     */
    UpgradeStatus run(upgrade_progress_cb_t callback = nullptr, void* user_data = nullptr);

    const UpgradeStatus& getStatus() const { return _status; }
    UpgradeState getState() const { return _status.state; }
    bool isActive() const;

    /**
     * Acknowledgement state of one block, BLOCK_PENDING when out of range
     */
    BlockAckState getBlockState(uint32_t index) const;

private:
    FirmwareUpgrade(const FirmwareUpgrade&);
    FirmwareUpgrade& operator=(const FirmwareUpgrade&);

    void stepHandshake();
    void stepHeader();
    void stepBlock();
    void stepVerify();
    void stepCommit();

    CwError sendRebootSequence();
    CwError sendFrame(const uint8_t* data, size_t len);
    CwError awaitAck(uint32_t timeoutMs, uint8_t* reply);
    void    failIo(CwError err);
    void    abortTransfer(UpgradeCause cause);
    void    finish(UpgradeState state);
    void    releaseImage();
    void    updateProgress();

    ProtocolEngine& _engine;
    SerialPort&     _port;
    UpgradeConfig   _config;
    UpgradeStatus   _status;

    uint8_t*        _image;
    size_t          _imageLen;
    uint32_t        _imageCrc;
    uint8_t*        _blockStates;
    uint32_t        _currentBlock;
    uint8_t         _attempts;              // Tries of the current exchange
    uint32_t        _strayBytes;
    uint32_t        _sessionBaud;
    bool            _holdsSession;
    volatile sig_atomic_t _abortRequested;
};

#endif /* FIRMWARE_UPGRADE_H */
