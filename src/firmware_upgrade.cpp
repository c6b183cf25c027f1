/**
 * @file firmware_upgrade.cpp
 * @brief CloudWatcher firmware upgrade state machine
 */

#include <string.h>
#include "firmware_upgrade.h"
#include "cw_crc.h"
#include "cw_debug.h"
#include "cw_time.h"

// Commands that drop the running firmware into its bootloader
static const char* const rebootSequence[] = { "B!", "O!", "O!", "T!" };

static void putU16(uint8_t* p, uint16_t v) {
    p[0] = (uint8_t)(v >> 8);
    p[1] = (uint8_t)v;
}

static void putU32(uint8_t* p, uint32_t v) {
    p[0] = (uint8_t)(v >> 24);
    p[1] = (uint8_t)(v >> 16);
    p[2] = (uint8_t)(v >> 8);
    p[3] = (uint8_t)v;
}

static uint32_t getU32(const uint8_t* p) {
    return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) | p[3];
}

static const char* stateName(UpgradeState state) {
    switch (state) {
        case UPGRADE_STATE_IDLE:                    return "idle";
        case UPGRADE_STATE_HANDSHAKE_SENT:          return "handshake";
        case UPGRADE_STATE_BOOTLOADER_CONFIRMED:    return "header";
        case UPGRADE_STATE_TRANSFERRING:            return "transfer";
        case UPGRADE_STATE_VERIFYING:               return "verify";
        case UPGRADE_STATE_COMMITTING:              return "commit";
        case UPGRADE_STATE_DONE:                    return "done";
        case UPGRADE_STATE_ABORTED:                 return "aborted";
    }
    return "?";
}

void upgradeConfig_setDefaults(UpgradeConfig* config) {
    config->upgradeBaud = CW_UPGRADE_BAUD;
    config->blockSize = CW_UPGRADE_BLOCK_SIZE;
    config->blockTimeoutMs = CW_UPGRADE_BLOCK_TIMEOUT_MS;
    config->maxBlockRetries = CW_UPGRADE_MAX_BLOCK_RETRIES;
    config->handshakeTimeoutMs = CW_UPGRADE_HANDSHAKE_TIMEOUT_MS;
    config->handshakeRetries = CW_UPGRADE_HANDSHAKE_RETRIES;
    config->verifyTimeoutMs = CW_UPGRADE_VERIFY_TIMEOUT_MS;
    config->commitTimeoutMs = CW_UPGRADE_COMMIT_TIMEOUT_MS;
    config->commandGapMs = CW_UPGRADE_COMMAND_GAP_MS;
}

FirmwareUpgrade::FirmwareUpgrade(ProtocolEngine& engine, const UpgradeConfig* config)
    : _engine(engine)
    , _port(engine.port())
    , _image(nullptr)
    , _imageLen(0)
    , _imageCrc(0)
    , _blockStates(nullptr)
    , _currentBlock(0)
    , _attempts(0)
    , _strayBytes(0)
    , _sessionBaud(0)
    , _holdsSession(false)
    , _abortRequested(0)
{
    if (config != nullptr) {
        _config = *config;
    } else {
        upgradeConfig_setDefaults(&_config);
    }
    memset(&_status, 0, sizeof(_status));
    _status.state = UPGRADE_STATE_IDLE;
    _status.abortedIn = UPGRADE_STATE_IDLE;
}

FirmwareUpgrade::~FirmwareUpgrade() {
    if (isActive()) {
        abortTransfer(UPGRADE_CAUSE_USER_ABORT);
    }
    releaseImage();
    delete[] _blockStates;
}

bool FirmwareUpgrade::isActive() const {
    return _status.state != UPGRADE_STATE_IDLE &&
           _status.state != UPGRADE_STATE_DONE &&
           _status.state != UPGRADE_STATE_ABORTED;
}

BlockAckState FirmwareUpgrade::getBlockState(uint32_t index) const {
    if (_blockStates == nullptr || index >= _status.totalBlocks) {
        return BLOCK_PENDING;
    }
    return (BlockAckState)_blockStates[index];
}

/* ==========================================================================
 * START / STOP
 * ========================================================================== */

CwError FirmwareUpgrade::begin(const uint8_t* image, size_t len) {
    if (isActive()) {
        return CW_ERR_BUSY;
    }
    if (image == nullptr || len == 0 || len > CW_UPGRADE_MAX_IMAGE_SIZE) {
        CW_LOG_ERROR("Upgrade: image size %u not supported", (unsigned)len);
        return CW_ERR_INVALID_ARG;
    }
    if (_config.blockSize == 0 || _config.blockSize > CW_UPGRADE_MAX_BLOCK_SIZE) {
        CW_LOG_ERROR("Upgrade: block size %u not supported", (unsigned)_config.blockSize);
        return CW_ERR_INVALID_ARG;
    }

    uint32_t totalBlocks = (uint32_t)((len + _config.blockSize - 1) / _config.blockSize);
    if (totalBlocks > CW_UPGRADE_MAX_BLOCKS) {
        CW_LOG_ERROR("Upgrade: %u blocks of %u bytes exceed the 16-bit block index",
                     (unsigned)totalBlocks, (unsigned)_config.blockSize);
        return CW_ERR_INVALID_ARG;
    }

    if (!_port.isOpen()) {
        return CW_ERR_NOT_OPEN;
    }
    if (!_engine.acquireExclusive()) {
        CW_LOG_WARNING("Upgrade: session busy");
        return CW_ERR_BUSY;
    }
    _holdsSession = true;

    releaseImage();
    delete[] _blockStates;
    _image = new uint8_t[len];
    memcpy(_image, image, len);
    _imageLen = len;
    _imageCrc = cw_crc32(_image, _imageLen);
    _blockStates = new uint8_t[totalBlocks];
    memset(_blockStates, BLOCK_PENDING, totalBlocks);

    memset(&_status, 0, sizeof(_status));
    _status.totalBlocks = totalBlocks;
    _status.abortedIn = UPGRADE_STATE_IDLE;
    _currentBlock = 0;
    _attempts = 0;
    _strayBytes = 0;
    _abortRequested = 0;
    _sessionBaud = _port.baudRate();

    CW_LOG_INFO("Upgrade: %u bytes in %u blocks, CRC32 %08X",
                (unsigned)len, (unsigned)totalBlocks, (unsigned)_imageCrc);

    _status.state = UPGRADE_STATE_HANDSHAKE_SENT;
    CwError err = sendRebootSequence();
    if (err != CW_OK) {
        failIo(err);
        return CW_ERR_UPGRADE_ABORTED;
    }
    return CW_OK;
}

void FirmwareUpgrade::abort() {
    // Safe from a signal handler: step() ignores the flag once finished and begin() clears it
    _abortRequested = 1;
}

void FirmwareUpgrade::abortTransfer(UpgradeCause cause) {
    if (!isActive()) {
        return;
    }

    CW_LOG_ERROR("Upgrade: aborted in %s phase, cause %d", stateName(_status.state), (int)cause);
    _status.abortedIn = _status.state;
    _status.cause = cause;
    _status.error = CW_ERR_UPGRADE_ABORTED;

    if (_port.isOpen()) {
        uint8_t can = UPGRADE_CAN;
        CwError err = _port.write(&can, 1, _engine.config().writeTimeoutMs);
        if (err != CW_OK) {
            CW_LOG_WARNING("Upgrade: could not send CAN: %s", cwError_toString(err));
        }
    }

    finish(UPGRADE_STATE_ABORTED);
}

void FirmwareUpgrade::failIo(CwError err) {
    CW_LOG_ERROR("Upgrade: link error: %s", cwError_toString(err));
    abortTransfer(UPGRADE_CAUSE_IO);
}

void FirmwareUpgrade::finish(UpgradeState state) {
    if (_port.isOpen()) {
        if (_port.baudRate() != _sessionBaud) {
            CwError err = _port.setBaudRate(_sessionBaud);
            if (err != CW_OK) {
                CW_LOG_ERROR("Upgrade: cannot restore %u baud: %s",
                             (unsigned)_sessionBaud, cwError_toString(err));
            }
        }
        _port.flushInput();
    }

    if (_holdsSession) {
        _engine.releaseExclusive();
        _holdsSession = false;
    }

    releaseImage();
    _status.state = state;
    _abortRequested = 0;
    updateProgress();
}

void FirmwareUpgrade::releaseImage() {
    delete[] _image;
    _image = nullptr;
    _imageLen = 0;
}

void FirmwareUpgrade::updateProgress() {
    if (_status.state == UPGRADE_STATE_DONE) {
        _status.progress = 100;
    } else if (_status.totalBlocks > 0) {
        _status.progress = (uint8_t)((_status.blocksAcked * 100) / _status.totalBlocks);
    }
}

/* ==========================================================================
 * STATE MACHINE
 * ========================================================================== */

UpgradeStatus FirmwareUpgrade::step() {
    if (!isActive()) {
        return _status;
    }

    if (_abortRequested) {
        abortTransfer(UPGRADE_CAUSE_USER_ABORT);
        return _status;
    }

    switch (_status.state) {
        case UPGRADE_STATE_HANDSHAKE_SENT:
            stepHandshake();
            break;
        case UPGRADE_STATE_BOOTLOADER_CONFIRMED:
            stepHeader();
            break;
        case UPGRADE_STATE_TRANSFERRING:
            stepBlock();
            break;
        case UPGRADE_STATE_VERIFYING:
            stepVerify();
            break;
        case UPGRADE_STATE_COMMITTING:
            stepCommit();
            break;
        default:
            break;
    }

    if (_abortRequested && isActive()) {
        abortTransfer(UPGRADE_CAUSE_USER_ABORT);
    }

    updateProgress();
    return _status;
}

UpgradeStatus FirmwareUpgrade::run(upgrade_progress_cb_t callback, void* user_data) {
    while (isActive()) {
        step();
        if (callback != nullptr) {
            callback(&_status, user_data);
        }
    }
    return _status;
}

CwError FirmwareUpgrade::sendRebootSequence() {
    for (size_t i = 0; i < sizeof(rebootSequence) / sizeof(rebootSequence[0]); i++) {
        CwError err = sendFrame((const uint8_t*)rebootSequence[i], strlen(rebootSequence[i]));
        if (err != CW_OK) {
            return err;
        }
        if (_config.commandGapMs > 0) {
            cw_delay(_config.commandGapMs);
        }
    }

    _port.flushInput();
    CwError err = _port.setBaudRate(_config.upgradeBaud);
    if (err != CW_OK) {
        return err;
    }
    CW_LOG_DEBUG("Upgrade: reboot sequence sent, waiting for bootloader at %u baud",
                 (unsigned)_config.upgradeBaud);
    return CW_OK;
}

CwError FirmwareUpgrade::sendFrame(const uint8_t* data, size_t len) {
    return _port.write(data, len, _engine.config().writeTimeoutMs);
}

CwError FirmwareUpgrade::awaitAck(uint32_t timeoutMs, uint8_t* reply) {
    *reply = 0;
    return _port.readExact(reply, 1, timeoutMs);
}

void FirmwareUpgrade::stepHandshake() {
    uint8_t b = 0;
    CwError err = _port.readExact(&b, 1, _config.handshakeTimeoutMs);

    if (err == CW_ERR_TIMEOUT) {
        _attempts++;
        CW_LOG_WARNING("Upgrade: no bootloader hello (%u/%u)",
                       (unsigned)_attempts, (unsigned)_config.handshakeRetries);
        if (_attempts > _config.handshakeRetries) {
            abortTransfer(UPGRADE_CAUSE_HANDSHAKE_TIMEOUT);
        }
        return;
    }
    if (err != CW_OK) {
        failIo(err);
        return;
    }

    if (b != UPGRADE_HELLO) {
        if (++_strayBytes > UPGRADE_MAX_STRAY_BYTES) {
            abortTransfer(UPGRADE_CAUSE_HANDSHAKE_TIMEOUT);
        }
        return;
    }

    uint8_t reply = UPGRADE_HELLO_REPLY;
    err = sendFrame(&reply, 1);
    if (err != CW_OK) {
        failIo(err);
        return;
    }

    CW_LOG_INFO("Upgrade: bootloader confirmed");
    _attempts = 0;
    _status.state = UPGRADE_STATE_BOOTLOADER_CONFIRMED;
}

void FirmwareUpgrade::stepHeader() {
    uint8_t frame[UPGRADE_HEADER_FRAME_SIZE];
    frame[0] = UPGRADE_SOH;
    frame[1] = UPGRADE_HEADER;
    putU32(&frame[2], (uint32_t)_imageLen);
    putU16(&frame[6], (uint16_t)_status.totalBlocks);
    putU16(&frame[8], _config.blockSize);
    putU32(&frame[10], _imageCrc);
    putU16(&frame[14], cw_crc16(frame, 14));

    CwError err = sendFrame(frame, sizeof(frame));
    if (err != CW_OK) {
        failIo(err);
        return;
    }

    uint8_t reply;
    err = awaitAck(_config.blockTimeoutMs, &reply);
    if (err == CW_OK && reply == UPGRADE_ACK) {
        _attempts = 0;
        _currentBlock = 0;
        _status.state = UPGRADE_STATE_TRANSFERRING;
        return;
    }
    if (err != CW_OK && err != CW_ERR_TIMEOUT) {
        failIo(err);
        return;
    }

    _attempts++;
    _status.retries++;
    _port.flushInput();
    if (_attempts > _config.maxBlockRetries) {
        abortTransfer(UPGRADE_CAUSE_HEADER_REJECTED);
    }
}

void FirmwareUpgrade::stepBlock() {
    uint32_t index = _currentBlock;
    size_t offset = (size_t)index * _config.blockSize;
    size_t len = _imageLen - offset;
    if (len > _config.blockSize) {
        len = _config.blockSize;
    }

    uint8_t frame[UPGRADE_BLOCK_OVERHEAD + CW_UPGRADE_MAX_BLOCK_SIZE];
    frame[0] = UPGRADE_STX;
    putU16(&frame[1], (uint16_t)index);
    putU16(&frame[3], (uint16_t)len);
    memcpy(&frame[5], &_image[offset], len);
    putU16(&frame[5 + len], cw_crc16(&frame[1], 4 + len));

    CwError err = sendFrame(frame, UPGRADE_BLOCK_OVERHEAD + len);
    if (err != CW_OK) {
        failIo(err);
        return;
    }

    uint8_t reply;
    err = awaitAck(_config.blockTimeoutMs, &reply);
    if (err != CW_OK && err != CW_ERR_TIMEOUT) {
        failIo(err);
        return;
    }

    if (err == CW_OK && reply == UPGRADE_ACK) {
        _blockStates[index] = BLOCK_ACKED;
        _status.blocksAcked++;
        _currentBlock++;
        _attempts = 0;
        if (_currentBlock >= _status.totalBlocks) {
            CW_LOG_INFO("Upgrade: all %u blocks acknowledged", (unsigned)_status.totalBlocks);
            _status.state = UPGRADE_STATE_VERIFYING;
        }
        return;
    }

    _blockStates[index] = (err == CW_ERR_TIMEOUT) ? BLOCK_TIMED_OUT : BLOCK_NACKED;
    _attempts++;
    _status.retries++;
    CW_LOG_WARNING("Upgrade: block %u %s (%u/%u)", (unsigned)index,
                   (err == CW_ERR_TIMEOUT) ? "timed out" : "rejected",
                   (unsigned)_attempts, (unsigned)_config.maxBlockRetries);

    // A late ACK for this try must not count for the resend
    _port.flushInput();
    if (_attempts > _config.maxBlockRetries) {
        abortTransfer(UPGRADE_CAUSE_BLOCK_RETRIES);
    }
}

void FirmwareUpgrade::stepVerify() {
    uint8_t request[2] = { UPGRADE_ENQ, UPGRADE_VERIFY };
    CwError err = sendFrame(request, sizeof(request));
    if (err != CW_OK) {
        failIo(err);
        return;
    }

    uint8_t reply[5];
    err = _port.readExact(reply, sizeof(reply), _config.verifyTimeoutMs);
    if (err == CW_ERR_TIMEOUT) {
        abortTransfer(UPGRADE_CAUSE_VERIFY_TIMEOUT);
        return;
    }
    if (err != CW_OK) {
        failIo(err);
        return;
    }

    uint32_t deviceCrc = getU32(&reply[1]);
    if (reply[0] != UPGRADE_VERIFY || deviceCrc != _imageCrc) {
        CW_LOG_ERROR("Upgrade: CRC mismatch, device %08X, image %08X",
                     (unsigned)deviceCrc, (unsigned)_imageCrc);
        abortTransfer(UPGRADE_CAUSE_VERIFY_MISMATCH);
        return;
    }

    CW_LOG_INFO("Upgrade: image verified");
    _status.state = UPGRADE_STATE_COMMITTING;
}

void FirmwareUpgrade::stepCommit() {
    uint8_t request[2] = { UPGRADE_EOT, UPGRADE_COMMIT };
    CwError err = sendFrame(request, sizeof(request));
    if (err != CW_OK) {
        failIo(err);
        return;
    }

    uint8_t reply;
    err = awaitAck(_config.commitTimeoutMs, &reply);
    if (err == CW_OK && reply == UPGRADE_ACK) {
        CW_LOG_INFO("Upgrade: committed");
        finish(UPGRADE_STATE_DONE);
        return;
    }
    if (err != CW_OK && err != CW_ERR_TIMEOUT) {
        failIo(err);
        return;
    }
    abortTransfer(UPGRADE_CAUSE_COMMIT_FAILED);
}
