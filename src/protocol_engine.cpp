/**
 * @file protocol_engine.cpp
 * @brief Command/response engine implementation
 */

#include <string.h>
#include "protocol_engine.h"
#include "cw_debug.h"
#include "cw_time.h"

ProtocolEngine::ProtocolEngine(SerialPort& port, const CwConfig& config, const CommandTable* table)
    : _port(port)
    , _config(config)
    , _table(table != nullptr ? table : cw_default_command_table())
    , _state(ENGINE_STATE_IDLE)
{
    pthread_mutex_init(&_lock, nullptr);
    pthread_mutex_init(&_statsLock, nullptr);
    resetStats();
}

ProtocolEngine::~ProtocolEngine() {
    pthread_mutex_destroy(&_statsLock);
    pthread_mutex_destroy(&_lock);
}

void ProtocolEngine::resetStats() {
    pthread_mutex_lock(&_statsLock);
    memset(&_stats, 0, sizeof(_stats));
    pthread_mutex_unlock(&_statsLock);
}

EngineStats ProtocolEngine::getStats() {
    pthread_mutex_lock(&_statsLock);
    EngineStats stats = _stats;
    pthread_mutex_unlock(&_statsLock);
    return stats;
}

void ProtocolEngine::countStat(uint32_t* counter) {
    pthread_mutex_lock(&_statsLock);
    (*counter)++;
    pthread_mutex_unlock(&_statsLock);
}

bool ProtocolEngine::acquireExclusive() {
    if (pthread_mutex_trylock(&_lock) != 0) {
        return false;
    }
    return true;
}

void ProtocolEngine::releaseExclusive() {
    pthread_mutex_unlock(&_lock);
}

CwError ProtocolEngine::execute(CwCommandId id, Frame* response, const char* args) {
    const CommandDef* def = commandTable_find(_table, id);
    if (def == nullptr) {
        CW_LOG_ERROR("CW: command %d not in table", (int)id);
        return CW_ERR_INVALID_ARG;
    }

    Command cmd;
    if (!command_make(&cmd, def, args)) {
        CW_LOG_ERROR("CW: bad arguments for %s!", def->token);
        return CW_ERR_INVALID_ARG;
    }
    return execute(cmd, response);
}

CwError ProtocolEngine::execute(const Command& cmd, Frame* response, ExecuteResult* result) {
    ExecuteResult local;
    if (result == nullptr) {
        result = &local;
    }
    result->error = CW_OK;
    result->reason = CW_OK;
    result->attempts = 0;

    if (cmd.def == nullptr || response == nullptr) {
        result->error = CW_ERR_INVALID_ARG;
        return CW_ERR_INVALID_ARG;
    }

    if (pthread_mutex_trylock(&_lock) != 0) {
        countStat(&_stats.busy);
        CW_LOG_DEBUG("CW: %s! rejected, session busy", cmd.def->token);
        result->error = CW_ERR_BUSY;
        return CW_ERR_BUSY;
    }

    CwError err = runCommand(cmd, response, result);
    _state = ENGINE_STATE_IDLE;
    pthread_mutex_unlock(&_lock);

    result->error = err;
    if (err != CW_OK) {
        countStat(&_stats.failures);
    }
    return err;
}

CwError ProtocolEngine::runCommand(const Command& cmd, Frame* response, ExecuteResult* result) {
    const CommandDef* def = cmd.def;

    if (!_port.isOpen()) {
        return CW_ERR_NOT_OPEN;
    }

    uint8_t request[CW_MAX_COMMAND_SIZE];
    size_t requestLen = frame_encode(&cmd, request, sizeof(request));
    if (requestLen == 0) {
        CW_LOG_ERROR("CW: cannot encode %s!", def->token);
        return CW_ERR_INVALID_ARG;
    }

    uint32_t timeoutMs = (def->timeoutMs != 0) ? def->timeoutMs : _config.readTimeoutMs;
    uint8_t buf[CW_MAX_FRAME_SIZE];
    size_t len = 0;
    bool graceAvailable = true;
    bool timeoutRetried = false;
    uint8_t malformedRetries = 0;

    countStat(&_stats.commands);

    while (true) {
        result->attempts++;
        _state = ENGINE_STATE_AWAITING_RESPONSE;

        CW_LOG_DEBUG("CW: > %.*s", (int)requestLen, (const char*)request);
        CwError err = _port.write(request, requestLen, _config.writeTimeoutMs);
        if (err != CW_OK) {
            CW_LOG_ERROR("CW: write %s! failed: %s", def->token, cwError_toString(err));
            result->reason = err;
            return (err == CW_ERR_NOT_OPEN) ? err : CW_ERR_IO;
        }

        err = readResponse(def, timeoutMs, &graceAvailable, buf, &len);

        if (err == CW_ERR_TIMEOUT) {
            countStat(&_stats.timeouts);
            result->reason = CW_ERR_TIMEOUT;
            if (timeoutRetried) {
                CW_LOG_ERROR("CW: no answer to %s! after %u attempts", def->token, (unsigned)result->attempts);
                return CW_ERR_DEVICE_UNRESPONSIVE;
            }
            CW_LOG_WARNING("CW: timeout on %s!, resending", def->token);
            timeoutRetried = true;
            countStat(&_stats.retries);
            _state = ENGINE_STATE_RETRYING;
            _port.flushInput();
            continue;
        }

        if (err != CW_OK && err != CW_ERR_MALFORMED) {
            CW_LOG_ERROR("CW: read %s! failed: %s", def->token, cwError_toString(err));
            result->reason = err;
            return err;
        }

        _state = ENGINE_STATE_DECODING;
        if (err == CW_OK && frame_decode(buf, len, def, response)) {
            return CW_OK;
        }
        if (err != CW_OK) {
            // Keep the partial bytes for diagnostics
            frame_decode(buf, len, def, response);
        }

        countStat(&_stats.malformed);
        result->reason = CW_ERR_MALFORMED;
        CW_LOG_WARNING("CW: malformed answer to %s! (defect %d, %u bytes)",
                       def->token, (int)response->defect, (unsigned)len);
        CW_LOG_HEXDUMP(buf, len);

        if (malformedRetries >= _config.retryCount) {
            CW_LOG_ERROR("CW: %s! failed after %u attempts", def->token, (unsigned)result->attempts);
            return CW_ERR_PROTOCOL_FAILURE;
        }
        malformedRetries++;
        countStat(&_stats.retries);
        _state = ENGINE_STATE_RETRYING;
        _port.flushInput();
    }
}

CwError ProtocolEngine::readResponse(const CommandDef* def, uint32_t timeoutMs, bool* graceAvailable,
                                     uint8_t* buf, size_t* len) {
    while (true) {
        bool stale = false;
        CwError err;

        if (def->shape == CW_RESPONSE_FIXED) {
            err = readFixed(def, timeoutMs, buf, len, &stale);
        } else {
            err = readDelimited(def, timeoutMs, buf, len, &stale);
        }

        if (stale) {
            countStat(&_stats.staleFrames);
            CW_LOG_DEBUG("CW: discarded stale frame before %s! answer", def->token);
        }

        if ((stale || err == CW_ERR_TIMEOUT) && *graceAvailable) {
            *graceAvailable = false;
            continue;
        }
        return err;
    }
}

CwError ProtocolEngine::readFixed(const CommandDef* def, uint32_t timeoutMs, uint8_t* buf, size_t* len,
                                  bool* stale) {
    size_t blocks = (size_t)def->dataBlocks + 1;
    uint32_t start = cw_millis();
    *len = 0;

    if (blocks * CW_BLOCK_SIZE > CW_MAX_FRAME_SIZE) {
        return CW_ERR_INVALID_ARG;
    }

    for (size_t i = 0; i < blocks; i++) {
        uint32_t remaining = cw_remaining(start, timeoutMs);
        if (remaining == 0) {
            return CW_ERR_TIMEOUT;
        }

        uint8_t* block = &buf[i * CW_BLOCK_SIZE];
        CwError err = _port.readExact(block, CW_BLOCK_SIZE, remaining);
        if (err != CW_OK) {
            return err;
        }
        *len += CW_BLOCK_SIZE;

        if (i + 1 < blocks && frame_isHandshakeBlock(block)) {
            // Handshake before the expected length: left over from an earlier exchange
            *stale = true;
            return CW_ERR_MALFORMED;
        }
    }

    return CW_OK;
}

CwError ProtocolEngine::readDelimited(const CommandDef* def, uint32_t timeoutMs, uint8_t* buf, size_t* len,
                                      bool* stale) {
    size_t maxLen = ((size_t)def->dataBlocks + 1) * CW_BLOCK_SIZE;
    if (maxLen > CW_MAX_FRAME_SIZE) {
        maxLen = CW_MAX_FRAME_SIZE;
    }

    CwError err = _port.readUntil(CW_HANDSHAKE_BLOCK, CW_BLOCK_SIZE, buf, maxLen, len, timeoutMs);
    if (err != CW_OK) {
        return err;
    }

    if (*len < ((size_t)def->minBlocks + 1) * CW_BLOCK_SIZE) {
        // Handshake before the shortest valid answer: left over from an earlier exchange
        *stale = true;
        return CW_ERR_MALFORMED;
    }
    return CW_OK;
}
