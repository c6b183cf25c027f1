/**
 * @file protocol_engine.h
 * @brief Command/response engine for the CloudWatcher serial protocol
 *
 * One command at a time per session:
 *
 *   IDLE -> AWAITING_RESPONSE -> DECODING -> IDLE
 *                 ^                  |
 *                 +--- RETRYING <----+  (malformed / timeout)
 *
 * Retry policy:
 * - Malformed frame: flush input and repeat the round-trip up to
 *   retryCount times, then CW_ERR_PROTOCOL_FAILURE.
 * - Timeout: one grace read per execute (a slow device or a stale frame
 *   from an aborted exchange), then one re-sent round-trip. A timeout on
 *   the re-sent round-trip is CW_ERR_DEVICE_UNRESPONSIVE.
 * - I/O errors and CW_ERR_BUSY are never retried.
 */

#ifndef PROTOCOL_ENGINE_H
#define PROTOCOL_ENGINE_H

#include <stdint.h>
#include <pthread.h>
#include "cw_error.h"
#include "command_table.h"
#include "frame_codec.h"
#include "config_manager.h"
#include "serial_port.h"

enum EngineState {
    ENGINE_STATE_IDLE = 0,
    ENGINE_STATE_AWAITING_RESPONSE,
    ENGINE_STATE_DECODING,
    ENGINE_STATE_RETRYING
};

/**
 * Outcome details of one execute() call
 */
struct ExecuteResult {
    CwError error;                  // Final result
    CwError reason;                 // Last failure seen before giving up
    uint8_t attempts;               // Round-trips performed
};

/**
 * Cumulative counters for the session
 */
struct EngineStats {
    uint32_t commands;
    uint32_t retries;
    uint32_t timeouts;
    uint32_t malformed;
    uint32_t staleFrames;
    uint32_t failures;
    uint32_t busy;
};

class ProtocolEngine {
public:
    /**
     * @param table Command table, nullptr selects the built-in one
     */
    ProtocolEngine(SerialPort& port, const CwConfig& config, const CommandTable* table = nullptr);
    ~ProtocolEngine();

    /**
     * Send a command and wait for a valid response
     * @param response Filled with the validated frame on success, or the
     *                 last malformed frame on CW_ERR_PROTOCOL_FAILURE
     * @param result Optional attempt details
     */
    CwError execute(const Command& cmd, Frame* response, ExecuteResult* result = nullptr);

    /**
     * Look up a command in the table and execute it
     * @param args Argument characters, nullptr for none
     */
    CwError execute(CwCommandId id, Frame* response, const char* args = nullptr);

    /**
     * Take the session for a long operation (firmware upgrade).
     * execute() returns CW_ERR_BUSY until releaseExclusive().
     * @return false if a command or another holder already has it
     */
    bool acquireExclusive();
    void releaseExclusive();

    EngineState getState() const { return _state; }
    /**
     * Snapshot of the counters, safe to call while a command runs
     */
    EngineStats getStats();
    void resetStats();

    const CommandTable* commandTable() const { return _table; }
    const CwConfig& config() const { return _config; }
    SerialPort& port() { return _port; }

private:
    ProtocolEngine(const ProtocolEngine&);
    ProtocolEngine& operator=(const ProtocolEngine&);

    CwError runCommand(const Command& cmd, Frame* response, ExecuteResult* result);
    void    countStat(uint32_t* counter);
    CwError readResponse(const CommandDef* def, uint32_t timeoutMs, bool* graceAvailable,
                         uint8_t* buf, size_t* len);
    CwError readFixed(const CommandDef* def, uint32_t timeoutMs, uint8_t* buf, size_t* len,
                      bool* stale);
    CwError readDelimited(const CommandDef* def, uint32_t timeoutMs, uint8_t* buf, size_t* len,
                          bool* stale);

    SerialPort&         _port;
    const CwConfig&     _config;
    const CommandTable* _table;
    pthread_mutex_t     _lock;
    pthread_mutex_t     _statsLock;     // Guards _stats; never held across I/O
    volatile EngineState _state;
    EngineStats         _stats;
};

#endif /* PROTOCOL_ENGINE_H */
