/**
 * @file frame_codec.h
 * @brief CloudWatcher command encoding and response frame validation
 *
 * A response is a sequence of 15-byte blocks. Data blocks start with '!'
 * followed by a short tag and a right-aligned value:
 *
 *     "!1          -1523"   sky temperature, hundredths of a degree
 *
 * The last block is always the handshake block:
 *
 *     0x21 0x11 0x20 x 12 0x30
 *
 * The link has no checksum, so this structure is the only integrity check.
 */

#ifndef FRAME_CODEC_H
#define FRAME_CODEC_H

#include <stdint.h>
#include <stddef.h>
#include "cw_config.h"
#include "command_table.h"

/* ==========================================================================
 * FRAME
 * ========================================================================== */

enum FrameDefect {
    FRAME_DEFECT_NONE = 0,
    FRAME_DEFECT_LENGTH,            // Not a whole number of blocks or wrong count
    FRAME_DEFECT_TERMINATOR,        // Last block is not the handshake block
    FRAME_DEFECT_BLOCK_START,       // A data block does not start with '!'
    FRAME_DEFECT_PREFIX             // First block does not carry the expected tag
};

struct Frame {
    uint8_t     raw[CW_MAX_FRAME_SIZE];
    size_t      rawLen;
    bool        valid;
    FrameDefect defect;
    uint8_t     dataBlocks;         // Blocks before the handshake block
};

extern const uint8_t CW_HANDSHAKE_BLOCK[CW_BLOCK_SIZE];

/* ==========================================================================
 * ENCODE / DECODE
 * ========================================================================== */

/**
 * Encode a command as token + arguments + '!'
 * @return Bytes written, 0 if out is too small
 */
size_t frame_encode(const Command* cmd, uint8_t* out, size_t maxLen);

/**
 * Validate a received response against its command definition.
 * Never fails hard: a bad frame comes back with valid == false, the
 * defect set and the raw bytes kept for diagnostics.
 * @return frame->valid
 */
bool frame_decode(const uint8_t* raw, size_t len, const CommandDef* def, Frame* frame);

/**
 * Build a response frame from block texts. Each text is a tag, optionally
 * followed by a space and a value; the value is right-aligned in the block.
 * Used by device simulators.
 * @return Bytes written, 0 if a text does not fit or out is too small
 */
size_t frame_buildResponse(const char* const* blocks, size_t count, uint8_t* out, size_t maxLen);

bool frame_isHandshakeBlock(const uint8_t* block);

/* ==========================================================================
 * PAYLOAD ACCESS
 * ========================================================================== */

/**
 * Pointer to data block `index`, nullptr when out of range
 */
const uint8_t* frame_block(const Frame* frame, uint8_t index);

/**
 * Copy the trimmed text after `prefix` in data block `index`
 */
bool frame_blockText(const Frame* frame, uint8_t index, const char* prefix,
                     char* out, size_t maxLen);

/**
 * Integer after `prefix` in data block `index`. Only whitespace may
 * separate them, so "!t" does not match a "!th" block.
 */
bool frame_blockInt(const Frame* frame, uint8_t index, const char* prefix, int32_t* value);

/**
 * Search every data block for `prefix` followed by an integer
 */
bool frame_findInt(const Frame* frame, const char* prefix, int32_t* value);

#endif /* FRAME_CODEC_H */
