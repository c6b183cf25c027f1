/**
 * @file frame_codec.cpp
 * @brief CloudWatcher frame encode/decode
 */

#include <string.h>
#include <stdlib.h>
#include <ctype.h>
#include <errno.h>
#include <limits.h>
#include "frame_codec.h"
#include "cw_debug.h"

const uint8_t CW_HANDSHAKE_BLOCK[CW_BLOCK_SIZE] = {
    0x21, 0x11,
    0x20, 0x20, 0x20, 0x20, 0x20, 0x20, 0x20, 0x20, 0x20, 0x20, 0x20, 0x20,
    0x30
};

bool frame_isHandshakeBlock(const uint8_t* block) {
    return memcmp(block, CW_HANDSHAKE_BLOCK, CW_BLOCK_SIZE) == 0;
}

size_t frame_encode(const Command* cmd, uint8_t* out, size_t maxLen) {
    if (cmd == nullptr || cmd->def == nullptr || cmd->def->token == nullptr) {
        return 0;
    }

    size_t tokenLen = strlen(cmd->def->token);
    size_t total = tokenLen + cmd->argLen + 1;
    if (total > maxLen || cmd->argLen > CW_MAX_COMMAND_ARGS) {
        return 0;
    }

    memcpy(out, cmd->def->token, tokenLen);
    memcpy(&out[tokenLen], cmd->args, cmd->argLen);
    out[total - 1] = CW_COMMAND_TERMINATOR;
    return total;
}

static bool setDefect(Frame* frame, FrameDefect defect) {
    frame->valid = false;
    frame->defect = defect;
    return false;
}

bool frame_decode(const uint8_t* raw, size_t len, const CommandDef* def, Frame* frame) {
    memset(frame, 0, sizeof(*frame));

    size_t keep = (len < sizeof(frame->raw)) ? len : sizeof(frame->raw);
    if (raw != nullptr && keep > 0) {
        memcpy(frame->raw, raw, keep);
    }
    frame->rawLen = keep;

    if (raw == nullptr || def == nullptr) {
        return setDefect(frame, FRAME_DEFECT_LENGTH);
    }

    if (len == 0 || len % CW_BLOCK_SIZE != 0 || len > CW_MAX_FRAME_SIZE) {
        return setDefect(frame, FRAME_DEFECT_LENGTH);
    }

    size_t blocks = len / CW_BLOCK_SIZE;
    size_t dataBlocks = blocks - 1;

    if (def->shape == CW_RESPONSE_FIXED && dataBlocks != def->dataBlocks) {
        return setDefect(frame, FRAME_DEFECT_LENGTH);
    }
    if (def->shape == CW_RESPONSE_DELIMITED &&
        (dataBlocks > def->dataBlocks || dataBlocks < def->minBlocks)) {
        return setDefect(frame, FRAME_DEFECT_LENGTH);
    }

    if (!frame_isHandshakeBlock(&raw[dataBlocks * CW_BLOCK_SIZE])) {
        return setDefect(frame, FRAME_DEFECT_TERMINATOR);
    }

    for (size_t i = 0; i < dataBlocks; i++) {
        const uint8_t* block = &raw[i * CW_BLOCK_SIZE];
        if (frame_isHandshakeBlock(block)) {
            // A second response glued in front of this one
            return setDefect(frame, FRAME_DEFECT_LENGTH);
        }
        if (block[0] != '!') {
            return setDefect(frame, FRAME_DEFECT_BLOCK_START);
        }
    }

    if (def->responsePrefix != nullptr && dataBlocks > 0) {
        size_t prefixLen = strlen(def->responsePrefix);
        if (memcmp(raw, def->responsePrefix, prefixLen) != 0) {
            return setDefect(frame, FRAME_DEFECT_PREFIX);
        }
    }

    frame->valid = true;
    frame->defect = FRAME_DEFECT_NONE;
    frame->dataBlocks = (uint8_t)dataBlocks;
    return true;
}

size_t frame_buildResponse(const char* const* blocks, size_t count, uint8_t* out, size_t maxLen) {
    size_t total = (count + 1) * CW_BLOCK_SIZE;
    if (total > maxLen) {
        return 0;
    }

    for (size_t i = 0; i < count; i++) {
        uint8_t* block = &out[i * CW_BLOCK_SIZE];
        const char* text = blocks[i];
        const char* space = strchr(text, ' ');
        size_t textLen = strlen(text);

        if (textLen > CW_BLOCK_SIZE) {
            return 0;
        }
        memset(block, ' ', CW_BLOCK_SIZE);

        if (space == nullptr) {
            memcpy(block, text, textLen);
        } else {
            size_t tagLen = (size_t)(space - text);
            const char* value = space + 1;
            size_t valueLen = strlen(value);
            memcpy(block, text, tagLen);
            memcpy(&block[CW_BLOCK_SIZE - valueLen], value, valueLen);
        }
    }

    memcpy(&out[count * CW_BLOCK_SIZE], CW_HANDSHAKE_BLOCK, CW_BLOCK_SIZE);
    return total;
}

const uint8_t* frame_block(const Frame* frame, uint8_t index) {
    if (frame == nullptr || !frame->valid || index >= frame->dataBlocks) {
        return nullptr;
    }
    return &frame->raw[index * CW_BLOCK_SIZE];
}

bool frame_blockText(const Frame* frame, uint8_t index, const char* prefix,
                     char* out, size_t maxLen) {
    const uint8_t* block = frame_block(frame, index);
    if (block == nullptr || maxLen == 0) {
        return false;
    }

    size_t prefixLen = strlen(prefix);
    if (prefixLen > CW_BLOCK_SIZE || memcmp(block, prefix, prefixLen) != 0) {
        return false;
    }

    size_t start = prefixLen;
    size_t end = CW_BLOCK_SIZE;
    while (start < end && block[start] == ' ') {
        start++;
    }
    while (end > start && block[end - 1] == ' ') {
        end--;
    }

    size_t len = end - start;
    if (len >= maxLen) {
        len = maxLen - 1;
    }
    memcpy(out, &block[start], len);
    out[len] = '\0';
    return true;
}

bool frame_blockInt(const Frame* frame, uint8_t index, const char* prefix, int32_t* value) {
    char text[CW_BLOCK_SIZE + 1];
    if (!frame_blockText(frame, index, prefix, text, sizeof(text))) {
        return false;
    }

    // The text must be a bare integer
    const char* p = text;
    if (*p == '+' || *p == '-') {
        p++;
    }
    if (!isdigit((unsigned char)*p)) {
        return false;
    }

    char* end = nullptr;
    errno = 0;
    long parsed = strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || parsed < INT32_MIN || parsed > INT32_MAX) {
        return false;
    }

    *value = (int32_t)parsed;
    return true;
}

bool frame_findInt(const Frame* frame, const char* prefix, int32_t* value) {
    if (frame == nullptr || !frame->valid) {
        return false;
    }
    for (uint8_t i = 0; i < frame->dataBlocks; i++) {
        if (frame_blockInt(frame, i, prefix, value)) {
            return true;
        }
    }
    return false;
}
