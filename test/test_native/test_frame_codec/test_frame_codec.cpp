/**
 * @file test_frame_codec.cpp
 * @brief Unit tests for command encoding, response validation and CRCs
 *
 * Run with: ctest -R test_frame_codec
 */

#include <unity.h>
#include <string.h>
#include <stdint.h>
#include "frame_codec.h"
#include "command_table.h"
#include "cw_crc.h"

static const CommandTable* table;

void setUp(void) {
    table = cw_default_command_table();
}

void tearDown(void) {
}

static const CommandDef* def(CwCommandId id) {
    return commandTable_find(table, id);
}

// =============================================================================
// COMMAND ENCODING
// =============================================================================

void test_encode_plain_command(void) {
    Command cmd;
    uint8_t out[CW_MAX_COMMAND_SIZE];

    TEST_ASSERT_TRUE(command_make(&cmd, def(CW_CMD_INTERNAL_NAME), nullptr));
    TEST_ASSERT_EQUAL(2, frame_encode(&cmd, out, sizeof(out)));
    TEST_ASSERT_EQUAL_MEMORY("A!", out, 2);
}

void test_encode_command_with_arguments(void) {
    Command cmd;
    uint8_t out[CW_MAX_COMMAND_SIZE];

    TEST_ASSERT_TRUE(command_make(&cmd, def(CW_CMD_SET_PWM), "0512"));
    TEST_ASSERT_EQUAL(6, frame_encode(&cmd, out, sizeof(out)));
    TEST_ASSERT_EQUAL_MEMORY("P0512!", out, 6);
}

void test_encode_is_deterministic(void) {
    Command cmd;
    uint8_t a[CW_MAX_COMMAND_SIZE];
    uint8_t b[CW_MAX_COMMAND_SIZE];

    TEST_ASSERT_TRUE(command_make(&cmd, def(CW_CMD_HUMIDITY), nullptr));
    size_t lenA = frame_encode(&cmd, a, sizeof(a));
    size_t lenB = frame_encode(&cmd, b, sizeof(b));
    TEST_ASSERT_EQUAL(lenA, lenB);
    TEST_ASSERT_EQUAL_MEMORY(a, b, lenA);
    TEST_ASSERT_EQUAL_MEMORY("h!", a, 2);
}

void test_command_make_rejects_wrong_argument_length(void) {
    Command cmd;
    TEST_ASSERT_FALSE(command_make(&cmd, def(CW_CMD_SET_PWM), "12"));
    TEST_ASSERT_FALSE(command_make(&cmd, def(CW_CMD_SET_PWM), nullptr));
    TEST_ASSERT_FALSE(command_make(&cmd, def(CW_CMD_SKY_IR_TEMP), "1"));
}

void test_encode_rejects_small_buffer(void) {
    Command cmd;
    uint8_t out[4];
    TEST_ASSERT_TRUE(command_make(&cmd, def(CW_CMD_SET_PWM), "0001"));
    TEST_ASSERT_EQUAL(0, frame_encode(&cmd, out, sizeof(out)));
}

void test_default_table_has_every_command(void) {
    for (int id = 0; id < CW_CMD_COUNT; id++) {
        TEST_ASSERT_NOT_NULL(def((CwCommandId)id));
    }
}

// =============================================================================
// RESPONSE DECODING
// =============================================================================

void test_decode_round_trips_payload(void) {
    const char* blocks[] = { "!1 -1523" };
    uint8_t raw[CW_MAX_FRAME_SIZE];
    size_t len = frame_buildResponse(blocks, 1, raw, sizeof(raw));
    TEST_ASSERT_EQUAL(30, len);

    Frame frame;
    TEST_ASSERT_TRUE(frame_decode(raw, len, def(CW_CMD_SKY_IR_TEMP), &frame));
    TEST_ASSERT_EQUAL(1, frame.dataBlocks);

    int32_t value = 0;
    TEST_ASSERT_TRUE(frame_blockInt(&frame, 0, "!1", &value));
    TEST_ASSERT_EQUAL_INT32(-1523, value);
}

void test_build_response_right_aligns_value(void) {
    const char* blocks[] = { "!V 5.88" };
    uint8_t raw[CW_MAX_FRAME_SIZE];
    TEST_ASSERT_EQUAL(30, frame_buildResponse(blocks, 1, raw, sizeof(raw)));
    TEST_ASSERT_EQUAL_MEMORY("!V         5.88", raw, CW_BLOCK_SIZE);
    TEST_ASSERT_TRUE(frame_isHandshakeBlock(&raw[CW_BLOCK_SIZE]));
}

void test_decode_text_block(void) {
    const char* blocks[] = { "!N CloudWatcher" };
    uint8_t raw[CW_MAX_FRAME_SIZE];
    size_t len = frame_buildResponse(blocks, 1, raw, sizeof(raw));

    Frame frame;
    char name[16];
    TEST_ASSERT_TRUE(frame_decode(raw, len, def(CW_CMD_INTERNAL_NAME), &frame));
    TEST_ASSERT_TRUE(frame_blockText(&frame, 0, "!N", name, sizeof(name)));
    TEST_ASSERT_EQUAL_STRING("CloudWatcher", name);
}

void test_decode_handshake_only_response(void) {
    Frame frame;
    TEST_ASSERT_TRUE(frame_decode(CW_HANDSHAKE_BLOCK, CW_BLOCK_SIZE, def(CW_CMD_RESET_BUFFERS), &frame));
    TEST_ASSERT_EQUAL(0, frame.dataBlocks);
}

void test_decode_partial_block_is_malformed(void) {
    const char* blocks[] = { "!2 2150" };
    uint8_t raw[CW_MAX_FRAME_SIZE];
    size_t len = frame_buildResponse(blocks, 1, raw, sizeof(raw));

    Frame frame;
    TEST_ASSERT_FALSE(frame_decode(raw, len - 3, def(CW_CMD_IR_SENSOR_TEMP), &frame));
    TEST_ASSERT_EQUAL(FRAME_DEFECT_LENGTH, frame.defect);
    TEST_ASSERT_EQUAL(len - 3, frame.rawLen);
    TEST_ASSERT_EQUAL_MEMORY(raw, frame.raw, len - 3);
}

void test_decode_wrong_block_count_is_malformed(void) {
    const char* blocks[] = { "!E1 0", "!E2 0" };
    uint8_t raw[CW_MAX_FRAME_SIZE];
    size_t len = frame_buildResponse(blocks, 2, raw, sizeof(raw));

    Frame frame;
    TEST_ASSERT_FALSE(frame_decode(raw, len, def(CW_CMD_INTERNAL_ERRORS), &frame));
    TEST_ASSERT_EQUAL(FRAME_DEFECT_LENGTH, frame.defect);
}

void test_decode_missing_handshake_is_malformed(void) {
    const char* blocks[] = { "!1 100", "!2 200" };
    uint8_t raw[CW_MAX_FRAME_SIZE];
    frame_buildResponse(blocks, 2, raw, sizeof(raw));

    Frame frame;
    TEST_ASSERT_FALSE(frame_decode(raw, 2 * CW_BLOCK_SIZE, def(CW_CMD_SKY_IR_TEMP), &frame));
    TEST_ASSERT_EQUAL(FRAME_DEFECT_TERMINATOR, frame.defect);
}

void test_decode_bad_block_start_is_malformed(void) {
    const char* blocks[] = { "!R 42" };
    uint8_t raw[CW_MAX_FRAME_SIZE];
    size_t len = frame_buildResponse(blocks, 1, raw, sizeof(raw));
    raw[0] = '?';

    Frame frame;
    TEST_ASSERT_FALSE(frame_decode(raw, len, def(CW_CMD_RAIN_FREQUENCY), &frame));
    TEST_ASSERT_EQUAL(FRAME_DEFECT_BLOCK_START, frame.defect);
}

void test_decode_unexpected_tag_is_malformed(void) {
    const char* blocks[] = { "!2 2150" };
    uint8_t raw[CW_MAX_FRAME_SIZE];
    size_t len = frame_buildResponse(blocks, 1, raw, sizeof(raw));

    Frame frame;
    TEST_ASSERT_FALSE(frame_decode(raw, len, def(CW_CMD_SKY_IR_TEMP), &frame));
    TEST_ASSERT_EQUAL(FRAME_DEFECT_PREFIX, frame.defect);
}

void test_decode_delimited_variable_length(void) {
    const char* three[] = { "!6 900", "!4 512", "!5 600" };
    const char* five[] = { "!6 900", "!4 512", "!5 600", "!3 1500", "!8 12345" };
    uint8_t raw[CW_MAX_FRAME_SIZE];
    Frame frame;

    size_t len = frame_buildResponse(three, 3, raw, sizeof(raw));
    TEST_ASSERT_TRUE(frame_decode(raw, len, def(CW_CMD_VALUES), &frame));
    TEST_ASSERT_EQUAL(3, frame.dataBlocks);

    len = frame_buildResponse(five, 5, raw, sizeof(raw));
    TEST_ASSERT_TRUE(frame_decode(raw, len, def(CW_CMD_VALUES), &frame));
    TEST_ASSERT_EQUAL(5, frame.dataBlocks);

    int32_t light = 0;
    TEST_ASSERT_TRUE(frame_findInt(&frame, "!8", &light));
    TEST_ASSERT_EQUAL_INT32(12345, light);
}

void test_decode_delimited_below_minimum_is_malformed(void) {
    const char* two[] = { "!6 900", "!4 512" };
    uint8_t raw[CW_MAX_FRAME_SIZE];
    Frame frame;

    size_t len = frame_buildResponse(two, 2, raw, sizeof(raw));
    TEST_ASSERT_FALSE(frame_decode(raw, len, def(CW_CMD_VALUES), &frame));
    TEST_ASSERT_EQUAL(FRAME_DEFECT_LENGTH, frame.defect);

    // A lone handshake block is not an answer to C!
    TEST_ASSERT_FALSE(frame_decode(CW_HANDSHAKE_BLOCK, CW_BLOCK_SIZE, def(CW_CMD_VALUES), &frame));
    TEST_ASSERT_EQUAL(FRAME_DEFECT_LENGTH, frame.defect);
}

void test_decode_glued_frames_are_malformed(void) {
    const char* blocks[] = { "!6 900" };
    uint8_t raw[CW_MAX_FRAME_SIZE];
    size_t one = frame_buildResponse(blocks, 1, raw, sizeof(raw));
    memcpy(&raw[one], raw, one);

    Frame frame;
    TEST_ASSERT_FALSE(frame_decode(raw, 2 * one, def(CW_CMD_VALUES), &frame));
    TEST_ASSERT_EQUAL(FRAME_DEFECT_LENGTH, frame.defect);
}

void test_decode_garbage_never_valid(void) {
    uint8_t raw[CW_MAX_FRAME_SIZE];
    uint32_t seed = 12345;
    Frame frame;

    for (int round = 0; round < 200; round++) {
        for (size_t i = 0; i < sizeof(raw); i++) {
            seed = seed * 1103515245u + 12345u;
            raw[i] = (uint8_t)(seed >> 16);
        }
        size_t len = (size_t)(round % (int)sizeof(raw));
        TEST_ASSERT_FALSE(frame_decode(raw, len, def(CW_CMD_SKY_IR_TEMP), &frame));
    }
    TEST_ASSERT_FALSE(frame_decode(nullptr, 0, def(CW_CMD_SKY_IR_TEMP), &frame));
}

void test_int_prefix_does_not_match_longer_tag(void) {
    const char* blocks[] = { "!th 22000" };
    uint8_t raw[CW_MAX_FRAME_SIZE];
    size_t len = frame_buildResponse(blocks, 1, raw, sizeof(raw));

    Frame frame;
    int32_t value = 0;
    TEST_ASSERT_TRUE(frame_decode(raw, len, def(CW_CMD_TEMPERATURE), &frame));
    TEST_ASSERT_FALSE(frame_findInt(&frame, "!t", &value));
    TEST_ASSERT_TRUE(frame_findInt(&frame, "!th", &value));
    TEST_ASSERT_EQUAL_INT32(22000, value);
}

void test_block_access_out_of_range(void) {
    const char* blocks[] = { "!R 42" };
    uint8_t raw[CW_MAX_FRAME_SIZE];
    size_t len = frame_buildResponse(blocks, 1, raw, sizeof(raw));

    Frame frame;
    TEST_ASSERT_TRUE(frame_decode(raw, len, def(CW_CMD_RAIN_FREQUENCY), &frame));
    TEST_ASSERT_NOT_NULL(frame_block(&frame, 0));
    TEST_ASSERT_NULL(frame_block(&frame, 1));
}

// =============================================================================
// CRC
// =============================================================================

void test_crc16_ccitt_check_value(void) {
    const uint8_t data[] = "123456789";
    TEST_ASSERT_EQUAL_HEX16(0x29B1, cw_crc16(data, 9));
}

void test_crc32_check_value(void) {
    const uint8_t data[] = "123456789";
    TEST_ASSERT_EQUAL_HEX32(0xCBF43926, cw_crc32(data, 9));
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Encoding
    RUN_TEST(test_encode_plain_command);
    RUN_TEST(test_encode_command_with_arguments);
    RUN_TEST(test_encode_is_deterministic);
    RUN_TEST(test_command_make_rejects_wrong_argument_length);
    RUN_TEST(test_encode_rejects_small_buffer);
    RUN_TEST(test_default_table_has_every_command);

    // Decoding
    RUN_TEST(test_decode_round_trips_payload);
    RUN_TEST(test_build_response_right_aligns_value);
    RUN_TEST(test_decode_text_block);
    RUN_TEST(test_decode_handshake_only_response);
    RUN_TEST(test_decode_partial_block_is_malformed);
    RUN_TEST(test_decode_wrong_block_count_is_malformed);
    RUN_TEST(test_decode_missing_handshake_is_malformed);
    RUN_TEST(test_decode_bad_block_start_is_malformed);
    RUN_TEST(test_decode_unexpected_tag_is_malformed);
    RUN_TEST(test_decode_delimited_variable_length);
    RUN_TEST(test_decode_delimited_below_minimum_is_malformed);
    RUN_TEST(test_decode_glued_frames_are_malformed);
    RUN_TEST(test_decode_garbage_never_valid);
    RUN_TEST(test_int_prefix_does_not_match_longer_tag);
    RUN_TEST(test_block_access_out_of_range);

    // CRC
    RUN_TEST(test_crc16_ccitt_check_value);
    RUN_TEST(test_crc32_check_value);

    return UNITY_END();
}
