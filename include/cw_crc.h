/**
 * @file cw_crc.h
 * @brief CRC routines used by the firmware upgrade framing
 */

#ifndef CW_CRC_H
#define CW_CRC_H

#include <stdint.h>
#include <stddef.h>

/**
 * CRC16-CCITT (poly 0x1021, init 0xFFFF), per block and header frame
 */
uint16_t cw_crc16(const uint8_t* data, size_t len);

/**
 * CRC32 (IEEE 802.3, reflected), over the whole firmware image
 */
uint32_t cw_crc32(const uint8_t* data, size_t len);

#endif /* CW_CRC_H */
