/**
 * @file cw_time.h
 * @brief Monotonic millisecond clock and blocking delay
 */

#ifndef CW_TIME_H
#define CW_TIME_H

#include <stdint.h>

/**
 * Milliseconds since an arbitrary fixed point (CLOCK_MONOTONIC).
 * Wraps after ~49 days; compare with subtraction.
 */
uint32_t cw_millis(void);

void cw_delay(uint32_t ms);

/**
 * Milliseconds left until deadline, 0 once it has passed
 */
uint32_t cw_remaining(uint32_t startMs, uint32_t timeoutMs);

#endif /* CW_TIME_H */
