/**
 * @file cw_time.cpp
 * @brief Monotonic clock helpers
 */

#include <time.h>
#include <errno.h>
#include "cw_time.h"

uint32_t cw_millis(void) {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (uint32_t)((uint64_t)ts.tv_sec * 1000 + ts.tv_nsec / 1000000);
}

void cw_delay(uint32_t ms) {
    struct timespec req;
    req.tv_sec = ms / 1000;
    req.tv_nsec = (long)(ms % 1000) * 1000000L;

    // Resume after signals until the full delay has elapsed
    while (nanosleep(&req, &req) != 0 && errno == EINTR) {
    }
}

uint32_t cw_remaining(uint32_t startMs, uint32_t timeoutMs) {
    uint32_t elapsed = cw_millis() - startMs;
    if (elapsed >= timeoutMs) {
        return 0;
    }
    return timeoutMs - elapsed;
}
