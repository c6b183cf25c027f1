/**
 * @file cw_debug.h
 * @brief Debug logging macros for the CloudWatcher driver
 *
 * Uses syslog or stderr depending on configuration. Messages below
 * CW_LOG_LEVEL are compiled out.
 */

#ifndef CW_DEBUG_H
#define CW_DEBUG_H

#include <stdint.h>
#include "cw_config.h"

#define CW_LOG_LEVEL_NONE       0
#define CW_LOG_LEVEL_ERROR      1
#define CW_LOG_LEVEL_WARNING    2
#define CW_LOG_LEVEL_INFO       3
#define CW_LOG_LEVEL_DEBUG      4

#ifndef CW_LOG_LEVEL
#define CW_LOG_LEVEL            CW_LOG_LEVEL_INFO
#endif

#if CW_USE_SYSLOG

#include <stdio.h>
#include <syslog.h>

#define CW_LOG_INIT()           openlog("cloudwatcher", LOG_PID | LOG_NDELAY, LOG_USER)
#define CW_LOG_FLUSH()          do {} while(0)
#define CW_LOG_OUT_ERROR(...)   syslog(LOG_ERR, __VA_ARGS__)
#define CW_LOG_OUT_WARNING(...) syslog(LOG_WARNING, __VA_ARGS__)
#define CW_LOG_OUT_INFO(...)    syslog(LOG_INFO, __VA_ARGS__)
#define CW_LOG_OUT_DEBUG(...)   syslog(LOG_DEBUG, __VA_ARGS__)
#define CW_LOG_OUT_HEXDUMP(p, len) do { \
    char _hex[3 * 32 + 1]; \
    uint32_t _n = 0; \
    for (uint32_t _i = 0; _i < (uint32_t)(len); _i++) { \
        snprintf(&_hex[_n * 3], 4, "%02X ", ((const uint8_t*)(p))[_i]); \
        if (++_n == 32 || _i + 1 == (uint32_t)(len)) { \
            syslog(LOG_DEBUG, "%s", _hex); \
            _n = 0; \
        } \
    } \
} while(0)

#elif CW_USE_STDERR

#include <stdio.h>

#define CW_LOG_INIT()           do {} while(0)
#define CW_LOG_FLUSH()          fflush(stderr)
#define CW_LOG_OUT_ERROR(...)   do { fprintf(stderr, "[E] " __VA_ARGS__); fputc('\n', stderr); } while(0)
#define CW_LOG_OUT_WARNING(...) do { fprintf(stderr, "[W] " __VA_ARGS__); fputc('\n', stderr); } while(0)
#define CW_LOG_OUT_INFO(...)    do { fprintf(stderr, __VA_ARGS__); fputc('\n', stderr); } while(0)
#define CW_LOG_OUT_DEBUG(...)   do { fprintf(stderr, "[D] " __VA_ARGS__); fputc('\n', stderr); } while(0)
#define CW_LOG_OUT_HEXDUMP(p, len) do { \
    for (uint32_t _i = 0; _i < (uint32_t)(len); _i++) { \
        fprintf(stderr, "%02X ", ((const uint8_t*)(p))[_i]); \
    } \
    fputc('\n', stderr); \
} while(0)

#else

#define CW_LOG_INIT()           do {} while(0)
#define CW_LOG_FLUSH()          do {} while(0)

#endif

#if (CW_USE_SYSLOG || CW_USE_STDERR) && CW_LOG_LEVEL >= CW_LOG_LEVEL_ERROR
#define CW_LOG_ERROR(...)       CW_LOG_OUT_ERROR(__VA_ARGS__)
#else
#define CW_LOG_ERROR(...)       do {} while(0)
#endif

#if (CW_USE_SYSLOG || CW_USE_STDERR) && CW_LOG_LEVEL >= CW_LOG_LEVEL_WARNING
#define CW_LOG_WARNING(...)     CW_LOG_OUT_WARNING(__VA_ARGS__)
#else
#define CW_LOG_WARNING(...)     do {} while(0)
#endif

#if (CW_USE_SYSLOG || CW_USE_STDERR) && CW_LOG_LEVEL >= CW_LOG_LEVEL_INFO
#define CW_LOG_INFO(...)        CW_LOG_OUT_INFO(__VA_ARGS__)
#else
#define CW_LOG_INFO(...)        do {} while(0)
#endif

#if (CW_USE_SYSLOG || CW_USE_STDERR) && CW_LOG_LEVEL >= CW_LOG_LEVEL_DEBUG
#define CW_LOG_DEBUG(...)       CW_LOG_OUT_DEBUG(__VA_ARGS__)
#define CW_LOG_HEXDUMP(p, len)  CW_LOG_OUT_HEXDUMP(p, len)
#else
#define CW_LOG_DEBUG(...)       do {} while(0)
#define CW_LOG_HEXDUMP(p, len)  do {} while(0)
#endif

#endif /* CW_DEBUG_H */
