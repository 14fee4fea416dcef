// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#ifndef TURDUS_LOG_H
#define TURDUS_LOG_H

/**
 * @file
 * @brief Runtime logging interface used across turdus components.
 *
 * Declares log severity levels, the core logging write routine, and convenience
 * macros. The implementation forwards messages to `stderr`.
 */

/**
 * @brief Log severity levels for runtime logging.
 */
typedef enum { LOG_LEVEL_ERROR = 0, LOG_LEVEL_WARN = 1, LOG_LEVEL_INFO = 2, LOG_LEVEL_DEBUG = 3 } turdus_log_level_t;

/* Compile-time log level control, numeric 0 (error) .. 3 (debug); runtime gating decides below it */
#ifndef TURDUS_LOG_LEVEL
#define TURDUS_LOG_LEVEL 3
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Write a formatted log message to the logging sink.
 *
 * Messages more verbose than the runtime threshold are dropped.
 *
 * @param level  Log severity level.
 * @param format printf-style format string.
 * @param ...    Variadic arguments corresponding to `format`.
 */
void turdus_log_write(turdus_log_level_t level, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

/** @brief Set the runtime threshold (default LOG_LEVEL_INFO). */
void turdus_log_set_level(turdus_log_level_t level);

/** @brief Current runtime threshold. */
turdus_log_level_t turdus_log_get_level(void);

/**
 * @brief Parse a level name (error|warn|info|debug, case-insensitive).
 *
 * @return 0 on success, -1 when the name is not recognized.
 */
int turdus_log_level_parse(const char* name, turdus_log_level_t* out);

#ifdef __cplusplus
}
#endif

/* Logging macros route through turdus_log_write to allow runtime gating */

#define LOG_ERROR(...)                                                                                                 \
    do {                                                                                                               \
        turdus_log_write(LOG_LEVEL_ERROR, __VA_ARGS__);                                                                \
    } while (0)

#define LOG_WARN(...)                                                                                                  \
    do {                                                                                                               \
        turdus_log_write(LOG_LEVEL_WARN, __VA_ARGS__);                                                                 \
    } while (0)

#define LOG_INFO(...)                                                                                                  \
    do {                                                                                                               \
        turdus_log_write(LOG_LEVEL_INFO, __VA_ARGS__);                                                                 \
    } while (0)

/* Debug messages - compile-time gated */
#if TURDUS_LOG_LEVEL >= 3
#define LOG_DEBUG(...)                                                                                                 \
    do {                                                                                                               \
        turdus_log_write(LOG_LEVEL_DEBUG, __VA_ARGS__);                                                                \
    } while (0)
#else
#define LOG_DEBUG(...)                                                                                                 \
    do {                                                                                                               \
        /* Debug logging disabled */                                                                                   \
    } while (0)
#endif

/* For warnings with WARNING: prefix */
#define LOG_WARNING(...)  LOG_WARN("WARNING: " __VA_ARGS__)

/* For notices with NOTICE: prefix */
#define LOG_NOTICE(...)   LOG_INFO("NOTICE: " __VA_ARGS__)

/* For critical errors that may exit */
#define LOG_CRITICAL(...) LOG_ERROR(__VA_ARGS__)

#endif /* TURDUS_LOG_H */
