// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Runtime logging implementation.
 *
 * Implements the low-level write routine used by logging macros to emit
 * messages to `stderr`, gated by a runtime severity threshold.
 */

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <turdus/platform/posix_compat.h>
#include <turdus/runtime/log.h>

static std::atomic<int> g_log_level(LOG_LEVEL_INFO);

void
turdus_log_set_level(turdus_log_level_t level) {
    g_log_level.store((int)level, std::memory_order_relaxed);
}

turdus_log_level_t
turdus_log_get_level(void) {
    return (turdus_log_level_t)g_log_level.load(std::memory_order_relaxed);
}

int
turdus_log_level_parse(const char* name, turdus_log_level_t* out) {
    if (!name || !*name || !out) {
        return -1;
    }
    if (turdus_strcasecmp(name, "error") == 0) {
        *out = LOG_LEVEL_ERROR;
    } else if (turdus_strcasecmp(name, "warn") == 0 || turdus_strcasecmp(name, "warning") == 0) {
        *out = LOG_LEVEL_WARN;
    } else if (turdus_strcasecmp(name, "info") == 0) {
        *out = LOG_LEVEL_INFO;
    } else if (turdus_strcasecmp(name, "debug") == 0) {
        *out = LOG_LEVEL_DEBUG;
    } else {
        return -1;
    }
    return 0;
}

/**
 * @brief Write a formatted log message to the logging sink.
 *
 * @param level  Log severity level; dropped when above the runtime threshold.
 * @param format printf-style format string.
 * @param ...    Variadic arguments corresponding to `format`.
 */
void
turdus_log_write(turdus_log_level_t level, const char* format, ...) {
    if (format == nullptr) {
        return;
    }
    if ((int)level > g_log_level.load(std::memory_order_relaxed)) {
        return;
    }

    va_list args;
    va_start(args, format);
    /* Format into a temporary buffer first so concurrent writers do not interleave mid-line */
    char buf[4096];
    vsnprintf(buf, sizeof(buf), format, args);
    va_end(args);

    fputs(buf, stderr);
}
