// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Status codes returned by turdus engine and host functions.
 *
 * Success is zero; failures are negative so call sites can test `rc < 0`.
 */

#pragma once

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    TURDUS_OK = 0,
    TURDUS_ERR_INVALID_ARG = -1,    /* NULL pointer, zero channels, bad sample rate */
    TURDUS_ERR_INVALID_PRESET = -2, /* cutoff outside (0, Nyquist), non-positive gain/stages */
    TURDUS_ERR_NOMEM = -3,
    TURDUS_ERR_ORDER = -4, /* chunk does not start at the next unprocessed frame */
    TURDUS_ERR_RANGE = -5, /* chunk extends past the end of the buffer */
    TURDUS_ERR_IO = -6,
    TURDUS_ERR_FORMAT = -7,
    TURDUS_ERR_CONFIG = -8,
} turdus_status;

/** @brief Stable human-readable description of a status code. */
const char* turdus_status_str(int status);

#ifdef __cplusplus
}
#endif
