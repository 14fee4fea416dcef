// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#include <turdus/core/status.h>

const char*
turdus_status_str(int status) {
    switch (status) {
        case TURDUS_OK: return "ok";
        case TURDUS_ERR_INVALID_ARG: return "invalid argument";
        case TURDUS_ERR_INVALID_PRESET: return "invalid preset";
        case TURDUS_ERR_NOMEM: return "out of memory";
        case TURDUS_ERR_ORDER: return "chunk out of order";
        case TURDUS_ERR_RANGE: return "chunk out of range";
        case TURDUS_ERR_IO: return "i/o error";
        case TURDUS_ERR_FORMAT: return "unsupported audio format";
        case TURDUS_ERR_CONFIG: return "configuration error";
        default: return "unknown error";
    }
}
