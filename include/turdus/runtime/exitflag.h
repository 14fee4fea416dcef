// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Shutdown signaling flag for the turdus host.
 *
 * Set by the SIGINT handler and checked by the host between processing
 * chunks. The DSP engine never reads it.
 */

#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

extern volatile uint8_t exitflag;

#ifdef __cplusplus
}
#endif
