// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Zeroed, cache-line aligned float sample storage.
 *
 * Backs audio buffers, pitch curves and downmix scratch space.
 */

#ifndef TURDUS_RUNTIME_MEM_H
#define TURDUS_RUNTIME_MEM_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

#ifndef TURDUS_SAMPLE_ALIGN
#define TURDUS_SAMPLE_ALIGN 64
#endif

/**
 * @brief Allocate `count` zeroed floats aligned to TURDUS_SAMPLE_ALIGN.
 *
 * @return NULL when `count` is 0, the byte size overflows, or allocation fails.
 */
float* turdus_samples_alloc(size_t count);

/** @brief Release storage from turdus_samples_alloc. NULL is a no-op. */
void turdus_samples_free(float* samples);

#ifdef __cplusplus
}
#endif

#endif /* TURDUS_RUNTIME_MEM_H */
