// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#include <cstdint>
#include <cstring>

#include <turdus/platform/posix_compat.h>
#include <turdus/runtime/mem.h>

float*
turdus_samples_alloc(size_t count) {
    if (count == 0 || count > SIZE_MAX / sizeof(float) - TURDUS_SAMPLE_ALIGN) {
        return NULL;
    }
    /* Whole alignment blocks; some aligned allocators reject other sizes */
    const size_t bytes = (count * sizeof(float) + (TURDUS_SAMPLE_ALIGN - 1)) & ~(size_t)(TURDUS_SAMPLE_ALIGN - 1);
    float* p = (float*)turdus_aligned_alloc(TURDUS_SAMPLE_ALIGN, bytes);
    if (p) {
        std::memset(p, 0, bytes);
    }
    return p;
}

void
turdus_samples_free(float* samples) {
    turdus_aligned_free(samples);
}
