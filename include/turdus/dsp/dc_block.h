// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Single-pole DC blocker: y[n] = x[n] - x[n-1] + r * y[n-1].
 */

#ifndef TURDUS_DSP_DC_BLOCK_H
#define TURDUS_DSP_DC_BLOCK_H

#ifdef __cplusplus
extern "C" {
#endif

/* Pole radius; ~35 Hz corner at 44.1 kHz */
#define TURDUS_DC_BLOCK_R 0.995

typedef struct turdus_dc_block {
    double r;
    double x1;
    double y1;
} turdus_dc_block;

/** @brief Initialize with the fixed pole radius and zero history. */
void turdus_dc_block_init(turdus_dc_block* d);

static inline double
turdus_dc_block_process(turdus_dc_block* d, double x) {
    const double y = x - d->x1 + d->r * d->y1;
    d->x1 = x;
    d->y1 = y;
    return y;
}

#ifdef __cplusplus
}
#endif

#endif /* TURDUS_DSP_DC_BLOCK_H */
