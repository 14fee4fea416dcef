// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Second-order IIR low-pass section (bilinear-transform biquad).
 *
 * Coefficients are fixed at init from (cutoff, sample rate) with
 * alpha = sin(w0) / (2 * sqrt(2)) and normalized by a0 for unit DC gain.
 * History is per instance; one instance serves exactly one channel of one
 * encode/decode call and must see samples in ascending time order.
 */

#ifndef TURDUS_DSP_BIQUAD_H
#define TURDUS_DSP_BIQUAD_H

#ifdef __cplusplus
extern "C" {
#endif

typedef struct turdus_biquad {
    /* Feed-forward (b) and feedback (a) coefficients, a0 normalized to 1 */
    double b0, b1, b2;
    double a1, a2;
    /* Direct form I history */
    double x1, x2;
    double y1, y2;
} turdus_biquad;

/**
 * @brief Design a low-pass section and clear its history.
 *
 * Cutoff range is not checked here; presets are validated before any filter
 * is built.
 *
 * @param f              Filter to initialize.
 * @param cutoff_hz      -3 dB-region corner frequency in Hz.
 * @param sample_rate_hz Sample rate in Hz.
 */
void turdus_biquad_lowpass_init(turdus_biquad* f, double cutoff_hz, int sample_rate_hz);

/** @brief Clear history, keep coefficients. */
void turdus_biquad_reset(turdus_biquad* f);

/**
 * @brief Filter one sample.
 *
 * y[n] = b0 x[n] + b1 x[n-1] + b2 x[n-2] - a1 y[n-1] - a2 y[n-2]
 *
 * Works in double so a cascade rounds to float only once, at the caller.
 */
static inline double
turdus_biquad_process(turdus_biquad* f, double x) {
    const double y = f->b0 * x + f->b1 * f->x1 + f->b2 * f->x2 - f->a1 * f->y1 - f->a2 * f->y2;
    f->x2 = f->x1;
    f->x1 = x;
    f->y2 = f->y1;
    f->y1 = y;
    return y;
}

/**
 * @brief Magnitude response |H(e^jw)| at `freq_hz`.
 *
 * Used by tests and the preset listing; does not touch filter history.
 */
double turdus_biquad_magnitude(const turdus_biquad* f, double freq_hz, int sample_rate_hz);

#ifdef __cplusplus
}
#endif

#endif /* TURDUS_DSP_BIQUAD_H */
