// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Low-pass biquad design from the analog prototype via the bilinear transform.
 */

#include <math.h>
#include <turdus/dsp/biquad.h>

static const double kPi = 3.14159265358979323846;
static const double kSqrt2 = 1.41421356237309504880;

void
turdus_biquad_lowpass_init(turdus_biquad* f, double cutoff_hz, int sample_rate_hz) {
    const double omega = 2.0 * kPi * cutoff_hz / (double)sample_rate_hz;
    const double sn = sin(omega);
    const double cs = cos(omega);
    const double alpha = sn / (2.0 * kSqrt2);

    const double b0 = (1.0 - cs) / 2.0;
    const double b1 = 1.0 - cs;
    const double b2 = b0;
    const double a0 = 1.0 + alpha;
    const double a1 = -2.0 * cs;
    const double a2 = 1.0 - alpha;

    f->b0 = b0 / a0;
    f->b1 = b1 / a0;
    f->b2 = b2 / a0;
    f->a1 = a1 / a0;
    f->a2 = a2 / a0;
    turdus_biquad_reset(f);
}

void
turdus_biquad_reset(turdus_biquad* f) {
    f->x1 = 0.0;
    f->x2 = 0.0;
    f->y1 = 0.0;
    f->y2 = 0.0;
}

double
turdus_biquad_magnitude(const turdus_biquad* f, double freq_hz, int sample_rate_hz) {
    const double w = 2.0 * kPi * freq_hz / (double)sample_rate_hz;
    /* Evaluate numerator and denominator at z = e^{jw} */
    const double c1 = cos(w), s1 = sin(w);
    const double c2 = cos(2.0 * w), s2 = sin(2.0 * w);
    const double nr = f->b0 + f->b1 * c1 + f->b2 * c2;
    const double ni = -(f->b1 * s1 + f->b2 * s2);
    const double dr = 1.0 + f->a1 * c1 + f->a2 * c2;
    const double di = -(f->a1 * s1 + f->a2 * s2);
    const double den = sqrt(dr * dr + di * di);
    if (den == 0.0) {
        return 0.0;
    }
    return sqrt(nr * nr + ni * ni) / den;
}
