// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Autocorrelation pitch estimator and per-sample pitch curve builder.
 *
 * The estimator searches integer lags covering a 70-400 Hz voice
 * fundamental. The curve builder runs it every `TURDUS_PITCH_HOP` samples
 * over a `TURDUS_PITCH_WINDOW`-sample window of the channel down-mix, holds
 * each value across its hop, and smooths voiced estimates exponentially.
 */

#ifndef TURDUS_DSP_PITCH_H
#define TURDUS_DSP_PITCH_H

#include <stddef.h>
#include <turdus/core/audio_buffer.h>

#ifdef __cplusplus
extern "C" {
#endif

#define TURDUS_PITCH_WINDOW      2048
#define TURDUS_PITCH_HOP         512
#define TURDUS_PITCH_MIN_HZ      70
#define TURDUS_PITCH_MAX_HZ      400
#define TURDUS_PITCH_SILENCE_RMS 0.02
#define TURDUS_PITCH_INITIAL_HZ  120.0
#define TURDUS_PITCH_SMOOTHING   0.8 /* weight of the previous value */

/**
 * @brief Estimate the fundamental of one analysis window.
 *
 * Lags from floor(sr/400) up to (not including) floor(sr/70) are scored by a
 * lag-product sum over every other sample; the first lag reaching the
 * maximum wins.
 *
 * @param x              Window samples.
 * @param n              Window length.
 * @param sample_rate_hz Sample rate in Hz.
 * @return Pitch in Hz, or 0 when the window RMS is below the silence gate
 *         or no lag scores above -1.
 */
double turdus_pitch_estimate(const float* x, size_t n, int sample_rate_hz);

/**
 * @brief Fold a new estimate into the held pitch.
 *
 * @param previous Pitch currently held.
 * @param estimate Output of turdus_pitch_estimate (0 = unvoiced).
 * @return `previous` when unvoiced, else 0.8 * previous + 0.2 * estimate.
 */
double turdus_pitch_smooth(double previous, double estimate);

/**
 * @brief Build one pitch value per frame of `in` from its channel down-mix.
 *
 * Frames after the last analysis window at least half a window long get
 * pitch 0, as does every frame of a buffer shorter than half a window.
 *
 * @param in    Input buffer (any channel count).
 * @param curve Output, `in->frames` values.
 * @return TURDUS_OK, TURDUS_ERR_INVALID_ARG or TURDUS_ERR_NOMEM.
 */
int turdus_pitch_curve_build(const turdus_audio_buffer* in, float* curve);

#ifdef __cplusplus
}
#endif

#endif /* TURDUS_DSP_PITCH_H */
