// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Autocorrelation pitch tracking that steers the encoder carrier.
 */

#include <math.h>
#include <turdus/core/status.h>
#include <turdus/dsp/pitch.h>
#include <turdus/runtime/log.h>
#include <turdus/runtime/mem.h>

static double
window_rms(const float* x, size_t n) {
    if (n == 0) {
        return 0.0;
    }
    double acc = 0.0;
    for (size_t i = 0; i < n; i++) {
        acc += (double)x[i] * (double)x[i];
    }
    return sqrt(acc / (double)n);
}

double
turdus_pitch_estimate(const float* x, size_t n, int sample_rate_hz) {
    if (!x || n == 0 || sample_rate_hz <= 0) {
        return 0.0;
    }
    if (window_rms(x, n) < TURDUS_PITCH_SILENCE_RMS) {
        return 0.0;
    }

    const size_t min_period = (size_t)(sample_rate_hz / TURDUS_PITCH_MAX_HZ);
    const size_t max_period = (size_t)(sample_rate_hz / TURDUS_PITCH_MIN_HZ);

    double best_corr = -1.0;
    size_t best_period = 0;
    for (size_t period = min_period; period < max_period; period++) {
        double sum = 0.0;
        /* Every other sample keeps the search cheap; resolution is set by the lag grid anyway */
        for (size_t i = 0; i + period < n; i += 2) {
            sum += (double)x[i] * (double)x[i + period];
        }
        if (sum > best_corr) {
            best_corr = sum;
            best_period = period;
        }
    }
    return best_period > 0 ? (double)sample_rate_hz / (double)best_period : 0.0;
}

double
turdus_pitch_smooth(double previous, double estimate) {
    if (estimate == 0.0) {
        return previous;
    }
    return previous * TURDUS_PITCH_SMOOTHING + estimate * (1.0 - TURDUS_PITCH_SMOOTHING);
}

int
turdus_pitch_curve_build(const turdus_audio_buffer* in, float* curve) {
    if (!turdus_audio_buffer_is_valid(in) || (!curve && in->frames > 0)) {
        return TURDUS_ERR_INVALID_ARG;
    }
    const size_t total = in->frames;
    if (total == 0) {
        return TURDUS_OK;
    }

    const float* mono = in->data;
    float* mix = NULL;
    if (in->channels > 1) {
        mix = turdus_samples_alloc(total);
        if (!mix) {
            LOG_ERROR("pitch: down-mix allocation failed (%zu frames)\n", total);
            return TURDUS_ERR_NOMEM;
        }
        turdus_audio_buffer_downmix(in, mix);
        mono = mix;
    }

    const size_t hop = TURDUS_PITCH_HOP;
    const size_t num_frames = (total + hop - 1) / hop;
    double last_pitch = TURDUS_PITCH_INITIAL_HZ;
    size_t filled = 0;
    int voiced = 0;

    for (size_t f = 0; f < num_frames; f++) {
        const size_t start = f * hop;
        size_t end = start + TURDUS_PITCH_WINDOW;
        if (end > total) {
            end = total;
        }
        if (end - start < TURDUS_PITCH_WINDOW / 2) {
            break;
        }
        const double estimate = turdus_pitch_estimate(mono + start, end - start, in->sample_rate);
        if (estimate != 0.0) {
            voiced++;
        }
        last_pitch = turdus_pitch_smooth(last_pitch, estimate);
        for (size_t j = start; j < start + hop && j < total; j++) {
            curve[j] = (float)last_pitch;
        }
        filled = (start + hop < total) ? start + hop : total;
    }
    /* No analysis past here: zero pitch leaves the carrier at its base frequency */
    for (size_t j = filled; j < total; j++) {
        curve[j] = 0.0f;
    }

    LOG_DEBUG("pitch: %zu frames, %zu analysis steps, %d voiced, final %.1f Hz\n", total, num_frames, voiced,
              last_pitch);
    turdus_samples_free(mix);
    return TURDUS_OK;
}
