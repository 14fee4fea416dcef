// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Planar float PCM buffer allocation and layout helpers.
 */

#include <stdint.h>
#include <string.h>
#include <turdus/core/audio_buffer.h>
#include <turdus/core/status.h>
#include <turdus/runtime/log.h>
#include <turdus/runtime/mem.h>

int
turdus_audio_buffer_alloc(turdus_audio_buffer* buf, int channels, size_t frames, int sample_rate) {
    if (!buf || channels < 1 || sample_rate <= 0) {
        return TURDUS_ERR_INVALID_ARG;
    }
    buf->sample_rate = sample_rate;
    buf->channels = channels;
    buf->frames = frames;
    buf->data = NULL;
    if (frames == 0) {
        return TURDUS_OK;
    }
    if (frames > SIZE_MAX / sizeof(float) / (size_t)channels) {
        LOG_ERROR("audio buffer too large: %d channels x %zu frames\n", channels, frames);
        return TURDUS_ERR_NOMEM;
    }
    buf->data = turdus_samples_alloc((size_t)channels * frames);
    if (!buf->data) {
        LOG_ERROR("audio buffer allocation failed (%d channels x %zu frames)\n", channels, frames);
        buf->frames = 0;
        return TURDUS_ERR_NOMEM;
    }
    return TURDUS_OK;
}

void
turdus_audio_buffer_free(turdus_audio_buffer* buf) {
    if (!buf) {
        return;
    }
    turdus_samples_free(buf->data);
    memset(buf, 0, sizeof(*buf));
}

float*
turdus_audio_buffer_channel(turdus_audio_buffer* buf, int ch) {
    if (!buf || !buf->data || ch < 0 || ch >= buf->channels) {
        return NULL;
    }
    return buf->data + (size_t)ch * buf->frames;
}

const float*
turdus_audio_buffer_channel_const(const turdus_audio_buffer* buf, int ch) {
    if (!buf || !buf->data || ch < 0 || ch >= buf->channels) {
        return NULL;
    }
    return buf->data + (size_t)ch * buf->frames;
}

int
turdus_audio_buffer_is_valid(const turdus_audio_buffer* buf) {
    if (!buf || buf->channels < 1 || buf->sample_rate <= 0) {
        return 0;
    }
    return (buf->frames == 0 || buf->data != NULL) ? 1 : 0;
}

void
turdus_audio_buffer_downmix(const turdus_audio_buffer* buf, float* out) {
    if (!buf || !out || !buf->data) {
        return;
    }
    const size_t n = buf->frames;
    if (buf->channels == 1) {
        memcpy(out, buf->data, n * sizeof(float));
        return;
    }
    for (size_t i = 0; i < n; i++) {
        float sum = 0.0f;
        for (int c = 0; c < buf->channels; c++) {
            sum += buf->data[(size_t)c * n + i];
        }
        out[i] = sum / (float)buf->channels;
    }
}

void
turdus_audio_buffer_deinterleave(turdus_audio_buffer* buf, const float* interleaved) {
    if (!buf || !buf->data || !interleaved) {
        return;
    }
    const size_t n = buf->frames;
    const int nch = buf->channels;
    for (size_t i = 0; i < n; i++) {
        for (int c = 0; c < nch; c++) {
            buf->data[(size_t)c * n + i] = interleaved[i * (size_t)nch + (size_t)c];
        }
    }
}
