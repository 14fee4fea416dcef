// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Multi-channel float PCM buffer shared by the encoder, decoder and
 * WAV writer.
 *
 * Samples are stored planar (channel-major) in one aligned allocation sized
 * once from `channels * frames`. Every channel has the same frame count and
 * sample rate. A buffer handed to the engine as input is never modified.
 */

#pragma once

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct turdus_audio_buffer {
    int sample_rate; /* Hz */
    int channels;    /* >= 1 */
    size_t frames;   /* samples per channel */
    float* data;     /* channels * frames, channel c at data + c * frames */
} turdus_audio_buffer;

/**
 * @brief Allocate zero-filled storage for a buffer.
 *
 * A zero-frame buffer is valid and has `data == NULL`.
 *
 * @param buf         Buffer to initialize (previous contents are not freed).
 * @param channels    Channel count (>= 1).
 * @param frames      Samples per channel.
 * @param sample_rate Sample rate in Hz (> 0).
 * @return TURDUS_OK, TURDUS_ERR_INVALID_ARG or TURDUS_ERR_NOMEM.
 */
int turdus_audio_buffer_alloc(turdus_audio_buffer* buf, int channels, size_t frames, int sample_rate);

/** @brief Release storage and reset all fields. Safe on a zeroed buffer. */
void turdus_audio_buffer_free(turdus_audio_buffer* buf);

/** @brief Mutable pointer to channel `ch`, or NULL when out of range/empty. */
float* turdus_audio_buffer_channel(turdus_audio_buffer* buf, int ch);

/** @brief Read-only pointer to channel `ch`, or NULL when out of range/empty. */
const float* turdus_audio_buffer_channel_const(const turdus_audio_buffer* buf, int ch);

/** @brief Non-zero when the buffer has a valid shape (channels >= 1, sample_rate > 0). */
int turdus_audio_buffer_is_valid(const turdus_audio_buffer* buf);

/**
 * @brief Average all channels into `out` (length `frames`).
 *
 * Mono input is copied verbatim.
 */
void turdus_audio_buffer_downmix(const turdus_audio_buffer* buf, float* out);

/**
 * @brief Copy interleaved samples (frame-major) into planar storage.
 *
 * @param buf         Allocated destination buffer.
 * @param interleaved `buf->frames * buf->channels` samples.
 */
void turdus_audio_buffer_deinterleave(turdus_audio_buffer* buf, const float* interleaved);

#ifdef __cplusplus
}
#endif
