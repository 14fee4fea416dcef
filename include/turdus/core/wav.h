// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Canonical 44-byte-header RIFF/WAVE PCM16 serializer.
 *
 * Layout: "RIFF", size-8, "WAVE", "fmt " (16, tag 1, channels, rate,
 * byte rate, block align, 16 bits), "data", data size, then frame-major
 * interleaved little-endian int16 samples. Output is a pure function of
 * the buffer contents and scaling mode.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>
#include <turdus/core/audio_buffer.h>

#ifdef __cplusplus
extern "C" {
#endif

#define TURDUS_WAV_HEADER_BYTES 44

typedef enum {
    /* Negative samples scale by 32768, non-negative by 32767 (matches existing recordings) */
    TURDUS_PCM_ASYMMETRIC = 0,
    /* Both polarities scale by 32767 */
    TURDUS_PCM_SYMMETRIC = 1,
} turdus_pcm_scaling;

/**
 * @brief Clamp to [-1, 1], scale and truncate toward zero. NaN maps to 0.
 */
int16_t turdus_pcm16_from_float(float sample, turdus_pcm_scaling scaling);

/**
 * @brief Serialized size in bytes: 44 + frames * channels * 2.
 *
 * @return 0 when the buffer shape is invalid or the size does not fit the
 *         32-bit RIFF length fields.
 */
size_t turdus_wav_size(const turdus_audio_buffer* buf);

/**
 * @brief Serialize `buf` into `out`.
 *
 * @param buf      Source samples.
 * @param scaling  Float to int16 mapping.
 * @param out      Destination, at least turdus_wav_size(buf) bytes.
 * @param out_cap  Capacity of `out`.
 * @param out_len  [out] Bytes written (may be NULL).
 * @return TURDUS_OK, TURDUS_ERR_INVALID_ARG (bad buffer or capacity) or
 *         TURDUS_ERR_FORMAT (too large for RIFF).
 */
int turdus_wav_serialize(const turdus_audio_buffer* buf, turdus_pcm_scaling scaling, uint8_t* out, size_t out_cap,
                         size_t* out_len);

/**
 * @brief Serialize and write to `path` (truncating).
 *
 * @return TURDUS_OK, serialization errors, TURDUS_ERR_NOMEM or TURDUS_ERR_IO.
 */
int turdus_wav_write_file(const char* path, const turdus_audio_buffer* buf, turdus_pcm_scaling scaling);

/**
 * @brief Parse a scaling name ("asymmetric" | "symmetric", case-insensitive).
 *
 * @return 0 on success, -1 otherwise.
 */
int turdus_pcm_scaling_parse(const char* name, turdus_pcm_scaling* out);

#ifdef __cplusplus
}
#endif
