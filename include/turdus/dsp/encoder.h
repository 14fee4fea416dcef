// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Speech-to-birdsong AM encoder.
 *
 * Per channel: band-limit the speech, bias it into an envelope
 * (1 + 2.4 * speech), multiply a pitch-steered carrier with a slow phase
 * wobble, and soft-clip with tanh. The pitch curve is computed once per
 * session from the down-mix and read by every channel.
 *
 * Sessions process the buffer in ascending, contiguous chunks so a host can
 * interleave other work; chunked and one-shot output are identical.
 */

#ifndef TURDUS_DSP_ENCODER_H
#define TURDUS_DSP_ENCODER_H

#include <stddef.h>
#include <turdus/core/audio_buffer.h>
#include <turdus/dsp/biquad.h>
#include <turdus/dsp/presets.h>
#include <turdus/runtime/worker_pool.h>

#ifdef __cplusplus
extern "C" {
#endif

#define TURDUS_ENC_INPUT_GAIN     3.0
#define TURDUS_ENC_MOD_INDEX      0.8
#define TURDUS_ENC_SOFTCLIP_DRIVE 0.5
#define TURDUS_ENC_VIBRATO_RATE   0.001 /* radians of wobble argument per sample */
#define TURDUS_ENC_VIBRATO_DEPTH  50.0  /* peak phase offset, radians */

typedef struct turdus_encode_channel {
    turdus_biquad lpf;
    double phase; /* carrier phase, kept in [0, 2*pi) */
} turdus_encode_channel;

typedef struct turdus_encoder {
    turdus_encode_preset preset;
    const turdus_audio_buffer* in;
    turdus_audio_buffer* out;
    float* pitch_curve; /* in->frames entries */
    turdus_encode_channel* chans;
    size_t next_frame;
} turdus_encoder;

/**
 * @brief Validate, allocate the output buffer and build the pitch curve.
 *
 * On failure nothing is allocated and `out` is left empty.
 *
 * @param enc    Session to initialize.
 * @param in     Input speech; must outlive the session and stay unchanged.
 * @param preset Encode preset (copied).
 * @param out    Receives a buffer of the same shape as `in`.
 * @return TURDUS_OK, TURDUS_ERR_INVALID_ARG, TURDUS_ERR_INVALID_PRESET or
 *         TURDUS_ERR_NOMEM.
 */
int turdus_encoder_begin(turdus_encoder* enc, const turdus_audio_buffer* in, const turdus_encode_preset* preset,
                         turdus_audio_buffer* out);

/**
 * @brief Encode frames [offset, offset + length) of every channel.
 *
 * @param pool Optional worker pool; NULL runs channels sequentially.
 * @return TURDUS_OK, TURDUS_ERR_ORDER when `offset` is not the next
 *         unprocessed frame, TURDUS_ERR_RANGE when the chunk runs past the end.
 */
int turdus_encoder_process_chunk(turdus_encoder* enc, size_t offset, size_t length, turdus_worker_pool* pool);

/** @brief Encode everything not yet processed. */
int turdus_encoder_run(turdus_encoder* enc, turdus_worker_pool* pool);

/** @brief Frames still to be processed. */
size_t turdus_encoder_remaining(const turdus_encoder* enc);

/** @brief Release session state. The output buffer stays with the caller. */
void turdus_encoder_end(turdus_encoder* enc);

/**
 * @brief One-shot encode of a whole buffer.
 *
 * @return Same codes as turdus_encoder_begin.
 */
int turdus_encode(const turdus_audio_buffer* in, const turdus_encode_preset* preset, turdus_audio_buffer* out,
                  turdus_worker_pool* pool);

#ifdef __cplusplus
}
#endif

#endif /* TURDUS_DSP_ENCODER_H */
