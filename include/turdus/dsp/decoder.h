// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Birdsong-to-speech envelope detector.
 *
 * Per channel: full-wave rectify, run `filter_stages` identical low-pass
 * sections in series, remove the envelope bias with the DC blocker and apply
 * makeup gain. No clipping happens here; the WAV writer clamps.
 */

#ifndef TURDUS_DSP_DECODER_H
#define TURDUS_DSP_DECODER_H

#include <stddef.h>
#include <turdus/core/audio_buffer.h>
#include <turdus/dsp/biquad.h>
#include <turdus/dsp/dc_block.h>
#include <turdus/dsp/presets.h>
#include <turdus/runtime/worker_pool.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct turdus_decode_channel {
    turdus_biquad stages[TURDUS_MAX_FILTER_STAGES];
    turdus_dc_block dc;
} turdus_decode_channel;

typedef struct turdus_decoder {
    turdus_decode_preset preset;
    const turdus_audio_buffer* in;
    turdus_audio_buffer* out;
    turdus_decode_channel* chans;
    size_t next_frame;
} turdus_decoder;

/**
 * @brief Validate the preset and allocate the output buffer.
 *
 * On failure nothing is allocated and `out` is left empty.
 *
 * @return TURDUS_OK, TURDUS_ERR_INVALID_ARG, TURDUS_ERR_INVALID_PRESET or
 *         TURDUS_ERR_NOMEM.
 */
int turdus_decoder_begin(turdus_decoder* dec, const turdus_audio_buffer* in, const turdus_decode_preset* preset,
                         turdus_audio_buffer* out);

/**
 * @brief Decode frames [offset, offset + length) of every channel.
 *
 * @return TURDUS_OK, TURDUS_ERR_ORDER or TURDUS_ERR_RANGE.
 */
int turdus_decoder_process_chunk(turdus_decoder* dec, size_t offset, size_t length, turdus_worker_pool* pool);

int turdus_decoder_run(turdus_decoder* dec, turdus_worker_pool* pool);
size_t turdus_decoder_remaining(const turdus_decoder* dec);
void turdus_decoder_end(turdus_decoder* dec);

/** @brief One-shot decode of a whole buffer. */
int turdus_decode(const turdus_audio_buffer* in, const turdus_decode_preset* preset, turdus_audio_buffer* out,
                  turdus_worker_pool* pool);

#ifdef __cplusplus
}
#endif

#endif /* TURDUS_DSP_DECODER_H */
