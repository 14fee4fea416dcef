// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Envelope-detection decoder (rectifier, low-pass cascade, DC blocker, gain).
 */

#include <math.h>
#include <stdlib.h>
#include <string.h>
#include <turdus/core/status.h>
#include <turdus/dsp/decoder.h>
#include <turdus/runtime/log.h>

#include "channel_tasks.h"

static void
decode_channel_range(void* session, int ch, size_t offset, size_t length) {
    turdus_decoder* dec = (turdus_decoder*)session;
    turdus_decode_channel* st = &dec->chans[ch];
    const float* x = turdus_audio_buffer_channel_const(dec->in, ch);
    float* y = turdus_audio_buffer_channel(dec->out, ch);
    const int stages = dec->preset.filter_stages;
    const double gain = dec->preset.gain_multiplier;

    for (size_t i = offset; i < offset + length; i++) {
        double v = fabs((double)x[i]);
        for (int k = 0; k < stages; k++) {
            v = turdus_biquad_process(&st->stages[k], v);
        }
        v = turdus_dc_block_process(&st->dc, v);
        y[i] = (float)(v * gain);
    }
}

int
turdus_decoder_begin(turdus_decoder* dec, const turdus_audio_buffer* in, const turdus_decode_preset* preset,
                     turdus_audio_buffer* out) {
    if (!dec || !out) {
        return TURDUS_ERR_INVALID_ARG;
    }
    memset(dec, 0, sizeof(*dec));
    memset(out, 0, sizeof(*out));
    if (!turdus_audio_buffer_is_valid(in)) {
        LOG_ERROR("decode: invalid input buffer\n");
        return TURDUS_ERR_INVALID_ARG;
    }
    int rc = turdus_decode_preset_validate(preset, in->sample_rate);
    if (rc != TURDUS_OK) {
        return rc;
    }

    dec->chans = (turdus_decode_channel*)calloc((size_t)in->channels, sizeof(turdus_decode_channel));
    if (!dec->chans) {
        LOG_ERROR("decode: channel state allocation failed\n");
        return TURDUS_ERR_NOMEM;
    }
    rc = turdus_audio_buffer_alloc(out, in->channels, in->frames, in->sample_rate);
    if (rc != TURDUS_OK) {
        turdus_audio_buffer_free(out);
        turdus_decoder_end(dec);
        return rc;
    }

    dec->preset = *preset;
    dec->in = in;
    dec->out = out;
    for (int c = 0; c < in->channels; c++) {
        for (int k = 0; k < preset->filter_stages; k++) {
            turdus_biquad_lowpass_init(&dec->chans[c].stages[k], preset->lpf_hz, in->sample_rate);
        }
        turdus_dc_block_init(&dec->chans[c].dc);
    }
    LOG_DEBUG("decode: preset '%s', %d ch, %zu frames @ %d Hz\n", preset->id, in->channels, in->frames,
              in->sample_rate);
    return TURDUS_OK;
}

int
turdus_decoder_process_chunk(turdus_decoder* dec, size_t offset, size_t length, turdus_worker_pool* pool) {
    if (!dec || !dec->in || !dec->chans) {
        return TURDUS_ERR_INVALID_ARG;
    }
    if (offset != dec->next_frame) {
        LOG_ERROR("decode: chunk at frame %zu, expected %zu\n", offset, dec->next_frame);
        return TURDUS_ERR_ORDER;
    }
    if (length > dec->in->frames - offset) {
        LOG_ERROR("decode: chunk [%zu, +%zu) past end of %zu frames\n", offset, length, dec->in->frames);
        return TURDUS_ERR_RANGE;
    }
    if (length == 0) {
        return TURDUS_OK;
    }
    turdus_dispatch_channels(pool, dec->in->channels, decode_channel_range, dec, offset, length);
    dec->next_frame += length;
    return TURDUS_OK;
}

int
turdus_decoder_run(turdus_decoder* dec, turdus_worker_pool* pool) {
    if (!dec) {
        return TURDUS_ERR_INVALID_ARG;
    }
    return turdus_decoder_process_chunk(dec, dec->next_frame, turdus_decoder_remaining(dec), pool);
}

size_t
turdus_decoder_remaining(const turdus_decoder* dec) {
    if (!dec || !dec->in) {
        return 0;
    }
    return dec->in->frames - dec->next_frame;
}

void
turdus_decoder_end(turdus_decoder* dec) {
    if (!dec) {
        return;
    }
    free(dec->chans);
    memset(dec, 0, sizeof(*dec));
}

int
turdus_decode(const turdus_audio_buffer* in, const turdus_decode_preset* preset, turdus_audio_buffer* out,
              turdus_worker_pool* pool) {
    turdus_decoder dec;
    int rc = turdus_decoder_begin(&dec, in, preset, out);
    if (rc != TURDUS_OK) {
        return rc;
    }
    rc = turdus_decoder_run(&dec, pool);
    turdus_decoder_end(&dec);
    if (rc != TURDUS_OK) {
        turdus_audio_buffer_free(out);
    }
    return rc;
}
