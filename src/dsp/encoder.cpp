// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief AM encoder: pitch-steered carrier modulated by band-limited speech.
 */

#include <math.h>
#include <stdlib.h>
#include <string.h>
#include <turdus/core/status.h>
#include <turdus/dsp/encoder.h>
#include <turdus/dsp/pitch.h>
#include <turdus/runtime/log.h>
#include <turdus/runtime/mem.h>

#include "channel_tasks.h"

static const double kTwoPi = 6.28318530717958647692;

static void
encode_channel_range(void* session, int ch, size_t offset, size_t length) {
    turdus_encoder* enc = (turdus_encoder*)session;
    turdus_encode_channel* st = &enc->chans[ch];
    const float* x = turdus_audio_buffer_channel_const(enc->in, ch);
    float* y = turdus_audio_buffer_channel(enc->out, ch);
    const float* pitch = enc->pitch_curve;
    const double base = enc->preset.carrier_base_hz;
    const double mult = enc->preset.pitch_multiplier;
    const double inv_rate = 1.0 / (double)enc->in->sample_rate;
    double phase = st->phase;

    for (size_t i = offset; i < offset + length; i++) {
        const double speech = turdus_biquad_process(&st->lpf, (double)x[i]);
        const double envelope = 1.0 + speech * TURDUS_ENC_INPUT_GAIN * TURDUS_ENC_MOD_INDEX;

        const double carrier_hz = base + (double)pitch[i] * mult;
        phase += kTwoPi * carrier_hz * inv_rate;
        if (phase >= kTwoPi) {
            phase = fmod(phase, kTwoPi);
        }
        const double vibrato = sin((double)i * TURDUS_ENC_VIBRATO_RATE) * TURDUS_ENC_VIBRATO_DEPTH;

        y[i] = (float)tanh(envelope * sin(phase + vibrato) * TURDUS_ENC_SOFTCLIP_DRIVE);
    }
    st->phase = phase;
}

int
turdus_encoder_begin(turdus_encoder* enc, const turdus_audio_buffer* in, const turdus_encode_preset* preset,
                     turdus_audio_buffer* out) {
    if (!enc || !out) {
        return TURDUS_ERR_INVALID_ARG;
    }
    memset(enc, 0, sizeof(*enc));
    memset(out, 0, sizeof(*out));
    if (!turdus_audio_buffer_is_valid(in)) {
        LOG_ERROR("encode: invalid input buffer\n");
        return TURDUS_ERR_INVALID_ARG;
    }
    int rc = turdus_encode_preset_validate(preset, in->sample_rate);
    if (rc != TURDUS_OK) {
        return rc;
    }

    enc->chans = (turdus_encode_channel*)calloc((size_t)in->channels, sizeof(turdus_encode_channel));
    if (!enc->chans) {
        LOG_ERROR("encode: channel state allocation failed\n");
        return TURDUS_ERR_NOMEM;
    }
    if (in->frames > 0) {
        enc->pitch_curve = turdus_samples_alloc(in->frames);
        if (!enc->pitch_curve) {
            LOG_ERROR("encode: pitch curve allocation failed (%zu frames)\n", in->frames);
            turdus_encoder_end(enc);
            return TURDUS_ERR_NOMEM;
        }
    }
    rc = turdus_audio_buffer_alloc(out, in->channels, in->frames, in->sample_rate);
    if (rc != TURDUS_OK) {
        turdus_audio_buffer_free(out);
        turdus_encoder_end(enc);
        return rc;
    }
    rc = turdus_pitch_curve_build(in, enc->pitch_curve);
    if (rc != TURDUS_OK) {
        turdus_audio_buffer_free(out);
        turdus_encoder_end(enc);
        return rc;
    }

    enc->preset = *preset;
    enc->in = in;
    enc->out = out;
    for (int c = 0; c < in->channels; c++) {
        turdus_biquad_lowpass_init(&enc->chans[c].lpf, preset->input_lpf_hz, in->sample_rate);
        enc->chans[c].phase = 0.0;
    }
    LOG_DEBUG("encode: preset '%s', %d ch, %zu frames @ %d Hz\n", preset->id, in->channels, in->frames,
              in->sample_rate);
    return TURDUS_OK;
}

int
turdus_encoder_process_chunk(turdus_encoder* enc, size_t offset, size_t length, turdus_worker_pool* pool) {
    if (!enc || !enc->in || !enc->chans) {
        return TURDUS_ERR_INVALID_ARG;
    }
    if (offset != enc->next_frame) {
        LOG_ERROR("encode: chunk at frame %zu, expected %zu\n", offset, enc->next_frame);
        return TURDUS_ERR_ORDER;
    }
    if (length > enc->in->frames - offset) {
        LOG_ERROR("encode: chunk [%zu, +%zu) past end of %zu frames\n", offset, length, enc->in->frames);
        return TURDUS_ERR_RANGE;
    }
    if (length == 0) {
        return TURDUS_OK;
    }
    turdus_dispatch_channels(pool, enc->in->channels, encode_channel_range, enc, offset, length);
    enc->next_frame += length;
    return TURDUS_OK;
}

int
turdus_encoder_run(turdus_encoder* enc, turdus_worker_pool* pool) {
    if (!enc) {
        return TURDUS_ERR_INVALID_ARG;
    }
    return turdus_encoder_process_chunk(enc, enc->next_frame, turdus_encoder_remaining(enc), pool);
}

size_t
turdus_encoder_remaining(const turdus_encoder* enc) {
    if (!enc || !enc->in) {
        return 0;
    }
    return enc->in->frames - enc->next_frame;
}

void
turdus_encoder_end(turdus_encoder* enc) {
    if (!enc) {
        return;
    }
    turdus_samples_free(enc->pitch_curve);
    free(enc->chans);
    memset(enc, 0, sizeof(*enc));
}

int
turdus_encode(const turdus_audio_buffer* in, const turdus_encode_preset* preset, turdus_audio_buffer* out,
              turdus_worker_pool* pool) {
    turdus_encoder enc;
    int rc = turdus_encoder_begin(&enc, in, preset, out);
    if (rc != TURDUS_OK) {
        return rc;
    }
    rc = turdus_encoder_run(&enc, pool);
    turdus_encoder_end(&enc);
    if (rc != TURDUS_OK) {
        turdus_audio_buffer_free(out);
    }
    return rc;
}
