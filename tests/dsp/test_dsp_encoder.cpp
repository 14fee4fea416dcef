// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/* Unit tests: AM birdsong encoder output shape, carrier, determinism and errors. */

#include <math.h>
#include <stdio.h>
#include <string.h>
#include <turdus/core/audio_buffer.h>
#include <turdus/core/status.h>
#include <turdus/dsp/encoder.h>
#include <turdus/dsp/pitch.h>
#include <turdus/dsp/presets.h>

#include "test_support.h"

static void
fill_speechlike(float* x, size_t n, int fs) {
    for (size_t i = 0; i < n; i++) {
        const double t = (double)i / fs;
        x[i] = (float)(0.15 * sin(2.0 * M_PI * 200.0 * t) * (0.5 + 0.5 * sin(2.0 * M_PI * 3.0 * t)));
    }
}

static void
fill_tone(float* x, size_t n, double amp, double freq, int fs) {
    for (size_t i = 0; i < n; i++) {
        x[i] = (float)(amp * sin(2.0 * M_PI * freq * (double)i / fs));
    }
}

/* End of the last pitch analysis hop; later frames carry pitch 0 */
static size_t
analysed_frames(size_t n) {
    size_t end = 0;
    for (size_t start = 0; start < n && n - start >= TURDUS_PITCH_WINDOW / 2; start += TURDUS_PITCH_HOP) {
        end = start + TURDUS_PITCH_HOP < n ? start + TURDUS_PITCH_HOP : n;
    }
    return end;
}

/* Carrier the encoder emits for silence: initial pitch while analysed, base frequency after */
static double
bare_carrier(const turdus_encode_preset* p, size_t i, size_t analysed, double* phase, int fs) {
    const double two_pi = 6.28318530717958647692;
    const double pitch = i < analysed ? TURDUS_PITCH_INITIAL_HZ : 0.0;
    *phase += two_pi * (p->carrier_base_hz + pitch * p->pitch_multiplier) / (double)fs;
    if (*phase >= two_pi) {
        *phase = fmod(*phase, two_pi);
    }
    const double vib = sin((double)i * TURDUS_ENC_VIBRATO_RATE) * TURDUS_ENC_VIBRATO_DEPTH;
    return tanh(sin(*phase + vib) * TURDUS_ENC_SOFTCLIP_DRIVE);
}

int
main(void) {
    const int fs = 44100;
    const size_t n = 22050;

    // Silence encodes to the bare carrier for every preset
    for (int p = 0; p < turdus_encode_preset_count(); p++) {
        const turdus_encode_preset* preset = turdus_encode_preset_at(p);
        turdus_audio_buffer in;
        turdus_audio_buffer out;
        if (turdus_audio_buffer_alloc(&in, 1, n, fs) != TURDUS_OK) {
            return 1;
        }
        if (turdus_encode(&in, preset, &out, NULL) != TURDUS_OK) {
            fprintf(stderr, "encoder: encode of silence failed (%s)\n", preset->id);
            turdus_audio_buffer_free(&in);
            return 1;
        }
        const size_t analysed = analysed_frames(n);
        double phase = 0.0;
        double max_err = 0.0;
        for (size_t i = 0; i < n; i++) {
            double e = fabs((double)out.data[i] - bare_carrier(preset, i, analysed, &phase, fs));
            if (e > max_err) {
                max_err = e;
            }
        }
        double rms = turdus_test_rms(out.data, n);
        turdus_audio_buffer_free(&out);
        turdus_audio_buffer_free(&in);
        if (max_err > 1e-5) {
            fprintf(stderr, "encoder: %s silence deviates from carrier by %g\n", preset->id, max_err);
            return 1;
        }
        if (rms < 0.2) {
            fprintf(stderr, "encoder: %s carrier too weak (rms %.4f)\n", preset->id, rms);
            return 1;
        }
    }

    // Shape preserved, output bounded, deterministic
    {
        turdus_audio_buffer in;
        turdus_audio_buffer a;
        turdus_audio_buffer b;
        if (turdus_audio_buffer_alloc(&in, 2, n, 48000) != TURDUS_OK) {
            return 1;
        }
        fill_speechlike(in.data, n, 48000);
        for (size_t i = 0; i < n; i++) {
            in.data[n + i] = (i % 100 < 50) ? 0.9f : -0.9f; // hard square wave
        }
        const turdus_encode_preset* preset = turdus_encode_preset_at(1);
        if (turdus_encode(&in, preset, &a, NULL) != TURDUS_OK || turdus_encode(&in, preset, &b, NULL) != TURDUS_OK) {
            fprintf(stderr, "encoder: encode failed\n");
            return 1;
        }
        int fail = 0;
        if (a.channels != 2 || a.frames != n || a.sample_rate != 48000) {
            fprintf(stderr, "encoder: shape %d ch / %zu frames / %d Hz\n", a.channels, a.frames, a.sample_rate);
            fail = 1;
        }
        for (size_t i = 0; !fail && i < 2 * n; i++) {
            if (!isfinite(a.data[i]) || fabsf(a.data[i]) >= 1.0f) {
                fprintf(stderr, "encoder: sample %zu out of bounds (%g)\n", i, a.data[i]);
                fail = 1;
            }
        }
        if (!fail && memcmp(a.data, b.data, 2 * n * sizeof(float)) != 0) {
            fprintf(stderr, "encoder: repeated encode differs\n");
            fail = 1;
        }
        turdus_audio_buffer_free(&a);
        turdus_audio_buffer_free(&b);
        turdus_audio_buffer_free(&in);
        if (fail) {
            return 1;
        }
    }

    // Identical channels encode identically and match the mono result
    {
        turdus_audio_buffer mono;
        turdus_audio_buffer stereo;
        turdus_audio_buffer om;
        turdus_audio_buffer os;
        if (turdus_audio_buffer_alloc(&mono, 1, n, fs) != TURDUS_OK
            || turdus_audio_buffer_alloc(&stereo, 2, n, fs) != TURDUS_OK) {
            return 1;
        }
        fill_speechlike(mono.data, n, fs);
        memcpy(stereo.data, mono.data, n * sizeof(float));
        memcpy(stereo.data + n, mono.data, n * sizeof(float));
        const turdus_encode_preset* preset = turdus_encode_preset_at(0);
        if (turdus_encode(&mono, preset, &om, NULL) != TURDUS_OK
            || turdus_encode(&stereo, preset, &os, NULL) != TURDUS_OK) {
            fprintf(stderr, "encoder: encode failed\n");
            return 1;
        }
        int fail = memcmp(os.data, om.data, n * sizeof(float)) != 0
                   || memcmp(os.data + n, om.data, n * sizeof(float)) != 0;
        turdus_audio_buffer_free(&om);
        turdus_audio_buffer_free(&os);
        turdus_audio_buffer_free(&mono);
        turdus_audio_buffer_free(&stereo);
        if (fail) {
            fprintf(stderr, "encoder: channel state leaked between channels\n");
            return 1;
        }
    }

    // Under half a window nothing is analysed: pure base-frequency carrier
    {
        const size_t short_n = 700;
        turdus_audio_buffer in;
        turdus_audio_buffer out;
        if (turdus_audio_buffer_alloc(&in, 1, short_n, fs) != TURDUS_OK) {
            return 1;
        }
        const turdus_encode_preset* preset = turdus_encode_preset_at(0);
        if (turdus_encode(&in, preset, &out, NULL) != TURDUS_OK) {
            turdus_audio_buffer_free(&in);
            return 1;
        }
        double phase = 0.0;
        double max_err = 0.0;
        for (size_t i = 0; i < short_n; i++) {
            double e = fabs((double)out.data[i] - bare_carrier(preset, i, 0, &phase, fs));
            max_err = e > max_err ? e : max_err;
        }
        turdus_audio_buffer_free(&out);
        turdus_audio_buffer_free(&in);
        if (max_err > 1e-5) {
            fprintf(stderr, "encoder: short buffer deviates from base carrier by %g\n", max_err);
            return 1;
        }
    }

    // Channel 1 output does not depend on channel 0 samples (all inputs below the pitch gate)
    {
        turdus_audio_buffer ab;
        turdus_audio_buffer cb;
        turdus_audio_buffer b;
        turdus_audio_buffer oab;
        turdus_audio_buffer ocb;
        turdus_audio_buffer ob;
        if (turdus_audio_buffer_alloc(&ab, 2, n, fs) != TURDUS_OK
            || turdus_audio_buffer_alloc(&cb, 2, n, fs) != TURDUS_OK
            || turdus_audio_buffer_alloc(&b, 1, n, fs) != TURDUS_OK) {
            return 1;
        }
        fill_tone(ab.data, n, 0.010, 220.0, fs);
        fill_tone(cb.data, n, 0.008, 1500.0, fs);
        fill_tone(b.data, n, 0.012, 300.0, fs);
        memcpy(ab.data + n, b.data, n * sizeof(float));
        memcpy(cb.data + n, b.data, n * sizeof(float));
        const turdus_encode_preset* preset = turdus_encode_preset_at(1);
        if (turdus_encode(&ab, preset, &oab, NULL) != TURDUS_OK || turdus_encode(&cb, preset, &ocb, NULL) != TURDUS_OK
            || turdus_encode(&b, preset, &ob, NULL) != TURDUS_OK) {
            fprintf(stderr, "encoder: encode failed\n");
            return 1;
        }
        int fail = memcmp(oab.data + n, ocb.data + n, n * sizeof(float)) != 0
                   || memcmp(oab.data + n, ob.data, n * sizeof(float)) != 0;
        int ch0_differs = memcmp(oab.data, ocb.data, n * sizeof(float)) != 0;
        turdus_audio_buffer_free(&oab);
        turdus_audio_buffer_free(&ocb);
        turdus_audio_buffer_free(&ob);
        turdus_audio_buffer_free(&ab);
        turdus_audio_buffer_free(&cb);
        turdus_audio_buffer_free(&b);
        if (fail || !ch0_differs) {
            fprintf(stderr, "encoder: channel 1 depends on channel 0 (fail=%d ch0_differs=%d)\n", fail, ch0_differs);
            return 1;
        }
    }

    // Speech raises the envelope above the bare carrier
    {
        turdus_audio_buffer in;
        turdus_audio_buffer out;
        if (turdus_audio_buffer_alloc(&in, 1, n, fs) != TURDUS_OK) {
            return 1;
        }
        fill_speechlike(in.data, n, fs);
        if (turdus_encode(&in, turdus_encode_preset_at(0), &out, NULL) != TURDUS_OK) {
            return 1;
        }
        float peak = 0.0f;
        for (size_t i = 0; i < n; i++) {
            peak = fabsf(out.data[i]) > peak ? fabsf(out.data[i]) : peak;
        }
        turdus_audio_buffer_free(&out);
        turdus_audio_buffer_free(&in);
        if (!(peak > (float)tanh(0.5) && peak < 0.7f)) {
            fprintf(stderr, "encoder: modulated peak %.4f outside (tanh(0.5), 0.7)\n", peak);
            return 1;
        }
    }

    // Empty input is not an error
    {
        turdus_audio_buffer in;
        turdus_audio_buffer out;
        if (turdus_audio_buffer_alloc(&in, 2, 0, fs) != TURDUS_OK) {
            return 1;
        }
        int rc = turdus_encode(&in, turdus_encode_preset_at(2), &out, NULL);
        if (rc != TURDUS_OK || out.channels != 2 || out.frames != 0 || out.sample_rate != fs) {
            fprintf(stderr, "encoder: empty input rc=%d ch=%d frames=%zu\n", rc, out.channels, out.frames);
            return 1;
        }
        turdus_audio_buffer_free(&out);
        turdus_audio_buffer_free(&in);
    }

    // Invalid preset or input: rejected before any output is produced
    {
        turdus_test_capture_stderr cap;
        if (turdus_test_capture_stderr_begin(&cap, "turdus_encoder_err") != 0) {
            return 1;
        }
        turdus_audio_buffer in;
        turdus_audio_buffer out;
        int ok = turdus_audio_buffer_alloc(&in, 1, 1024, fs) == TURDUS_OK;
        turdus_encode_preset bad = *turdus_encode_preset_at(0);
        bad.input_lpf_hz = 30000.0;
        int rc1 = turdus_encode(&in, &bad, &out, NULL);
        int empty1 = out.data == NULL && out.frames == 0;
        int rc2 = turdus_encode(&in, NULL, &out, NULL);
        turdus_audio_buffer broken = in;
        broken.channels = 0;
        int rc3 = turdus_encode(&broken, turdus_encode_preset_at(0), &out, NULL);
        turdus_test_capture_stderr_end(&cap);
        remove(cap.path);
        turdus_audio_buffer_free(&in);
        if (!ok || rc1 != TURDUS_ERR_INVALID_PRESET || !empty1 || rc2 != TURDUS_ERR_INVALID_PRESET
            || rc3 != TURDUS_ERR_INVALID_ARG) {
            fprintf(stderr, "encoder: error paths rc=%d/%d/%d empty=%d\n", rc1, rc2, rc3, empty1);
            return 1;
        }
    }

    return 0;
}
