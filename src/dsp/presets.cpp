// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Encode/decode preset tables.
 */

#include <ctype.h>
#include <stdlib.h>
#include <turdus/core/status.h>
#include <turdus/dsp/presets.h>
#include <turdus/platform/posix_compat.h>
#include <turdus/runtime/log.h>

static const turdus_encode_preset k_encode_presets[] = {
    {"turdus", "TURDUS (STD)", "Standard Blackbird modulation.", 4000.0, 16.0, 2500.0},
    {"erithacus", "ERITHACUS (HI)", "High-pitch Robin variant. Clearer speech.", 5500.0, 20.0, 3000.0},
    {"strix", "STRIX (LO)", "Low-freq Owl rumble. High concealment.", 2000.0, 8.0, 1200.0},
};

static const turdus_decode_preset k_decode_presets[] = {
    {"std", "STANDARD", "Balanced recovery.", 2500.0, 3, 8.0},
    {"wide", "CLARITY (WIDE)", "More treble, some carrier bleed.", 3500.0, 2, 6.0},
    {"narrow", "ISOLATION (NR)", "Aggressive filtering for noisy artifacts.", 1500.0, 4, 12.0},
};

#define ARRAY_LEN(a) ((int)(sizeof(a) / sizeof((a)[0])))

int
turdus_encode_preset_count(void) {
    return ARRAY_LEN(k_encode_presets);
}

int
turdus_decode_preset_count(void) {
    return ARRAY_LEN(k_decode_presets);
}

const turdus_encode_preset*
turdus_encode_preset_at(int index) {
    if (index < 0 || index >= ARRAY_LEN(k_encode_presets)) {
        return NULL;
    }
    return &k_encode_presets[index];
}

const turdus_decode_preset*
turdus_decode_preset_at(int index) {
    if (index < 0 || index >= ARRAY_LEN(k_decode_presets)) {
        return NULL;
    }
    return &k_decode_presets[index];
}

/* Parse a plain non-negative decimal index; -1 if `s` is anything else */
static int
parse_index(const char* s) {
    if (!s || !*s) {
        return -1;
    }
    for (const char* p = s; *p; ++p) {
        if (!isdigit((unsigned char)*p)) {
            return -1;
        }
    }
    char* end = NULL;
    long v = strtol(s, &end, 10);
    if (end == s || v > 1000000L) {
        return -1;
    }
    return (int)v;
}

int
turdus_encode_preset_find(const char* id_or_index) {
    if (!id_or_index || !*id_or_index) {
        return -1;
    }
    const int n = ARRAY_LEN(k_encode_presets);
    for (int i = 0; i < n; i++) {
        if (turdus_strcasecmp(id_or_index, k_encode_presets[i].id) == 0) {
            return i;
        }
    }
    int idx = parse_index(id_or_index);
    return (idx >= 0 && idx < n) ? idx : -1;
}

int
turdus_decode_preset_find(const char* id_or_index) {
    if (!id_or_index || !*id_or_index) {
        return -1;
    }
    const int n = ARRAY_LEN(k_decode_presets);
    for (int i = 0; i < n; i++) {
        if (turdus_strcasecmp(id_or_index, k_decode_presets[i].id) == 0) {
            return i;
        }
    }
    int idx = parse_index(id_or_index);
    return (idx >= 0 && idx < n) ? idx : -1;
}

int
turdus_preset_cycle(int index, int count, int step) {
    if (count <= 0) {
        return 0;
    }
    int r = (index % count + step % count) % count;
    if (r < 0) {
        r += count;
    }
    return r;
}

int
turdus_encode_preset_validate(const turdus_encode_preset* p, int sample_rate_hz) {
    if (!p || sample_rate_hz <= 0) {
        LOG_ERROR("encode preset: missing preset or invalid sample rate %d\n", sample_rate_hz);
        return TURDUS_ERR_INVALID_PRESET;
    }
    const double nyquist = (double)sample_rate_hz / 2.0;
    if (!(p->carrier_base_hz > 0.0)) {
        LOG_ERROR("encode preset '%s': carrier base %.1f Hz must be positive\n", p->id ? p->id : "?",
                  p->carrier_base_hz);
        return TURDUS_ERR_INVALID_PRESET;
    }
    if (!(p->input_lpf_hz > 0.0) || p->input_lpf_hz >= nyquist) {
        LOG_ERROR("encode preset '%s': input cutoff %.1f Hz outside (0, %.1f) Hz\n", p->id ? p->id : "?",
                  p->input_lpf_hz, nyquist);
        return TURDUS_ERR_INVALID_PRESET;
    }
    return TURDUS_OK;
}

int
turdus_decode_preset_validate(const turdus_decode_preset* p, int sample_rate_hz) {
    if (!p || sample_rate_hz <= 0) {
        LOG_ERROR("decode preset: missing preset or invalid sample rate %d\n", sample_rate_hz);
        return TURDUS_ERR_INVALID_PRESET;
    }
    const double nyquist = (double)sample_rate_hz / 2.0;
    if (!(p->lpf_hz > 0.0) || p->lpf_hz >= nyquist) {
        LOG_ERROR("decode preset '%s': cutoff %.1f Hz outside (0, %.1f) Hz\n", p->id ? p->id : "?", p->lpf_hz,
                  nyquist);
        return TURDUS_ERR_INVALID_PRESET;
    }
    if (p->filter_stages < 1 || p->filter_stages > TURDUS_MAX_FILTER_STAGES) {
        LOG_ERROR("decode preset '%s': %d filter stages outside [1, %d]\n", p->id ? p->id : "?", p->filter_stages,
                  TURDUS_MAX_FILTER_STAGES);
        return TURDUS_ERR_INVALID_PRESET;
    }
    if (!(p->gain_multiplier > 0.0)) {
        LOG_ERROR("decode preset '%s': gain %.3f must be positive\n", p->id ? p->id : "?", p->gain_multiplier);
        return TURDUS_ERR_INVALID_PRESET;
    }
    return TURDUS_OK;
}
