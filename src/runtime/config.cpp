// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Runtime configuration parser for environment-derived settings.
 *
 * Parses environment variables into a typed `turdusRuntimeConfig` and exposes
 * an immutable accessor. Intended to be called early during application init.
 */

#include <stdlib.h>
#include <string.h>
#include <turdus/dsp/presets.h>
#include <turdus/runtime/config.h>
#include <turdus/runtime/log.h>

static turdusRuntimeConfig g_config;
static int g_config_inited = 0;

/**
 * @brief Check whether an environment string is set and non-empty.
 *
 * @param v Environment value string pointer (may be NULL).
 * @return 1 if set and non-empty; otherwise 0.
 */
static int
env_is_set(const char* v) {
    return v && v[0] != '\0';
}

/* Strict decimal parse; -1 on trailing garbage */
static int
env_parse_int(const char* v, long* out) {
    char* end = NULL;
    long x = strtol(v, &end, 10);
    if (end == v || *end != '\0') {
        return -1;
    }
    *out = x;
    return 0;
}

void
turdus_config_defaults(turdusRuntimeConfig* c) {
    if (!c) {
        return;
    }
    memset(c, 0, sizeof(*c));
    c->encode_preset = 0;
    c->decode_preset = 0;
    c->mt_enable = 0;
    c->chunk_frames = TURDUS_CHUNK_FRAMES_DEFAULT;
    c->pcm_scaling = TURDUS_PCM_ASYMMETRIC;
    c->log_level = LOG_LEVEL_INFO;
}

/**
 * @brief Parse environment variables and initialize the runtime configuration.
 *
 * @note Safe to call multiple times; the most recent call wins.
 */
void
turdus_config_init(void) {
    turdusRuntimeConfig c;
    turdus_config_defaults(&c);

    /* ENCODE_PRESET */
    const char* ep = getenv("TURDUS_ENCODE_PRESET");
    if (env_is_set(ep)) {
        int idx = turdus_encode_preset_find(ep);
        if (idx >= 0) {
            c.encode_preset_is_set = 1;
            c.encode_preset = idx;
        } else {
            LOG_WARNING("TURDUS_ENCODE_PRESET='%s' is not a known encode preset; using default.\n", ep);
        }
    }

    /* DECODE_PRESET */
    const char* dp = getenv("TURDUS_DECODE_PRESET");
    if (env_is_set(dp)) {
        int idx = turdus_decode_preset_find(dp);
        if (idx >= 0) {
            c.decode_preset_is_set = 1;
            c.decode_preset = idx;
        } else {
            LOG_WARNING("TURDUS_DECODE_PRESET='%s' is not a known decode preset; using default.\n", dp);
        }
    }

    /* MT */
    const char* mt = getenv("TURDUS_MT");
    c.mt_is_set = env_is_set(mt);
    c.mt_enable = (c.mt_is_set && mt[0] == '1') ? 1 : 0;

    /* CHUNK_FRAMES */
    const char* cf = getenv("TURDUS_CHUNK_FRAMES");
    if (env_is_set(cf)) {
        long v = 0;
        if (env_parse_int(cf, &v) != 0 || v <= 0) {
            LOG_WARNING("TURDUS_CHUNK_FRAMES='%s' is not a positive integer; using %d.\n", cf,
                        TURDUS_CHUNK_FRAMES_DEFAULT);
        } else {
            if (v < TURDUS_CHUNK_FRAMES_MIN) {
                v = TURDUS_CHUNK_FRAMES_MIN;
            } else if (v > TURDUS_CHUNK_FRAMES_MAX) {
                v = TURDUS_CHUNK_FRAMES_MAX;
            }
            c.chunk_frames_is_set = 1;
            c.chunk_frames = (int)v;
        }
    }

    /* PCM_SCALING */
    const char* ps = getenv("TURDUS_PCM_SCALING");
    if (env_is_set(ps)) {
        turdus_pcm_scaling sc = TURDUS_PCM_ASYMMETRIC;
        if (turdus_pcm_scaling_parse(ps, &sc) == 0) {
            c.pcm_scaling_is_set = 1;
            c.pcm_scaling = sc;
        } else {
            LOG_WARNING("TURDUS_PCM_SCALING='%s' (use asymmetric|symmetric); using asymmetric.\n", ps);
        }
    }

    /* LOG_LEVEL */
    const char* ll = getenv("TURDUS_LOG_LEVEL");
    if (env_is_set(ll)) {
        turdus_log_level_t lv = LOG_LEVEL_INFO;
        if (turdus_log_level_parse(ll, &lv) == 0) {
            c.log_level_is_set = 1;
            c.log_level = lv;
        } else {
            LOG_WARNING("TURDUS_LOG_LEVEL='%s' (use error|warn|info|debug); using info.\n", ll);
        }
    }

    g_config = c;
    g_config_inited = 1;
}

/**
 * @brief Get the current runtime configuration.
 *
 * @return Pointer to the immutable runtime config, or NULL if not initialized.
 */
const turdusRuntimeConfig*
turdus_config_get(void) {
    return g_config_inited ? &g_config : NULL;
}
