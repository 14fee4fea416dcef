// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Runtime configuration API and environment documentation.
 *
 * Exposes typed configuration parsed from environment variables, the INI user
 * configuration file, and the merge between the two.
 */

#ifndef TURDUS_RUNTIME_CONFIG_H
#define TURDUS_RUNTIME_CONFIG_H

#include <stdio.h>
#include <turdus/core/wav.h>
#include <turdus/runtime/log.h>

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Runtime configuration (environment variables)
 *
 * Precedence: CLI flags > environment > user config file > built-in defaults.
 * This module parses environment variables once and exposes a typed config.
 *
 * - TURDUS_ENCODE_PRESET
 *     Encode preset id (turdus|erithacus|strix) or zero-based index. Default: turdus.
 * - TURDUS_DECODE_PRESET
 *     Decode preset id (std|wide|narrow) or zero-based index. Default: std.
 * - TURDUS_MT
 *     "1" processes channels two at a time on the worker pool. Default: inline.
 * - TURDUS_CHUNK_FRAMES
 *     Frames per cooperative processing chunk. Default: 16384, minimum 256.
 * - TURDUS_PCM_SCALING
 *     "asymmetric" (negative samples x32768, positive x32767) or "symmetric"
 *     (both x32767). Default: asymmetric.
 * - TURDUS_LOG_LEVEL
 *     error|warn|info|debug. Default: info.
 * - TURDUS_CONFIG
 *     Path of the INI user configuration (see turdus_user_config_default_path).
 */

#define TURDUS_CHUNK_FRAMES_DEFAULT 16384
#define TURDUS_CHUNK_FRAMES_MIN     256
#define TURDUS_CHUNK_FRAMES_MAX     (1 << 24)

typedef struct turdusRuntimeConfig {
    /* Encode preset index */
    int encode_preset_is_set;
    int encode_preset;

    /* Decode preset index */
    int decode_preset_is_set;
    int decode_preset;

    /* Two-thread worker pool */
    int mt_is_set;
    int mt_enable;

    /* Cooperative chunk size */
    int chunk_frames_is_set;
    int chunk_frames;

    /* Float to int16 mapping */
    int pcm_scaling_is_set;
    turdus_pcm_scaling pcm_scaling;

    /* Runtime log threshold */
    int log_level_is_set;
    turdus_log_level_t log_level;
} turdusRuntimeConfig;

/**
 * @brief Fill `c` with built-in defaults and every `*_is_set` cleared.
 */
void turdus_config_defaults(turdusRuntimeConfig* c);

/**
 * @brief Parse environment variables and initialize the runtime configuration.
 *
 * Invalid values are reported with LOG_WARNING and leave the field at its
 * default with `*_is_set` cleared.
 * @note Safe to call multiple times; the most recent call wins.
 */
void turdus_config_init(void);

/**
 * @brief Access the configuration parsed by the last turdus_config_init().
 *
 * @return Pointer to the internal configuration, or NULL before init.
 */
const turdusRuntimeConfig* turdus_config_get(void);

/* User configuration (INI) ------------------------------------------------- */

typedef struct turdusUserConfig {
    int version; /* schema version, currently 1 */

    /* [encode] */
    int has_encode_preset;
    int encode_preset;

    /* [decode] */
    int has_decode_preset;
    int decode_preset;

    /* [output] */
    int has_pcm_scaling;
    turdus_pcm_scaling pcm_scaling;

    /* [runtime] */
    int has_threads;
    int threads; /* 1 inline, 2 worker pool */
    int has_chunk_frames;
    int chunk_frames;
    int has_log_level;
    turdus_log_level_t log_level;
} turdusUserConfig;

/* Resolve the default config path (no I/O): $TURDUS_CONFIG, else
 * $XDG_CONFIG_HOME/turdus/config.ini, else ~/.config/turdus/config.ini.
 * Returns a pointer to an internal static buffer, or NULL when no reasonable
 * default can be determined. */
const char* turdus_user_config_default_path(void);

/* Load config from a given path into cfg. Unrecognized or invalid values are
 * skipped (see turdus_user_config_validate for diagnostics).
 * Returns 0 on success, -1 when the file cannot be read; cfg is reset first. */
int turdus_user_config_load(const char* path, turdusUserConfig* cfg);

/* Merge file values into `rc` for every field the environment did not set. */
void turdus_user_config_apply(const turdusUserConfig* cfg, turdusRuntimeConfig* rc);

/* Render a user config as INI to the given stream. */
void turdus_user_config_render_ini(const turdusUserConfig* cfg, FILE* stream);

#ifdef __cplusplus
}
#endif

#endif /* TURDUS_RUNTIME_CONFIG_H */
