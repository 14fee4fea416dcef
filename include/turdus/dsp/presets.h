// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Fixed encode/decode preset tables, lookup, cycling and validation.
 *
 * Callers select presets by index or id; the tables are the only way the
 * engine is parameterized.
 */

#ifndef TURDUS_DSP_PRESETS_H
#define TURDUS_DSP_PRESETS_H

#ifdef __cplusplus
extern "C" {
#endif

/* Upper bound for cascaded decoder low-pass sections */
#define TURDUS_MAX_FILTER_STAGES 8

typedef struct turdus_encode_preset {
    const char* id;
    const char* name;
    const char* description;
    double carrier_base_hz;  /* carrier frequency with zero pitch */
    double pitch_multiplier; /* carrier offset per Hz of detected pitch */
    double input_lpf_hz;     /* speech band-limit before modulation */
} turdus_encode_preset;

typedef struct turdus_decode_preset {
    const char* id;
    const char* name;
    const char* description;
    double lpf_hz;          /* envelope low-pass cutoff */
    int filter_stages;      /* cascaded sections, 1..TURDUS_MAX_FILTER_STAGES */
    double gain_multiplier; /* makeup gain */
} turdus_decode_preset;

/** @brief Number of entries in the encode preset table. */
int turdus_encode_preset_count(void);
/** @brief Number of entries in the decode preset table. */
int turdus_decode_preset_count(void);

/** @brief Encode preset at `index`, or NULL when out of range. */
const turdus_encode_preset* turdus_encode_preset_at(int index);
/** @brief Decode preset at `index`, or NULL when out of range. */
const turdus_decode_preset* turdus_decode_preset_at(int index);

/**
 * @brief Resolve a preset by id (case-insensitive) or decimal index.
 *
 * @return Table index, or -1 when nothing matches.
 */
int turdus_encode_preset_find(const char* id_or_index);
int turdus_decode_preset_find(const char* id_or_index);

/**
 * @brief Step through a preset table with wrap-around.
 *
 * @param index Current index (values outside the table are first wrapped).
 * @param count Table size (> 0).
 * @param step  +1 forward, -1 backward; any magnitude is accepted.
 * @return Index in [0, count), or 0 when count <= 0.
 */
int turdus_preset_cycle(int index, int count, int step);

/**
 * @brief Check a preset against a sample rate.
 *
 * Logs the first violated constraint.
 *
 * @return TURDUS_OK or TURDUS_ERR_INVALID_PRESET.
 */
int turdus_encode_preset_validate(const turdus_encode_preset* p, int sample_rate_hz);
int turdus_decode_preset_validate(const turdus_decode_preset* p, int sample_rate_hz);

#ifdef __cplusplus
}
#endif

#endif /* TURDUS_DSP_PRESETS_H */
