// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Audio file input through libsndfile.
 *
 * Any container/codec libsndfile understands is decoded to normalized float
 * samples in [-1, 1]. Writing goes through turdus_wav_write_file so the
 * byte layout stays fixed.
 */

#pragma once

#include <turdus/core/audio_buffer.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Decode an audio file into a freshly allocated buffer.
 *
 * @param path Input file path.
 * @param out  Receives the samples; left empty on failure.
 * @return TURDUS_OK, TURDUS_ERR_IO (open/read failure), TURDUS_ERR_FORMAT
 *         (no channels or sample rate) or TURDUS_ERR_NOMEM.
 */
int turdus_audio_read_file(const char* path, turdus_audio_buffer* out);

#ifdef __cplusplus
}
#endif
