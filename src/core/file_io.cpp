// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief libsndfile-backed audio reader.
 */

#include <sndfile.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <turdus/core/file_io.h>
#include <turdus/core/status.h>
#include <turdus/runtime/log.h>

int
turdus_audio_read_file(const char* path, turdus_audio_buffer* out) {
    if (!path || !*path || !out) {
        return TURDUS_ERR_INVALID_ARG;
    }
    memset(out, 0, sizeof(*out));

    SF_INFO info;
    memset(&info, 0, sizeof(info));
    SNDFILE* sf = sf_open(path, SFM_READ, &info);
    if (!sf) {
        LOG_ERROR("Error, couldn't open '%s': %s\n", path, sf_strerror(NULL));
        return TURDUS_ERR_IO;
    }
    if (info.channels < 1 || info.samplerate <= 0 || info.frames < 0) {
        LOG_ERROR("Error, '%s' reports %d channels at %d Hz\n", path, info.channels, info.samplerate);
        sf_close(sf);
        return TURDUS_ERR_FORMAT;
    }
    /* Full-scale float in [-1, 1] regardless of the on-disk sample type */
    sf_command(sf, SFC_SET_NORM_FLOAT, NULL, SF_TRUE);

    const size_t frames = (size_t)info.frames;
    if (frames > SIZE_MAX / sizeof(float) / (size_t)info.channels) {
        LOG_ERROR("Error, '%s' is too large (%zu frames)\n", path, frames);
        sf_close(sf);
        return TURDUS_ERR_NOMEM;
    }
    float* interleaved = NULL;
    sf_count_t got = 0;
    if (frames > 0) {
        interleaved = (float*)malloc(frames * (size_t)info.channels * sizeof(float));
        if (!interleaved) {
            LOG_ERROR("Error, cannot allocate read buffer for '%s'\n", path);
            sf_close(sf);
            return TURDUS_ERR_NOMEM;
        }
        got = sf_readf_float(sf, interleaved, (sf_count_t)frames);
        if (got < 0 || (got == 0 && sf_error(sf) != SF_ERR_NO_ERROR)) {
            LOG_ERROR("Error reading '%s': %s\n", path, sf_strerror(sf));
            free(interleaved);
            sf_close(sf);
            return TURDUS_ERR_IO;
        }
        if ((size_t)got < frames) {
            LOG_WARNING("'%s' ended early (%lld of %zu frames)\n", path, (long long)got, frames);
        }
    }
    sf_close(sf);

    int rc = turdus_audio_buffer_alloc(out, info.channels, (size_t)got, info.samplerate);
    if (rc != TURDUS_OK) {
        free(interleaved);
        turdus_audio_buffer_free(out);
        return rc;
    }
    turdus_audio_buffer_deinterleave(out, interleaved);
    free(interleaved);
    LOG_DEBUG("read '%s': %d ch, %zu frames @ %d Hz\n", path, out->channels, out->frames, out->sample_rate);
    return TURDUS_OK;
}
