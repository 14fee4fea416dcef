// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief RIFF/WAVE PCM16 serialization of float buffers.
 */

#include <errno.h>
#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <turdus/core/status.h>
#include <turdus/core/wav.h>
#include <turdus/platform/posix_compat.h>
#include <turdus/runtime/log.h>

static inline void
put_u16le(uint8_t* p, uint16_t v) {
    p[0] = (uint8_t)(v & 0xFF);
    p[1] = (uint8_t)(v >> 8);
}

static inline void
put_u32le(uint8_t* p, uint32_t v) {
    p[0] = (uint8_t)(v & 0xFF);
    p[1] = (uint8_t)((v >> 8) & 0xFF);
    p[2] = (uint8_t)((v >> 16) & 0xFF);
    p[3] = (uint8_t)(v >> 24);
}

int16_t
turdus_pcm16_from_float(float sample, turdus_pcm_scaling scaling) {
    if (isnan(sample)) {
        return 0;
    }
    double s = (double)sample;
    if (s > 1.0) {
        s = 1.0;
    } else if (s < -1.0) {
        s = -1.0;
    }
    const double scale = (s < 0.0 && scaling == TURDUS_PCM_ASYMMETRIC) ? 32768.0 : 32767.0;
    return (int16_t)(int32_t)(s * scale);
}

size_t
turdus_wav_size(const turdus_audio_buffer* buf) {
    if (!turdus_audio_buffer_is_valid(buf) || buf->channels > 0xFFFF) {
        return 0;
    }
    const uint64_t data_len = (uint64_t)buf->frames * (uint64_t)buf->channels * 2u;
    const uint64_t total = TURDUS_WAV_HEADER_BYTES + data_len;
    if (total > 0xFFFFFFFFull || total > (uint64_t)SIZE_MAX) {
        return 0;
    }
    return (size_t)total;
}

int
turdus_wav_serialize(const turdus_audio_buffer* buf, turdus_pcm_scaling scaling, uint8_t* out, size_t out_cap,
                     size_t* out_len) {
    if (out_len) {
        *out_len = 0;
    }
    if (!turdus_audio_buffer_is_valid(buf) || !out) {
        return TURDUS_ERR_INVALID_ARG;
    }
    const size_t total = turdus_wav_size(buf);
    if (total == 0) {
        LOG_ERROR("wav: %d channels x %zu frames does not fit a RIFF file\n", buf->channels, buf->frames);
        return TURDUS_ERR_FORMAT;
    }
    if (out_cap < total) {
        return TURDUS_ERR_INVALID_ARG;
    }

    const uint16_t nch = (uint16_t)buf->channels;
    const uint32_t rate = (uint32_t)buf->sample_rate;
    const uint32_t data_len = (uint32_t)(total - TURDUS_WAV_HEADER_BYTES);

    memcpy(out + 0, "RIFF", 4);
    put_u32le(out + 4, (uint32_t)(total - 8));
    memcpy(out + 8, "WAVE", 4);
    memcpy(out + 12, "fmt ", 4);
    put_u32le(out + 16, 16);   /* fmt chunk size */
    put_u16le(out + 20, 1);    /* PCM */
    put_u16le(out + 22, nch);
    put_u32le(out + 24, rate);
    put_u32le(out + 28, rate * nch * 2u);
    put_u16le(out + 32, (uint16_t)(nch * 2u));
    put_u16le(out + 34, 16);
    memcpy(out + 36, "data", 4);
    put_u32le(out + 40, data_len);

    uint8_t* p = out + TURDUS_WAV_HEADER_BYTES;
    const size_t n = buf->frames;
    for (size_t i = 0; i < n; i++) {
        for (int c = 0; c < buf->channels; c++) {
            const int16_t v = turdus_pcm16_from_float(buf->data[(size_t)c * n + i], scaling);
            put_u16le(p, (uint16_t)v);
            p += 2;
        }
    }
    if (out_len) {
        *out_len = total;
    }
    return TURDUS_OK;
}

int
turdus_wav_write_file(const char* path, const turdus_audio_buffer* buf, turdus_pcm_scaling scaling) {
    if (!path || !*path) {
        return TURDUS_ERR_INVALID_ARG;
    }
    const size_t total = turdus_wav_size(buf);
    if (total == 0) {
        return turdus_audio_buffer_is_valid(buf) ? TURDUS_ERR_FORMAT : TURDUS_ERR_INVALID_ARG;
    }
    uint8_t* bytes = (uint8_t*)malloc(total);
    if (!bytes) {
        LOG_ERROR("wav: cannot allocate %zu bytes\n", total);
        return TURDUS_ERR_NOMEM;
    }
    int rc = turdus_wav_serialize(buf, scaling, bytes, total, NULL);
    if (rc != TURDUS_OK) {
        free(bytes);
        return rc;
    }

    FILE* fp = fopen(path, "wb");
    if (!fp) {
        LOG_ERROR("wav: cannot open '%s' for writing: %s\n", path, strerror(errno));
        free(bytes);
        return TURDUS_ERR_IO;
    }
    size_t wr = fwrite(bytes, 1, total, fp);
    int close_rc = fclose(fp);
    free(bytes);
    if (wr != total || close_rc != 0) {
        LOG_ERROR("wav: short write to '%s' (%zu of %zu bytes)\n", path, wr, total);
        return TURDUS_ERR_IO;
    }
    return TURDUS_OK;
}

int
turdus_pcm_scaling_parse(const char* name, turdus_pcm_scaling* out) {
    if (!name || !out) {
        return -1;
    }
    if (turdus_strcasecmp(name, "asymmetric") == 0) {
        *out = TURDUS_PCM_ASYMMETRIC;
        return 0;
    }
    if (turdus_strcasecmp(name, "symmetric") == 0) {
        *out = TURDUS_PCM_SYMMETRIC;
        return 0;
    }
    return -1;
}
