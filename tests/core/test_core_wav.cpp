// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/* Unit tests: PCM16 RIFF/WAVE serialization layout and sample scaling. */

#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <turdus/core/audio_buffer.h>
#include <turdus/core/status.h>
#include <turdus/core/wav.h>

#include "test_support.h"

static uint32_t
rd_u32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

static uint16_t
rd_u16(const uint8_t* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
}

static int16_t
rd_s16(const uint8_t* p) {
    return (int16_t)rd_u16(p);
}

int
main(void) {
    // Header layout: 1000 stereo frames at 44.1 kHz
    {
        turdus_audio_buffer buf;
        if (turdus_audio_buffer_alloc(&buf, 2, 1000, 44100) != TURDUS_OK) {
            return 1;
        }
        if (turdus_wav_size(&buf) != 4044) {
            fprintf(stderr, "wav: size %zu != 4044\n", turdus_wav_size(&buf));
            return 1;
        }
        uint8_t* bytes = (uint8_t*)malloc(4044);
        size_t len = 0;
        if (!bytes || turdus_wav_serialize(&buf, TURDUS_PCM_ASYMMETRIC, bytes, 4044, &len) != TURDUS_OK
            || len != 4044) {
            fprintf(stderr, "wav: serialize failed\n");
            return 1;
        }
        int ok = memcmp(bytes, "RIFF", 4) == 0 && rd_u32(bytes + 4) == 4036 && memcmp(bytes + 8, "WAVE", 4) == 0
                 && memcmp(bytes + 12, "fmt ", 4) == 0 && rd_u32(bytes + 16) == 16 && rd_u16(bytes + 20) == 1
                 && rd_u16(bytes + 22) == 2 && rd_u32(bytes + 24) == 44100 && rd_u32(bytes + 28) == 176400
                 && rd_u16(bytes + 32) == 4 && rd_u16(bytes + 34) == 16 && memcmp(bytes + 36, "data", 4) == 0
                 && rd_u32(bytes + 40) == 4000;
        for (size_t i = 44; ok && i < 4044; i++) {
            ok = bytes[i] == 0;
        }
        if (!ok) {
            fprintf(stderr, "wav: header or silent payload wrong\n");
            return 1;
        }
        // Too small a destination is rejected
        int short_rc = turdus_wav_serialize(&buf, TURDUS_PCM_ASYMMETRIC, bytes, 4043, &len);
        if (short_rc != TURDUS_ERR_INVALID_ARG || len != 0) {
            fprintf(stderr, "wav: short destination accepted\n");
            return 1;
        }
        free(bytes);
        turdus_audio_buffer_free(&buf);
    }

    // Scaling: clamp, asymmetric vs symmetric, truncation toward zero, NaN
    {
        const float in[] = {1.0f, -1.0f, 2.0f, -3.0f, 0.5f, -0.5f, 0.0f, 1e-5f, -1e-5f};
        const int16_t asym[] = {32767, -32768, 32767, -32768, 16383, -16384, 0, 0, 0};
        const int16_t sym[] = {32767, -32767, 32767, -32767, 16383, -16383, 0, 0, 0};
        for (int i = 0; i < 9; i++) {
            int16_t a = turdus_pcm16_from_float(in[i], TURDUS_PCM_ASYMMETRIC);
            int16_t s = turdus_pcm16_from_float(in[i], TURDUS_PCM_SYMMETRIC);
            if (a != asym[i] || s != sym[i]) {
                fprintf(stderr, "wav: %g -> %d/%d expected %d/%d\n", in[i], a, s, asym[i], sym[i]);
                return 1;
            }
        }
        if (turdus_pcm16_from_float(NAN, TURDUS_PCM_ASYMMETRIC) != 0) {
            fprintf(stderr, "wav: NaN not mapped to 0\n");
            return 1;
        }
    }

    // Interleaving: frame-major, channel order preserved, little-endian
    {
        turdus_audio_buffer buf;
        if (turdus_audio_buffer_alloc(&buf, 2, 3, 8000) != TURDUS_OK) {
            return 1;
        }
        const float l[3] = {1.0f, 0.25f, -1.0f};
        const float r[3] = {-0.25f, 0.0f, 0.75f};
        memcpy(buf.data, l, sizeof l);
        memcpy(buf.data + 3, r, sizeof r);
        uint8_t bytes[44 + 12];
        if (turdus_wav_serialize(&buf, TURDUS_PCM_ASYMMETRIC, bytes, sizeof bytes, NULL) != TURDUS_OK) {
            return 1;
        }
        const int16_t expect[6] = {32767, -8192, 8191, 0, -32768, 24575};
        for (int i = 0; i < 6; i++) {
            if (rd_s16(bytes + 44 + 2 * i) != expect[i]) {
                fprintf(stderr, "wav: sample %d = %d expected %d\n", i, rd_s16(bytes + 44 + 2 * i), expect[i]);
                return 1;
            }
        }
        if (bytes[44] != 0xFF || bytes[45] != 0x7F) {
            fprintf(stderr, "wav: payload not little-endian\n");
            return 1;
        }
        turdus_audio_buffer_free(&buf);
    }

    // Zero frames: header only, valid
    {
        turdus_audio_buffer buf;
        if (turdus_audio_buffer_alloc(&buf, 1, 0, 22050) != TURDUS_OK) {
            return 1;
        }
        uint8_t bytes[44];
        size_t len = 0;
        if (turdus_wav_serialize(&buf, TURDUS_PCM_SYMMETRIC, bytes, sizeof bytes, &len) != TURDUS_OK || len != 44
            || rd_u32(bytes + 4) != 36 || rd_u32(bytes + 40) != 0 || rd_u32(bytes + 28) != 44100) {
            fprintf(stderr, "wav: empty buffer header wrong\n");
            return 1;
        }
    }

    // File output matches the in-memory serialization
    {
        turdus_audio_buffer buf;
        if (turdus_audio_buffer_alloc(&buf, 1, 100, 44100) != TURDUS_OK) {
            return 1;
        }
        for (int i = 0; i < 100; i++) {
            buf.data[i] = (float)(i - 50) / 50.0f;
        }
        uint8_t mem[244];
        uint8_t disk[300];
        char path[TURDUS_TEST_PATH_MAX];
        int fd = turdus_test_mkstemp(path, sizeof path, "turdus_wav_out");
        if (fd < 0) {
            fprintf(stderr, "wav: cannot create temp file\n");
            return 1;
        }
        turdus_close(fd);
        int rc = turdus_wav_write_file(path, &buf, TURDUS_PCM_ASYMMETRIC);
        long got = turdus_test_read_file(path, disk, sizeof disk);
        remove(path);
        int mem_rc = turdus_wav_serialize(&buf, TURDUS_PCM_ASYMMETRIC, mem, sizeof mem, NULL);
        if (rc != TURDUS_OK || got != 244 || mem_rc != TURDUS_OK || memcmp(mem, disk, 244) != 0) {
            fprintf(stderr, "wav: file output differs (rc=%d, %ld bytes)\n", rc, got);
            return 1;
        }
        turdus_audio_buffer_free(&buf);
    }

    // Scaling names
    {
        turdus_pcm_scaling s = TURDUS_PCM_ASYMMETRIC;
        if (turdus_pcm_scaling_parse("Symmetric", &s) != 0 || s != TURDUS_PCM_SYMMETRIC
            || turdus_pcm_scaling_parse("asymmetric", &s) != 0 || s != TURDUS_PCM_ASYMMETRIC
            || turdus_pcm_scaling_parse("loud", &s) == 0) {
            fprintf(stderr, "wav: scaling name parsing wrong\n");
            return 1;
        }
    }

    return 0;
}
