// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/* Integration test: PCM16 files written by the serializer decode through libsndfile. */

#include <math.h>
#include <stdio.h>
#include <string.h>
#include <turdus/core/audio_buffer.h>
#include <turdus/core/file_io.h>
#include <turdus/core/status.h>
#include <turdus/core/wav.h>

#include "test_support.h"

int
main(void) {
    char path[TURDUS_TEST_PATH_MAX];

    // Stereo file read back as planar normalized float
    {
        turdus_audio_buffer src;
        if (turdus_audio_buffer_alloc(&src, 2, 480, 48000) != TURDUS_OK) {
            return 1;
        }
        for (size_t i = 0; i < 480; i++) {
            src.data[i] = 0.5f * sinf(2.0f * 3.14159265f * 1000.0f * (float)i / 48000.0f);
            src.data[480 + i] = -0.25f;
        }
        int fd = turdus_test_mkstemp(path, sizeof path, "turdus_fio");
        if (fd < 0) {
            fprintf(stderr, "file_io: cannot create temp file\n");
            return 1;
        }
        turdus_close(fd);
        if (turdus_wav_write_file(path, &src, TURDUS_PCM_ASYMMETRIC) != TURDUS_OK) {
            fprintf(stderr, "file_io: write failed\n");
            remove(path);
            return 1;
        }
        turdus_audio_buffer got;
        int rc = turdus_audio_read_file(path, &got);
        remove(path);
        if (rc != TURDUS_OK) {
            fprintf(stderr, "file_io: read failed: %s\n", turdus_status_str(rc));
            return 1;
        }
        if (got.channels != 2 || got.frames != 480 || got.sample_rate != 48000) {
            fprintf(stderr, "file_io: shape %d ch %zu frames %d Hz\n", got.channels, got.frames, got.sample_rate);
            return 1;
        }
        for (size_t i = 0; i < 2 * 480; i++) {
            /* One PCM16 step of quantization */
            if (fabsf(got.data[i] - src.data[i]) > 1.0f / 16384.0f) {
                fprintf(stderr, "file_io: sample %zu %g vs %g\n", i, got.data[i], src.data[i]);
                return 1;
            }
        }
        turdus_audio_buffer_free(&got);
        turdus_audio_buffer_free(&src);
    }

    // Missing file
    {
        turdus_audio_buffer got;
        char missing[TURDUS_TEST_PATH_MAX];
        turdus_test_path_join(missing, sizeof missing, turdus_test_tmpdir(), "turdus_no_such_file.wav");
        if (turdus_audio_read_file(missing, &got) != TURDUS_ERR_IO) {
            fprintf(stderr, "file_io: missing file not reported as i/o error\n");
            return 1;
        }
    }

    // Not an audio file
    {
        if (turdus_test_write_temp_text(path, sizeof path, "turdus_fio_txt", "this is not audio\n") != 0) {
            return 1;
        }
        turdus_audio_buffer got;
        int rc = turdus_audio_read_file(path, &got);
        remove(path);
        if (rc != TURDUS_ERR_IO && rc != TURDUS_ERR_FORMAT) {
            fprintf(stderr, "file_io: text file accepted (rc=%d)\n", rc);
            return 1;
        }
    }

    if (turdus_audio_read_file(NULL, NULL) != TURDUS_ERR_INVALID_ARG) {
        fprintf(stderr, "file_io: NULL arguments accepted\n");
        return 1;
    }
    return 0;
}
