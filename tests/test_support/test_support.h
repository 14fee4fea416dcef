// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#pragma once

/*
 * Small helpers for making unit tests portable across Linux/macOS/Windows.
 *
 * Keep this header dependency-light and usable from both C and C++ tests.
 */

#include <turdus/platform/posix_compat.h>

#include <errno.h>
#include <math.h>
#include <stddef.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#ifdef __cplusplus
extern "C" {
#endif

#ifndef TURDUS_TEST_PATH_MAX
#define TURDUS_TEST_PATH_MAX 1024
#endif

static inline int
turdus_test_path_join(char* out, size_t out_sz, const char* dir, const char* leaf) {
    if (!out || out_sz == 0 || !leaf) {
        errno = EINVAL;
        return -1;
    }
    if (!dir || dir[0] == '\0') {
        dir = ".";
    }

    size_t dir_len = strlen(dir);
    size_t leaf_len = strlen(leaf);
    int need_sep = (dir_len > 0 && dir[dir_len - 1] != '/' && dir[dir_len - 1] != '\\');

    size_t total = dir_len + (need_sep ? 1u : 0u) + leaf_len + 1u;
    if (total > out_sz) {
        errno = ENAMETOOLONG;
        return -1;
    }

    memcpy(out, dir, dir_len);
    size_t pos = dir_len;
    if (need_sep) {
#if TURDUS_PLATFORM_WIN_NATIVE
        out[pos++] = '\\';
#else
        out[pos++] = '/';
#endif
    }
    memcpy(out + pos, leaf, leaf_len + 1);
    return 0;
}

static inline const char*
turdus_test_tmpdir(void) {
    const char* v = getenv("TURDUS_TEST_TMPDIR");
    if (v && v[0] != '\0') {
        return v;
    }
#if TURDUS_PLATFORM_WIN_NATIVE
    v = getenv("TEMP");
#else
    v = getenv("TMPDIR");
#endif
    if (v && v[0] != '\0') {
        return v;
    }
    return ".";
}

/* Create a unique empty file under the temp dir; returns an open fd or -1. */
static inline int
turdus_test_mkstemp(char* out_path, size_t out_sz, const char* prefix) {
    if (!prefix || prefix[0] == '\0') {
        errno = EINVAL;
        return -1;
    }
    char leaf[256];
    int n = snprintf(leaf, sizeof(leaf), "%s_XXXXXX", prefix);
    if (n < 0 || (size_t)n >= sizeof(leaf)) {
        errno = ENAMETOOLONG;
        return -1;
    }
    if (turdus_test_path_join(out_path, out_sz, turdus_test_tmpdir(), leaf) != 0) {
        return -1;
    }
    return turdus_mkstemp(out_path);
}

/* Create a temp file holding `text`; the path is written to out_path. */
static inline int
turdus_test_write_temp_text(char* out_path, size_t out_sz, const char* prefix, const char* text) {
    int fd = turdus_test_mkstemp(out_path, out_sz, prefix);
    if (fd < 0) {
        return -1;
    }
    turdus_close(fd);
    FILE* fp = fopen(out_path, "wb");
    if (!fp) {
        return -1;
    }
    size_t len = strlen(text);
    size_t wr = fwrite(text, 1, len, fp);
    if (fclose(fp) != 0 || wr != len) {
        return -1;
    }
    return 0;
}

/* Read at most cap bytes of a file; returns the byte count or -1. */
static inline long
turdus_test_read_file(const char* path, unsigned char* buf, size_t cap) {
    FILE* fp = fopen(path, "rb");
    if (!fp) {
        return -1;
    }
    size_t got = fread(buf, 1, cap, fp);
    fclose(fp);
    return (long)got;
}

static inline int
turdus_test_setenv(const char* name, const char* value, int overwrite) {
    return turdus_setenv(name, value, overwrite);
}

static inline int
turdus_test_unsetenv(const char* name) {
    return turdus_unsetenv(name);
}

static inline double
turdus_test_rms(const float* x, size_t n) {
    if (n == 0) {
        return 0.0;
    }
    double acc = 0.0;
    for (size_t i = 0; i < n; i++) {
        acc += (double)x[i] * (double)x[i];
    }
    return sqrt(acc / (double)n);
}

typedef struct turdus_test_capture_stderr {
    int saved_fd;
    char path[TURDUS_TEST_PATH_MAX];
} turdus_test_capture_stderr;

static inline int
turdus_test_capture_stderr_begin(turdus_test_capture_stderr* cap, const char* prefix) {
    if (!cap) {
        errno = EINVAL;
        return -1;
    }
    cap->saved_fd = -1;
    cap->path[0] = '\0';

    (void)fflush(stderr);
    int saved = turdus_dup(TURDUS_STDERR_FILENO);
    if (saved < 0) {
        return -1;
    }

    int fd = turdus_test_mkstemp(cap->path, sizeof(cap->path), prefix);
    if (fd < 0) {
        turdus_close(saved);
        return -1;
    }

    if (turdus_dup2(fd, TURDUS_STDERR_FILENO) < 0) {
        turdus_close(fd);
        turdus_close(saved);
        return -1;
    }
    turdus_close(fd);

    cap->saved_fd = saved;
    return 0;
}

static inline int
turdus_test_capture_stderr_end(turdus_test_capture_stderr* cap) {
    if (!cap) {
        errno = EINVAL;
        return -1;
    }

    (void)fflush(stderr);

    if (cap->saved_fd >= 0) {
        (void)turdus_dup2(cap->saved_fd, TURDUS_STDERR_FILENO);
        (void)turdus_close(cap->saved_fd);
        cap->saved_fd = -1;
    }
    return 0;
}

/* Non-zero when the captured stderr text contains `needle`. */
static inline int
turdus_test_capture_contains(const turdus_test_capture_stderr* cap, const char* needle) {
    static unsigned char buf[16384];
    long n = turdus_test_read_file(cap->path, buf, sizeof(buf) - 1);
    if (n < 0) {
        return 0;
    }
    buf[n] = '\0';
    return strstr((const char*)buf, needle) != NULL;
}

#ifdef __cplusplus
} /* extern "C" */
#endif
