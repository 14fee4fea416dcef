// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#pragma once

/**
 * @file
 * @brief Thin POSIX/Win32 wrappers: environment, strings, aligned memory,
 * temp files and descriptor redirection.
 *
 * Engine and config code include this instead of calling setenv, strcasecmp,
 * posix_memalign or dup2 directly.
 */

#include <stddef.h>
#include <string.h>
#include <turdus/platform/platform.h>

#if TURDUS_PLATFORM_WIN_NATIVE
#include <io.h>
#define turdus_strtok_r(str, delim, saveptr) strtok_s(str, delim, saveptr)
#define turdus_strcasecmp                    _stricmp
#define TURDUS_STDERR_FILENO                 2
#else
#include <strings.h>
#include <unistd.h>
#define turdus_strtok_r      strtok_r
#define turdus_strcasecmp    strcasecmp
#define TURDUS_STDERR_FILENO STDERR_FILENO
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* Environment. Both return 0 on success, -1 with errno set otherwise. */
int turdus_setenv(const char* name, const char* value, int overwrite);
int turdus_unsetenv(const char* name);

/**
 * @brief Allocate `size` bytes aligned to `alignment` (a power of two).
 *
 * @return NULL when `size` is 0 or allocation fails. Release with
 *         turdus_aligned_free.
 */
void* turdus_aligned_alloc(size_t alignment, size_t size);
void turdus_aligned_free(void* ptr);

/**
 * @brief Create and open a unique file from a template ending in "XXXXXX".
 *
 * @return Open descriptor, or -1 on error.
 */
int turdus_mkstemp(char* tmpl);

/* Descriptor helpers used to redirect stderr. dup2 returns newfd on success. */
int turdus_dup(int oldfd);
int turdus_dup2(int oldfd, int newfd);
int turdus_close(int fd);

#ifdef __cplusplus
}
#endif
