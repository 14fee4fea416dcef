// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#include <errno.h>
#include <stdlib.h>
#include <turdus/platform/posix_compat.h>

#if TURDUS_PLATFORM_WIN_NATIVE
#include <fcntl.h>
#include <malloc.h>
#include <sys/stat.h>
#endif

int
turdus_setenv(const char* name, const char* value, int overwrite) {
    if (!name || !*name || !value) {
        errno = EINVAL;
        return -1;
    }
#if TURDUS_PLATFORM_WIN_NATIVE
    if (!overwrite && getenv(name) != NULL) {
        return 0;
    }
    return _putenv_s(name, value) == 0 ? 0 : -1;
#else
    return setenv(name, value, overwrite);
#endif
}

int
turdus_unsetenv(const char* name) {
    if (!name || !*name) {
        errno = EINVAL;
        return -1;
    }
#if TURDUS_PLATFORM_WIN_NATIVE
    return _putenv_s(name, "") == 0 ? 0 : -1;
#else
    return unsetenv(name);
#endif
}

void*
turdus_aligned_alloc(size_t alignment, size_t size) {
    if (size == 0) {
        return NULL;
    }
#if TURDUS_PLATFORM_WIN_NATIVE
    return _aligned_malloc(size, alignment);
#else
    void* p = NULL;
    if (posix_memalign(&p, alignment, size) != 0) {
        return NULL;
    }
    return p;
#endif
}

void
turdus_aligned_free(void* ptr) {
    if (!ptr) {
        return;
    }
#if TURDUS_PLATFORM_WIN_NATIVE
    _aligned_free(ptr);
#else
    free(ptr);
#endif
}

int
turdus_mkstemp(char* tmpl) {
    if (!tmpl) {
        errno = EINVAL;
        return -1;
    }
#if TURDUS_PLATFORM_WIN_NATIVE
    if (_mktemp_s(tmpl, strlen(tmpl) + 1) != 0) {
        return -1;
    }
    return _open(tmpl, _O_CREAT | _O_EXCL | _O_RDWR | _O_BINARY, _S_IREAD | _S_IWRITE);
#else
    return mkstemp(tmpl);
#endif
}

int
turdus_dup(int oldfd) {
#if TURDUS_PLATFORM_WIN_NATIVE
    return _dup(oldfd);
#else
    return dup(oldfd);
#endif
}

int
turdus_dup2(int oldfd, int newfd) {
#if TURDUS_PLATFORM_WIN_NATIVE
    return _dup2(oldfd, newfd) == 0 ? newfd : -1;
#else
    return dup2(oldfd, newfd);
#endif
}

int
turdus_close(int fd) {
#if TURDUS_PLATFORM_WIN_NATIVE
    return _close(fd);
#else
    return close(fd);
#endif
}
