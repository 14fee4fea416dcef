// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief pthreads / Win32 backends for the threading abstraction.
 */

#include <turdus/platform/threading.h>

#if TURDUS_PLATFORM_WIN_NATIVE
#include <process.h>
#include <stdint.h>

int
turdus_thread_create(turdus_thread_t* thread, turdus_thread_fn func, void* arg) {
    uintptr_t h = _beginthreadex(NULL, 0, func, arg, 0, NULL);
    if (h == 0) {
        return -1;
    }
    *thread = (HANDLE)h;
    return 0;
}

int
turdus_thread_join(turdus_thread_t thread) {
    if (WaitForSingleObject(thread, INFINITE) != WAIT_OBJECT_0) {
        return -1;
    }
    CloseHandle(thread);
    return 0;
}

int
turdus_mutex_init(turdus_mutex_t* mutex) {
    InitializeCriticalSection(mutex);
    return 0;
}

int
turdus_mutex_destroy(turdus_mutex_t* mutex) {
    DeleteCriticalSection(mutex);
    return 0;
}

int
turdus_mutex_lock(turdus_mutex_t* mutex) {
    EnterCriticalSection(mutex);
    return 0;
}

int
turdus_mutex_unlock(turdus_mutex_t* mutex) {
    LeaveCriticalSection(mutex);
    return 0;
}

int
turdus_cond_init(turdus_cond_t* cond) {
    InitializeConditionVariable(cond);
    return 0;
}

int
turdus_cond_destroy(turdus_cond_t* cond) {
    (void)cond; /* Win32 condition variables need no teardown */
    return 0;
}

int
turdus_cond_wait(turdus_cond_t* cond, turdus_mutex_t* mutex) {
    return SleepConditionVariableCS(cond, mutex, INFINITE) ? 0 : -1;
}

int
turdus_cond_signal(turdus_cond_t* cond) {
    WakeConditionVariable(cond);
    return 0;
}

int
turdus_cond_broadcast(turdus_cond_t* cond) {
    WakeAllConditionVariable(cond);
    return 0;
}

#else /* POSIX */

int
turdus_thread_create(turdus_thread_t* thread, turdus_thread_fn func, void* arg) {
    return pthread_create(thread, NULL, func, arg);
}

int
turdus_thread_join(turdus_thread_t thread) {
    return pthread_join(thread, NULL);
}

int
turdus_mutex_init(turdus_mutex_t* mutex) {
    return pthread_mutex_init(mutex, NULL);
}

int
turdus_mutex_destroy(turdus_mutex_t* mutex) {
    return pthread_mutex_destroy(mutex);
}

int
turdus_mutex_lock(turdus_mutex_t* mutex) {
    return pthread_mutex_lock(mutex);
}

int
turdus_mutex_unlock(turdus_mutex_t* mutex) {
    return pthread_mutex_unlock(mutex);
}

int
turdus_cond_init(turdus_cond_t* cond) {
    return pthread_cond_init(cond, NULL);
}

int
turdus_cond_destroy(turdus_cond_t* cond) {
    return pthread_cond_destroy(cond);
}

int
turdus_cond_wait(turdus_cond_t* cond, turdus_mutex_t* mutex) {
    return pthread_cond_wait(cond, mutex);
}

int
turdus_cond_signal(turdus_cond_t* cond) {
    return pthread_cond_signal(cond);
}

int
turdus_cond_broadcast(turdus_cond_t* cond) {
    return pthread_cond_broadcast(cond);
}

#endif
