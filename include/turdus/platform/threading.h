// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#pragma once

/**
 * @file
 * @brief Threads, mutexes and condition variables over pthreads or Win32.
 *
 * Only what the channel worker pool needs. Every function returns 0 on
 * success and a non-zero backend error code otherwise.
 */

#include <turdus/platform/platform.h>

#if TURDUS_PLATFORM_WIN_NATIVE
#include <windows.h>
#else
#include <pthread.h>
#endif

#ifdef __cplusplus
extern "C" {
#endif

#if TURDUS_PLATFORM_WIN_NATIVE
typedef HANDLE turdus_thread_t;
typedef CRITICAL_SECTION turdus_mutex_t;
typedef CONDITION_VARIABLE turdus_cond_t;
#define TURDUS_THREAD_CALL        __stdcall
#define TURDUS_THREAD_RETURN_TYPE unsigned int
#define TURDUS_THREAD_RETURN      return 0
#else
typedef pthread_t turdus_thread_t;
typedef pthread_mutex_t turdus_mutex_t;
typedef pthread_cond_t turdus_cond_t;
#define TURDUS_THREAD_CALL
#define TURDUS_THREAD_RETURN_TYPE void*
#define TURDUS_THREAD_RETURN      return NULL
#endif

/* Entry point shape: `static TURDUS_THREAD_RETURN_TYPE TURDUS_THREAD_CALL fn(void* arg)` */
typedef TURDUS_THREAD_RETURN_TYPE(TURDUS_THREAD_CALL* turdus_thread_fn)(void*);

int turdus_thread_create(turdus_thread_t* thread, turdus_thread_fn func, void* arg);
int turdus_thread_join(turdus_thread_t thread);

int turdus_mutex_init(turdus_mutex_t* mutex);
int turdus_mutex_destroy(turdus_mutex_t* mutex);
int turdus_mutex_lock(turdus_mutex_t* mutex);
int turdus_mutex_unlock(turdus_mutex_t* mutex);

int turdus_cond_init(turdus_cond_t* cond);
int turdus_cond_destroy(turdus_cond_t* cond);
/* `mutex` must be held; it is released while waiting and re-acquired before return */
int turdus_cond_wait(turdus_cond_t* cond, turdus_mutex_t* mutex);
int turdus_cond_signal(turdus_cond_t* cond);
int turdus_cond_broadcast(turdus_cond_t* cond);

#ifdef __cplusplus
}
#endif
