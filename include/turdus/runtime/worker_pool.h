// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Minimal 2-thread worker pool API for per-channel processing tasks.
 *
 * The pool is owned by the caller; nothing about it is process-global. When
 * disabled (or when thread creation fails) posted tasks run synchronously in
 * the caller thread.
 */

#ifndef TURDUS_RUNTIME_WORKER_POOL_H
#define TURDUS_RUNTIME_WORKER_POOL_H

#ifdef __cplusplus
extern "C" {
#endif

struct turdus_worker_ctx;

typedef struct turdus_worker_pool {
    struct turdus_worker_ctx* ctx; /* NULL when running inline */
} turdus_worker_pool;

/**
 * @brief Initialize the pool.
 *
 * @param pool    Pool handle to initialize.
 * @param enabled Non-zero to start two worker threads.
 * @return 0 on success (including the inline fallback), negative status on
 *         invalid arguments.
 */
int turdus_worker_pool_init(turdus_worker_pool* pool, int enabled);

/**
 * @brief Tear down worker threads created by `turdus_worker_pool_init`.
 *
 * @note Safe no-op if the pool was never enabled/initialized.
 */
void turdus_worker_pool_destroy(turdus_worker_pool* pool);

/** @brief Non-zero when posted tasks run on worker threads. */
int turdus_worker_pool_is_threaded(const turdus_worker_pool* pool);

/**
 * @brief Post up to two tasks and wait for completion.
 *
 * Runs synchronously in the caller thread when the pool is disabled.
 * @param pool Pool handle (may be NULL for inline execution).
 * @param f0 Function pointer for the first task (may be NULL).
 * @param a0 Argument for the first task.
 * @param f1 Function pointer for the second task (may be NULL).
 * @param a1 Argument for the second task.
 */
void turdus_worker_pool_run_two(turdus_worker_pool* pool, void (*f0)(void*), void* a0, void (*f1)(void*), void* a1);

#ifdef __cplusplus
}
#endif

#endif /* TURDUS_RUNTIME_WORKER_POOL_H */
