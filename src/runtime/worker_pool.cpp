// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Minimal 2-thread worker pool for per-channel processing tasks.
 *
 * Each encode/decode host owns its pool; channels are handed out two at a
 * time. Falls back to inline execution when threads are unavailable.
 */

#include <stdlib.h>
#include <turdus/core/status.h>
#include <turdus/platform/threading.h>
#include <turdus/runtime/log.h>
#include <turdus/runtime/worker_pool.h>

struct turdus_worker_arg {
    struct turdus_worker_ctx* ctx;
    int id;
};

struct turdus_worker_ctx {
    turdus_thread_t threads[2];
    int threads_started;
    turdus_mutex_t lock;
    turdus_cond_t cv;
    turdus_cond_t done_cv;
    bool should_exit;
    int epoch;
    int completed_in_epoch;
    int posted_count;
    turdus_worker_arg args[2];

    struct {
        void (*run)(void*);
        void* arg;
    } tasks[2];
};

static TURDUS_THREAD_RETURN_TYPE TURDUS_THREAD_CALL
channel_worker(void* arg) {
    turdus_worker_arg* wa = (turdus_worker_arg*)arg;
    turdus_worker_ctx* ctx = wa->ctx;
    const int id = wa->id;
    int local_epoch = 0;
    for (;;) {
        turdus_mutex_lock(&ctx->lock);
        while (!ctx->should_exit && ctx->epoch == local_epoch) {
            turdus_cond_wait(&ctx->cv, &ctx->lock);
        }
        if (ctx->should_exit) {
            turdus_mutex_unlock(&ctx->lock);
            break;
        }
        local_epoch = ctx->epoch;
        void (*fn)(void*) = nullptr;
        void* fn_arg = nullptr;
        const bool has_task = id < ctx->posted_count;
        if (has_task) {
            fn = ctx->tasks[id].run;
            fn_arg = ctx->tasks[id].arg;
        }
        turdus_mutex_unlock(&ctx->lock);
        if (!has_task) {
            continue;
        }
        fn(fn_arg);
        turdus_mutex_lock(&ctx->lock);
        ctx->completed_in_epoch++;
        if (ctx->completed_in_epoch >= ctx->posted_count) {
            turdus_cond_signal(&ctx->done_cv);
        }
        turdus_mutex_unlock(&ctx->lock);
    }
    TURDUS_THREAD_RETURN;
}

static void
stop_threads(turdus_worker_ctx* ctx) {
    turdus_mutex_lock(&ctx->lock);
    ctx->should_exit = true;
    turdus_cond_broadcast(&ctx->cv);
    turdus_mutex_unlock(&ctx->lock);
    for (int i = 0; i < ctx->threads_started; i++) {
        turdus_thread_join(ctx->threads[i]);
    }
    turdus_cond_destroy(&ctx->done_cv);
    turdus_cond_destroy(&ctx->cv);
    turdus_mutex_destroy(&ctx->lock);
}

int
turdus_worker_pool_init(turdus_worker_pool* pool, int enabled) {
    if (!pool) {
        return TURDUS_ERR_INVALID_ARG;
    }
    pool->ctx = nullptr;
    if (!enabled) {
        return TURDUS_OK;
    }
    turdus_worker_ctx* ctx = (turdus_worker_ctx*)calloc(1, sizeof(turdus_worker_ctx));
    if (!ctx) {
        LOG_WARNING("worker pool allocation failed; processing channels inline.\n");
        return TURDUS_OK;
    }
    turdus_mutex_init(&ctx->lock);
    turdus_cond_init(&ctx->cv);
    turdus_cond_init(&ctx->done_cv);
    for (int i = 0; i < 2; i++) {
        ctx->args[i].ctx = ctx;
        ctx->args[i].id = i;
        if (turdus_thread_create(&ctx->threads[i], channel_worker, &ctx->args[i]) != 0) {
            LOG_WARNING("worker thread %d failed to start; processing channels inline.\n", i);
            stop_threads(ctx);
            free(ctx);
            return TURDUS_OK;
        }
        ctx->threads_started++;
    }
    pool->ctx = ctx;
    LOG_DEBUG("Channel multithreading enabled, workers: 2.\n");
    return TURDUS_OK;
}

void
turdus_worker_pool_destroy(turdus_worker_pool* pool) {
    if (!pool || !pool->ctx) {
        return;
    }
    stop_threads(pool->ctx);
    free(pool->ctx);
    pool->ctx = nullptr;
}

int
turdus_worker_pool_is_threaded(const turdus_worker_pool* pool) {
    return (pool && pool->ctx) ? 1 : 0;
}

void
turdus_worker_pool_run_two(turdus_worker_pool* pool, void (*f0)(void*), void* a0, void (*f1)(void*), void* a1) {
    if (!f0) {
        f0 = f1;
        a0 = a1;
        f1 = nullptr;
        a1 = nullptr;
    }
    if (!f0) {
        return;
    }
    turdus_worker_ctx* ctx = pool ? pool->ctx : nullptr;
    if (!ctx) {
        f0(a0);
        if (f1) {
            f1(a1);
        }
        return;
    }
    turdus_mutex_lock(&ctx->lock);
    ctx->tasks[0].run = f0;
    ctx->tasks[0].arg = a0;
    ctx->tasks[1].run = f1;
    ctx->tasks[1].arg = a1;
    ctx->posted_count = (f1 != nullptr) ? 2 : 1;
    ctx->completed_in_epoch = 0;
    ctx->epoch++;
    turdus_cond_broadcast(&ctx->cv);
    while (ctx->completed_in_epoch < ctx->posted_count) {
        turdus_cond_wait(&ctx->done_cv, &ctx->lock);
    }
    turdus_mutex_unlock(&ctx->lock);
}
