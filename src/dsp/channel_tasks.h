// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * Private helper shared by the encoder and decoder: run one function per
 * channel over a frame range, two channels at a time on the worker pool.
 */

#pragma once

#include <stddef.h>
#include <turdus/runtime/worker_pool.h>

typedef void (*turdus_channel_fn)(void* session, int ch, size_t offset, size_t length);

typedef struct turdus_channel_task {
    turdus_channel_fn fn;
    void* session;
    int ch;
    size_t offset;
    size_t length;
} turdus_channel_task;

static inline void
turdus_channel_task_run(void* arg) {
    turdus_channel_task* t = (turdus_channel_task*)arg;
    t->fn(t->session, t->ch, t->offset, t->length);
}

static inline void
turdus_dispatch_channels(turdus_worker_pool* pool, int channels, turdus_channel_fn fn, void* session, size_t offset,
                         size_t length) {
    for (int c = 0; c < channels; c += 2) {
        turdus_channel_task t0 = {fn, session, c, offset, length};
        turdus_channel_task t1 = {fn, session, c + 1, offset, length};
        void (*second)(void*) = (c + 1 < channels) ? turdus_channel_task_run : NULL;
        turdus_worker_pool_run_two(pool, turdus_channel_task_run, &t0, second, &t1);
    }
}
