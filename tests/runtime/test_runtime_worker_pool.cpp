// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/* Worker pool: inline fallback, threaded completion, and single-task posts. */

#include <stdio.h>
#include <turdus/core/status.h>
#include <turdus/runtime/worker_pool.h>

typedef struct {
    int hits;
    long sum;
} counter_t;

static void
bump(void* arg) {
    counter_t* c = (counter_t*)arg;
    long acc = 0;
    for (int i = 1; i <= 1000; i++) {
        acc += i;
    }
    c->sum += acc;
    c->hits++;
}

static int
exercise(turdus_worker_pool* pool, const char* tag) {
    counter_t a = {0, 0};
    counter_t b = {0, 0};
    for (int round = 0; round < 200; round++) {
        turdus_worker_pool_run_two(pool, bump, &a, bump, &b);
    }
    if (a.hits != 200 || b.hits != 200 || a.sum != 200L * 500500L || b.sum != a.sum) {
        fprintf(stderr, "%s: paired tasks a=%d b=%d\n", tag, a.hits, b.hits);
        return 1;
    }

    // Single task in either slot
    counter_t c = {0, 0};
    turdus_worker_pool_run_two(pool, bump, &c, NULL, NULL);
    turdus_worker_pool_run_two(pool, NULL, NULL, bump, &c);
    turdus_worker_pool_run_two(pool, NULL, NULL, NULL, NULL);
    if (c.hits != 2) {
        fprintf(stderr, "%s: single tasks ran %d times\n", tag, c.hits);
        return 1;
    }
    return 0;
}

int
main(void) {
    if (turdus_worker_pool_init(NULL, 1) != TURDUS_ERR_INVALID_ARG) {
        fprintf(stderr, "worker_pool: NULL pool accepted\n");
        return 1;
    }

    turdus_worker_pool inline_pool;
    if (turdus_worker_pool_init(&inline_pool, 0) != TURDUS_OK || turdus_worker_pool_is_threaded(&inline_pool)) {
        fprintf(stderr, "worker_pool: disabled pool is threaded\n");
        return 1;
    }
    if (exercise(&inline_pool, "inline") != 0) {
        return 1;
    }
    turdus_worker_pool_destroy(&inline_pool);

    // NULL pool runs inline
    if (exercise(NULL, "null") != 0) {
        return 1;
    }

    turdus_worker_pool pool;
    if (turdus_worker_pool_init(&pool, 1) != TURDUS_OK) {
        fprintf(stderr, "worker_pool: init failed\n");
        return 1;
    }
    int rc = exercise(&pool, turdus_worker_pool_is_threaded(&pool) ? "threaded" : "fallback");
    turdus_worker_pool_destroy(&pool);
    turdus_worker_pool_destroy(&pool);
    if (pool.ctx != NULL) {
        fprintf(stderr, "worker_pool: destroy left a context\n");
        return 1;
    }
    return rc;
}
