// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/* Log level parsing and runtime threshold gating. */

#include <stdio.h>
#include <turdus/runtime/log.h>

#include "test_support.h"

int
main(void) {
    turdus_log_level_t lv = LOG_LEVEL_INFO;
    if (turdus_log_level_parse("WARNING", &lv) != 0 || lv != LOG_LEVEL_WARN) {
        fprintf(stderr, "log: WARNING not parsed\n");
        return 1;
    }
    if (turdus_log_level_parse("debug", &lv) != 0 || lv != LOG_LEVEL_DEBUG || turdus_log_level_parse("loud", &lv) == 0
        || turdus_log_level_parse("", &lv) == 0) {
        fprintf(stderr, "log: level parsing wrong\n");
        return 1;
    }

    turdus_test_capture_stderr cap;
    if (turdus_test_capture_stderr_begin(&cap, "turdus_log") != 0) {
        fprintf(stderr, "log: cannot capture stderr\n");
        return 1;
    }
    turdus_log_set_level(LOG_LEVEL_WARN);
    LOG_INFO("info-line-hidden\n");
    LOG_WARNING("warn-line-shown\n");
    LOG_ERROR("error-line-shown\n");
    turdus_log_set_level(LOG_LEVEL_INFO);
    LOG_INFO("info-line-shown\n");
    turdus_test_capture_stderr_end(&cap);

    int ok = !turdus_test_capture_contains(&cap, "info-line-hidden")
             && turdus_test_capture_contains(&cap, "WARNING: warn-line-shown")
             && turdus_test_capture_contains(&cap, "error-line-shown")
             && turdus_test_capture_contains(&cap, "info-line-shown");
    remove(cap.path);
    if (!ok || turdus_log_get_level() != LOG_LEVEL_INFO) {
        fprintf(stderr, "log: threshold gating wrong\n");
        return 1;
    }
    return 0;
}
