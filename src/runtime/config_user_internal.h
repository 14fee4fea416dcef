// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * Private helpers shared by runtime config implementation units.
 */

#pragma once

#include <turdus/runtime/config.h>

typedef enum {
    USER_CFG_LINE_BLANK = 0,   /* empty or comment-only */
    USER_CFG_LINE_SECTION,     /* `[name]`, name lower-cased */
    USER_CFG_LINE_KEYVAL,      /* `key = value`, key lower-cased, value unquoted */
    USER_CFG_LINE_BAD_SECTION, /* `[` without closing `]` */
    USER_CFG_LINE_MALFORMED    /* anything else */
} user_cfg_line_kind;

/* Classify and split one INI line in place. `name` receives the section or
 * key, `val` the value for key lines. */
user_cfg_line_kind user_config_split_line(char* line, char** name, char** val);

/* Strict base-10 integer parse of the whole string. Returns 0 on success. */
int user_config_parse_int(const char* v, int* out);
