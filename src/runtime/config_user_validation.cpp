// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * Schema, validation and diagnostics for INI-based user configuration.
 */

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <turdus/dsp/presets.h>
#include <turdus/platform/posix_compat.h>
#include <turdus/runtime/config.h>
#include <turdus/runtime/config_schema.h>

#include "config_user_internal.h"

// Schema ---------------------------------------------------------------------

static const turdus_cfg_schema_entry_t k_schema[] = {
    {"", "version", "Config schema version", "1", NULL, TURDUS_CFG_TYPE_INT, 1, 1},
    {"encode", "preset", "Encode preset id or index", "turdus", "turdus|erithacus|strix",
     TURDUS_CFG_TYPE_ENCODE_PRESET, 0, 0},
    {"decode", "preset", "Decode preset id or index", "std", "std|wide|narrow", TURDUS_CFG_TYPE_DECODE_PRESET, 0,
     0},
    {"output", "pcm_scaling", "Float to int16 mapping", "asymmetric", "asymmetric|symmetric", TURDUS_CFG_TYPE_ENUM,
     0, 0},
    {"runtime", "threads", "1 = inline, 2 = two-thread worker pool", "1", NULL, TURDUS_CFG_TYPE_INT, 1, 2},
    {"runtime", "chunk_frames", "Frames per processing chunk", "16384", NULL, TURDUS_CFG_TYPE_INT,
     TURDUS_CHUNK_FRAMES_MIN, TURDUS_CHUNK_FRAMES_MAX},
    {"runtime", "log_level", "Log threshold", "info", "error|warn|warning|info|debug", TURDUS_CFG_TYPE_ENUM, 0, 0},
};

#define SCHEMA_LEN ((int)(sizeof(k_schema) / sizeof(k_schema[0])))

int
turdus_cfg_schema_count(void) {
    return SCHEMA_LEN;
}

const turdus_cfg_schema_entry_t*
turdus_cfg_schema_get(int index) {
    if (index < 0 || index >= SCHEMA_LEN) {
        return NULL;
    }
    return &k_schema[index];
}

const turdus_cfg_schema_entry_t*
turdus_cfg_schema_find(const char* section, const char* key) {
    if (!section || !key) {
        return NULL;
    }
    for (int i = 0; i < SCHEMA_LEN; i++) {
        if (turdus_strcasecmp(k_schema[i].section, section) == 0 && turdus_strcasecmp(k_schema[i].key, key) == 0) {
            return &k_schema[i];
        }
    }
    return NULL;
}

int
turdus_cfg_schema_has_section(const char* section) {
    if (!section) {
        return 0;
    }
    for (int i = 0; i < SCHEMA_LEN; i++) {
        if (turdus_strcasecmp(k_schema[i].section, section) == 0) {
            return 1;
        }
    }
    return 0;
}

// Diagnostics ----------------------------------------------------------------

void
turdus_cfg_diags_init(turdus_cfg_diagnostics_t* diags) {
    if (diags) {
        memset(diags, 0, sizeof(*diags));
    }
}

void
turdus_cfg_diags_add(turdus_cfg_diagnostics_t* diags, turdus_cfg_diag_level_t level, int line, const char* section,
                     const char* key, const char* message) {
    if (!diags) {
        return;
    }
    if (diags->count >= diags->capacity) {
        int cap = diags->capacity > 0 ? diags->capacity * 2 : 8;
        turdus_cfg_diagnostic_t* items =
            (turdus_cfg_diagnostic_t*)realloc(diags->items, (size_t)cap * sizeof(turdus_cfg_diagnostic_t));
        if (!items) {
            return; /* drop the message, keep what we have */
        }
        diags->items = items;
        diags->capacity = cap;
    }
    turdus_cfg_diagnostic_t* d = &diags->items[diags->count++];
    memset(d, 0, sizeof(*d));
    d->level = level;
    d->line_number = line;
    snprintf(d->section, sizeof d->section, "%s", section ? section : "");
    snprintf(d->key, sizeof d->key, "%s", key ? key : "");
    snprintf(d->message, sizeof d->message, "%s", message ? message : "");
    if (level == TURDUS_CFG_DIAG_ERROR) {
        diags->error_count++;
    } else if (level == TURDUS_CFG_DIAG_WARNING) {
        diags->warning_count++;
    }
}

void
turdus_cfg_diags_free(turdus_cfg_diagnostics_t* diags) {
    if (!diags) {
        return;
    }
    free(diags->items);
    memset(diags, 0, sizeof(*diags));
}

static const char*
diag_level_name(turdus_cfg_diag_level_t level) {
    switch (level) {
        case TURDUS_CFG_DIAG_ERROR: return "error";
        case TURDUS_CFG_DIAG_WARNING: return "warning";
        default: return "info";
    }
}

void
turdus_cfg_diags_print(const turdus_cfg_diagnostics_t* diags, FILE* stream, const char* path) {
    if (!diags || !stream) {
        return;
    }
    for (int i = 0; i < diags->count; i++) {
        const turdus_cfg_diagnostic_t* d = &diags->items[i];
        fprintf(stream, "%s:%d: %s: %s\n", path ? path : "<config>", d->line_number, diag_level_name(d->level),
                d->message);
    }
    fprintf(stream, "%d error(s), %d warning(s)\n", diags->error_count, diags->warning_count);
}

// Validation -----------------------------------------------------------------

static int
validate_enum_value(const char* val, const char* allowed) {
    if (!val || !allowed) {
        return -1;
    }

    char buf[256];
    snprintf(buf, sizeof buf, "%s", allowed);

    char* save = NULL;
    char* tok = turdus_strtok_r(buf, "|", &save);
    while (tok) {
        if (turdus_strcasecmp(val, tok) == 0) {
            return 0;
        }
        tok = turdus_strtok_r(NULL, "|", &save);
    }
    return -1;
}

static void
validate_entry_value(const turdus_cfg_schema_entry_t* entry, const char* val, turdus_cfg_diagnostics_t* diags,
                     int line_num, const char* section, const char* key) {
    char msg[256];
    switch (entry->type) {
        case TURDUS_CFG_TYPE_INT: {
            int int_val = 0;
            if (user_config_parse_int(val, &int_val) != 0) {
                snprintf(msg, sizeof msg, "Invalid integer value '%s'", val);
                turdus_cfg_diags_add(diags, TURDUS_CFG_DIAG_ERROR, line_num, section, key, msg);
            } else if ((entry->min_val != 0 || entry->max_val != 0)
                       && (int_val < entry->min_val || int_val > entry->max_val)) {
                snprintf(msg, sizeof msg, "Value %d is out of range [%d, %d]", int_val, entry->min_val,
                         entry->max_val);
                turdus_cfg_diags_add(diags, TURDUS_CFG_DIAG_WARNING, line_num, section, key, msg);
            }
            break;
        }

        case TURDUS_CFG_TYPE_ENUM:
            if (validate_enum_value(val, entry->allowed) != 0) {
                snprintf(msg, sizeof msg, "Invalid value '%s' (allowed: %s)", val, entry->allowed);
                turdus_cfg_diags_add(diags, TURDUS_CFG_DIAG_ERROR, line_num, section, key, msg);
            }
            break;

        case TURDUS_CFG_TYPE_ENCODE_PRESET:
            if (turdus_encode_preset_find(val) < 0) {
                snprintf(msg, sizeof msg, "Unknown encode preset '%s' (allowed: %s or 0..%d)", val, entry->allowed,
                         turdus_encode_preset_count() - 1);
                turdus_cfg_diags_add(diags, TURDUS_CFG_DIAG_ERROR, line_num, section, key, msg);
            }
            break;

        case TURDUS_CFG_TYPE_DECODE_PRESET:
            if (turdus_decode_preset_find(val) < 0) {
                snprintf(msg, sizeof msg, "Unknown decode preset '%s' (allowed: %s or 0..%d)", val, entry->allowed,
                         turdus_decode_preset_count() - 1);
                turdus_cfg_diags_add(diags, TURDUS_CFG_DIAG_ERROR, line_num, section, key, msg);
            }
            break;

        default: break;
    }
}

int
turdus_user_config_validate(const char* path, turdus_cfg_diagnostics_t* diags) {
    if (!diags) {
        return -1;
    }

    turdus_cfg_diags_init(diags);

    if (!path || !*path) {
        turdus_cfg_diags_add(diags, TURDUS_CFG_DIAG_ERROR, 0, "", "", "No config path provided");
        return -1;
    }

    FILE* fp = fopen(path, "r");
    if (!fp) {
        char msg[256];
        snprintf(msg, sizeof msg, "Cannot open file: %s", strerror(errno));
        turdus_cfg_diags_add(diags, TURDUS_CFG_DIAG_ERROR, 0, "", "", msg);
        return -1;
    }

    char line[1024];
    char current_section[64];
    current_section[0] = '\0';
    int line_num = 0;

    while (fgets(line, sizeof line, fp)) {
        line_num++;

        char* name = NULL;
        char* val = NULL;
        user_cfg_line_kind kind = user_config_split_line(line, &name, &val);

        if (kind == USER_CFG_LINE_BLANK) {
            continue;
        }
        if (kind == USER_CFG_LINE_BAD_SECTION) {
            turdus_cfg_diags_add(diags, TURDUS_CFG_DIAG_ERROR, line_num, "", "", "Malformed section header");
            continue;
        }
        if (kind == USER_CFG_LINE_MALFORMED) {
            turdus_cfg_diags_add(diags, TURDUS_CFG_DIAG_ERROR, line_num, current_section, "",
                                 "Line is not a comment, section, or key=value");
            continue;
        }
        if (kind == USER_CFG_LINE_SECTION) {
            snprintf(current_section, sizeof current_section, "%s", name);
            if (current_section[0] == '\0' || !turdus_cfg_schema_has_section(current_section)) {
                std::string msg = std::string("Unknown section [") + current_section + "]";
                turdus_cfg_diags_add(diags, TURDUS_CFG_DIAG_WARNING, line_num, current_section, "", msg.c_str());
            }
            continue;
        }

        const turdus_cfg_schema_entry_t* entry = turdus_cfg_schema_find(current_section, name);
        if (!entry) {
            std::string msg = current_section[0]
                                  ? std::string("Unknown key '") + name + "' in section [" + current_section + "]"
                                  : std::string("Unknown top-level key '") + name + "'";
            turdus_cfg_diags_add(diags, TURDUS_CFG_DIAG_WARNING, line_num, current_section, name, msg.c_str());
            continue;
        }

        validate_entry_value(entry, val, diags, line_num, current_section, name);
    }

    fclose(fp);
    return diags->error_count > 0 ? -1 : 0;
}
