// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * INI-based user configuration: default path, loader, merge and rendering.
 */

#include <ctype.h>
#include <errno.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <turdus/dsp/presets.h>
#include <turdus/platform/posix_compat.h>
#include <turdus/runtime/config.h>

#include "config_user_internal.h"

static void
trim_whitespace(char* s) {
    char* p = s;
    while (*p && isspace((unsigned char)*p)) {
        p++;
    }
    if (p != s) {
        memmove(s, p, strlen(p) + 1);
    }
    size_t n = strlen(s);
    while (n > 0 && isspace((unsigned char)s[n - 1])) {
        s[--n] = '\0';
    }
}

static void
strip_inline_comment(char* s) {
    int in_quote = 0;
    for (char* p = s; *p; ++p) {
        if (*p == '"') {
            in_quote = !in_quote;
            continue;
        }
        if (!in_quote && (*p == '#' || *p == ';')) {
            *p = '\0';
            break;
        }
    }
}

static void
unquote(char* s) {
    size_t n = strlen(s);
    if (n >= 2 && s[0] == '"' && s[n - 1] == '"') {
        memmove(s, s + 1, n - 2);
        s[n - 2] = '\0';
    }
}

static void
lowercase(char* s) {
    for (char* c = s; *c; ++c) {
        *c = (char)tolower((unsigned char)*c);
    }
}

user_cfg_line_kind
user_config_split_line(char* line, char** name, char** val) {
    *name = NULL;
    *val = NULL;
    strip_inline_comment(line);
    trim_whitespace(line);
    if (line[0] == '\0') {
        return USER_CFG_LINE_BLANK;
    }

    if (line[0] == '[') {
        char* end = strchr(line, ']');
        if (!end) {
            return USER_CFG_LINE_BAD_SECTION;
        }
        *end = '\0';
        char* sec = line + 1;
        trim_whitespace(sec);
        lowercase(sec);
        *name = sec;
        return USER_CFG_LINE_SECTION;
    }

    char* eq = strchr(line, '=');
    if (!eq || eq == line) {
        return USER_CFG_LINE_MALFORMED;
    }
    *eq = '\0';
    char* key = line;
    char* v = eq + 1;
    trim_whitespace(key);
    trim_whitespace(v);
    if (key[0] == '\0') {
        return USER_CFG_LINE_MALFORMED;
    }
    lowercase(key);
    unquote(v);
    *name = key;
    *val = v;
    return USER_CFG_LINE_KEYVAL;
}

int
user_config_parse_int(const char* v, int* out) {
    if (!v || !*v) {
        return -1;
    }
    char* end = NULL;
    errno = 0;
    long x = strtol(v, &end, 10);
    if (end == v || *end != '\0' || errno == ERANGE || x < INT_MIN || x > INT_MAX) {
        return -1;
    }
    if (out) {
        *out = (int)x;
    }
    return 0;
}

static int
clamp_int(int v, int lo, int hi) {
    return v < lo ? lo : (v > hi ? hi : v);
}

// Default path ---------------------------------------------------------------

const char*
turdus_user_config_default_path(void) {
    static char buf[1024];
    buf[0] = '\0';

    const char* explicit_path = getenv("TURDUS_CONFIG");
    if (explicit_path && *explicit_path) {
        snprintf(buf, sizeof buf, "%s", explicit_path);
        return buf;
    }

#if defined(_WIN32)
    const char* appdata = getenv("APPDATA");
    if (appdata && *appdata) {
        snprintf(buf, sizeof buf, "%s\\turdus\\config.ini", appdata);
    }
#else
    const char* xdg = getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        snprintf(buf, sizeof buf, "%s/turdus/config.ini", xdg);
    } else {
        const char* home = getenv("HOME");
        if (home && *home) {
            snprintf(buf, sizeof buf, "%s/.config/turdus/config.ini", home);
        }
    }
#endif
    buf[sizeof buf - 1] = '\0';
    return buf[0] ? buf : NULL;
}

// INI loader ------------------------------------------------------------------

static void
user_cfg_reset(turdusUserConfig* cfg) {
    memset(cfg, 0, sizeof(*cfg));
    cfg->version = 1;
    cfg->pcm_scaling = TURDUS_PCM_ASYMMETRIC;
    cfg->threads = 1;
    cfg->chunk_frames = TURDUS_CHUNK_FRAMES_DEFAULT;
    cfg->log_level = LOG_LEVEL_INFO;
}

static void
apply_runtime_section_key(turdusUserConfig* cfg, const char* key, const char* val) {
    int v = 0;
    if (strcmp(key, "threads") == 0) {
        if (user_config_parse_int(val, &v) == 0) {
            cfg->has_threads = 1;
            cfg->threads = clamp_int(v, 1, 2);
        }
    } else if (strcmp(key, "chunk_frames") == 0) {
        if (user_config_parse_int(val, &v) == 0) {
            cfg->has_chunk_frames = 1;
            cfg->chunk_frames = clamp_int(v, TURDUS_CHUNK_FRAMES_MIN, TURDUS_CHUNK_FRAMES_MAX);
        }
    } else if (strcmp(key, "log_level") == 0) {
        turdus_log_level_t lv = LOG_LEVEL_INFO;
        if (turdus_log_level_parse(val, &lv) == 0) {
            cfg->has_log_level = 1;
            cfg->log_level = lv;
        }
    }
}

static void
apply_key(turdusUserConfig* cfg, const char* section, const char* key, const char* val) {
    if (section[0] == '\0') {
        int v = 0;
        if (strcmp(key, "version") == 0 && user_config_parse_int(val, &v) == 0) {
            cfg->version = v;
        }
    } else if (strcmp(section, "encode") == 0) {
        if (strcmp(key, "preset") == 0) {
            int idx = turdus_encode_preset_find(val);
            if (idx >= 0) {
                cfg->has_encode_preset = 1;
                cfg->encode_preset = idx;
            }
        }
    } else if (strcmp(section, "decode") == 0) {
        if (strcmp(key, "preset") == 0) {
            int idx = turdus_decode_preset_find(val);
            if (idx >= 0) {
                cfg->has_decode_preset = 1;
                cfg->decode_preset = idx;
            }
        }
    } else if (strcmp(section, "output") == 0) {
        if (strcmp(key, "pcm_scaling") == 0) {
            turdus_pcm_scaling sc = TURDUS_PCM_ASYMMETRIC;
            if (turdus_pcm_scaling_parse(val, &sc) == 0) {
                cfg->has_pcm_scaling = 1;
                cfg->pcm_scaling = sc;
            }
        }
    } else if (strcmp(section, "runtime") == 0) {
        apply_runtime_section_key(cfg, key, val);
    }
}

int
turdus_user_config_load(const char* path, turdusUserConfig* cfg) {
    if (!cfg) {
        return -1;
    }
    user_cfg_reset(cfg);
    if (!path || !*path) {
        return -1;
    }

    FILE* fp = fopen(path, "r");
    if (!fp) {
        return -1;
    }

    char line[1024];
    char current_section[64];
    current_section[0] = '\0';

    while (fgets(line, sizeof line, fp)) {
        char* name = NULL;
        char* val = NULL;
        switch (user_config_split_line(line, &name, &val)) {
            case USER_CFG_LINE_SECTION: snprintf(current_section, sizeof current_section, "%s", name); break;
            case USER_CFG_LINE_KEYVAL: apply_key(cfg, current_section, name, val); break;
            default: break;
        }
    }

    fclose(fp);
    return 0;
}

// Merge ----------------------------------------------------------------------

void
turdus_user_config_apply(const turdusUserConfig* cfg, turdusRuntimeConfig* rc) {
    if (!cfg || !rc) {
        return;
    }
    if (cfg->has_encode_preset && !rc->encode_preset_is_set) {
        rc->encode_preset = cfg->encode_preset;
    }
    if (cfg->has_decode_preset && !rc->decode_preset_is_set) {
        rc->decode_preset = cfg->decode_preset;
    }
    if (cfg->has_pcm_scaling && !rc->pcm_scaling_is_set) {
        rc->pcm_scaling = cfg->pcm_scaling;
    }
    if (cfg->has_threads && !rc->mt_is_set) {
        rc->mt_enable = cfg->threads >= 2 ? 1 : 0;
    }
    if (cfg->has_chunk_frames && !rc->chunk_frames_is_set) {
        rc->chunk_frames = cfg->chunk_frames;
    }
    if (cfg->has_log_level && !rc->log_level_is_set) {
        rc->log_level = cfg->log_level;
    }
}

// Rendering ------------------------------------------------------------------

static const char*
log_level_name(turdus_log_level_t lv) {
    switch (lv) {
        case LOG_LEVEL_ERROR: return "error";
        case LOG_LEVEL_WARN: return "warn";
        case LOG_LEVEL_DEBUG: return "debug";
        default: return "info";
    }
}

void
turdus_user_config_render_ini(const turdusUserConfig* cfg, FILE* out) {
    if (!cfg || !out) {
        return;
    }

    fprintf(out, "version = %d\n", cfg->version > 0 ? cfg->version : 1);

    if (cfg->has_encode_preset) {
        const turdus_encode_preset* p = turdus_encode_preset_at(cfg->encode_preset);
        if (p) {
            fprintf(out, "\n[encode]\npreset = \"%s\"\n", p->id);
        }
    }
    if (cfg->has_decode_preset) {
        const turdus_decode_preset* p = turdus_decode_preset_at(cfg->decode_preset);
        if (p) {
            fprintf(out, "\n[decode]\npreset = \"%s\"\n", p->id);
        }
    }
    if (cfg->has_pcm_scaling) {
        fprintf(out, "\n[output]\npcm_scaling = \"%s\"\n",
                cfg->pcm_scaling == TURDUS_PCM_SYMMETRIC ? "symmetric" : "asymmetric");
    }
    if (cfg->has_threads || cfg->has_chunk_frames || cfg->has_log_level) {
        fprintf(out, "\n[runtime]\n");
        if (cfg->has_threads) {
            fprintf(out, "threads = %d\n", cfg->threads);
        }
        if (cfg->has_chunk_frames) {
            fprintf(out, "chunk_frames = %d\n", cfg->chunk_frames);
        }
        if (cfg->has_log_level) {
            fprintf(out, "log_level = \"%s\"\n", log_level_name(cfg->log_level));
        }
    }
}
