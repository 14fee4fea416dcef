// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Minimal CLI surface for parsing args into turdus options.
 */
#pragma once

#include <stdio.h>
#include <turdus/runtime/config.h>

#ifdef __cplusplus
extern "C" {
#endif

/** Return codes for turdus_cli_parse. */
#define TURDUS_PARSE_CONTINUE 0
#define TURDUS_PARSE_HELP     1
#define TURDUS_PARSE_ERROR    (-1)

/** Process exit codes used by the host. */
#define TURDUS_EXIT_OK          0
#define TURDUS_EXIT_USAGE       1
#define TURDUS_EXIT_FAILURE     2
#define TURDUS_EXIT_INTERRUPTED 130

typedef enum {
    TURDUS_CMD_NONE = 0,
    TURDUS_CMD_ENCODE,
    TURDUS_CMD_DECODE,
    TURDUS_CMD_ROUNDTRIP,
    TURDUS_CMD_PRESETS,
    TURDUS_CMD_VALIDATE_CONFIG,
    TURDUS_CMD_PRINT_CONFIG
} turdus_cli_command;

typedef struct turdus_cli_opts {
    turdus_cli_command command;
    const char* input_path;    /* -i */
    const char* output_path;   /* -o */
    const char* encode_preset; /* -p (encode, roundtrip) */
    const char* decode_preset; /* -p (decode), -q (roundtrip) */
    const char* config_path;   /* -c, or positional for validate-config */
    int symmetric;             /* -s */
    int mt;                    /* -j */
    int verbose;               /* -v */
} turdus_cli_opts;

/**
 * @brief Parse `turdus <command> [flags]`.
 *
 * Pointers in `out` alias `argv`. Problems are reported on stderr.
 *
 * @return TURDUS_PARSE_CONTINUE with `out` filled, TURDUS_PARSE_HELP for
 *         -h/--help/help, or TURDUS_PARSE_ERROR on a usage error.
 */
int turdus_cli_parse(int argc, char** argv, turdus_cli_opts* out);

/**
 * @brief Apply CLI overrides on top of the env/INI-merged configuration.
 *
 * @return TURDUS_OK, or TURDUS_ERR_INVALID_PRESET when -p/-q names no preset.
 */
int turdus_cli_apply(const turdus_cli_opts* cli, turdusRuntimeConfig* rc);

/** @brief Print the usage/help text. */
void turdus_cli_usage(FILE* stream);

#ifdef __cplusplus
}
#endif
