// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Command-line parsing and CLI precedence for the turdus host.
 */

#include <stdio.h>
#include <string.h>
#include <turdus/core/status.h>
#include <turdus/dsp/presets.h>
#include <turdus/runtime/cli.h>
#include <turdus/runtime/log.h>

static const struct {
    const char* name;
    turdus_cli_command cmd;
} k_commands[] = {
    {"encode", TURDUS_CMD_ENCODE},
    {"decode", TURDUS_CMD_DECODE},
    {"roundtrip", TURDUS_CMD_ROUNDTRIP},
    {"presets", TURDUS_CMD_PRESETS},
    {"validate-config", TURDUS_CMD_VALIDATE_CONFIG},
    {"print-config", TURDUS_CMD_PRINT_CONFIG},
};

void
turdus_cli_usage(FILE* stream) {
    fprintf(stream, "Usage: turdus <command> [options]\n"
                    "\n"
                    "Commands:\n"
                    "  encode -i <in> -o <out.wav> [-p <preset>]     Hide speech in a birdsong-like carrier\n"
                    "  decode -i <in> -o <out.wav> [-p <preset>]     Recover speech from an encoded file\n"
                    "  roundtrip -i <in> -o <out.wav> [-p <enc>] [-q <dec>]\n"
                    "                                                Encode then decode in one pass\n"
                    "  presets                                       List encode and decode presets\n"
                    "  validate-config [path]                        Check an INI config file\n"
                    "  print-config                                  Show the effective configuration as INI\n"
                    "\n"
                    "Options:\n"
                    "  -i <path>   Input audio file (any format libsndfile reads)\n"
                    "  -o <path>   Output 16-bit PCM WAV file\n"
                    "  -p <id>     Encode preset (encode, roundtrip) or decode preset (decode)\n"
                    "  -q <id>     Decode preset (roundtrip)\n"
                    "  -c <path>   User config file (default: $TURDUS_CONFIG or ~/.config/turdus/config.ini)\n"
                    "  -s          Symmetric PCM scaling (x32767 for both polarities)\n"
                    "  -j          Process channels on the two-thread worker pool\n"
                    "  -v          Debug logging\n"
                    "  -h          Show this help\n");
}

static int
takes_io(turdus_cli_command cmd) {
    return cmd == TURDUS_CMD_ENCODE || cmd == TURDUS_CMD_DECODE || cmd == TURDUS_CMD_ROUNDTRIP;
}

int
turdus_cli_parse(int argc, char** argv, turdus_cli_opts* out) {
    if (!out) {
        return TURDUS_PARSE_ERROR;
    }
    memset(out, 0, sizeof(*out));
    if (argc < 2 || !argv || !argv[1]) {
        fprintf(stderr, "turdus: missing command\n");
        return TURDUS_PARSE_ERROR;
    }

    const char* name = argv[1];
    if (strcmp(name, "-h") == 0 || strcmp(name, "--help") == 0 || strcmp(name, "help") == 0) {
        return TURDUS_PARSE_HELP;
    }
    for (size_t i = 0; i < sizeof(k_commands) / sizeof(k_commands[0]); i++) {
        if (strcmp(name, k_commands[i].name) == 0) {
            out->command = k_commands[i].cmd;
            break;
        }
    }
    if (out->command == TURDUS_CMD_NONE) {
        fprintf(stderr, "turdus: unknown command '%s'\n", name);
        return TURDUS_PARSE_ERROR;
    }

    for (int i = 2; i < argc; i++) {
        const char* a = argv[i];
        if (a[0] != '-' || a[1] == '\0') {
            if (out->command == TURDUS_CMD_VALIDATE_CONFIG && !out->config_path) {
                out->config_path = a;
                continue;
            }
            fprintf(stderr, "turdus: unexpected argument '%s'\n", a);
            return TURDUS_PARSE_ERROR;
        }
        if (a[2] != '\0') {
            if (strcmp(a, "--help") == 0) {
                return TURDUS_PARSE_HELP;
            }
            fprintf(stderr, "turdus: unknown option '%s'\n", a);
            return TURDUS_PARSE_ERROR;
        }

        const char opt = a[1];
        switch (opt) {
            case 'h': return TURDUS_PARSE_HELP;
            case 's': out->symmetric = 1; continue;
            case 'j': out->mt = 1; continue;
            case 'v': out->verbose = 1; continue;
            case 'i':
            case 'o':
            case 'p':
            case 'q':
            case 'c': break;
            default: fprintf(stderr, "turdus: unknown option '%s'\n", a); return TURDUS_PARSE_ERROR;
        }

        if (i + 1 >= argc) {
            fprintf(stderr, "turdus: option -%c requires a value\n", opt);
            return TURDUS_PARSE_ERROR;
        }
        const char* val = argv[++i];
        switch (opt) {
            case 'i': out->input_path = val; break;
            case 'o': out->output_path = val; break;
            case 'c': out->config_path = val; break;
            case 'p':
                if (out->command == TURDUS_CMD_DECODE) {
                    out->decode_preset = val;
                } else {
                    out->encode_preset = val;
                }
                break;
            case 'q':
                if (out->command != TURDUS_CMD_ROUNDTRIP) {
                    fprintf(stderr, "turdus: -q only applies to roundtrip\n");
                    return TURDUS_PARSE_ERROR;
                }
                out->decode_preset = val;
                break;
            default: break;
        }
    }

    if (takes_io(out->command) && (!out->input_path || !out->output_path)) {
        fprintf(stderr, "turdus: %s needs -i <input> and -o <output>\n", name);
        return TURDUS_PARSE_ERROR;
    }
    return TURDUS_PARSE_CONTINUE;
}

int
turdus_cli_apply(const turdus_cli_opts* cli, turdusRuntimeConfig* rc) {
    if (!cli || !rc) {
        return TURDUS_ERR_INVALID_ARG;
    }
    if (cli->encode_preset) {
        int idx = turdus_encode_preset_find(cli->encode_preset);
        if (idx < 0) {
            LOG_ERROR("Unknown encode preset '%s' (see `turdus presets`)\n", cli->encode_preset);
            return TURDUS_ERR_INVALID_PRESET;
        }
        rc->encode_preset_is_set = 1;
        rc->encode_preset = idx;
    }
    if (cli->decode_preset) {
        int idx = turdus_decode_preset_find(cli->decode_preset);
        if (idx < 0) {
            LOG_ERROR("Unknown decode preset '%s' (see `turdus presets`)\n", cli->decode_preset);
            return TURDUS_ERR_INVALID_PRESET;
        }
        rc->decode_preset_is_set = 1;
        rc->decode_preset = idx;
    }
    if (cli->symmetric) {
        rc->pcm_scaling_is_set = 1;
        rc->pcm_scaling = TURDUS_PCM_SYMMETRIC;
    }
    if (cli->mt) {
        rc->mt_is_set = 1;
        rc->mt_enable = 1;
    }
    if (cli->verbose) {
        rc->log_level_is_set = 1;
        rc->log_level = LOG_LEVEL_DEBUG;
    }
    return TURDUS_OK;
}
