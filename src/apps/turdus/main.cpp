// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief turdus command-line host: encode, decode and round-trip audio files.
 *
 * Resolves configuration (CLI > env > INI > defaults), reads the input with
 * libsndfile, runs the engine chunk by chunk so SIGINT can stop between
 * chunks, and writes a 16-bit PCM WAV.
 */

#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <turdus/core/audio_buffer.h>
#include <turdus/core/file_io.h>
#include <turdus/core/status.h>
#include <turdus/core/wav.h>
#include <turdus/dsp/decoder.h>
#include <turdus/dsp/encoder.h>
#include <turdus/dsp/presets.h>
#include <turdus/runtime/cli.h>
#include <turdus/runtime/config.h>
#include <turdus/runtime/config_schema.h>
#include <turdus/runtime/exitflag.h>
#include <turdus/runtime/log.h>
#include <turdus/runtime/worker_pool.h>

volatile uint8_t exitflag = 0;

extern "C" void
turdus_sighandler(int sig) {
    (void)sig;
    exitflag = 1;
}

/* Status for an interrupted run; never returned by the engine */
#define HOST_INTERRUPTED 1

static int
run_encode(const turdus_audio_buffer* in, const turdus_encode_preset* preset, int chunk_frames,
           turdus_worker_pool* pool, turdus_audio_buffer* out) {
    turdus_encoder enc;
    int rc = turdus_encoder_begin(&enc, in, preset, out);
    if (rc != TURDUS_OK) {
        return rc;
    }
    while (turdus_encoder_remaining(&enc) > 0) {
        if (exitflag) {
            turdus_encoder_end(&enc);
            return HOST_INTERRUPTED;
        }
        size_t len = turdus_encoder_remaining(&enc);
        if (len > (size_t)chunk_frames) {
            len = (size_t)chunk_frames;
        }
        rc = turdus_encoder_process_chunk(&enc, enc.next_frame, len, pool);
        if (rc != TURDUS_OK) {
            turdus_encoder_end(&enc);
            return rc;
        }
    }
    turdus_encoder_end(&enc);
    return TURDUS_OK;
}

static int
run_decode(const turdus_audio_buffer* in, const turdus_decode_preset* preset, int chunk_frames,
           turdus_worker_pool* pool, turdus_audio_buffer* out) {
    turdus_decoder dec;
    int rc = turdus_decoder_begin(&dec, in, preset, out);
    if (rc != TURDUS_OK) {
        return rc;
    }
    while (turdus_decoder_remaining(&dec) > 0) {
        if (exitflag) {
            turdus_decoder_end(&dec);
            return HOST_INTERRUPTED;
        }
        size_t len = turdus_decoder_remaining(&dec);
        if (len > (size_t)chunk_frames) {
            len = (size_t)chunk_frames;
        }
        rc = turdus_decoder_process_chunk(&dec, dec.next_frame, len, pool);
        if (rc != TURDUS_OK) {
            turdus_decoder_end(&dec);
            return rc;
        }
    }
    turdus_decoder_end(&dec);
    return TURDUS_OK;
}

static void
print_presets(void) {
    printf("Encode presets:\n");
    for (int i = 0; i < turdus_encode_preset_count(); i++) {
        const turdus_encode_preset* p = turdus_encode_preset_at(i);
        printf("  %d  %-10s %-15s carrier %6.0f Hz  x%-3.0f  lpf %5.0f Hz  %s\n", i, p->id, p->name,
               p->carrier_base_hz, p->pitch_multiplier, p->input_lpf_hz, p->description);
    }
    printf("Decode presets:\n");
    for (int i = 0; i < turdus_decode_preset_count(); i++) {
        const turdus_decode_preset* p = turdus_decode_preset_at(i);
        printf("  %d  %-10s %-15s lpf %5.0f Hz  %d stages  gain x%-4.0f %s\n", i, p->id, p->name, p->lpf_hz,
               p->filter_stages, p->gain_multiplier, p->description);
    }
}

static void
print_effective_config(const turdusRuntimeConfig* rc) {
    turdusUserConfig u;
    memset(&u, 0, sizeof(u));
    u.version = 1;
    u.has_encode_preset = 1;
    u.encode_preset = rc->encode_preset;
    u.has_decode_preset = 1;
    u.decode_preset = rc->decode_preset;
    u.has_pcm_scaling = 1;
    u.pcm_scaling = rc->pcm_scaling;
    u.has_threads = 1;
    u.threads = rc->mt_enable ? 2 : 1;
    u.has_chunk_frames = 1;
    u.chunk_frames = rc->chunk_frames;
    u.has_log_level = 1;
    u.log_level = rc->log_level;
    turdus_user_config_render_ini(&u, stdout);
}

static int
validate_config(const char* path) {
    if (!path) {
        fprintf(stderr, "turdus: no config path given and no default location available\n");
        return TURDUS_EXIT_USAGE;
    }
    turdus_cfg_diagnostics_t diags;
    int rc = turdus_user_config_validate(path, &diags);
    turdus_cfg_diags_print(&diags, stdout, path);
    turdus_cfg_diags_free(&diags);
    return rc == 0 ? TURDUS_EXIT_OK : TURDUS_EXIT_FAILURE;
}

static int
process_file(const turdus_cli_opts* cli, const turdusRuntimeConfig* rc) {
    const turdus_encode_preset* ep = turdus_encode_preset_at(rc->encode_preset);
    const turdus_decode_preset* dp = turdus_decode_preset_at(rc->decode_preset);

    turdus_audio_buffer in;
    int st = turdus_audio_read_file(cli->input_path, &in);
    if (st != TURDUS_OK) {
        LOG_ERROR("Failed to read '%s': %s\n", cli->input_path, turdus_status_str(st));
        return TURDUS_EXIT_FAILURE;
    }
    LOG_INFO("Input: %s (%d ch, %zu frames @ %d Hz)\n", cli->input_path, in.channels, in.frames, in.sample_rate);

    turdus_worker_pool pool;
    st = turdus_worker_pool_init(&pool, rc->mt_enable);
    if (st != TURDUS_OK) {
        turdus_audio_buffer_free(&in);
        return TURDUS_EXIT_FAILURE;
    }

    turdus_audio_buffer mid;
    turdus_audio_buffer out;
    memset(&mid, 0, sizeof(mid));
    memset(&out, 0, sizeof(out));

    switch (cli->command) {
        case TURDUS_CMD_ENCODE:
            LOG_INFO("Encoding with preset %s\n", ep->name);
            st = run_encode(&in, ep, rc->chunk_frames, &pool, &out);
            break;
        case TURDUS_CMD_DECODE:
            LOG_INFO("Decoding with preset %s\n", dp->name);
            st = run_decode(&in, dp, rc->chunk_frames, &pool, &out);
            break;
        default:
            LOG_INFO("Round trip: encode %s, decode %s\n", ep->name, dp->name);
            st = run_encode(&in, ep, rc->chunk_frames, &pool, &mid);
            if (st == TURDUS_OK) {
                st = run_decode(&mid, dp, rc->chunk_frames, &pool, &out);
            }
            break;
    }
    turdus_worker_pool_destroy(&pool);
    turdus_audio_buffer_free(&mid);
    turdus_audio_buffer_free(&in);

    int exit_rc = TURDUS_EXIT_OK;
    if (st == HOST_INTERRUPTED) {
        LOG_WARNING("Interrupted; discarding partial output.\n");
        exit_rc = TURDUS_EXIT_INTERRUPTED;
    } else if (st != TURDUS_OK) {
        LOG_ERROR("Processing failed: %s\n", turdus_status_str(st));
        exit_rc = TURDUS_EXIT_FAILURE;
    } else {
        st = turdus_wav_write_file(cli->output_path, &out, rc->pcm_scaling);
        if (st != TURDUS_OK) {
            LOG_ERROR("Failed to write '%s': %s\n", cli->output_path, turdus_status_str(st));
            exit_rc = TURDUS_EXIT_FAILURE;
        } else {
            LOG_INFO("Wrote %s (%zu frames)\n", cli->output_path, out.frames);
        }
    }
    turdus_audio_buffer_free(&out);
    return exit_rc;
}

int
main(int argc, char** argv) {
    turdus_cli_opts cli;
    int prc = turdus_cli_parse(argc, argv, &cli);
    if (prc == TURDUS_PARSE_HELP) {
        turdus_cli_usage(stdout);
        return TURDUS_EXIT_OK;
    }
    if (prc != TURDUS_PARSE_CONTINUE) {
        turdus_cli_usage(stderr);
        return TURDUS_EXIT_USAGE;
    }

    if (cli.command == TURDUS_CMD_PRESETS) {
        print_presets();
        return TURDUS_EXIT_OK;
    }
    if (cli.command == TURDUS_CMD_VALIDATE_CONFIG) {
        return validate_config(cli.config_path ? cli.config_path : turdus_user_config_default_path());
    }

    turdus_config_init();
    turdusRuntimeConfig rc = *turdus_config_get();

    const char* cfg_path = cli.config_path ? cli.config_path : turdus_user_config_default_path();
    if (cfg_path) {
        turdusUserConfig ucfg;
        if (turdus_user_config_load(cfg_path, &ucfg) == 0) {
            turdus_user_config_apply(&ucfg, &rc);
            LOG_DEBUG("Loaded user config %s\n", cfg_path);
        } else if (cli.config_path) {
            LOG_ERROR("Cannot read config file '%s'\n", cfg_path);
            return TURDUS_EXIT_FAILURE;
        }
    }
    if (turdus_cli_apply(&cli, &rc) != TURDUS_OK) {
        return TURDUS_EXIT_FAILURE;
    }
    turdus_log_set_level(rc.log_level);

    if (cli.command == TURDUS_CMD_PRINT_CONFIG) {
        print_effective_config(&rc);
        return TURDUS_EXIT_OK;
    }

    signal(SIGINT, turdus_sighandler);
    signal(SIGTERM, turdus_sighandler);
    return process_file(&cli, &rc);
}
