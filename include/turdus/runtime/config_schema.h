// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Configuration key schema and validation diagnostics.
 *
 * Describes every INI key the loader understands so validation can report
 * unknown keys, type mismatches and out-of-range values with line numbers.
 */

#ifndef TURDUS_RUNTIME_CONFIG_SCHEMA_H
#define TURDUS_RUNTIME_CONFIG_SCHEMA_H

#include <stdio.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Value types for configuration keys.
 */
typedef enum {
    TURDUS_CFG_TYPE_INT = 0,       /**< Integer, optionally range-checked */
    TURDUS_CFG_TYPE_ENUM,          /**< One of a pipe-separated list */
    TURDUS_CFG_TYPE_ENCODE_PRESET, /**< Encode preset id or index */
    TURDUS_CFG_TYPE_DECODE_PRESET  /**< Decode preset id or index */
} turdus_cfg_type_t;

/**
 * @brief Schema entry describing a single configuration key.
 */
typedef struct {
    const char* section;     /**< Section name (e.g., "encode") */
    const char* key;         /**< Key name (e.g., "preset") */
    const char* description; /**< Human-readable description */
    const char* default_str; /**< Default value as string */
    const char* allowed;     /**< Pipe-separated allowed values (for ENUM) */
    turdus_cfg_type_t type;  /**< Value type */
    int min_val;             /**< Minimum value (for INT type) */
    int max_val;             /**< Maximum value (for INT type, 0 = no range) */
} turdus_cfg_schema_entry_t;

/**
 * @brief Diagnostic severity levels.
 */
typedef enum {
    TURDUS_CFG_DIAG_INFO = 0, /**< Informational */
    TURDUS_CFG_DIAG_WARNING,  /**< Unknown key/section, out of range */
    TURDUS_CFG_DIAG_ERROR     /**< Malformed line, bad value */
} turdus_cfg_diag_level_t;

/**
 * @brief Single diagnostic message from config validation.
 */
typedef struct {
    turdus_cfg_diag_level_t level; /**< Severity level */
    int line_number;               /**< Line number in config file (0 if N/A) */
    char section[64];              /**< Section name where issue occurred */
    char key[64];                  /**< Key name where issue occurred */
    char message[256];             /**< Human-readable diagnostic message */
} turdus_cfg_diagnostic_t;

/**
 * @brief Collection of diagnostic messages from validation.
 */
typedef struct {
    turdus_cfg_diagnostic_t* items; /**< Array of diagnostics (heap-allocated) */
    int count;                      /**< Number of diagnostics */
    int capacity;                   /**< Allocated capacity */
    int error_count;                /**< Number of error-level diagnostics */
    int warning_count;              /**< Number of warning-level diagnostics */
} turdus_cfg_diagnostics_t;

int turdus_cfg_schema_count(void);
const turdus_cfg_schema_entry_t* turdus_cfg_schema_get(int index);

/**
 * @brief Find a schema entry by section and key name (case-insensitive).
 * @return Pointer to schema entry, or NULL if not found.
 */
const turdus_cfg_schema_entry_t* turdus_cfg_schema_find(const char* section, const char* key);

/**
 * @brief Check whether any schema entry lives in `section`.
 */
int turdus_cfg_schema_has_section(const char* section);

void turdus_cfg_diags_init(turdus_cfg_diagnostics_t* diags);

/**
 * @brief Add a diagnostic message to the collection.
 * @param diags Diagnostics collection.
 * @param level Severity level.
 * @param line Line number (0 if not applicable).
 * @param section Section name (may be empty).
 * @param key Key name (may be empty).
 * @param message Diagnostic message.
 */
void turdus_cfg_diags_add(turdus_cfg_diagnostics_t* diags, turdus_cfg_diag_level_t level, int line,
                          const char* section, const char* key, const char* message);

void turdus_cfg_diags_free(turdus_cfg_diagnostics_t* diags);

/**
 * @brief Print diagnostics to a stream, one per line.
 * @param path Config file path for context (may be NULL).
 */
void turdus_cfg_diags_print(const turdus_cfg_diagnostics_t* diags, FILE* stream, const char* path);

/**
 * @brief Validate an INI file against the schema.
 *
 * Errors: unreadable file, malformed section header or line, bad integer,
 * enum or preset value. Warnings: unknown section or key, integer out of
 * range.
 *
 * @param path Config file path.
 * @param diags [out] Initialized here; free with turdus_cfg_diags_free().
 * @return 0 when no errors were found, -1 otherwise.
 */
int turdus_user_config_validate(const char* path, turdus_cfg_diagnostics_t* diags);

#ifdef __cplusplus
}
#endif

#endif /* TURDUS_RUNTIME_CONFIG_SCHEMA_H */
