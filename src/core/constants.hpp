#pragma once

// ── Identity ────────────────────────────────────────────────
constexpr const char* KANRI_VERSION = "0.4.0";

// ── Environment ─────────────────────────────────────────────
constexpr const char* ENV_PROJECT    = "KANRI_PROJECT";     // set for template commands
constexpr const char* ENV_SESSION    = "KANRI_SESSION";     // set for `open --shell`
constexpr const char* ENV_CONFIG_DIR = "KANRI_CONFIG_DIR";  // overrides the config directory
constexpr const char* ENV_NO_COLOR   = "NO_COLOR";

// ── Files ───────────────────────────────────────────────────
constexpr const char* CONFIG_FILE_NAME    = "config.yaml";
constexpr const char* TEMPLATES_FILE_NAME = "templates.yaml";
constexpr const char* IGNORE_FILE_NAME    = ".ignore";
constexpr const char* DEFAULT_BACKUP_FILE = "kanri_backup.tar";
constexpr const char* CONFIG_VERSION      = "1";

// ── Name resolution ─────────────────────────────────────────
constexpr const char* RECENT_SENTINEL = "-";
constexpr const char* DEFAULT_PROFILE = "default";
