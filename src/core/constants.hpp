#pragma once

#include <cstddef>

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_BASE_TIMEOUT_SECS  = 60;     // Base deadline for one command
constexpr int DEFAULT_TIMEOUT_CEILING_SECS = 3600; // No request may run longer
constexpr int TERMINATE_GRACE_MS         = 2000;   // SIGTERM -> SIGKILL window
constexpr int ORPHAN_DRAIN_MS            = 500;    // Pipe drain after the leader exits
constexpr int POLL_SLICE_MS              = 50;     // Max wait per poll() round
constexpr int MAX_TIMEOUT_SECS           = 2147483; // deadline in ms must fit an int

// ── Multipliers ─────────────────────────────────────────────
constexpr int NPM_TIMEOUT_MULTIPLIER       = 3;    // installs are slow
constexpr int PYTHON_TIMEOUT_MULTIPLIER    = 2;
constexpr int TERRAFORM_TIMEOUT_MULTIPLIER = 10;   // provisioning runs long
constexpr int GIT_TIMEOUT_MULTIPLIER       = 1;
constexpr int GENERIC_TIMEOUT_MULTIPLIER   = 1;

// ── Buffer sizes ────────────────────────────────────────────
constexpr size_t PIPE_READ_BUF_SIZE      = 4096;
constexpr size_t DEFAULT_MAX_OUTPUT_BYTES = 10 * 1024 * 1024;  // per stream

// ── Exit codes for the CLI ──────────────────────────────────
constexpr int EXIT_REJECTED = 1;
constexpr int EXIT_TIMED_OUT = 124;
constexpr int EXIT_SPAWN_ERROR = 127;

// ── Files ───────────────────────────────────────────────────
constexpr const char* PROJECT_CONFIG_FILE = "cmdgate.yaml";
constexpr const char* GLOBAL_CONFIG_DIR   = ".cmdgate";
constexpr const char* GLOBAL_CONFIG_FILE  = "config.yaml";
constexpr const char* DEFAULT_LOG_FILE    = "cmdgate.log";
