#pragma once

// ── SSH transport ───────────────────────────────────────────
constexpr int SSH_PORT                   = 22;
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP connect + handshake
constexpr int SSH_SOCKET_WAIT_MS         = 1000;  // One socket wait between EAGAINs
constexpr int SSH_KEEPALIVE_SECS         = 30;
constexpr const char* SSH_PTY_TERM       = "xterm";
constexpr int SSH_PTY_WIDTH              = 80;
constexpr int SSH_PTY_HEIGHT             = 40;
constexpr unsigned SSH_PTY_BAUD          = 14400;

// Reported when the remote gave no exit code, or the command never ran
constexpr int STATUS_MISSING             = 1;
constexpr int STATUS_COMMAND_FAILED      = 1;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 16384;
constexpr int SSH_WRITE_CHUNK_SIZE       = 32768;
constexpr int LOG_TRUNCATE_CHARS         = 500;

// ── Control plane ───────────────────────────────────────────
constexpr const char* AWS_CLI_PROGRAM    = "aws";

// ── Local files ─────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME    = "awsrender";
constexpr const char* DEFAULTS_FILE_NAME = "defaults.yaml";
constexpr const char* DEBUG_LOG_NAME     = "awsrender_debug.log";

// ── Remote job layout ───────────────────────────────────────
constexpr const char* RUN_SCRIPT_NAME    = "run.sh";
constexpr const char* RESULT_FILE_PREFIX = "awsrender-";   // in the remote $HOME
constexpr const char* RESULT_FILE_SUFFIX = ".result";

constexpr const char* AWSRENDER_VERSION  = "1.1.0";
