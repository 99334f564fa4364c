// logger.h - logging setup around spdlog
#pragma once

#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace fakehub::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Log directory from FAKEHUB_LOG_DIR; nullopt disables the file sink.
std::optional<std::string> get_log_dir();

// Today's log file path inside log_dir (fakehub.jsonl.YYYY-MM-DD).
std::string get_log_file_path(const std::string& log_dir);

// Retention days from FAKEHUB_LOG_RETENTION_DAYS (default: 7).
int get_retention_days();

// Remove fakehub.jsonl.* files dated before today - retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Install the default "fakehub" logger. Without a file path or extra sinks
// it logs to stdout. additional_sinks is mainly for tests (ostream sinks).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// Initialize from environment variables:
// FAKEHUB_LOG_LEVEL (trace|debug|info|warn|error|critical|off)
// FAKEHUB_LOG_DIR (adds a daily JSON-lines file sink)
// FAKEHUB_LOG_RETENTION_DAYS (default: 7)
void init_from_env();

}  // namespace fakehub::logger
