#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string app_log_path() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_NAME).string();
    return path;
}

inline void app_log(const std::string& msg) {
    std::ofstream out(app_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

inline void app_log_cmd(const std::string& label, const std::string& cmd,
                        const CommandResult& r) {
    app_log(fmt::format("{} CMD: {}", label, cmd));
    app_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_status,
                        r.stdout_data.size(), r.stdout_data.substr(0, LOG_TRUNCATE_CHARS)));
    if (!r.stderr_data.empty())
        app_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, LOG_TRUNCATE_CHARS)));
    if (r.transport_failed())
        app_log(fmt::format("{} transport error: {}", label, r.error));
}

template <typename T>
inline void app_log_error(const std::string& label, const Result<T>& r) {
    app_log(fmt::format("{} failed [{}]: {}", label, error_kind_name(r.kind), r.error));
}
