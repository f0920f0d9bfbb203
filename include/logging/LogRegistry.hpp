#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cairn::config {
struct LoggingConfig;
} // namespace cairn::config

namespace cairn::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels from the registered config.
    static void init();
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name. Falls back to spdlog's default logger until init() ran.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> cairn()   { return get("cairn"); }
    static std::shared_ptr<spdlog::logger> storage() { return get("storage"); }
    static std::shared_ptr<spdlog::logger> fs()      { return get("filesystem"); }
    static std::shared_ptr<spdlog::logger> cloud()   { return get("cloud"); }
    static std::shared_ptr<spdlog::logger> config()  { return get("config"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

} // namespace cairn::logging
