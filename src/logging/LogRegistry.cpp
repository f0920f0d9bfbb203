#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace cairn::logging {

void LogRegistry::init() {
    init(config::ConfigRegistry::get().logging);
}

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);
    sinks.push_back(console_sink_);

    // main file sink (rotating), only with a log directory
    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);

        const auto logPath = cnf.log_dir / "cairn.log";
        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("cairn",      sub_levels.cairn);
    makeLogger("storage",    sub_levels.storage);
    makeLogger("filesystem", sub_levels.filesystem);
    makeLogger("cloud",      sub_levels.cloud);
    makeLogger("config",     sub_levels.config);

    initialized_ = true;
    get("cairn")->info("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    if (!initialized_) return spdlog::default_logger();
    auto logger = spdlog::get(name);
    if (!logger) throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

} // namespace cairn::logging
