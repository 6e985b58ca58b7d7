#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace pv::log {

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    const auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(cnf.levels.console_log_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern(LOG_FORMAT);
    sinks.push_back(consoleSink);

    if (cnf.file_logging) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);

        const auto log_file = cnf.log_dir / "panovault.log";
        const auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file.string(), main_max_bytes_, main_max_files_);
        rotatingSink->set_level(cnf.levels.file_log_level);
        rotatingSink->set_pattern(LOG_FORMAT);
        sinks.push_back(rotatingSink);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;

    makeLogger("panovault", sub_levels.panovault);
    makeLogger("ingest", sub_levels.ingest);
    makeLogger("render", sub_levels.render);
    makeLogger("storage", sub_levels.storage);
    makeLogger("cli", sub_levels.cli);

    initialized_ = true;
    panovault()->debug("[log::Registry] Initialized (file logging: {})", cnf.file_logging);
}

void Registry::initForTesting() {
    config::LoggingConfig cnf;
    cnf.file_logging = false;
    cnf.levels.console_log_level = spdlog::level::warn;
    cnf.levels.subsystem_levels = {
        .panovault = spdlog::level::debug,
        .ingest = spdlog::level::debug,
        .render = spdlog::level::debug,
        .storage = spdlog::level::debug,
        .cli = spdlog::level::debug,
    };
    init(cnf);
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
