#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace pv::config { struct LoggingConfig; }

namespace pv::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Console-only loggers, no file sink.
    static void initForTesting();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> panovault() { return get("panovault"); }
    static std::shared_ptr<spdlog::logger> ingest()    { return get("ingest"); }
    static std::shared_ptr<spdlog::logger> render()    { return get("render"); }
    static std::shared_ptr<spdlog::logger> storage()   { return get("storage"); }
    static std::shared_ptr<spdlog::logger> cli()       { return get("cli"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
