#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace pv::config {

constexpr static uintmax_t MAX_UPLOAD_SIZE_BYTES = 200 * 1024 * 1024; // 200MB
constexpr static size_t MIN_CANDIDATE_BYTES = 50 * 1024;               // 50KB
constexpr static size_t MIN_SOURCE_BYTES = 500 * 1024;                 // 500KB

struct IngestConfig {
    uintmax_t max_upload_size_bytes = MAX_UPLOAD_SIZE_BYTES;
    std::vector<std::string> allowed_extensions = {".dng", ".jpg", ".jpeg", ".webp", ".png"};
    std::vector<std::string> raw_extensions = {".dng"};
    size_t min_candidate_bytes = MIN_CANDIDATE_BYTES;
    size_t min_source_bytes = MIN_SOURCE_BYTES;
    double aspect_min = 1.8;
    double aspect_max = 2.2;
};

struct RenditionConfig {
    int max_width = 0;
    int max_height = 0;
    int quality = 85;
    bool clamp_to_source = true;
};

// Labels are fixed; only the boxes and qualities are tunable.
struct RenditionsConfig {
    RenditionConfig high{4096, 2048, 85, true};
    RenditionConfig medium{2048, 1024, 85, true};
    RenditionConfig low{512, 256, 60, false};
};

struct StorageConfig {
    std::string endpoint;
    std::string region = "auto";
    std::string bucket;
    std::string access_key;
    std::string public_base_url;
    std::string key_prefix = "panoramas";
    std::string credential_env = "PANOVAULT_S3_SECRET";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum panovault = spdlog::level::info;   // startup, shutdown, config
    spdlog::level::level_enum ingest    = spdlog::level::info;   // stage transitions, extraction decisions
    spdlog::level::level_enum render    = spdlog::level::info;   // dimensions, per-rendition sizes
    spdlog::level::level_enum storage   = spdlog::level::info;   // sink mode, object writes, S3 failures
    spdlog::level::level_enum cli       = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/panovault";
    bool file_logging = false;
    LogLevelsConfig levels;
};

struct Config {
    IngestConfig ingest;
    RenditionsConfig renditions;
    StorageConfig storage;
    LoggingConfig logging;
};

// Lower-cased with exactly one leading dot, so "JPG" and ".Jpg" both become ".jpg".
// Throws std::runtime_error when nothing but dots and whitespace remains.
std::string normalizeExtension(const std::string& ext);

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

}
