#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace pv::config;

template<>
struct convert<IngestConfig> {
    static Node encode(const IngestConfig& rhs) {
        Node node;
        node["max_upload_size_mb"] = rhs.max_upload_size_bytes / (1024 * 1024);
        node["allowed_extensions"] = rhs.allowed_extensions;
        node["raw_extensions"] = rhs.raw_extensions;
        node["min_candidate_kb"] = rhs.min_candidate_bytes / 1024;
        node["min_source_kb"] = rhs.min_source_bytes / 1024;
        node["aspect_min"] = rhs.aspect_min;
        node["aspect_max"] = rhs.aspect_max;
        return node;
    }

    static bool decode(const Node& node, IngestConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_upload_size_bytes = node["max_upload_size_mb"].as<uintmax_t>(200) * 1024 * 1024; // Default 200MB
        const auto extensions = [&](const char* key, std::vector<std::string>& out) {
            if (!node[key]) return;
            out.clear();
            for (const auto& ext : node[key].as<std::vector<std::string>>()) out.push_back(normalizeExtension(ext));
        };
        extensions("allowed_extensions", rhs.allowed_extensions);
        extensions("raw_extensions", rhs.raw_extensions);
        rhs.min_candidate_bytes = node["min_candidate_kb"].as<size_t>(50) * 1024;
        rhs.min_source_bytes = node["min_source_kb"].as<size_t>(500) * 1024;
        rhs.aspect_min = node["aspect_min"].as<double>(rhs.aspect_min);
        rhs.aspect_max = node["aspect_max"].as<double>(rhs.aspect_max);
        return true;
    }
};

template<>
struct convert<RenditionConfig> {
    static Node encode(const RenditionConfig& rhs) {
        Node node;
        node["max_width"] = rhs.max_width;
        node["max_height"] = rhs.max_height;
        node["quality"] = rhs.quality;
        node["clamp_to_source"] = rhs.clamp_to_source;
        return node;
    }

    static bool decode(const Node& node, RenditionConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_width = node["max_width"].as<int>(rhs.max_width);
        rhs.max_height = node["max_height"].as<int>(rhs.max_height);
        rhs.quality = node["quality"].as<int>(rhs.quality);
        rhs.clamp_to_source = node["clamp_to_source"].as<bool>(rhs.clamp_to_source);
        return true;
    }
};

template<>
struct convert<RenditionsConfig> {
    static Node encode(const RenditionsConfig& rhs) {
        Node node;
        node["high"] = rhs.high;
        node["medium"] = rhs.medium;
        node["low"] = rhs.low;
        return node;
    }

    static bool decode(const Node& node, RenditionsConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["high"]) convert<RenditionConfig>::decode(node["high"], rhs.high);
        if (node["medium"]) convert<RenditionConfig>::decode(node["medium"], rhs.medium);
        if (node["low"]) convert<RenditionConfig>::decode(node["low"], rhs.low);
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["endpoint"] = rhs.endpoint;
        node["region"] = rhs.region;
        node["bucket"] = rhs.bucket;
        node["access_key"] = rhs.access_key;
        node["public_base_url"] = rhs.public_base_url;
        node["key_prefix"] = rhs.key_prefix;
        node["credential_env"] = rhs.credential_env;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.endpoint = node["endpoint"].as<std::string>("");
        rhs.region = node["region"].as<std::string>("auto");
        rhs.bucket = node["bucket"].as<std::string>("");
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.public_base_url = node["public_base_url"].as<std::string>("");
        rhs.key_prefix = node["key_prefix"].as<std::string>("panoramas");
        rhs.credential_env = node["credential_env"].as<std::string>("PANOVAULT_S3_SECRET");
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["panovault"] = to_std_string(spdlog::level::to_string_view(rhs.panovault));
        node["ingest"]    = to_std_string(spdlog::level::to_string_view(rhs.ingest));
        node["render"]    = to_std_string(spdlog::level::to_string_view(rhs.render));
        node["storage"]   = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["cli"]       = to_std_string(spdlog::level::to_string_view(rhs.cli));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.panovault = spdlog::level::from_str(node["panovault"].as<std::string>("info"));
        rhs.ingest = spdlog::level::from_str(node["ingest"].as<std::string>("info"));
        rhs.render = spdlog::level::from_str(node["render"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("info"));
        rhs.cli = spdlog::level::from_str(node["cli"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["file_logging"] = rhs.file_logging;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/panovault");
        rhs.file_logging = node["file_logging"].as<bool>(false);
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
