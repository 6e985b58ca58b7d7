#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace pv::config {

namespace {

Config fromRoot(const YAML::Node& root) {
    Config cfg;

    if (auto node = root["ingest"]) YAML::convert<IngestConfig>::decode(node, cfg.ingest);
    if (auto node = root["renditions"]) YAML::convert<RenditionsConfig>::decode(node, cfg.renditions);
    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

}

std::string normalizeExtension(const std::string& ext) {
    const auto first = ext.find_first_not_of(" \t.");
    const auto last = ext.find_last_not_of(" \t");
    if (first == std::string::npos || last < first)
        throw std::runtime_error("Invalid file extension in config: '" + ext + "'");

    std::string out = "." + ext.substr(first, last - first + 1);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return std::tolower(c); });
    return out;
}

Config loadConfig(const std::filesystem::path& path) {
    return fromRoot(YAML::LoadFile(path.string()));
}

Config loadConfigFromString(const std::string& yaml) {
    if (yaml.empty()) return {};
    return fromRoot(YAML::Load(yaml));
}

}
