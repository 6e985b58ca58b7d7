#pragma once

#include "ingest/types.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pv::config { struct StorageConfig; }

namespace pv::storage {

enum class SinkMode { Inline, Persistent };

std::string_view to_string(SinkMode mode);

inline constexpr std::string_view kRenditionContentType = "image/webp";
inline constexpr std::string_view kRenditionExtension = "webp";

class StorageSink {
public:
    virtual ~StorageSink() = default;

    [[nodiscard]] virtual SinkMode mode() const = 0;

    // Returns label -> URL for every asset. Persistent backends throw
    // std::runtime_error when the write is rejected.
    virtual std::map<std::string, std::string> store(const std::string& panoramaId,
                                                     const std::vector<ingest::RenderedAsset>& assets) const = 0;
};

// {keyPrefix}/{panoramaId}/{label}.webp
std::filesystem::path objectKey(const std::string& keyPrefix, const std::string& panoramaId, const std::string& label);

// Value of the environment variable named by cfg.credential_env, if set and non-empty
std::optional<std::string> credentialFromEnv(const config::StorageConfig& cfg);

// Persistent sink when a secret is supplied, inline data URIs otherwise
std::unique_ptr<StorageSink> makeSink(const config::StorageConfig& cfg, const std::optional<std::string>& secret);

}
