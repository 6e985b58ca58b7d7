#include "storage/Sink.hpp"
#include "storage/InlineSink.hpp"
#include "storage/PersistentSink.hpp"
#include "storage/s3/S3Controller.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace pv::storage;
using pv::log::Registry;

std::string_view pv::storage::to_string(const SinkMode mode) {
    return mode == SinkMode::Persistent ? "persistent" : "inline";
}

std::filesystem::path pv::storage::objectKey(const std::string& keyPrefix, const std::string& panoramaId,
                                             const std::string& label) {
    std::filesystem::path key;
    if (!keyPrefix.empty()) key /= keyPrefix;
    key /= panoramaId;
    key /= label + "." + std::string(kRenditionExtension);
    return key;
}

std::optional<std::string> pv::storage::credentialFromEnv(const config::StorageConfig& cfg) {
    if (cfg.credential_env.empty()) return std::nullopt;
    const char* value = std::getenv(cfg.credential_env.c_str());
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

std::unique_ptr<StorageSink> pv::storage::makeSink(const config::StorageConfig& cfg,
                                                   const std::optional<std::string>& secret) {
    if (!secret) {
        Registry::storage()->info("[Sink] No storage credential in ${}, using inline data URIs", cfg.credential_env);
        return std::make_unique<InlineSink>();
    }

    if (cfg.endpoint.empty() || cfg.bucket.empty())
        throw std::runtime_error("Storage credential is set but storage.endpoint or storage.bucket is missing");

    Registry::storage()->info("[Sink] Using object storage {} (bucket: {})", cfg.endpoint, cfg.bucket);

    auto store = std::make_shared<s3::S3Controller>(
        s3::APIKey{cfg.access_key, *secret, cfg.region, cfg.endpoint}, cfg.bucket, cfg.public_base_url);
    return std::make_unique<PersistentSink>(std::move(store), cfg.key_prefix);
}
