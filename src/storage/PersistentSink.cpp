#include "storage/PersistentSink.hpp"
#include "ingest/Error.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

using namespace pv::storage;
using pv::log::Registry;

bool ProbeReport::ok() const {
    return !steps.empty() && std::ranges::all_of(steps, &ProbeStep::ok);
}

void pv::storage::to_json(nlohmann::json& j, const ProbeStep& s) {
    j = {
        {"step", s.step},
        {"status", s.ok ? "success" : "error"},
        {"details", s.details}
    };
}

void pv::storage::to_json(nlohmann::json& j, const ProbeReport& r) {
    j = {
        {"success", r.ok()},
        {"results", r.steps}
    };
}

PersistentSink::PersistentSink(std::shared_ptr<ObjectStore> store, std::string keyPrefix)
: store_(std::move(store)), keyPrefix_(std::move(keyPrefix)) {
    if (!store_) throw std::invalid_argument("PersistentSink requires an object store");
    while (!keyPrefix_.empty() && keyPrefix_.back() == '/') keyPrefix_.pop_back();
}

std::map<std::string, std::string> PersistentSink::store(const std::string& panoramaId,
                                                         const std::vector<ingest::RenderedAsset>& assets) const {
    std::map<std::string, std::string> urls;
    std::vector<std::filesystem::path> written;

    for (const auto& asset : assets) {
        const auto key = objectKey(keyPrefix_, panoramaId, asset.label);
        try {
            store_->putObject(key, asset.encodedBytes, std::string(kRenditionContentType));
            written.push_back(key);
            urls[asset.label] = store_->publicUrl(key);
        } catch (const std::runtime_error& e) {
            Registry::storage()->error("[PersistentSink] Writing {} failed: {}", key.string(), e.what());
            rollback(written);
            throw ingest::IngestError::storageUnavailable(e.what());
        }

        Registry::storage()->info("[PersistentSink] Stored {} ({} KB)", key.string(), asset.byteSize / 1024);
    }

    return urls;
}

void PersistentSink::rollback(const std::vector<std::filesystem::path>& written) const {
    for (const auto& key : written) {
        try {
            store_->deleteObject(key);
            Registry::storage()->info("[PersistentSink] Rolled back {}", key.string());
        } catch (const std::runtime_error& e) {
            Registry::storage()->warn("[PersistentSink] Could not roll back {}: {}", key.string(), e.what());
        }
    }
}

Catalog PersistentSink::list() const {
    const auto prefix = keyPrefix_.empty() ? std::string{} : keyPrefix_ + "/";
    const auto objects = store_->listObjects(prefix);

    auto catalog = buildCatalog(objects, keyPrefix_, [this](const std::string& key) {
        return store_->publicUrl(key);
    });

    Registry::storage()->debug("[PersistentSink] Listed {} panorama(s) from {} object(s)",
                               catalog.panoramas.size(), catalog.totalObjects);
    return catalog;
}

ProbeReport PersistentSink::probe() const {
    ProbeReport report;

    const auto creds = store_->validateAPICredentials();
    report.steps.push_back({"credentials", creds.ok, creds.msg});
    if (!creds.ok) return report;

    try {
        const auto objects = store_->listObjects(keyPrefix_.empty() ? std::string{} : keyPrefix_ + "/");
        report.steps.push_back({"list", true, fmt::format("{} object(s) found", objects.size())});
    } catch (const std::runtime_error& e) {
        report.steps.push_back({"list", false, e.what()});
    }

    const std::filesystem::path scratchKey = fmt::format("test/verification-{}.txt", util::unixMillis());
    const std::string content = "Test file created at " + util::timestampToString(std::time(nullptr));

    try {
        store_->putObject(scratchKey, std::vector<uint8_t>(content.begin(), content.end()), "text/plain");
        report.steps.push_back({"upload", true, store_->publicUrl(scratchKey)});
    } catch (const std::runtime_error& e) {
        report.steps.push_back({"upload", false, e.what()});
        return report;
    }

    try {
        const std::string received = store_->fetchPublic(scratchKey);
        if (received == content)
            report.steps.push_back({"verify", true, fmt::format("Content matches ({} bytes)", received.size())});
        else
            report.steps.push_back({"verify", false, fmt::format("Content mismatch: expected {} bytes, received {}",
                                                                 content.size(), received.size())});
    } catch (const std::runtime_error& e) {
        report.steps.push_back({"verify", false, e.what()});
    }

    // Scratch object is removed even when verification failed
    try {
        store_->deleteObject(scratchKey);
        report.steps.push_back({"delete", true, scratchKey.string()});
    } catch (const std::runtime_error& e) {
        report.steps.push_back({"delete", false, e.what()});
    }

    return report;
}
