#include "storage/Catalog.hpp"
#include "storage/Sink.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <map>

using namespace pv::storage;

std::time_t PanoramaEntry::newestUpload() const {
    std::time_t newest = 0;
    for (const auto& f : files) newest = std::max(newest, f.uploaded_at);
    return newest;
}

Catalog pv::storage::buildCatalog(const std::vector<ObjectInfo>& objects,
                                  const std::string& keyPrefix,
                                  const std::function<std::string(const std::string& key)>& urlFor) {
    Catalog catalog;
    catalog.totalObjects = objects.size();

    const std::string prefix = keyPrefix.empty() ? std::string{} : keyPrefix + "/";
    const std::string suffix = "." + std::string(kRenditionExtension);

    std::map<std::string, PanoramaEntry> byId;

    for (const auto& obj : objects) {
        if (!obj.key.starts_with(prefix)) continue;

        const std::string rest = obj.key.substr(prefix.size());
        const auto slash = rest.find('/');
        if (slash == std::string::npos || slash == 0) continue;

        const std::string id = rest.substr(0, slash);
        std::string fileName = rest.substr(slash + 1);
        if (fileName.empty() || fileName.find('/') != std::string::npos) continue;
        if (fileName.ends_with(suffix)) fileName.resize(fileName.size() - suffix.size());

        auto& entry = byId[id];
        entry.id = id;
        entry.files.push_back({
            .resolution = std::move(fileName),
            .url = urlFor(obj.key),
            .size = obj.size,
            .uploaded_at = obj.last_modified
        });
        entry.totalSize += obj.size;
    }

    catalog.panoramas.reserve(byId.size());
    for (auto& [_, entry] : byId) catalog.panoramas.push_back(std::move(entry));

    std::ranges::sort(catalog.panoramas, [](const PanoramaEntry& a, const PanoramaEntry& b) {
        if (a.newestUpload() != b.newestUpload()) return a.newestUpload() > b.newestUpload();
        return a.id > b.id;
    });

    return catalog;
}

void pv::storage::to_json(nlohmann::json& j, const PanoramaFile& f) {
    j = {
        {"resolution", f.resolution},
        {"url", f.url},
        {"size", f.size},
        {"uploadedAt", util::timestampToString(f.uploaded_at)}
    };
}

void pv::storage::to_json(nlohmann::json& j, const PanoramaEntry& e) {
    j = {
        {"id", e.id},
        {"files", e.files},
        {"totalSize", e.totalSize}
    };
}

void pv::storage::to_json(nlohmann::json& j, const Catalog& c) {
    j = {
        {"success", true},
        {"count", c.panoramas.size()},
        {"totalObjects", c.totalObjects},
        {"panoramas", c.panoramas}
    };
}
