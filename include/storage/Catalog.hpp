#pragma once

#include "storage/ObjectStore.hpp"

#include <ctime>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace pv::storage {

struct PanoramaFile {
    std::string resolution;   // high, medium, low
    std::string url;
    uintmax_t size{0};
    std::time_t uploaded_at{0};
};

struct PanoramaEntry {
    std::string id;
    std::vector<PanoramaFile> files;
    uintmax_t totalSize{0};

    [[nodiscard]] std::time_t newestUpload() const;
};

struct Catalog {
    std::vector<PanoramaEntry> panoramas;   // newest first
    size_t totalObjects{0};
};

// Groups {prefix}/{id}/{resolution}.webp keys by id; keys of any other
// shape are counted but not listed.
Catalog buildCatalog(const std::vector<ObjectInfo>& objects,
                     const std::string& keyPrefix,
                     const std::function<std::string(const std::string& key)>& urlFor);

void to_json(nlohmann::json& j, const PanoramaFile& f);
void to_json(nlohmann::json& j, const PanoramaEntry& e);
void to_json(nlohmann::json& j, const Catalog& c);

}
