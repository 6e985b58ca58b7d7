#pragma once

#include "storage/Sink.hpp"
#include "storage/Catalog.hpp"
#include "storage/ObjectStore.hpp"

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace pv::storage {

struct ProbeStep {
    std::string step;
    bool ok{false};
    std::string details;
};

struct ProbeReport {
    std::vector<ProbeStep> steps;

    [[nodiscard]] bool ok() const;
};

void to_json(nlohmann::json& j, const ProbeStep& s);
void to_json(nlohmann::json& j, const ProbeReport& r);

class PersistentSink final : public StorageSink {
public:
    PersistentSink(std::shared_ptr<ObjectStore> store, std::string keyPrefix);

    [[nodiscard]] SinkMode mode() const override { return SinkMode::Persistent; }

    // All-or-nothing: on a failed write the objects already written for this
    // panorama are deleted before IngestError(StorageUnavailable) is thrown.
    std::map<std::string, std::string> store(const std::string& panoramaId,
                                             const std::vector<ingest::RenderedAsset>& assets) const override;

    [[nodiscard]] Catalog list() const;

    // Credential check, listing, then write, read back through the public URL
    // and delete a scratch object
    [[nodiscard]] ProbeReport probe() const;

    [[nodiscard]] const std::string& keyPrefix() const { return keyPrefix_; }

private:
    std::shared_ptr<ObjectStore> store_;
    std::string keyPrefix_;

    void rollback(const std::vector<std::filesystem::path>& written) const;
};

}
