#pragma once

#include "storage/Sink.hpp"

namespace pv::storage {

// Embeds each rendition as a base64 data URI; needs no backend.
class InlineSink final : public StorageSink {
public:
    [[nodiscard]] SinkMode mode() const override { return SinkMode::Inline; }

    std::map<std::string, std::string> store(const std::string& panoramaId,
                                             const std::vector<ingest::RenderedAsset>& assets) const override;

    static std::string dataUri(const std::vector<uint8_t>& bytes);
};

}
