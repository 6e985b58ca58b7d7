#pragma once

#include "config/Config.hpp"
#include "ingest/BinaryScanner.hpp"
#include "ingest/types.hpp"

#include <string>
#include <vector>

namespace pv::ingest {

class SourceExtractor {
public:
    static constexpr const auto* kEmbeddedPreviewWarning =
        "DNG wurde über eingebettetes JPEG-Preview verarbeitet. "
        "Für volle RAW-Qualität bitte das exportierte JPEG/TIFF hochladen.";

    explicit SourceExtractor(config::IngestConfig cfg);

    // RAW containers yield their largest embedded JPEG, anything else passes
    // through untouched. Throws IngestError (NoDecodableImage, UnreadableImage).
    [[nodiscard]] ExtractedImage extract(std::vector<uint8_t> raw, const std::string& filename) const;

    [[nodiscard]] bool isRawContainer(const std::string& filename) const;

private:
    config::IngestConfig cfg_;
    BinaryScanner scanner_;
};

}
