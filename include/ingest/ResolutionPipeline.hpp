#pragma once

#include "config/Config.hpp"
#include "ingest/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pv::ingest {

// high, medium, low from the rendition config, in that order
std::vector<ResolutionSpec> resolutionSpecs(const config::RenditionsConfig& cfg);

class ResolutionPipeline {
public:
    ResolutionPipeline(config::IngestConfig ingestCfg, const config::RenditionsConfig& renditions);

    // Decodes once and emits one WebP per ResolutionSpec. Throws IngestError
    // (UnreadableImage, DegenerateGeometry).
    [[nodiscard]] Rendering render(const ExtractedImage& source) const;

    // Advisory text when width/height falls outside the accepted band
    [[nodiscard]] std::optional<std::string> aspectWarning(int width, int height) const;

    [[nodiscard]] const std::vector<ResolutionSpec>& specs() const { return specs_; }

private:
    config::IngestConfig cfg_;
    std::vector<ResolutionSpec> specs_;
};

}
