#include "ingest/ResolutionPipeline.hpp"
#include "ingest/Error.hpp"
#include "preview/image.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

using namespace pv::ingest;
using pv::log::Registry;

namespace image = pv::preview::image;

namespace {

ResolutionSpec toSpec(std::string label, const pv::config::RenditionConfig& r) {
    return {
        .label = std::move(label),
        .maxWidth = r.max_width,
        .maxHeight = r.max_height,
        .quality = r.quality,
        .clampToSource = r.clamp_to_source
    };
}

}

std::vector<ResolutionSpec> pv::ingest::resolutionSpecs(const config::RenditionsConfig& cfg) {
    return {toSpec("high", cfg.high), toSpec("medium", cfg.medium), toSpec("low", cfg.low)};
}

ResolutionPipeline::ResolutionPipeline(config::IngestConfig ingestCfg, const config::RenditionsConfig& renditions)
: cfg_(std::move(ingestCfg)), specs_(resolutionSpecs(renditions)) {
    for (const auto& spec : specs_)
        if (spec.maxWidth <= 0 || spec.maxHeight <= 0 || spec.quality < 0 || spec.quality > 100)
            throw std::invalid_argument(fmt::format("Invalid rendition '{}': {}x{} q{}",
                                                    spec.label, spec.maxWidth, spec.maxHeight, spec.quality));
}

std::optional<std::string> ResolutionPipeline::aspectWarning(const int width, const int height) const {
    const double ratio = static_cast<double>(width) / static_cast<double>(height);
    if (ratio >= cfg_.aspect_min && ratio <= cfg_.aspect_max) return std::nullopt;

    Registry::render()->warn("[ResolutionPipeline] Aspect ratio {:.2f} is not 2:1. Image may not display correctly as 360° panorama.", ratio);
    return fmt::format("Seitenverhältnis ist {:.2f}:1 statt 2:1. "
                       "Das Bild wird möglicherweise nicht korrekt als 360°-Panorama angezeigt.", ratio);
}

Rendering ResolutionPipeline::render(const ExtractedImage& source) const {
    // Header first so corrupt input fails before any pixel work
    const auto dims = image::probe(source.bytes);
    if (!dims) {
        Registry::render()->warn("[ResolutionPipeline] Codec rejected {} byte {} buffer",
                                 source.bytes.size(), image::to_string(image::sniff(source.bytes)));
        throw IngestError::unreadableImage();
    }
    if (dims->width <= 0 || dims->height <= 0) {
        Registry::render()->warn("[ResolutionPipeline] Degenerate geometry {}x{}", dims->width, dims->height);
        throw IngestError::degenerateGeometry();
    }

    Registry::render()->info("[ResolutionPipeline] Image dimensions: {}x{}", dims->width, dims->height);

    Rendering out;
    if (auto warning = aspectWarning(dims->width, dims->height)) out.warnings.push_back(std::move(*warning));

    image::Bitmap bitmap;
    try {
        bitmap = image::decode(source.bytes);
    } catch (const std::runtime_error& e) {
        Registry::render()->warn("[ResolutionPipeline] {}", e.what());
        throw IngestError::unreadableImage();
    }

    const image::Dimensions sourceDims{bitmap.width, bitmap.height};

    for (const auto& spec : specs_) {
        int boxW = spec.maxWidth, boxH = spec.maxHeight;
        if (spec.clampToSource) {
            boxW = std::min(boxW, sourceDims.width);
            boxH = std::min(boxH, sourceDims.height);
        }

        const auto target = image::fit_inside(sourceDims, boxW, boxH);

        RenderedAsset asset;
        asset.label = spec.label;
        asset.width = target.width;
        asset.height = target.height;

        try {
            if (target.width == sourceDims.width && target.height == sourceDims.height) {
                image::compress_to_webp(bitmap.rgb.data(), bitmap.width, bitmap.height, asset.encodedBytes, spec.quality);
            } else {
                const auto resized = image::resize(bitmap, target);
                image::compress_to_webp(resized.rgb.data(), resized.width, resized.height, asset.encodedBytes, spec.quality);
            }
        } catch (const std::runtime_error& e) {
            Registry::render()->error("[ResolutionPipeline] Rendering {} failed: {}", spec.label, e.what());
            throw IngestError::unreadableImage();
        }

        asset.byteSize = asset.encodedBytes.size();

        Registry::render()->info("[ResolutionPipeline] Generated {}: {}x{} ({} KB)",
                                 asset.label, asset.width, asset.height, asset.byteSize / 1024);

        out.assets.push_back(std::move(asset));
    }

    return out;
}
