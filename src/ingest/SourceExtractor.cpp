#include "ingest/SourceExtractor.hpp"
#include "ingest/Error.hpp"
#include "preview/image.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <utility>

using namespace pv::ingest;
using pv::log::Registry;

namespace image = pv::preview::image;

std::string_view pv::ingest::to_string(const SourceKind kind) {
    return kind == SourceKind::EmbeddedPreview ? "EmbeddedPreview" : "DirectImage";
}

SourceExtractor::SourceExtractor(config::IngestConfig cfg)
: cfg_(std::move(cfg)), scanner_(cfg_.min_candidate_bytes) {}

bool SourceExtractor::isRawContainer(const std::string& filename) const {
    const auto ext = util::extensionOf(filename);
    return !ext.empty() && std::ranges::find(cfg_.raw_extensions, ext) != cfg_.raw_extensions.end();
}

ExtractedImage SourceExtractor::extract(std::vector<uint8_t> raw, const std::string& filename) const {
    ExtractedImage out;

    if (!isRawContainer(filename)) {
        if (image::sniff(raw) == image::Format::Unknown) {
            Registry::ingest()->warn("[SourceExtractor] {} has no recognised image signature", filename);
            throw IngestError::unreadableImage();
        }
        out.bytes = std::move(raw);
        out.sourceKind = SourceKind::DirectImage;
        return out;
    }

    Registry::ingest()->info("[SourceExtractor] Processing RAW container: {} ({:.2f} MB)",
                             filename, static_cast<double>(raw.size()) / 1024.0 / 1024.0);

    const auto segments = scanner_.findJpegSegments(raw);
    if (segments.empty()) {
        Registry::ingest()->warn("[SourceExtractor] No embedded JPEG >= {} KB in {}",
                                 cfg_.min_candidate_bytes / 1024, filename);
        throw IngestError::noDecodableImage();
    }

    // First of equally sized candidates wins
    const auto largest = std::ranges::max_element(segments, {}, &ByteRange::size);

    if (largest->size() < cfg_.min_source_bytes) {
        Registry::ingest()->warn("[SourceExtractor] Largest embedded JPEG in {} is {} KB, below the {} KB source floor",
                                 filename, largest->size() / 1024, cfg_.min_source_bytes / 1024);
        throw IngestError::noDecodableImage();
    }

    Registry::ingest()->info("[SourceExtractor] Found embedded JPEG: {:.2f} MB at offset {} ({} candidate(s))",
                             static_cast<double>(largest->size()) / 1024.0 / 1024.0, largest->start, segments.size());

    out.bytes.assign(raw.begin() + static_cast<std::ptrdiff_t>(largest->start),
                     raw.begin() + static_cast<std::ptrdiff_t>(largest->end));
    out.sourceKind = SourceKind::EmbeddedPreview;
    out.warnings.emplace_back(kEmbeddedPreviewWarning);
    return out;
}
