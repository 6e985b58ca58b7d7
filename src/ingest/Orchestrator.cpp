#include "ingest/Orchestrator.hpp"
#include "ingest/Error.hpp"
#include "ingest/PanoramaId.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

using namespace pv::ingest;
using pv::log::Registry;

std::string_view pv::ingest::to_string(const Stage stage) {
    switch (stage) {
        case Stage::Received: return "Received";
        case Stage::Extracted: return "Extracted";
        case Stage::Rendered: return "Rendered";
        case Stage::Stored: return "Stored";
        case Stage::Complete: return "Complete";
        case Stage::Failed: return "Failed";
    }
    return "Unknown";
}

namespace {

void advance(Stage& stage, const Stage next, const std::string& id) {
    Registry::ingest()->debug("[Orchestrator] {}: {} -> {}", id, to_string(stage), to_string(next));
    stage = next;
}

}

Orchestrator::Orchestrator(const config::Config& cfg, std::unique_ptr<storage::StorageSink> sink)
: cfg_(cfg.ingest), extractor_(cfg.ingest), pipeline_(cfg.ingest, cfg.renditions), sink_(std::move(sink)) {
    if (!sink_) throw std::invalid_argument("Orchestrator requires a storage sink");
    Registry::ingest()->info("[Orchestrator] Using {} storage", storage::to_string(sink_->mode()));
}

void Orchestrator::validate(const RawUpload& upload) const {
    if (upload.bytes.empty()) throw IngestError::emptyUpload();

    const auto ext = util::extensionOf(upload.filename);
    if (ext.empty() || std::ranges::find(cfg_.allowed_extensions, ext) == cfg_.allowed_extensions.end())
        throw IngestError::invalidExtension();

    if (upload.bytes.size() > cfg_.max_upload_size_bytes) throw IngestError::tooLarge(cfg_.max_upload_size_bytes);
}

IngestResult Orchestrator::ingest(RawUpload upload) const {
    IngestResult result;
    result.panoramaId = generatePanoramaId();
    const auto& id = result.panoramaId;

    Stage stage = Stage::Received;
    Registry::ingest()->info("[Orchestrator] {}: received {} ({:.2f} MB)", id, upload.filename,
                             static_cast<double>(upload.bytes.size()) / 1024.0 / 1024.0);

    try {
        validate(upload);

        Rendering rendering;
        {
            ExtractedImage extracted;
            try {
                extracted = extractor_.extract(std::move(upload.bytes), upload.filename);
            } catch (const IngestError&) {
                throw;
            } catch (const std::runtime_error& e) {
                Registry::ingest()->error("[Orchestrator] {}: extraction failed: {}", id, e.what());
                throw IngestError::unreadableImage();
            }
            advance(stage, Stage::Extracted, id);

            result.warnings = extracted.warnings;

            try {
                rendering = pipeline_.render(extracted);
            } catch (const IngestError&) {
                throw;
            } catch (const std::runtime_error& e) {
                Registry::ingest()->error("[Orchestrator] {}: rendering failed: {}", id, e.what());
                throw IngestError::unreadableImage();
            }
        }
        advance(stage, Stage::Rendered, id);

        result.warnings.insert(result.warnings.end(),
                               std::make_move_iterator(rendering.warnings.begin()),
                               std::make_move_iterator(rendering.warnings.end()));

        try {
            result.urls = sink_->store(id, rendering.assets);
        } catch (const IngestError&) {
            throw;
        } catch (const std::runtime_error& e) {
            throw IngestError::storageUnavailable(e.what());
        }
        rendering.assets.clear();
        advance(stage, Stage::Stored, id);
    } catch (const IngestError& e) {
        Registry::ingest()->warn("[Orchestrator] {}: {} -> Failed({}): {}", id, to_string(stage),
                                 to_string(e.kind()), e.what());
        throw;
    }

    advance(stage, Stage::Complete, id);
    Registry::ingest()->info("[Orchestrator] {}: complete with {} warning(s)", id, result.warnings.size());
    return result;
}

IngestResponse Orchestrator::handle(RawUpload upload) const {
    try {
        return IngestResponse::fromResult(ingest(std::move(upload)));
    } catch (const IngestError& e) {
        return IngestResponse::fromError(e);
    } catch (const std::exception& e) {
        Registry::ingest()->error("[Orchestrator] Unexpected failure: {}", e.what());
        return IngestResponse::unknownError();
    }
}
