#pragma once

#include "config/Config.hpp"
#include "ingest/IngestResponse.hpp"
#include "ingest/ResolutionPipeline.hpp"
#include "ingest/SourceExtractor.hpp"
#include "ingest/types.hpp"
#include "storage/Sink.hpp"

#include <memory>
#include <string_view>

namespace pv::ingest {

enum class Stage { Received, Extracted, Rendered, Stored, Complete, Failed };

std::string_view to_string(Stage stage);

// Validates an upload and drives extract -> render -> store. The sink is
// chosen once by the caller; the orchestrator holds no per-request state,
// so one instance may serve concurrent uploads.
class Orchestrator {
public:
    Orchestrator(const config::Config& cfg, std::unique_ptr<storage::StorageSink> sink);

    // Throws IngestError for every taxonomy failure
    [[nodiscard]] IngestResult ingest(RawUpload upload) const;

    // Same as ingest() but never throws; failures become a failure response
    [[nodiscard]] IngestResponse handle(RawUpload upload) const;

    // Throws IngestError(InvalidUpload)
    void validate(const RawUpload& upload) const;

    [[nodiscard]] const storage::StorageSink& sink() const { return *sink_; }

private:
    config::IngestConfig cfg_;
    SourceExtractor extractor_;
    ResolutionPipeline pipeline_;
    std::unique_ptr<storage::StorageSink> sink_;
};

}
