#include "ingest/IngestResponse.hpp"

#include <nlohmann/json.hpp>

#include <utility>

using namespace pv::ingest;

std::optional<std::string> pv::ingest::joinWarnings(const std::vector<std::string>& warnings) {
    if (warnings.empty()) return std::nullopt;

    std::string joined;
    for (const auto& w : warnings) {
        if (!joined.empty()) joined += ' ';
        joined += w;
    }
    return joined;
}

IngestResponse IngestResponse::fromResult(IngestResult result) {
    IngestResponse r;
    r.success = true;
    r.panoramaId = std::move(result.panoramaId);
    r.images = std::move(result.urls);
    r.warning = joinWarnings(result.warnings);
    r.warnings = std::move(result.warnings);
    return r;
}

IngestResponse IngestResponse::fromError(const IngestError& e) {
    IngestResponse r;
    r.error = e.what();
    r.errorKind = e.kind();
    return r;
}

IngestResponse IngestResponse::unknownError() {
    IngestResponse r;
    r.error = "Unbekannter Fehler";
    return r;
}

void pv::ingest::to_json(nlohmann::json& j, const IngestResponse& r) {
    if (!r.success) {
        j = {{"success", false}, {"error", r.error}};
        if (r.errorKind) j["errorKind"] = std::string(to_string(*r.errorKind));
        return;
    }

    j = {
        {"success", true},
        {"panoramaId", r.panoramaId},
        {"images", r.images}
    };
    if (r.warning) j["warning"] = *r.warning;
}
