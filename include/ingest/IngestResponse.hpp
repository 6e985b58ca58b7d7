#pragma once

#include "ingest/Error.hpp"
#include "ingest/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace pv::ingest {

// Caller-facing record: success carries id, urls and the joined warning,
// failure carries the German message and the error kind.
struct IngestResponse {
    bool success{false};
    std::string panoramaId;
    std::map<std::string, std::string> images;
    std::optional<std::string> warning;
    std::vector<std::string> warnings;
    std::string error;
    std::optional<ErrorKind> errorKind;

    static IngestResponse fromResult(IngestResult result);
    static IngestResponse fromError(const IngestError& e);
    static IngestResponse unknownError();
};

// All warnings in order, separated by a single space; nullopt when there are none
std::optional<std::string> joinWarnings(const std::vector<std::string>& warnings);

void to_json(nlohmann::json& j, const IngestResponse& r);

}
