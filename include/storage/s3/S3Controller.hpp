#pragma once

#include "storage/ObjectStore.hpp"
#include "storage/s3/APIKey.hpp"
#include "util/curlWrappers.hpp"

#include <curl/curl.h>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pv::storage::s3 {

namespace fs = std::filesystem;

// Parses one ListObjectsV2 page (<ListBucketResult>) into object records.
std::vector<ObjectInfo> objectsFromListXml(const std::string& xml);

class S3Controller final : public ObjectStore {
public:
    S3Controller(APIKey apiKey, std::string bucket, std::string publicBaseUrl = {});

    ~S3Controller() override;

    // #########################################################################
    // ########################### BUFFER OPS ##################################
    // #########################################################################

    void putObject(const fs::path& key, const std::vector<uint8_t>& buffer,
                   const std::string& contentType) const override;

    // #########################################################################
    // ############################### GENERAL #################################
    // #########################################################################

    void deleteObject(const fs::path& key) const override;
    [[nodiscard]] std::vector<ObjectInfo> listObjects(const fs::path& prefix) const override;
    [[nodiscard]] std::string publicUrl(const fs::path& key) const override;
    [[nodiscard]] std::string fetchPublic(const fs::path& key) const override;

    // #########################################################################
    // ########################### VALIDATION ##################################
    // #########################################################################

    [[nodiscard]] ValidateResult validateAPICredentials() const override;

private:
    APIKey apiKey_;
    std::string bucket_;
    std::string publicBaseUrl_;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& payloadHash) const;

    std::pair<std::string, std::string> constructPaths(CURL* curl, const fs::path& p,
                                                       const std::string& query = "") const;

    [[nodiscard]] util::SList makeSigHeaders(const std::string& method,
                                             const std::string& canonical,
                                             const std::string& payloadHash,
                                             const std::string& query = "") const;
};

}
