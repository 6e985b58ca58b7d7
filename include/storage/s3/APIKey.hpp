#pragma once

#include <string>
#include <utility>

namespace pv::storage::s3 {

// Runtime-only S3 credentials; the secret is never persisted or logged
struct APIKey {
    std::string access_key;
    std::string secret_access_key;
    std::string region;
    std::string endpoint;

    APIKey() = default;
    APIKey(std::string accessKey, std::string secretAccessKey, std::string region, std::string endpoint)
        : access_key(std::move(accessKey)), secret_access_key(std::move(secretAccessKey)),
          region(std::move(region)), endpoint(std::move(endpoint)) {}
};

}
