#include "storage/s3/S3Controller.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <pugixml.hpp>

#include <sstream>
#include <stdexcept>
#include <utility>

using namespace pv::storage::s3;
using namespace pv::util;
using pv::log::Registry;

namespace {

std::string rstrip(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

}

std::vector<pv::storage::ObjectInfo> pv::storage::s3::objectsFromListXml(const std::string& xml) {
    std::vector<ObjectInfo> objects;

    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_string(xml.c_str());
    if (!result) throw std::runtime_error(fmt::format("Failed to parse S3 listing: {}", result.description()));

    const pugi::xml_node root = doc.child("ListBucketResult");
    if (!root) throw std::runtime_error("S3 listing is missing <ListBucketResult>");

    for (const pugi::xml_node content : root.children("Contents")) {
        const auto keyNode = content.child("Key");
        const auto sizeNode = content.child("Size");
        const auto modifiedNode = content.child("LastModified");

        if (!keyNode || !sizeNode) {
            Registry::storage()->debug("[S3Controller] Skipping listing entry without Key/Size");
            continue;
        }

        objects.push_back({
            .key = keyNode.text().as_string(),
            .size = static_cast<uintmax_t>(sizeNode.text().as_ullong()),
            .last_modified = modifiedNode ? parseTimestampFromString(modifiedNode.text().as_string()) : 0
        });
    }

    return objects;
}

S3Controller::S3Controller(APIKey apiKey, std::string bucket, std::string publicBaseUrl)
: apiKey_(std::move(apiKey)), bucket_(std::move(bucket)), publicBaseUrl_(rstrip(std::move(publicBaseUrl))) {
    if (apiKey_.secret_access_key.empty()) throw std::runtime_error("S3Controller requires a secret access key");
    if (apiKey_.endpoint.empty()) throw std::runtime_error("S3Controller requires an endpoint");
    if (bucket_.empty()) throw std::runtime_error("S3Controller requires a bucket");
    apiKey_.endpoint = rstrip(apiKey_.endpoint);
    ensureCurlGlobalInit();
}

S3Controller::~S3Controller() = default;

void S3Controller::deleteObject(const fs::path& key) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key);

    const std::string payloadHash = sha256Hex(std::string{});
    const SList hdrs = makeSigHeaders("DELETE", canonical, payloadHash);

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) {
        Registry::storage()->error("[S3Controller] deleteObject failed: CURL={} HTTP={} Response:\n{}",
                                   static_cast<int>(resp.curl), resp.http, resp.body);
        throw std::runtime_error(fmt::format("Failed to delete object from S3 (HTTP {}): {}", resp.http, resp.body));
    }
}

std::vector<pv::storage::ObjectInfo> S3Controller::listObjects(const fs::path& prefix) const {
    std::vector<ObjectInfo> objects;
    std::string continuationToken;
    bool moreResults = true;

    while (moreResults) {
        CurlEasy curl;

        // Query parameters must be sorted by name for the canonical request
        std::ostringstream query;
        if (!continuationToken.empty()) {
            char* escapedToken = curl_easy_escape(curl, continuationToken.c_str(), static_cast<int>(continuationToken.size()));
            if (!escapedToken) throw std::runtime_error("Failed to escape S3 continuation token");
            query << "continuation-token=" << escapedToken << "&";
            curl_free(escapedToken);
        }
        query << "list-type=2";
        if (!prefix.empty()) {
            // Query values are fully escaped for SigV4, slashes included
            const std::string p = prefix.string();
            char* escapedPrefix = curl_easy_escape(curl, p.c_str(), static_cast<int>(p.size()));
            if (!escapedPrefix) throw std::runtime_error("Failed to escape S3 listing prefix");
            query << "&prefix=" << escapedPrefix;
            curl_free(escapedPrefix);
        }

        const std::string canonicalPath = "/" + bucket_;
        const std::string queryStr = query.str();
        const std::string url = apiKey_.endpoint + canonicalPath + "?" + queryStr;

        const std::string payloadHash = "UNSIGNED-PAYLOAD";
        const SList hdrs = makeSigHeaders("GET", canonicalPath, payloadHash, queryStr);

        const HttpResponse resp = performCurl([&](CURL* h) {
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        });

        if (!resp.ok()) {
            Registry::storage()->error("[S3Controller] listObjects failed: CURL={} HTTP={} Response:\n{}",
                                       static_cast<int>(resp.curl), resp.http, resp.body);
            throw std::runtime_error(fmt::format("Failed to list objects in S3 (HTTP {}): {}", resp.http, resp.body));
        }

        auto page = objectsFromListXml(resp.body);
        objects.insert(objects.end(), std::make_move_iterator(page.begin()), std::make_move_iterator(page.end()));

        parsePagination(resp.body, continuationToken, moreResults);
    }

    return objects;
}

std::string S3Controller::publicUrl(const fs::path& key) const {
    CurlEasy curl;
    const auto escapedKey = escapeKeyPreserveSlashes(curl, key);
    if (!publicBaseUrl_.empty()) return publicBaseUrl_ + "/" + escapedKey;
    return apiKey_.endpoint + "/" + bucket_ + "/" + escapedKey;
}

std::string S3Controller::fetchPublic(const fs::path& key) const {
    const std::string url = publicUrl(key);

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    });

    if (!resp.ok()) {
        Registry::storage()->error("[S3Controller] fetchPublic failed: CURL={} HTTP={} URL={}",
                                   static_cast<int>(resp.curl), resp.http, url);
        if (resp.curl != CURLE_OK)
            throw std::runtime_error(fmt::format("Failed to fetch {}: {}", url, curl_easy_strerror(resp.curl)));
        throw std::runtime_error(fmt::format("Failed to fetch {} (HTTP {})", url, resp.http));
    }

    return resp.body;
}

std::map<std::string, std::string> S3Controller::buildHeaderMap(const std::string& payloadHash) const {
    const auto scheme = apiKey_.endpoint.find("://");
    const std::string host = scheme == std::string::npos ? apiKey_.endpoint : apiKey_.endpoint.substr(scheme + 3);

    return {
        {"host", host},
        {"x-amz-content-sha256", payloadHash},
        {"x-amz-date", getCurrentTimestamp()}
    };
}

SList S3Controller::makeSigHeaders(const std::string& method, const std::string& canonical,
                                   const std::string& payloadHash, const std::string& query) const {
    const auto signedHeaders = buildHeaderMap(payloadHash);

    SList out;
    out.add("Authorization: " + buildAuthorizationHeader(apiKey_, method, canonical, signedHeaders, payloadHash, query));
    for (const auto& [name, value] : signedHeaders) out.add(name + ": " + value);
    return out;
}

std::pair<std::string, std::string> S3Controller::constructPaths(CURL* curl, const fs::path& p, const std::string& query) const {
    const auto escapedKey = escapeKeyPreserveSlashes(curl, p);
    const auto canonicalPath = "/" + bucket_ + "/" + escapedKey + query;
    const auto url = apiKey_.endpoint + canonicalPath;
    return {canonicalPath, url};
}
