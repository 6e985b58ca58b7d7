#pragma once

#include <curl/curl.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace pv::storage::s3 { struct APIKey; }

namespace pv::util {

std::string sha256Hex(const std::string& data);
std::string sha256Hex(const std::vector<uint8_t>& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);
std::string escapeKeyPreserveSlashes(CURL* curl, const std::filesystem::path& p);
size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);
void parsePagination(const std::string& response, std::string& continuationToken, bool& moreResults);
std::string buildAuthorizationHeader(const storage::s3::APIKey& api_key,
                                     const std::string& method, const std::string& fullPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash, const std::string& canonicalQuery = "");

void ensureCurlGlobalInit();

}
