#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "storage/s3/APIKey.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <iomanip>
#include <mutex>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace pv::util {

namespace {

std::string toHex(const unsigned char* digest, const size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return oss.str();
}

}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string sha256Hex(const std::vector<uint8_t>& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    unsigned char sig[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), rawKey.data(), static_cast<int>(rawKey.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), sig, nullptr);
    return toHex(sig, SHA256_DIGEST_LENGTH);
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::filesystem::path& p) {
    std::ostringstream out;
    bool first = true;
    for (const auto& part : p) {
        if (!first) out << '/';
        first = false;

        const std::string seg = part.string();
        char* esc = curl_easy_escape(curl, seg.c_str(), static_cast<int>(seg.length()));
        if (!esc) throw std::runtime_error("escape failed for key segment: " + seg);
        out << esc;
        curl_free(esc);
    }
    return out.str();
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

void parsePagination(const std::string& response, std::string& continuationToken, bool& moreResults) {
    moreResults = std::regex_search(response, std::regex("<IsTruncated>true</IsTruncated>"));
    std::smatch tokenMatch;
    if (moreResults && std::regex_search(response, tokenMatch,
                                         std::regex("<NextContinuationToken>([^<]+)</NextContinuationToken>")))
        continuationToken = tokenMatch[1].str();
    else moreResults = false;
}

std::string buildAuthorizationHeader(const storage::s3::APIKey& api_key,
                                     const std::string& method,
                                     const std::string& fullPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::string& canonicalQuery /* = "" */) {
    std::string canonicalPath;
    std::string effectiveQuery;

    // Parse fullPath only if canonicalQuery is not explicitly given
    if (canonicalQuery.empty()) {
        const auto qpos = fullPath.find('?');
        if (qpos == std::string::npos) {
            canonicalPath = fullPath;
        } else {
            canonicalPath = fullPath.substr(0, qpos);
            effectiveQuery = fullPath.substr(qpos + 1);
            if (effectiveQuery.find('=') == std::string::npos)
                effectiveQuery += "=";  // handle case like ?flag
        }
    } else {
        canonicalPath = fullPath;
        effectiveQuery = canonicalQuery;
    }

    const std::string service = "s3";
    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string amzDate = headers.at("x-amz-date");
    const std::string dateStamp = amzDate.substr(0, 8); // YYYYMMDD, same instant as x-amz-date

    // headers is a std::map, so keys arrive sorted as SigV4 requires
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end())
            signedHeaders += ";";
    }

    std::ostringstream canonicalRequestStream;
    canonicalRequestStream << method << "\n"
                           << canonicalPath << "\n"
                           << effectiveQuery << "\n"
                           << canonicalHeaders << "\n"
                           << signedHeaders << "\n"
                           << payloadHash;
    const std::string hashedCanonicalRequest = sha256Hex(canonicalRequestStream.str());

    const std::string credentialScope = dateStamp + "/" + api_key.region + "/" + service + "/aws4_request";
    std::ostringstream stringToSignStream;
    stringToSignStream << algorithm << "\n"
                       << amzDate << "\n"
                       << credentialScope << "\n"
                       << hashedCanonicalRequest;

    const std::string kDate    = hmacSha256Raw("AWS4" + api_key.secret_access_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, api_key.region);
    const std::string kService = hmacSha256Raw(kRegion, service);
    const std::string kSigning = hmacSha256Raw(kService, "aws4_request");

    const std::string signature = hmacSha256HexFromRaw(kSigning, stringToSignStream.str());

    std::ostringstream authHeader;
    authHeader << algorithm << " "
               << "Credential=" << api_key.access_key << "/" << credentialScope << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;

    return authHeader.str();
}

}
