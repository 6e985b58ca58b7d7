#include "storage/s3/S3Controller.hpp"

#include <curl/curl.h>
#include <regex>

using namespace pv::storage;
using namespace pv::storage::s3;
using namespace pv::util;

ValidateResult S3Controller::validateAPICredentials() const {
    const std::regex re_key("^[A-Za-z0-9/+=]{20,128}$");
    const std::regex re_endpoint(R"(^https?://([A-Za-z0-9.-]+|\d{1,3}(?:\.\d{1,3}){3})(:\d{1,5})?/?$)");

    std::string errors;
    if (!std::regex_match(apiKey_.access_key, re_key))
        errors += "Access key format looks wrong (expect 20-128 alphanumeric chars, slashes, pluses, or equals).\n";
    if (!std::regex_match(apiKey_.secret_access_key, re_key))
        errors += "Secret access key format looks wrong (expect 20-128 alphanumeric chars, slashes, pluses, or equals).\n";
    if (!std::regex_match(apiKey_.endpoint, re_endpoint))
        errors += "Endpoint format looks wrong (expect https://<host>[:port]/).\n";

    if (!errors.empty())
        return {false, errors};

    // --- Live probe: one-key listing of the configured bucket ---
    const std::string query = "list-type=2&max-keys=1";
    const std::string canonical = "/" + bucket_;
    const std::string url = apiKey_.endpoint + canonical + "?" + query;
    static const std::string kUnsigned = "UNSIGNED-PAYLOAD";

    SList hdrs = makeSigHeaders("GET", canonical, kUnsigned, query);
    hdrs.add("Content-Type: application/xml");

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_UPLOAD, 0L);
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(0));
    });

    if (resp.ok()) return {true, "Credentials validated (bucket listing succeeded)."};
    if (resp.curl != CURLE_OK) return {false, std::string("Endpoint unreachable: ") + curl_easy_strerror(resp.curl)};

    const std::string& body = resp.body;
    if (body.find("NoSuchBucket") != std::string::npos) return {false, "Bucket does not exist: " + bucket_};

    const bool accessDenied = body.find("AccessDenied") != std::string::npos;
    const bool badSig =
        body.find("SignatureDoesNotMatch") != std::string::npos ||
        body.find("InvalidAccessKeyId") != std::string::npos ||
        body.find("AuthFailure") != std::string::npos ||
        body.find("XAmzContentSHA256Mismatch") != std::string::npos;

    if (accessDenied && !badSig) return {true, "Credentials validated (auth OK, listing denied)."};
    return {false, "Auth probe failed: " + resp.body};
}
