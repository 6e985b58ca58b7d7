#include "storage/s3/S3Controller.hpp"
#include "util/s3Helpers.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <cstring>

using namespace pv::storage::s3;
using namespace pv::util;
using pv::log::Registry;

void S3Controller::putObject(const fs::path& key,
                             const std::vector<uint8_t>& buffer,
                             const std::string& contentType) const {
    Registry::storage()->debug("[S3Controller] Uploading buffer to S3 key: {}, buffer_size: {}",
                               key.string(), buffer.size());

    // Hash the raw bytes for SigV4
    const std::string payloadHash = sha256Hex(buffer);

    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key);

    SList hdrs = makeSigHeaders("PUT", canonical, payloadHash);
    hdrs.add("Content-Type: " + contentType);
    hdrs.add("x-amz-acl: public-read");
    // avoid Expect: 100-continue stalls on small uploads
    hdrs.add("Expect:");

    struct ReadCtx {
        const uint8_t* data{nullptr};
        size_t size{0};
        size_t off{0};
    } ctx{ buffer.data(), buffer.size(), 0 };

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(ctx.size));
        curl_easy_setopt(h, CURLOPT_READDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_READFUNCTION,
            +[](char* out, size_t size, size_t nmemb, void* userdata) -> size_t {
                auto* c = static_cast<ReadCtx*>(userdata);
                if (!c || !c->data) return 0;

                const size_t max_bytes = size * nmemb;
                const size_t remaining = (c->off < c->size) ? (c->size - c->off) : 0;
                const size_t to_copy = (remaining < max_bytes) ? remaining : max_bytes;

                if (to_copy) {
                    std::memcpy(out, c->data + c->off, to_copy);
                    c->off += to_copy;
                }
                return to_copy; // 0 signals EOF
            });

        // Support rewinds (auth retries, redirects)
        curl_easy_setopt(h, CURLOPT_SEEKDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_SEEKFUNCTION,
            +[](void* userdata, curl_off_t offset, int origin) -> int {
                auto* c = static_cast<ReadCtx*>(userdata);
                if (!c || origin != SEEK_SET || offset < 0) return CURL_SEEKFUNC_CANTSEEK;
                const auto off = static_cast<size_t>(offset);
                if (off > c->size) return CURL_SEEKFUNC_CANTSEEK;
                c->off = off;
                return CURL_SEEKFUNC_OK;
            });
    });

    if (!resp.ok()) {
        Registry::storage()->error("[S3Controller] putObject failed for {}: CURL={} HTTP={} Response:\n{}",
                                   key.string(), static_cast<int>(resp.curl), resp.http, resp.body);
        if (resp.curl != CURLE_OK)
            throw std::runtime_error(fmt::format("Failed to upload object to S3: {}", curl_easy_strerror(resp.curl)));
        throw std::runtime_error(fmt::format("Failed to upload object to S3 (HTTP {}): {}", resp.http, resp.body));
    }
}
