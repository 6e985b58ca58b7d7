#include "storage/InlineSink.hpp"
#include "util/encoding.hpp"
#include "log/Registry.hpp"

using namespace pv::storage;
using pv::log::Registry;

std::string InlineSink::dataUri(const std::vector<uint8_t>& bytes) {
    std::string uri = "data:";
    uri += kRenditionContentType;
    uri += ";base64,";
    uri += util::b64_encode(bytes);
    return uri;
}

std::map<std::string, std::string> InlineSink::store(const std::string& panoramaId,
                                                     const std::vector<ingest::RenderedAsset>& assets) const {
    std::map<std::string, std::string> urls;
    for (const auto& asset : assets) urls[asset.label] = dataUri(asset.encodedBytes);

    Registry::storage()->debug("[InlineSink] Inlined {} rendition(s) for {}", urls.size(), panoramaId);
    return urls;
}
