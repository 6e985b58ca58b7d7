#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace pv::ingest {

struct RawUpload {
    std::vector<uint8_t> bytes;
    std::string filename;   // only consulted for the extension
};

enum class SourceKind { DirectImage, EmbeddedPreview };

std::string_view to_string(SourceKind kind);

struct ExtractedImage {
    std::vector<uint8_t> bytes;
    SourceKind sourceKind = SourceKind::DirectImage;
    std::vector<std::string> warnings;
};

struct ResolutionSpec {
    std::string label;
    int maxWidth = 0;
    int maxHeight = 0;
    int quality = 85;
    bool clampToSource = true;
};

struct RenderedAsset {
    std::string label;
    std::vector<uint8_t> encodedBytes;
    size_t byteSize = 0;
    int width = 0;
    int height = 0;
};

struct Rendering {
    std::vector<RenderedAsset> assets;   // high, medium, low
    std::vector<std::string> warnings;
};

struct IngestResult {
    std::string panoramaId;
    std::map<std::string, std::string> urls;   // high, medium, low
    std::vector<std::string> warnings;
};

}
