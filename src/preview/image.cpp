#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION

#include "preview/image.hpp"

#include <stb/stb_image.h>
#include <stb/stb_image_resize.h>
#include <webp/decode.h>
#include <webp/encode.h>

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace pv::preview::image {

namespace {

constexpr uint8_t kJpegMagic[] = {0xFF, 0xD8, 0xFF};
constexpr uint8_t kPngMagic[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

int checkedLength(const size_t size) {
    if (size > static_cast<size_t>(INT_MAX)) throw std::runtime_error("Image buffer exceeds codec size limit");
    return static_cast<int>(size);
}

uint32_t be16(const uint8_t* p) { return (static_cast<uint32_t>(p[0]) << 8) | p[1]; }

uint32_t be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | p[3];
}

bool isStartOfFrame(const uint8_t marker) {
    // C4 (DHT), C8 (JPG) and CC (DAC) share the range but carry no frame
    return marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
}

// Walks JPEG marker segments up to the first SOFn and returns the geometry it declares
std::optional<Dimensions> jpegFrameGeometry(const std::vector<uint8_t>& buf) {
    size_t pos = 2;
    while (pos + 1 < buf.size()) {
        if (buf[pos] != 0xFF) return std::nullopt;
        while (pos < buf.size() && buf[pos] == 0xFF) ++pos;
        if (pos >= buf.size()) return std::nullopt;

        const uint8_t marker = buf[pos++];
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8)) continue;
        if (marker == 0xD9 || marker == 0xDA) return std::nullopt;

        if (pos + 2 > buf.size()) return std::nullopt;
        const uint32_t length = be16(&buf[pos]);
        if (length < 2 || pos + length > buf.size()) return std::nullopt;

        // length(2) precision(1) height(2) width(2)
        if (isStartOfFrame(marker)) {
            if (length < 7) return std::nullopt;
            return Dimensions{static_cast<int>(be16(&buf[pos + 5])), static_cast<int>(be16(&buf[pos + 3]))};
        }

        pos += length;
    }
    return std::nullopt;
}

// IHDR must be the first chunk: signature(8) length(4) "IHDR"(4) width(4) height(4)
std::optional<Dimensions> pngHeaderGeometry(const std::vector<uint8_t>& buf) {
    if (buf.size() < 24 || std::memcmp(buf.data() + 12, "IHDR", 4) != 0) return std::nullopt;
    const uint32_t w = be32(buf.data() + 16), h = be32(buf.data() + 20);
    if (w > static_cast<uint32_t>(INT_MAX) || h > static_cast<uint32_t>(INT_MAX)) return std::nullopt;
    return Dimensions{static_cast<int>(w), static_cast<int>(h)};
}

std::optional<Dimensions> declaredGeometry(const std::vector<uint8_t>& buf) {
    switch (sniff(buf)) {
        case Format::Jpeg: return jpegFrameGeometry(buf);
        case Format::Png: return pngHeaderGeometry(buf);
        default: return std::nullopt;
    }
}

}

Format sniff(const uint8_t* data, const size_t size) {
    if (!data) return Format::Unknown;
    if (size >= sizeof(kJpegMagic) && std::memcmp(data, kJpegMagic, sizeof(kJpegMagic)) == 0) return Format::Jpeg;
    if (size >= sizeof(kPngMagic) && std::memcmp(data, kPngMagic, sizeof(kPngMagic)) == 0) return Format::Png;
    if (size >= 12 && std::memcmp(data, "RIFF", 4) == 0 && std::memcmp(data + 8, "WEBP", 4) == 0) return Format::WebP;
    return Format::Unknown;
}

std::string to_string(const Format f) {
    switch (f) {
        case Format::Jpeg: return "jpeg";
        case Format::Png: return "png";
        case Format::WebP: return "webp";
        default: return "unknown";
    }
}

std::optional<Dimensions> probe(const std::vector<uint8_t>& buf) {
    if (buf.empty() || buf.size() > static_cast<size_t>(INT_MAX)) return std::nullopt;

    Dimensions dims;
    if (sniff(buf) == Format::WebP) {
        if (!WebPGetInfo(buf.data(), buf.size(), &dims.width, &dims.height)) return std::nullopt;
        return dims;
    }

    // stb refuses zero-sized frames outright, so report what the header declares
    if (const auto declared = declaredGeometry(buf); declared && (declared->width == 0 || declared->height == 0))
        return declared;

    int channels = 0;
    if (!stbi_info_from_memory(buf.data(), static_cast<int>(buf.size()), &dims.width, &dims.height, &channels))
        return std::nullopt;
    return dims;
}

Bitmap decode(const std::vector<uint8_t>& buf) {
    if (buf.size() < 4) throw std::runtime_error("Buffer too small to be a valid image");

    Bitmap bmp;

    if (sniff(buf) == Format::WebP) {
        uint8_t* decoded = WebPDecodeRGB(buf.data(), buf.size(), &bmp.width, &bmp.height);
        if (!decoded) throw std::runtime_error("Failed to decode WebP image from memory");
        bmp.rgb.assign(decoded, decoded + static_cast<size_t>(bmp.width) * bmp.height * 3);
        WebPFree(decoded);
        return bmp;
    }

    int channels = 0;
    unsigned char* decoded = stbi_load_from_memory(buf.data(), checkedLength(buf.size()),
                                                   &bmp.width, &bmp.height, &channels, 3);
    if (!decoded) {
        const char* reason = stbi_failure_reason();
        throw std::runtime_error(
            std::string("Failed to decode image from memory: ") + (reason ? reason : "unknown error"));
    }

    bmp.rgb.assign(decoded, decoded + static_cast<size_t>(bmp.width) * bmp.height * 3);
    stbi_image_free(decoded);
    return bmp;
}

Dimensions fit_inside(const Dimensions& src, const int max_w, const int max_h) {
    if (src.width <= 0 || src.height <= 0) throw std::invalid_argument("Source dimensions must be positive");
    if (max_w <= 0 || max_h <= 0) throw std::invalid_argument("Target box must be positive");

    const double ratio = std::min({1.0,
                                   static_cast<double>(max_w) / src.width,
                                   static_cast<double>(max_h) / src.height});

    Dimensions out;
    out.width = std::clamp(static_cast<int>(std::lround(src.width * ratio)), 1, std::min(max_w, src.width));
    out.height = std::clamp(static_cast<int>(std::lround(src.height * ratio)), 1, std::min(max_h, src.height));
    return out;
}

Bitmap resize(const Bitmap& src, const Dimensions& target) {
    if (target.width == src.width && target.height == src.height) return src;

    Bitmap out;
    out.width = target.width;
    out.height = target.height;
    out.rgb.resize(static_cast<size_t>(out.width) * out.height * 3);

    if (!stbir_resize_uint8(src.rgb.data(), src.width, src.height, 0,
                            out.rgb.data(), out.width, out.height, 0, 3))
        throw std::runtime_error("Image resize failed");

    return out;
}

void compress_to_webp(const uint8_t* rgb_data, const int width, const int height, std::vector<uint8_t>& out_buf,
                      const int quality) {
    uint8_t* webp_buf = nullptr;

    const size_t webp_size = WebPEncodeRGB(rgb_data, width, height, width * 3,
                                           static_cast<float>(std::clamp(quality, 0, 100)), &webp_buf);
    if (webp_size == 0 || !webp_buf) {
        WebPFree(webp_buf);
        throw std::runtime_error("WebP compression failed");
    }

    out_buf.assign(webp_buf, webp_buf + webp_size);
    WebPFree(webp_buf);
}

}
