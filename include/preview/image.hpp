#pragma once

#include <vector>
#include <string>
#include <optional>
#include <cstdint>

namespace pv::preview::image {

enum class Format { Jpeg, Png, WebP, Unknown };

struct Dimensions {
    int width = 0;
    int height = 0;
};

// Tightly packed 8-bit RGB pixels
struct Bitmap {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgb;
};

// Identifies the container from its leading magic bytes
Format sniff(const uint8_t* data, size_t size);
inline Format sniff(const std::vector<uint8_t>& buf) { return sniff(buf.data(), buf.size()); }

std::string to_string(Format f);

// Header-only geometry; nullopt when the codec rejects the header. A JPEG or
// PNG header declaring a zero side is returned as declared.
std::optional<Dimensions> probe(const std::vector<uint8_t>& buf);

Bitmap decode(const std::vector<uint8_t>& buf);

// Largest size that fits inside max_w x max_h while keeping the aspect ratio, never enlarged.
Dimensions fit_inside(const Dimensions& src, int max_w, int max_h);

Bitmap resize(const Bitmap& src, const Dimensions& target);

void compress_to_webp(const uint8_t* rgb_data, int width, int height, std::vector<uint8_t>& out_buf, int quality = 85);

}
