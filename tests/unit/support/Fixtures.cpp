#include "support/Fixtures.hpp"

#include <turbojpeg.h>

#include <algorithm>
#include <stdexcept>

namespace pv::test {

namespace {

std::vector<uint8_t> fillPixels(const int width, const int height, const Pattern pattern) {
    std::vector<uint8_t> rgb(static_cast<size_t>(width) * height * 3);
    uint32_t state = 0x9E3779B9u;

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            auto* px = &rgb[(static_cast<size_t>(y) * width + x) * 3];
            const auto gx = static_cast<uint8_t>(x * 255 / std::max(1, width - 1));
            const auto gy = static_cast<uint8_t>(y * 255 / std::max(1, height - 1));

            if (pattern == Pattern::Gradient) {
                px[0] = gx;
                px[1] = gy;
                px[2] = static_cast<uint8_t>((gx + gy) / 2);
            } else if (pattern == Pattern::Textured) {
                state = state * 1664525u + 1013904223u;
                const int grain = static_cast<int>((state >> 24) & 0x1F) - 16;
                px[0] = static_cast<uint8_t>(std::clamp(gx + grain, 0, 255));
                px[1] = static_cast<uint8_t>(std::clamp(gy + grain, 0, 255));
                px[2] = static_cast<uint8_t>(std::clamp((gx + gy) / 2 - grain, 0, 255));
            } else {
                state = state * 1664525u + 1013904223u;
                px[0] = static_cast<uint8_t>(state >> 24);
                px[1] = static_cast<uint8_t>(state >> 16);
                px[2] = static_cast<uint8_t>(state >> 8);
            }
        }
    }
    return rgb;
}

}

std::vector<uint8_t> makeJpeg(const int width, const int height, const Pattern pattern, const int quality) {
    const auto rgb = fillPixels(width, height, pattern);

    tjhandle tj = tjInitCompress();
    if (!tj) throw std::runtime_error("Failed to initialize TurboJPEG compressor");

    unsigned char* jpeg_buf = nullptr;
    unsigned long jpeg_size = 0;

    if (tjCompress2(tj, rgb.data(), width, 0, height, TJPF_RGB,
                    &jpeg_buf, &jpeg_size, TJSAMP_444, quality, 0) != 0) {
        const std::string err = tjGetErrorStr();
        tjDestroy(tj);
        throw std::runtime_error("JPEG compression failed: " + err);
    }

    std::vector<uint8_t> out(jpeg_buf, jpeg_buf + jpeg_size);
    tjFree(jpeg_buf);
    tjDestroy(tj);
    return out;
}

std::vector<uint8_t> syntheticSegment(const size_t size) {
    if (size < 5) throw std::invalid_argument("segment needs at least 5 bytes");
    std::vector<uint8_t> seg(size, 0x00);
    seg[0] = 0xFF; seg[1] = 0xD8; seg[2] = 0xFF;
    seg[size - 2] = 0xFF; seg[size - 1] = 0xD9;
    return seg;
}

std::vector<uint8_t> makeRawContainer(const std::vector<std::vector<uint8_t>>& embedded,
                                      const size_t fillerBytes, const size_t minTotalBytes) {
    std::vector<uint8_t> out = {'I', 'I', 0x2A, 0x00, 0x08, 0x00, 0x00, 0x00};
    for (const auto& part : embedded) {
        out.insert(out.end(), fillerBytes, 0x00);
        out.insert(out.end(), part.begin(), part.end());
    }
    if (out.size() < minTotalBytes) out.resize(minTotalBytes, 0x00);
    return out;
}

std::vector<uint8_t> concat(const std::initializer_list<std::vector<uint8_t>> parts) {
    std::vector<uint8_t> out;
    for (const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
    return out;
}

void FakeObjectStore::putObject(const std::filesystem::path& key, const std::vector<uint8_t>& buffer,
                                const std::string& contentType) const {
    std::lock_guard lock(mutex_);
    ++puts_;
    if (failPutNumber > 0 && puts_ == failPutNumber)
        throw std::runtime_error("Failed to upload object to S3 (HTTP 503): SlowDown");

    objects[key.string()] = {buffer, contentType, clock};
    putLog.push_back(key.string());
}

void FakeObjectStore::deleteObject(const std::filesystem::path& key) const {
    std::lock_guard lock(mutex_);
    deleteLog.push_back(key.string());
    if (failDeletes) throw std::runtime_error("Failed to delete object from S3 (HTTP 500): InternalError");
    objects.erase(key.string());
}

std::vector<storage::ObjectInfo> FakeObjectStore::listObjects(const std::filesystem::path& prefix) const {
    std::lock_guard lock(mutex_);
    std::vector<storage::ObjectInfo> out;
    const auto p = prefix.string();
    for (const auto& [key, obj] : objects)
        if (key.starts_with(p)) out.push_back({key, obj.bytes.size(), obj.lastModified});
    return out;
}

std::string FakeObjectStore::publicUrl(const std::filesystem::path& key) const {
    return "https://cdn.test/" + key.string();
}

std::string FakeObjectStore::fetchPublic(const std::filesystem::path& key) const {
    std::lock_guard lock(mutex_);
    const auto it = objects.find(key.string());
    if (it == objects.end()) throw std::runtime_error("Failed to fetch " + publicUrl(key) + " (HTTP 404)");
    if (staleReads) return "stale";
    return {it->second.bytes.begin(), it->second.bytes.end()};
}

storage::ValidateResult FakeObjectStore::validateAPICredentials() const {
    if (credentialsOk) return {true, "ok"};
    return {false, "Auth probe failed: SignatureDoesNotMatch"};
}

void FakeObjectStore::seed(const std::string& key, const size_t size, const std::time_t lastModified) {
    std::lock_guard lock(mutex_);
    objects[key] = {std::vector<uint8_t>(size, 0x00), "image/webp", lastModified};
}

}
