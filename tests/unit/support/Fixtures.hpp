#pragma once

#include "storage/ObjectStore.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace pv::test {

enum class Pattern { Gradient, Textured, Noise };

// Baseline JPEG from libjpeg-turbo. Gradient compresses tightly, Textured
// (gradient plus grain) lands in the megabytes at 4K, Noise stays large.
std::vector<uint8_t> makeJpeg(int width, int height, Pattern pattern = Pattern::Gradient, int quality = 90);

// FF D8 FF, zero fill, FF D9; exactly `size` bytes. Not decodable.
std::vector<uint8_t> syntheticSegment(size_t size);

// Little-endian TIFF header, then each part preceded by `fillerBytes` of zeros,
// then trailing zeros until the container is at least `minTotalBytes`.
std::vector<uint8_t> makeRawContainer(const std::vector<std::vector<uint8_t>>& embedded,
                                      size_t fillerBytes = 4096, size_t minTotalBytes = 0);

std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> parts);

// In-memory object store; can be told to fail the Nth put, every delete, or
// to serve stale public reads.
class FakeObjectStore final : public storage::ObjectStore {
public:
    struct Stored {
        std::vector<uint8_t> bytes;
        std::string contentType;
        std::time_t lastModified{0};
    };

    void putObject(const std::filesystem::path& key, const std::vector<uint8_t>& buffer,
                   const std::string& contentType) const override;
    void deleteObject(const std::filesystem::path& key) const override;
    [[nodiscard]] std::vector<storage::ObjectInfo> listObjects(const std::filesystem::path& prefix) const override;
    [[nodiscard]] std::string publicUrl(const std::filesystem::path& key) const override;
    [[nodiscard]] std::string fetchPublic(const std::filesystem::path& key) const override;
    [[nodiscard]] storage::ValidateResult validateAPICredentials() const override;

    void seed(const std::string& key, size_t size, std::time_t lastModified);

    mutable std::map<std::string, Stored> objects;
    mutable std::vector<std::string> putLog;
    mutable std::vector<std::string> deleteLog;

    int failPutNumber = 0;        // 1-based; 0 never fails
    bool failDeletes = false;
    bool staleReads = false;      // public reads return content other than what was written
    bool credentialsOk = true;
    std::time_t clock = 1700000000;

private:
    mutable std::mutex mutex_;
    mutable int puts_ = 0;
};

}
