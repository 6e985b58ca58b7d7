#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace pv::storage {

struct ObjectInfo {
    std::string key;
    uintmax_t size{0};
    std::time_t last_modified{0};
};

struct ValidateResult { bool ok; std::string msg; };

// Minimal object-store surface the persistent sink needs. Implementations
// report failures by throwing std::runtime_error with the backend detail.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual void putObject(const std::filesystem::path& key,
                           const std::vector<uint8_t>& buffer,
                           const std::string& contentType) const = 0;

    virtual void deleteObject(const std::filesystem::path& key) const = 0;

    [[nodiscard]] virtual std::vector<ObjectInfo> listObjects(const std::filesystem::path& prefix) const = 0;

    [[nodiscard]] virtual std::string publicUrl(const std::filesystem::path& key) const = 0;

    // Reads an object back anonymously through its public URL
    [[nodiscard]] virtual std::string fetchPublic(const std::filesystem::path& key) const = 0;

    [[nodiscard]] virtual ValidateResult validateAPICredentials() const = 0;
};

}
