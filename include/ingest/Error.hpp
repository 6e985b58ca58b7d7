#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pv::ingest {

enum class ErrorKind {
    InvalidUpload,
    NoDecodableImage,
    UnreadableImage,
    DegenerateGeometry,
    StorageUnavailable
};

std::string_view to_string(ErrorKind kind);

// Carries the caller-facing (German) message as what()
class IngestError : public std::runtime_error {
public:
    IngestError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    static IngestError invalidExtension();
    static IngestError tooLarge(uintmax_t maxBytes);
    static IngestError emptyUpload();
    static IngestError noDecodableImage();
    static IngestError unreadableImage();
    static IngestError degenerateGeometry();
    static IngestError storageUnavailable(const std::string& detail);

private:
    ErrorKind kind_;
};

}
