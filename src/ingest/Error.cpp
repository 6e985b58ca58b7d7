#include "ingest/Error.hpp"

#include <fmt/core.h>

namespace pv::ingest {

std::string_view to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidUpload: return "InvalidUpload";
        case ErrorKind::NoDecodableImage: return "NoDecodableImage";
        case ErrorKind::UnreadableImage: return "UnreadableImage";
        case ErrorKind::DegenerateGeometry: return "DegenerateGeometry";
        case ErrorKind::StorageUnavailable: return "StorageUnavailable";
    }
    return "Unknown";
}

IngestError::IngestError(const ErrorKind kind, const std::string& message)
: std::runtime_error(message), kind_(kind) {}

IngestError IngestError::invalidExtension() {
    return {ErrorKind::InvalidUpload, "Ungültiges Dateiformat. Bitte DNG, JPEG, PNG oder WebP verwenden."};
}

IngestError IngestError::tooLarge(const uintmax_t maxBytes) {
    return {ErrorKind::InvalidUpload, fmt::format("Datei zu groß. Maximum ist {}MB.", maxBytes / (1024 * 1024))};
}

IngestError IngestError::emptyUpload() {
    return {ErrorKind::InvalidUpload, "Keine Datei gefunden"};
}

IngestError IngestError::noDecodableImage() {
    return {ErrorKind::NoDecodableImage,
            "Kein eingebettetes JPEG im DNG gefunden. "
            "Bitte exportiere das Panorama als JPEG oder TIFF und lade diese Datei hoch."};
}

IngestError IngestError::unreadableImage() {
    return {ErrorKind::UnreadableImage, "Ungültiges Bildformat"};
}

IngestError IngestError::degenerateGeometry() {
    return {ErrorKind::DegenerateGeometry, "Ungültiges Bildformat"};
}

IngestError IngestError::storageUnavailable(const std::string& detail) {
    return {ErrorKind::StorageUnavailable, "Speicher nicht erreichbar: " + detail};
}

}
