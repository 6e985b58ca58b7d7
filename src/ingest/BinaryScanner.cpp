#include "ingest/BinaryScanner.hpp"
#include "log/Registry.hpp"

#include <cstring>
#include <optional>

using namespace pv::ingest;
using pv::log::Registry;

namespace {

// Offset of the first FF D8 FF at or after `from`
std::optional<size_t> findStartMarker(const uint8_t* data, const size_t size, size_t from) {
    while (from + 3 <= size) {
        const auto* hit = static_cast<const uint8_t*>(std::memchr(data + from, 0xFF, size - from - 2));
        if (!hit) return std::nullopt;
        const auto pos = static_cast<size_t>(hit - data);
        if (data[pos + 1] == 0xD8 && data[pos + 2] == 0xFF) return pos;
        from = pos + 1;
    }
    return std::nullopt;
}

// Offset of the first FF D9 at or after `from`
std::optional<size_t> findEndMarker(const uint8_t* data, const size_t size, size_t from) {
    while (from + 2 <= size) {
        const auto* hit = static_cast<const uint8_t*>(std::memchr(data + from, 0xFF, size - from - 1));
        if (!hit) return std::nullopt;
        const auto pos = static_cast<size_t>(hit - data);
        if (data[pos + 1] == 0xD9) return pos;
        from = pos + 1;
    }
    return std::nullopt;
}

}

BinaryScanner::BinaryScanner(const size_t minSegmentBytes) : minSegmentBytes_(minSegmentBytes) {}

std::vector<ByteRange> BinaryScanner::findJpegSegments(const uint8_t* data, const size_t size) const {
    std::vector<ByteRange> segments;
    if (!data || size < 5) return segments;

    size_t cursor = 0;
    size_t discarded = 0;

    while (const auto start = findStartMarker(data, size, cursor)) {
        const auto eoi = findEndMarker(data, size, *start + 3);

        // No end marker after this start means none after any later start either
        if (!eoi) {
            Registry::ingest()->debug("[BinaryScanner] Unterminated JPEG start at offset {}, stopping scan", *start);
            break;
        }

        const ByteRange range{*start, *eoi + 2};
        if (range.size() >= minSegmentBytes_) segments.push_back(range);
        else ++discarded;

        cursor = range.end;
    }

    Registry::ingest()->debug("[BinaryScanner] {} candidate(s) >= {} KB, {} below floor",
                              segments.size(), minSegmentBytes_ / 1024, discarded);
    return segments;
}
