#pragma once

#include "config/Config.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pv::ingest {

// Half-open [start, end) byte range of one embedded JPEG
struct ByteRange {
    size_t start = 0;
    size_t end = 0;

    [[nodiscard]] size_t size() const { return end - start; }
};

// Finds JPEG streams (FF D8 FF ... FF D9) inside an arbitrary container by
// marker bytes alone. Ranges come back in buffer order and never overlap;
// candidates shorter than the floor are dropped.
class BinaryScanner {
public:
    explicit BinaryScanner(size_t minSegmentBytes = config::MIN_CANDIDATE_BYTES);

    [[nodiscard]] std::vector<ByteRange> findJpegSegments(const uint8_t* data, size_t size) const;
    [[nodiscard]] std::vector<ByteRange> findJpegSegments(const std::vector<uint8_t>& buf) const {
        return findJpegSegments(buf.data(), buf.size());
    }

    [[nodiscard]] size_t minSegmentBytes() const { return minSegmentBytes_; }

private:
    size_t minSegmentBytes_;
};

}
