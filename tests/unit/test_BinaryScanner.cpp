#include <gtest/gtest.h>
#include "ingest/BinaryScanner.hpp"
#include "support/Fixtures.hpp"

#include <algorithm>

using namespace pv::ingest;
using namespace pv::test;

class BinaryScannerTest : public ::testing::Test {
protected:
    BinaryScanner scanner;   // default 50 KB floor

    static std::vector<uint8_t> zeros(const size_t n) { return std::vector<uint8_t>(n, 0x00); }
};

TEST_F(BinaryScannerTest, EmptyBufferYieldsNothing) {
    EXPECT_TRUE(scanner.findJpegSegments({}).empty());
    EXPECT_TRUE(scanner.findJpegSegments(nullptr, 0).empty());
}

TEST_F(BinaryScannerTest, BufferWithoutSignatureYieldsNothing) {
    std::vector<uint8_t> buf(1024 * 1024);
    uint32_t state = 7;
    for (auto& b : buf) {
        state = state * 1103515245u + 12345u;
        b = static_cast<uint8_t>(std::min<uint32_t>((state >> 16) & 0xFF, 0xFE));
    }
    EXPECT_TRUE(scanner.findJpegSegments(buf).empty());
}

TEST_F(BinaryScannerTest, FindsSingleSegmentWithExactBounds) {
    const auto seg = syntheticSegment(60 * 1024);
    const auto buf = concat({zeros(1000), seg, zeros(500)});

    const auto ranges = scanner.findJpegSegments(buf);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0].start, 1000u);
    EXPECT_EQ(ranges[0].end, 1000u + seg.size());
    EXPECT_EQ(ranges[0].size(), seg.size());
}

TEST_F(BinaryScannerTest, DiscardsThumbnailsBelowFloor) {
    const auto buf = concat({zeros(64), syntheticSegment(10 * 1024), zeros(64), syntheticSegment(40 * 1024)});
    EXPECT_TRUE(scanner.findJpegSegments(buf).empty());
}

TEST_F(BinaryScannerTest, SegmentAtExactlyTheFloorIsKept) {
    const auto buf = concat({zeros(16), syntheticSegment(50 * 1024)});
    EXPECT_EQ(scanner.findJpegSegments(buf).size(), 1u);
}

TEST_F(BinaryScannerTest, MultipleSegmentsAreOrderedAndDisjoint) {
    const auto buf = concat({
        zeros(128), syntheticSegment(60 * 1024),
        zeros(256), syntheticSegment(8 * 1024),
        zeros(256), syntheticSegment(120 * 1024),
        zeros(32)
    });

    const auto ranges = scanner.findJpegSegments(buf);
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0].size(), 60u * 1024);
    EXPECT_EQ(ranges[1].size(), 120u * 1024);
    EXPECT_LE(ranges[0].end, ranges[1].start);
    for (const auto& r : ranges) {
        EXPECT_EQ(buf[r.start], 0xFF);
        EXPECT_EQ(buf[r.start + 1], 0xD8);
        EXPECT_EQ(buf[r.end - 2], 0xFF);
        EXPECT_EQ(buf[r.end - 1], 0xD9);
    }
}

TEST_F(BinaryScannerTest, SegmentEndsAtFirstEndMarker) {
    // Two end markers: the range closes at the first one, the tail is not a new segment
    auto seg = syntheticSegment(60 * 1024);
    const auto buf = concat({seg, zeros(70 * 1024), std::vector<uint8_t>{0xFF, 0xD9}});

    const auto ranges = scanner.findJpegSegments(buf);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0].end, seg.size());
}

TEST_F(BinaryScannerTest, EndMarkerSearchStartsAfterSignature) {
    // FF D8 FF D9 does not close the segment on its own signature byte
    auto seg = syntheticSegment(60 * 1024);
    seg[3] = 0xD9;

    const auto ranges = scanner.findJpegSegments(seg);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0].start, 0u);
    EXPECT_EQ(ranges[0].end, seg.size());
}

TEST_F(BinaryScannerTest, UnterminatedStartDoesNotFailTheScan) {
    const auto buf = concat({
        syntheticSegment(60 * 1024),
        zeros(100),
        std::vector<uint8_t>{0xFF, 0xD8, 0xFF},
        zeros(200 * 1024)
    });

    const auto ranges = scanner.findJpegSegments(buf);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0].size(), 60u * 1024);
}

TEST_F(BinaryScannerTest, TruncatedBufferYieldsNothing) {
    auto seg = syntheticSegment(80 * 1024);
    seg.resize(seg.size() - 2);
    EXPECT_TRUE(scanner.findJpegSegments(seg).empty());
}

TEST_F(BinaryScannerTest, LocatesRealJpegInsideRawContainer) {
    const auto jpeg = makeJpeg(1024, 512, Pattern::Noise);
    ASSERT_GE(jpeg.size(), 50u * 1024);

    const auto raw = makeRawContainer({jpeg}, 32 * 1024);
    const auto ranges = scanner.findJpegSegments(raw);

    ASSERT_EQ(ranges.size(), 1u);
    const std::vector<uint8_t> found(raw.begin() + static_cast<std::ptrdiff_t>(ranges[0].start),
                                     raw.begin() + static_cast<std::ptrdiff_t>(ranges[0].end));
    EXPECT_EQ(found, jpeg);
}

TEST_F(BinaryScannerTest, FloorIsConfigurable) {
    const BinaryScanner permissive(0);
    const auto buf = concat({syntheticSegment(16), zeros(8), syntheticSegment(32)});

    const auto ranges = permissive.findJpegSegments(buf);
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0].size(), 16u);
    EXPECT_EQ(ranges[1].size(), 32u);
}
