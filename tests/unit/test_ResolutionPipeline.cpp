#include <gtest/gtest.h>
#include "ingest/ResolutionPipeline.hpp"
#include "ingest/Error.hpp"
#include "preview/image.hpp"
#include "support/Fixtures.hpp"

#include <algorithm>
#include <iterator>

using namespace pv::ingest;
using namespace pv::test;

namespace image = pv::preview::image;

class ResolutionPipelineTest : public ::testing::Test {
protected:
    pv::config::Config cfg;
    ResolutionPipeline pipeline{cfg.ingest, cfg.renditions};

    static ExtractedImage direct(std::vector<uint8_t> bytes) {
        ExtractedImage img;
        img.bytes = std::move(bytes);
        return img;
    }

    static image::Dimensions dimsOf(const RenderedAsset& asset) {
        const auto dims = image::probe(asset.encodedBytes);
        EXPECT_TRUE(dims.has_value()) << asset.label;
        return dims.value_or(image::Dimensions{});
    }
};

TEST_F(ResolutionPipelineTest, EmitsHighMediumLowAsWebP) {
    const auto out = pipeline.render(direct(makeJpeg(1024, 512)));

    ASSERT_EQ(out.assets.size(), 3u);
    EXPECT_EQ(out.assets[0].label, "high");
    EXPECT_EQ(out.assets[1].label, "medium");
    EXPECT_EQ(out.assets[2].label, "low");

    for (const auto& a : out.assets) {
        EXPECT_EQ(image::sniff(a.encodedBytes), image::Format::WebP) << a.label;
        EXPECT_EQ(a.byteSize, a.encodedBytes.size());
        EXPECT_GT(a.byteSize, 0u);
    }
}

TEST_F(ResolutionPipelineTest, FullSizeSourceMapsToFixedBoxes) {
    const auto out = pipeline.render(direct(makeJpeg(4096, 2048)));
    ASSERT_EQ(out.assets.size(), 3u);

    const auto high = dimsOf(out.assets[0]);
    const auto medium = dimsOf(out.assets[1]);
    const auto low = dimsOf(out.assets[2]);

    EXPECT_EQ(high.width, 4096);  EXPECT_EQ(high.height, 2048);
    EXPECT_EQ(medium.width, 2048); EXPECT_EQ(medium.height, 1024);
    EXPECT_EQ(low.width, 512);    EXPECT_EQ(low.height, 256);
    EXPECT_TRUE(out.warnings.empty());
}

TEST_F(ResolutionPipelineTest, RenderingIsDeterministic) {
    const auto src = direct(makeJpeg(1200, 600, Pattern::Noise));

    const auto first = pipeline.render(src);
    const auto second = pipeline.render(src);

    ASSERT_EQ(first.assets.size(), second.assets.size());
    for (size_t i = 0; i < first.assets.size(); ++i)
        EXPECT_EQ(first.assets[i].encodedBytes, second.assets[i].encodedBytes) << first.assets[i].label;
}

TEST_F(ResolutionPipelineTest, OutputsStayInsideBoxAndSource) {
    const std::vector<std::pair<int, int>> sources = {{5000, 1000}, {1000, 500}, {300, 150}, {640, 640}};

    for (const auto& [w, h] : sources) {
        const auto out = pipeline.render(direct(makeJpeg(w, h)));
        ASSERT_EQ(out.assets.size(), pipeline.specs().size());

        for (size_t i = 0; i < out.assets.size(); ++i) {
            const auto& spec = pipeline.specs()[i];
            const auto dims = dimsOf(out.assets[i]);
            EXPECT_EQ(dims.width, out.assets[i].width);
            EXPECT_EQ(dims.height, out.assets[i].height);
            EXPECT_LE(dims.width, spec.maxWidth) << w << "x" << h << " " << spec.label;
            EXPECT_LE(dims.height, spec.maxHeight) << w << "x" << h << " " << spec.label;
            EXPECT_LE(dims.width, w) << w << "x" << h << " " << spec.label;
            EXPECT_LE(dims.height, h) << w << "x" << h << " " << spec.label;
        }
    }
}

TEST_F(ResolutionPipelineTest, SmallSourceIsNeverUpscaled) {
    const auto out = pipeline.render(direct(makeJpeg(300, 150)));
    for (const auto& a : out.assets) {
        EXPECT_EQ(a.width, 300) << a.label;
        EXPECT_EQ(a.height, 150) << a.label;
    }
}

TEST_F(ResolutionPipelineTest, FitInsideKeepsAspectRatio) {
    const auto out = pipeline.render(direct(makeJpeg(5000, 1000)));
    // 5:1 source is width-bound in every box
    EXPECT_EQ(out.assets[0].width, 4096); EXPECT_EQ(out.assets[0].height, 819);
    EXPECT_EQ(out.assets[1].width, 2048); EXPECT_EQ(out.assets[1].height, 410);
    EXPECT_EQ(out.assets[2].width, 512);  EXPECT_EQ(out.assets[2].height, 102);
}

TEST_F(ResolutionPipelineTest, TwoToOneProducesNoAspectWarning) {
    const auto out = pipeline.render(direct(makeJpeg(1024, 512)));
    EXPECT_TRUE(out.warnings.empty());
}

TEST_F(ResolutionPipelineTest, ThreeToOneProducesOneWarningWithRatio) {
    const auto out = pipeline.render(direct(makeJpeg(1200, 400)));
    ASSERT_EQ(out.warnings.size(), 1u);
    EXPECT_NE(out.warnings[0].find("3.00"), std::string::npos) << out.warnings[0];
    EXPECT_NE(out.warnings[0].find("360°"), std::string::npos);
}

TEST_F(ResolutionPipelineTest, AspectBandIsInclusive) {
    EXPECT_FALSE(pipeline.aspectWarning(1800, 1000).has_value());
    EXPECT_FALSE(pipeline.aspectWarning(2200, 1000).has_value());
    EXPECT_TRUE(pipeline.aspectWarning(1790, 1000).has_value());
    EXPECT_TRUE(pipeline.aspectWarning(2210, 1000).has_value());

    const auto square = pipeline.aspectWarning(1000, 1000);
    ASSERT_TRUE(square.has_value());
    EXPECT_NE(square->find("1.00"), std::string::npos);
}

TEST_F(ResolutionPipelineTest, CorruptHeaderIsUnreadable) {
    std::vector<uint8_t> bogus = {0xFF, 0xD8, 0xFF, 0xE0};
    bogus.resize(4096, 0x11);

    try {
        (void)pipeline.render(direct(bogus));
        FAIL() << "expected IngestError";
    } catch (const IngestError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnreadableImage);
        EXPECT_STREQ(e.what(), "Ungültiges Bildformat");
    }
}

TEST_F(ResolutionPipelineTest, ZeroHeightFrameIsDegenerate) {
    auto jpeg = makeJpeg(1024, 512);

    // Baseline SOF0 for 3 components: FF C0 00 11 08 Yh Yl Xh Xl
    const uint8_t sof0[] = {0xFF, 0xC0, 0x00, 0x11, 0x08};
    const auto it = std::search(jpeg.begin(), jpeg.end(), std::begin(sof0), std::end(sof0));
    ASSERT_NE(it, jpeg.end());
    *(it + 5) = 0x00;
    *(it + 6) = 0x00;

    const auto dims = image::probe(jpeg);
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(dims->width, 1024);
    EXPECT_EQ(dims->height, 0);

    try {
        (void)pipeline.render(direct(jpeg));
        FAIL() << "expected IngestError";
    } catch (const IngestError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DegenerateGeometry);
        EXPECT_STREQ(e.what(), "Ungültiges Bildformat");
    }
}

TEST_F(ResolutionPipelineTest, ZeroWidthPngHeaderIsDegenerate) {
    std::vector<uint8_t> png = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
        0x00, 0x00, 0x00, 0x0D, 'I', 'H', 'D', 'R',
        0x00, 0x00, 0x00, 0x00,             // width
        0x00, 0x00, 0x08, 0x00,             // height 2048
        0x08, 0x02, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00              // crc, unchecked
    };

    try {
        (void)pipeline.render(direct(png));
        FAIL() << "expected IngestError";
    } catch (const IngestError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DegenerateGeometry);
    }
}

TEST_F(ResolutionPipelineTest, EmptyBufferIsUnreadable) {
    EXPECT_THROW((void)pipeline.render(direct({})), IngestError);
}

TEST_F(ResolutionPipelineTest, WebPSourceIsAccepted) {
    image::Bitmap bmp;
    bmp.width = 800;
    bmp.height = 400;
    bmp.rgb.assign(static_cast<size_t>(bmp.width) * bmp.height * 3, 0x80);

    std::vector<uint8_t> webp;
    image::compress_to_webp(bmp.rgb.data(), bmp.width, bmp.height, webp, 90);

    const auto out = pipeline.render(direct(webp));
    ASSERT_EQ(out.assets.size(), 3u);
    EXPECT_EQ(out.assets[0].width, 800);
    EXPECT_EQ(out.assets[2].width, 512);
    EXPECT_EQ(out.assets[2].height, 256);
}

TEST_F(ResolutionPipelineTest, RenditionsComeFromConfig) {
    pv::config::RenditionsConfig custom;
    custom.low = {256, 128, 50, false};
    const ResolutionPipeline small(cfg.ingest, custom);

    const auto out = small.render(direct(makeJpeg(1024, 512)));
    EXPECT_EQ(out.assets[2].width, 256);
    EXPECT_EQ(out.assets[2].height, 128);
}

TEST_F(ResolutionPipelineTest, RejectsInvalidRenditionConfig) {
    pv::config::RenditionsConfig broken;
    broken.medium.quality = 150;
    EXPECT_THROW(ResolutionPipeline(cfg.ingest, broken), std::invalid_argument);
}

TEST(FitInsideTest, NeverEnlargesAndNeverCollapses) {
    const auto same = image::fit_inside({100, 50}, 4096, 2048);
    EXPECT_EQ(same.width, 100);
    EXPECT_EQ(same.height, 50);

    const auto sliver = image::fit_inside({10000, 1}, 512, 256);
    EXPECT_EQ(sliver.width, 512);
    EXPECT_EQ(sliver.height, 1);

    EXPECT_THROW(image::fit_inside({0, 10}, 512, 256), std::invalid_argument);
}
