#include <gtest/gtest.h>

#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

#include "film/image_buffer.h"
#include "io/image_io.h"

namespace glnt {

// ============================================================================
// ImageBuffer
// ============================================================================

TEST(ImageBufferTest, StoresPixelsAndReportsPeak) {
    ImageBuffer buf(4, 3);
    EXPECT_EQ(buf.width(), 4);
    EXPECT_EQ(buf.height(), 3);
    EXPECT_TRUE(buf.GetPixel(3, 2).IsBlack());

    buf.SetPixel(1, 2, Spectrum(0.5f, 1.0f, 2.0f));
    EXPECT_FLOAT_EQ(buf.GetPixel(1, 2).b(), 2.0f);
    EXPECT_FLOAT_EQ(buf.MaxLuminance(), Spectrum(0.5f, 1.0f, 2.0f).Luminance());
}

TEST(ImageBufferTest, OutOfBoundsWritesAreIgnored) {
    ImageBuffer buf(2, 2);
    buf.SetPixel(-1, 0, Spectrum(1.0f));
    buf.SetPixel(2, 0, Spectrum(1.0f));
    buf.SetPixel(0, 5, Spectrum(1.0f));
    EXPECT_FLOAT_EQ(buf.MaxLuminance(), 0.0f);
    EXPECT_THROW(buf.GetPixel(2, 0), std::out_of_range);
}

TEST(ImageBufferTest, RejectsEmptyDimensions) {
    EXPECT_THROW(ImageBuffer(0, 4), std::invalid_argument);
    EXPECT_THROW(ImageBuffer(4, -1), std::invalid_argument);
}

// ============================================================================
// Tonemapping
// ============================================================================

TEST(TonemapTest, BlackAndSaturation) {
    auto black = TonemapTo8Bit(Spectrum(0.0f));
    EXPECT_EQ(black[0], 0);
    EXPECT_EQ(black[2], 0);

    auto bright = TonemapTo8Bit(Spectrum(1e9f));
    EXPECT_EQ(bright[0], 255);

    // Reinhard maps 1 -> 0.5, then gamma 2.2
    auto mid = TonemapTo8Bit(Spectrum(1.0f));
    int expected = static_cast<int>(255.0f * std::pow(0.5f, 1.0f / 2.2f));
    EXPECT_NEAR(mid[1], expected, 1);
}

TEST(TonemapTest, NonFiniteAndNegativeValues) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    auto rgb = TonemapTo8Bit(Spectrum(nan, inf, -3.0f));
    EXPECT_EQ(rgb[0], 0);
    EXPECT_EQ(rgb[1], TonemapTo8Bit(Spectrum(1.0f))[1]);  // inf is treated as 1
    EXPECT_EQ(rgb[2], 0);
}

// ============================================================================
// Writers
// ============================================================================

class ImageIOTest : public ::testing::Test {
  protected:
    void SetUp() override {
        buf_.SetPixel(0, 0, Spectrum(1.0f, 0.0f, 0.0f));
        buf_.SetPixel(2, 1, Spectrum(0.2f, 0.4f, 0.8f));
    }

    static std::string ReadPrefix(const std::string& path, size_t n) {
        std::ifstream in(path, std::ios::binary);
        std::string data(n, '\0');
        in.read(&data[0], static_cast<std::streamsize>(n));
        data.resize(static_cast<size_t>(in.gcount()));
        return data;
    }

    ImageBuffer buf_{3, 2};
};

TEST_F(ImageIOTest, WritesPPMHeader) {
    std::string path = ::testing::TempDir() + "glint_image_io_test.ppm";
    ImageIO::Save(buf_, path);

    std::ifstream in(path);
    std::string magic;
    int w = 0, h = 0, maxval = 0;
    in >> magic >> w >> h >> maxval;
    EXPECT_EQ(magic, "P3");
    EXPECT_EQ(w, 3);
    EXPECT_EQ(h, 2);
    EXPECT_EQ(maxval, 255);

    int r = -1, g = -1, b = -1;
    in >> r >> g >> b;
    EXPECT_GT(r, 0);
    EXPECT_EQ(g, 0);
    EXPECT_EQ(b, 0);
}

TEST_F(ImageIOTest, WritesPNGSignature) {
    std::string path = ::testing::TempDir() + "glint_image_io_test.png";
    ImageIO::Save(buf_, path);
    EXPECT_EQ(ReadPrefix(path, 8), std::string("\x89PNG\r\n\x1a\n", 8));
}

TEST_F(ImageIOTest, WritesEXRMagic) {
    std::string path = ::testing::TempDir() + "glint_image_io_test.exr";
    ImageIO::Save(buf_, path);
    EXPECT_EQ(ReadPrefix(path, 4), std::string("\x76\x2f\x31\x01", 4));
}

TEST_F(ImageIOTest, ExtensionIsCaseInsensitive) {
    std::string path = ::testing::TempDir() + "glint_image_io_upper.PPM";
    EXPECT_NO_THROW(ImageIO::Save(buf_, path));
    EXPECT_EQ(ReadPrefix(path, 2), "P3");
}

TEST_F(ImageIOTest, UnknownExtensionThrows) {
    EXPECT_THROW(ImageIO::Save(buf_, ::testing::TempDir() + "glint.bmp"), std::runtime_error);
    EXPECT_THROW(ImageIO::Save(buf_, ::testing::TempDir() + "no_extension"), std::runtime_error);
}

TEST_F(ImageIOTest, UnwritablePathThrows) {
    EXPECT_THROW(ImageIO::Save(buf_, "/nonexistent/dir/out.ppm"), std::runtime_error);
}

}  // namespace glnt
