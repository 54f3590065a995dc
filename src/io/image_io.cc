#include "io/image_io.h"

#include <OpenEXR/ImfChannelList.h>
#include <OpenEXR/ImfFrameBuffer.h>
#include <OpenEXR/ImfHeader.h>
#include <OpenEXR/ImfOutputFile.h>
#include <png.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace glnt {

std::array<uint8_t, 3> TonemapTo8Bit(const Spectrum& s) {
    std::array<uint8_t, 3> out{};
    for (int i = 0; i < 3; ++i) {
        // NaN compares false and lands on 0
        Float v = s[i] > 0.0f ? s[i] : 0.0f;
        if (std::isinf(v)) v = 1.0f;
        v = v / (1.0f + v);
        v = std::pow(v, 1.0f / 2.2f);
        out[i] = static_cast<uint8_t>(255.999f * std::clamp(v, 0.0f, 1.0f));
    }
    return out;
}

void ImageIO::SavePPM(const ImageBuffer& buf, const std::string& filename) {
    std::ofstream out(filename);
    if (!out) {
        throw std::runtime_error("Could not open " + filename + " for writing");
    }

    // PPM Header: P3 = ASCII RGB, then width, height, max_val
    out << "P3\n" << buf.width() << " " << buf.height() << "\n255\n";
    for (int y = 0; y < buf.height(); ++y) {
        for (int x = 0; x < buf.width(); ++x) {
            auto c = TonemapTo8Bit(buf.GetPixel(x, y));
            out << static_cast<int>(c[0]) << " " << static_cast<int>(c[1]) << " "
                << static_cast<int>(c[2]) << "\n";
        }
    }

    if (!out) {
        throw std::runtime_error("Failed while writing " + filename);
    }
    std::clog << "[Image] Wrote " << filename << std::endl;
}

void ImageIO::SavePNG(const ImageBuffer& buf, const std::string& filename) {
    const int width = buf.width();
    const int height = buf.height();

    FILE* fp = fopen(filename.c_str(), "wb");
    if (!fp) {
        throw std::runtime_error("Failed to open PNG file for writing: " + filename);
    }

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        fclose(fp);
        throw std::runtime_error("Failed to create PNG write struct");
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        fclose(fp);
        throw std::runtime_error("Failed to create PNG info struct");
    }

    // Rows live outside the setjmp scope so longjmp never skips a destructor
    std::vector<uint8_t> row(static_cast<size_t>(width) * 3);

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        fclose(fp);
        throw std::runtime_error("PNG write error: " + filename);
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info, width, height, 8, PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            auto c = TonemapTo8Bit(buf.GetPixel(x, y));
            row[static_cast<size_t>(x) * 3 + 0] = c[0];
            row[static_cast<size_t>(x) * 3 + 1] = c[1];
            row[static_cast<size_t>(x) * 3 + 2] = c[2];
        }
        png_write_row(png, row.data());
    }

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    fclose(fp);
    std::clog << "[Image] Wrote " << filename << std::endl;
}

void ImageIO::SaveEXR(const ImageBuffer& buf, const std::string& filename) {
    const int width = buf.width();
    const int height = buf.height();
    const size_t count = static_cast<size_t>(width) * height;

    Imf::Header header(width, height);
    header.channels().insert("R", Imf::Channel(Imf::FLOAT));
    header.channels().insert("G", Imf::Channel(Imf::FLOAT));
    header.channels().insert("B", Imf::Channel(Imf::FLOAT));
    header.channels().insert("A", Imf::Channel(Imf::FLOAT));

    // Separate channels
    std::vector<float> r(count), g(count), b(count), a(count, 1.0f);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            size_t idx = static_cast<size_t>(y) * width + x;
            const Spectrum& s = buf.GetPixel(x, y);
            r[idx] = s.r();
            g[idx] = s.g();
            b[idx] = s.b();
        }
    }

    auto slice = [width](std::vector<float>& data) {
        return Imf::Slice(Imf::FLOAT, reinterpret_cast<char*>(data.data()), sizeof(float),
                          sizeof(float) * width);
    };

    try {
        Imf::OutputFile file(filename.c_str(), header);
        Imf::FrameBuffer frame_buffer;
        frame_buffer.insert("R", slice(r));
        frame_buffer.insert("G", slice(g));
        frame_buffer.insert("B", slice(b));
        frame_buffer.insert("A", slice(a));
        file.setFrameBuffer(frame_buffer);
        file.writePixels(height);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to write EXR " + filename + ": " + e.what());
    }
    std::clog << "[Image] Wrote " << filename << std::endl;
}

static std::string LowerExtension(const std::string& filename) {
    auto dot = filename.find_last_of('.');
    if (dot == std::string::npos) return "";
    std::string ext = filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return ext;
}

void ImageIO::Save(const ImageBuffer& buf, const std::string& filename) {
    std::string ext = LowerExtension(filename);
    if (ext == "ppm") {
        SavePPM(buf, filename);
    } else if (ext == "png") {
        SavePNG(buf, filename);
    } else if (ext == "exr") {
        SaveEXR(buf, filename);
    } else {
        throw std::runtime_error("Unsupported image extension for '" + filename +
                                 "' (expected .ppm, .png or .exr)");
    }
}

}  // namespace glnt
