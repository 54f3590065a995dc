#ifndef GLNT_IO_IMAGE_IO_H_
#define GLNT_IO_IMAGE_IO_H_

#include <array>
#include <cstdint>
#include <string>

#include "core/spectrum.h"
#include "film/image_buffer.h"

namespace glnt {

// Reinhard + gamma 2.2, negatives clamped. Returns 8-bit RGB.
std::array<uint8_t, 3> TonemapTo8Bit(const Spectrum& s);

class ImageIO {
  public:
    // ASCII P3, tonemapped
    static void SavePPM(const ImageBuffer& buf, const std::string& filename);

    // 8-bit RGB via libpng, tonemapped
    static void SavePNG(const ImageBuffer& buf, const std::string& filename);

    // Linear float RGBA via OpenEXR, alpha = 1
    static void SaveEXR(const ImageBuffer& buf, const std::string& filename);

    // Picks the writer from the extension (.ppm, .png, .exr).
    // Throws std::runtime_error for anything else or on write failure.
    static void Save(const ImageBuffer& buf, const std::string& filename);
};

}  // namespace glnt

#endif  // GLNT_IO_IMAGE_IO_H_
