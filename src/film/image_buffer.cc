#include "film/image_buffer.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace glnt {

ImageBuffer::ImageBuffer(int width, int height) : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Invalid image dimensions " + std::to_string(width) + "x" +
                                    std::to_string(height));
    }
    pixels_.resize(static_cast<size_t>(width) * height);
}

void ImageBuffer::SetPixel(int x, int y, const Spectrum& s) {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
    pixels_[static_cast<size_t>(y) * width_ + x] = s;
}

const Spectrum& ImageBuffer::GetPixel(int x, int y) const {
    return pixels_.at(static_cast<size_t>(y) * width_ + x);
}

Float ImageBuffer::MaxLuminance() const {
    Float max_lum = 0.0f;
    for (const auto& p : pixels_) {
        max_lum = std::max(max_lum, p.Luminance());
    }
    return max_lum;
}

}  // namespace glnt
