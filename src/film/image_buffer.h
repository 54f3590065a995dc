#ifndef GLNT_FILM_IMAGE_BUFFER_H_
#define GLNT_FILM_IMAGE_BUFFER_H_

#include <vector>

#include "core/spectrum.h"

namespace glnt {

// Linear HDR image, row-major, (0,0) is top-left
class ImageBuffer {
  public:
    ImageBuffer(int width, int height);

    // Out-of-bounds writes are ignored
    void SetPixel(int x, int y, const Spectrum& s);
    const Spectrum& GetPixel(int x, int y) const;

    int width() const { return width_; }
    int height() const { return height_; }

    // Largest luminance over all pixels
    Float MaxLuminance() const;

  private:
    int width_;
    int height_;
    std::vector<Spectrum> pixels_;
};

}  // namespace glnt

#endif  // GLNT_FILM_IMAGE_BUFFER_H_
