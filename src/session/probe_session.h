#ifndef GLNT_SESSION_PROBE_SESSION_H_
#define GLNT_SESSION_PROBE_SESSION_H_

#include <memory>
#include <string>

#include "core/rng.h"
#include "core/spectrum.h"
#include "core/vec3.h"
#include "io/rig_loader.h"
#include "session/probe_options.h"

/*
 * Drives the light routines over a receiver plane.
 * Every pixel of the probe is a shading point; the image stores the
 * cosine-weighted light arriving there, summed over all lights of the rig.
 */

namespace glnt {

class ImageBuffer;

class ProbeSession {
  public:
    ProbeSession();
    ~ProbeSession();

    // SETUP: Load lights and probe options from a JSON rig
    void LoadRigFromFile(const std::string& rig_file);
    void SetRig(LightRig rig);

    // Command-line overrides go through here after loading
    ProbeOptions& options() { return rig_.probe; }
    const LightRig& rig() const { return rig_; }

    // EXECUTE: Evaluate every pixel of the probe
    void Render();

    // OUTPUT: Write the image to options().outfile
    void Save() const;

    // Valid after Render()
    const ImageBuffer& image() const;

    // One estimate at shading point `x` in the current mode. `sample_index`
    // selects the stratum for rect lights. Direct mode ignores both `rng` and it.
    Spectrum ShadePoint(const Point3& x, RNG& rng, int sample_index) const;

  private:
    Spectrum ShadeDirect(const Point3& x) const;
    Spectrum ShadeSampled(const Point3& x, RNG& rng, int sample_index) const;

    LightRig rig_;
    std::unique_ptr<ImageBuffer> image_;
};

}  // namespace glnt

#endif  // GLNT_SESSION_PROBE_SESSION_H_
