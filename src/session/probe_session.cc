#include "session/probe_session.h"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "core/sampling.h"
#include "film/image_buffer.h"
#include "io/image_io.h"
#include "lights/light_eval.h"
#include "lights/light_sample.h"
#include "lights/mesh_light.h"

namespace glnt {

ProbeSession::ProbeSession() {}
ProbeSession::~ProbeSession() = default;

void ProbeSession::LoadRigFromFile(const std::string& rig_file) {
    SetRig(glnt::LoadRigFromFile(rig_file));
}

void ProbeSession::SetRig(LightRig rig) {
    rig_ = std::move(rig);
    image_.reset();
}

const ImageBuffer& ProbeSession::image() const {
    if (!image_) {
        throw std::logic_error("ProbeSession::image() called before Render()");
    }
    return *image_;
}

Spectrum ProbeSession::ShadeDirect(const Point3& x) const {
    const Vec3& normal = rig_.probe.plane.normal;
    Spectrum sum;
    for (const RigLight& entry : rig_.lights) {
        LightAttributes attrs = EvalLightAttributes(entry.light, x, 1.0f);
        Float cos_theta = std::max(0.0f, Dot(normal, attrs.L));
        sum += attrs.intensity * (cos_theta * attrs.shadow);
    }
    return sum;
}

Spectrum ProbeSession::ShadeSampled(const Point3& x, RNG& rng, int sample_index) const {
    const ProbeOptions& opts = rig_.probe;
    StratumIndex stratum{sample_index % opts.strata.nx,
                         (sample_index / opts.strata.nx) % opts.strata.ny};

    Spectrum sum;
    for (const RigLight& entry : rig_.lights) {
        std::optional<LightAttributes> attrs;
        if (entry.mesh_id >= 0) {
            MeshLightGeometry geometry(rig_.meshes[entry.mesh_id]);
            attrs = SampleMeshLight(x, entry.light, geometry, rng.UniformVec3());
        } else if (entry.light.type == LightType::Area) {
            attrs = SampleRectLight(x, entry.light, rng.UniformVec2(), stratum, opts.strata);
        } else {
            attrs = SampleLight(x, entry.light, rng.UniformVec3());
        }

        // No sample for this light type: contributes nothing
        if (!attrs) continue;

        Float cos_theta = std::max(0.0f, Dot(opts.plane.normal, attrs->L));
        sum += attrs->intensity * (cos_theta * attrs->shadow);
    }
    return sum;
}

Spectrum ProbeSession::ShadePoint(const Point3& x, RNG& rng, int sample_index) const {
    if (rig_.probe.mode == ProbeMode::Direct) {
        return ShadeDirect(x);
    }
    return ShadeSampled(x, rng, sample_index);
}

void ProbeSession::Render() {
    const ProbeOptions& opts = rig_.probe;
    const int width = opts.width;
    const int height = opts.height;
    const int spp = opts.mode == ProbeMode::Direct ? 1 : opts.samples;

    // Workers must not throw, so reject bad options up front
    if (spp <= 0 || opts.strata.nx <= 0 || opts.strata.ny <= 0) {
        throw std::invalid_argument("Probe needs positive samples and strata");
    }

    image_ = std::make_unique<ImageBuffer>(width, height);

    int thread_count = opts.num_threads;
    if (thread_count <= 0) {
        thread_count = static_cast<int>(std::thread::hardware_concurrency());
        if (thread_count == 0) thread_count = 4;  // Fallback
    }
    thread_count = std::min(thread_count, height);

    std::clog << "[Probe] " << width << "x" << height << ", "
              << (opts.mode == ProbeMode::Direct ? "direct" : "mc") << ", " << spp
              << " spp, " << thread_count << " threads" << std::endl;

    // Scanline work-stealing; each row is written by exactly one worker
    std::atomic<int> next_scanline(0);

    auto worker = [&]() {
        while (true) {
            int y = next_scanline.fetch_add(1);
            if (y >= height) break;

            for (int x = 0; x < width; ++x) {
                Spectrum sum;
                for (int s = 0; s < spp; ++s) {
                    RNG rng = MakeDeterministicPixelRNG(x, y, width, s);

                    Float jx = 0.5f, jy = 0.5f;
                    if (opts.mode == ProbeMode::MonteCarlo) {
                        jx = rng.UniformFloat();
                        jy = rng.UniformFloat();
                    }
                    Point3 p = opts.plane.origin + ((x + jx) / width) * opts.plane.u +
                               ((y + jy) / height) * opts.plane.v;
                    sum += ShadePoint(p, rng, s);
                }
                image_->SetPixel(x, y, sum / static_cast<Float>(spp));
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(thread_count);
    for (int i = 0; i < thread_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    std::clog << "[Probe] Done, peak luminance " << image_->MaxLuminance() << std::endl;
}

void ProbeSession::Save() const { ImageIO::Save(image(), rig_.probe.outfile); }

}  // namespace glnt
