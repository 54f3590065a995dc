#include "io/rig_loader.h"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/constants.h"
#include "core/spectrum.h"
#include "core/transform.h"
#include "core/vec3.h"

using json = nlohmann::json;

namespace glnt {

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

static Vec3 ParseVec3(const json& j) {
    if (!j.is_array() || j.size() != 3) {
        throw std::runtime_error("Expected array of 3 numbers for Vec3");
    }
    return Vec3(j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
}

// A single number is a grey value
static Spectrum ParseSpectrum(const json& j) {
    if (j.is_number()) {
        return Spectrum(j.get<float>());
    }
    if (!j.is_array() || j.size() != 3) {
        throw std::runtime_error("Expected a number or an array of 3 numbers for Spectrum");
    }
    return Spectrum(j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
}

template <typename T>
static T GetOr(const json& j, const std::string& key, const T& default_value) {
    if (j.contains(key)) {
        return j[key].get<T>();
    }
    return default_value;
}

static Vec3 GetVec3Or(const json& j, const std::string& key, const Vec3& default_value) {
    if (j.contains(key)) {
        return ParseVec3(j[key]);
    }
    return default_value;
}

// Either {"matrix": [16 numbers, row-major]} or {"translate", "rotate" (deg), "scale"}
static Transform ParseTransform(const json& t) {
    if (t.contains("matrix")) {
        const auto& m = t["matrix"];
        if (!m.is_array() || m.size() != 16) {
            throw std::runtime_error("'matrix' must be an array of 16 numbers");
        }
        Float rows[4][4];
        for (int i = 0; i < 16; ++i) {
            rows[i / 4][i % 4] = m[i].get<float>();
        }
        return Transform(rows);
    }

    Vec3 translate = GetVec3Or(t, "translate", Vec3(0.0f, 0.0f, 0.0f));
    Vec3 rotate_deg = GetVec3Or(t, "rotate", Vec3(0.0f, 0.0f, 0.0f));

    // Scale can be a scalar or a [x,y,z] array
    Vec3 scale(1.0f, 1.0f, 1.0f);
    if (t.contains("scale")) {
        if (t["scale"].is_number()) {
            float s = t["scale"].get<float>();
            scale = Vec3(s, s, s);
        } else {
            scale = ParseVec3(t["scale"]);
        }
    }
    return Transform::FromTRS(translate, rotate_deg, scale);
}

static Transform GetTransformOr(const json& j) {
    return j.contains("transform") ? ParseTransform(j["transform"]) : Transform::Identity();
}

//------------------------------------------------------------------------------
// Light Parsing
//------------------------------------------------------------------------------

static Mesh ParseMesh(const json& l) {
    if (l.contains("quad")) {
        const auto& q = l["quad"];
        if (!q.is_array() || q.size() != 4) {
            throw std::runtime_error("'quad' must be an array of 4 points");
        }
        return CreateQuad(ParseVec3(q[0]), ParseVec3(q[1]), ParseVec3(q[2]), ParseVec3(q[3]));
    }

    Mesh mesh;
    for (const auto& v : l.at("vertices")) {
        mesh.p.push_back(ParseVec3(v));
    }
    for (const auto& i : l.at("indices")) {
        mesh.indices.push_back(i.get<uint32_t>());
    }
    return mesh;
}

static RigLight ParseLight(const json& l, LightRig& rig) {
    std::string type = l.at("type").get<std::string>();
    Spectrum intensity = ParseSpectrum(l.at("intensity"));

    RigLight entry;
    entry.name = GetOr<std::string>(l, "name", type);

    if (type == "point") {
        entry.light = MakePointLight(ParseVec3(l.at("position")), intensity);
    } else if (type == "spot") {
        float opening = l.at("opening_angle").get<float>();
        float penumbra = GetOr(l, "penumbra_angle", 0.0f);
        entry.light = MakeSpotLight(ParseVec3(l.at("position")), ParseVec3(l.at("direction")),
                                    intensity, DegreesToRadians(opening),
                                    DegreesToRadians(penumbra));
    } else if (type == "directional") {
        entry.light = MakeDirectionalLight(ParseVec3(l.at("direction")), intensity);
    } else if (type == "rect") {
        entry.light = MakeRectLight(GetTransformOr(l), intensity);
    } else if (type == "mesh") {
        Mesh mesh = ParseMesh(l);
        entry.light = MakeMeshLight(GetTransformOr(l), intensity, mesh);
        rig.meshes.push_back(std::move(mesh));
        entry.mesh_id = static_cast<int>(rig.meshes.size() - 1);
    } else {
        throw std::runtime_error("Unknown light type: " + type);
    }
    return entry;
}

static void ParseLights(const json& j, LightRig& rig) {
    if (!j.contains("lights")) {
        return;
    }
    const auto& lights = j["lights"];
    if (!lights.is_array()) {
        throw std::runtime_error("'lights' must be an array");
    }

    for (size_t i = 0; i < lights.size(); ++i) {
        try {
            rig.lights.push_back(ParseLight(lights[i], rig));
        } catch (const std::exception& e) {
            throw std::runtime_error("Light at index " + std::to_string(i) + ": " + e.what());
        }

        const RigLight& added = rig.lights.back();
        std::clog << "[Rig] Light '" << added.name << "' -> " << LightTypeName(added.light.type)
                  << ", intensity (" << added.light.intensity << ")" << std::endl;
    }
}

//------------------------------------------------------------------------------
// Probe Parsing
//------------------------------------------------------------------------------

static ProbeMode ParseMode(const std::string& mode) {
    if (mode == "direct") return ProbeMode::Direct;
    if (mode == "mc") return ProbeMode::MonteCarlo;
    throw std::runtime_error("Unknown probe mode: " + mode + " (expected 'direct' or 'mc')");
}

static ProbeOptions ParseProbe(const json& j) {
    ProbeOptions opts;
    if (!j.contains("probe")) {
        return opts;
    }
    const json& p = j["probe"];

    opts.plane.origin = GetVec3Or(p, "origin", opts.plane.origin);
    opts.plane.u = GetVec3Or(p, "u", opts.plane.u);
    opts.plane.v = GetVec3Or(p, "v", opts.plane.v);
    Vec3 normal = GetVec3Or(p, "normal", opts.plane.normal);
    if (!(normal.Length() > 0.0f)) {
        throw std::runtime_error("Probe normal must be a non-zero vector");
    }
    opts.plane.normal = Normalize(normal);

    opts.width = GetOr(p, "width", opts.width);
    opts.height = GetOr(p, "height", opts.height);
    if (opts.width <= 0 || opts.height <= 0) {
        throw std::runtime_error("Probe resolution must be positive");
    }

    opts.mode = ParseMode(GetOr<std::string>(p, "mode", "direct"));
    opts.samples = GetOr(p, "samples", opts.samples);
    if (opts.samples <= 0) {
        throw std::runtime_error("Probe 'samples' must be positive");
    }

    if (p.contains("strata")) {
        const auto& s = p["strata"];
        if (!s.is_array() || s.size() != 2) {
            throw std::runtime_error("'strata' must be an array of 2 integers");
        }
        opts.strata.nx = s[0].get<int>();
        opts.strata.ny = s[1].get<int>();
        if (opts.strata.nx <= 0 || opts.strata.ny <= 0) {
            throw std::runtime_error("'strata' dimensions must be positive");
        }
    }

    opts.num_threads = GetOr(p, "threads", opts.num_threads);
    opts.outfile = GetOr<std::string>(p, "output", opts.outfile);
    return opts;
}

//------------------------------------------------------------------------------
// Entry points
//------------------------------------------------------------------------------

static LightRig ParseRig(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Rig root must be a JSON object");
    }

    LightRig rig;
    ParseLights(j, rig);
    rig.probe = ParseProbe(j);

    std::clog << "[Rig] " << rig.lights.size() << " light(s), probe " << rig.probe.width << "x"
              << rig.probe.height << std::endl;
    return rig;
}

LightRig LoadRigFromString(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("JSON parse error: " + std::string(e.what()));
    }
    try {
        return ParseRig(j);
    } catch (const json::exception& e) {
        // Missing keys and type mismatches surface from nlohmann as json::exception
        throw std::runtime_error("Invalid rig: " + std::string(e.what()));
    }
}

LightRig LoadRigFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open rig file: " + path);
    }

    std::clog << "[Rig] Loading " << path << std::endl;
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return LoadRigFromString(text);
}

}  // namespace glnt
