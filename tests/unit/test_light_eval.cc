#include <gtest/gtest.h>

#include <cmath>

#include "core/constants.h"
#include "core/rng.h"
#include "lights/light.h"
#include "lights/light_eval.h"

namespace glnt {

class LightEvalTest : public ::testing::Test {
  protected:
    static constexpr float kTol = 1e-5f;

    // Shading point at `degrees` off the axis of a spot sitting at the
    // origin and pointing down -Z, one unit away
    static Point3 OffAxisPoint(float degrees) {
        float a = DegreesToRadians(degrees);
        return Point3(std::sin(a), 0.0f, -std::cos(a));
    }

    Light MakeTestSpot() const {
        return MakeSpotLight(Point3(0, 0, 0), Vec3(0, 0, -1), Spectrum(1.0f),
                             DegreesToRadians(30.0f), DegreesToRadians(5.0f));
    }
};

// ============================================================================
// Point lights
// ============================================================================

TEST_F(LightEvalTest, PointLightDirectionAndRadiance) {
    Light light = MakePointLight(Point3(0, 0, 5), Spectrum(10.0f));
    Point3 p(0, 0, 0);

    LightAttributes attrs = EvalLightAttributes(light, p, 1.0f);
    EXPECT_NEAR(attrs.L.x(), 0.0f, kTol);
    EXPECT_NEAR(attrs.L.y(), 0.0f, kTol);
    EXPECT_NEAR(attrs.L.z(), 1.0f, kTol);

    // 10 / (4 pi 25) ~= 0.03183
    Spectrum radiance = LightRadiance(light, p);
    EXPECT_NEAR(radiance.r(), 10.0f / (4.0f * kPi * 25.0f), 1e-6f);
    EXPECT_NEAR(radiance.g(), 0.031831f, 1e-5f);
}

TEST_F(LightEvalTest, PointLightFollowsInverseSquare) {
    Light light = MakePointLight(Point3(0, 0, 0), Spectrum(8.0f));

    LightAttributes near_attrs = EvalLightAttributes(light, Point3(0, 1, 0), 1.0f);
    LightAttributes far_attrs = EvalLightAttributes(light, Point3(0, 2, 0), 1.0f);
    EXPECT_NEAR(near_attrs.intensity.r(), 8.0f, kTol);
    EXPECT_NEAR(far_attrs.intensity.r(), 2.0f, kTol);
}

TEST_F(LightEvalTest, PositionOfPointAndAreaLights) {
    Light point = MakePointLight(Point3(1, 2, 3), Spectrum(1.0f));
    Point3 pos = LightPosition(point, Point3(9, 9, 9));
    EXPECT_FLOAT_EQ(pos.x(), 1.0f);
    EXPECT_FLOAT_EQ(pos.z(), 3.0f);

    Light rect = MakeRectLight(Transform::Translate(Vec3(0, 4, 0)), Spectrum(1.0f));
    Point3 center = LightPosition(rect, Point3());
    EXPECT_NEAR(center.y(), 4.0f, kTol);
}

TEST_F(LightEvalTest, CoincidentPointGivesZeroDirection) {
    Light light = MakePointLight(Point3(0, 0, 0), Spectrum(1.0f));
    LightAttributes attrs = EvalLightAttributes(light, Point3(0.01f, 0, 0), 1.0f);
    EXPECT_TRUE(attrs.L.IsZero());
    EXPECT_TRUE(attrs.intensity.IsFinite());
    EXPECT_FALSE(attrs.intensity.HasNaNs());
}

// ============================================================================
// Spot cone
// ============================================================================

TEST_F(LightEvalTest, SpotOnAxisIsFullyLit) {
    Light spot = MakeTestSpot();
    LightAttributes attrs = EvalLightAttributes(spot, OffAxisPoint(0.0f), 1.0f);
    EXPECT_NEAR(attrs.intensity.r(), 1.0f, kTol);
}

TEST_F(LightEvalTest, SpotInsideInnerConeIsFullyLit) {
    Light spot = MakeTestSpot();
    LightAttributes attrs = EvalLightAttributes(spot, OffAxisPoint(20.0f), 1.0f);
    EXPECT_NEAR(attrs.intensity.r(), 1.0f, kTol);
}

TEST_F(LightEvalTest, SpotPenumbraIsPartial) {
    Light spot = MakeTestSpot();
    LightAttributes attrs = EvalLightAttributes(spot, OffAxisPoint(28.0f), 1.0f);
    EXPECT_GT(attrs.intensity.r(), 0.0f);
    EXPECT_LT(attrs.intensity.r(), 1.0f);
    // Linear ramp across the 5 degree band: (30 - 28) / 5
    EXPECT_NEAR(attrs.intensity.r(), 0.4f, 1e-3f);
}

TEST_F(LightEvalTest, SpotOutsideConeIsDark) {
    Light spot = MakeTestSpot();
    LightAttributes attrs = EvalLightAttributes(spot, OffAxisPoint(35.0f), 1.0f);
    EXPECT_EQ(attrs.intensity.r(), 0.0f);
    EXPECT_TRUE(attrs.intensity.IsBlack());
}

TEST_F(LightEvalTest, SpotFalloffNeverIncreasesWithAngle) {
    Light spot = MakeTestSpot();
    float prev = EvalLightAttributes(spot, OffAxisPoint(0.0f), 1.0f).intensity.r();
    for (float deg = 0.5f; deg <= 40.0f; deg += 0.5f) {
        float cur = EvalLightAttributes(spot, OffAxisPoint(deg), 1.0f).intensity.r();
        EXPECT_LE(cur, prev + kTol) << "at " << deg << " degrees";
        prev = cur;
    }
}

TEST_F(LightEvalTest, SpotWithoutPenumbraHasHardEdge) {
    Light spot = MakeSpotLight(Point3(0, 0, 0), Vec3(0, 0, -1), Spectrum(1.0f),
                               DegreesToRadians(30.0f), 0.0f);
    EXPECT_NEAR(EvalLightAttributes(spot, OffAxisPoint(29.0f), 1.0f).intensity.r(), 1.0f, kTol);
    EXPECT_EQ(EvalLightAttributes(spot, OffAxisPoint(31.0f), 1.0f).intensity.r(), 0.0f);
}

// ============================================================================
// Directional lights
// ============================================================================

TEST_F(LightEvalTest, DirectionalIgnoresShadingPoint) {
    Light sun = MakeDirectionalLight(Vec3(0, -1, 0), Spectrum(3.0f));

    for (const Point3& p : {Point3(0, 0, 0), Point3(100, -5, 3), Point3(-1, 1e4f, 0)}) {
        LightAttributes attrs = EvalLightAttributes(sun, p, 1.0f);
        EXPECT_FLOAT_EQ(attrs.L.x(), 0.0f);
        EXPECT_FLOAT_EQ(attrs.L.y(), 1.0f);
        EXPECT_FLOAT_EQ(attrs.L.z(), 0.0f);
        EXPECT_FLOAT_EQ(attrs.intensity.r(), 3.0f);
    }
}

TEST_F(LightEvalTest, DirectionalPositionIsBehindShadingPoint) {
    Light sun = MakeDirectionalLight(Vec3(0, -1, 0), Spectrum(1.0f));
    Point3 p(0, 3, 4);  // 5 units from the stored (origin) position
    Point3 pos = LightPosition(sun, p);
    EXPECT_NEAR(pos.x(), 0.0f, kTol);
    EXPECT_NEAR(pos.y(), 8.0f, kTol);
    EXPECT_NEAR(pos.z(), 4.0f, kTol);

    EXPECT_FLOAT_EQ(LightRadiance(sun, p).r(), 1.0f);
}

// ============================================================================
// Area lights
// ============================================================================

TEST_F(LightEvalTest, AreaLightFrontAndBack) {
    // 2x2 quad at the origin emitting toward +Z
    Light rect = MakeRectLight(Transform(), Spectrum(1.0f));

    LightAttributes front = EvalLightAttributes(rect, Point3(0, 0, 2), 1.0f);
    // cos = 1, area 4, distance^2 4
    EXPECT_NEAR(front.intensity.r(), 1.0f, kTol);

    LightAttributes back = EvalLightAttributes(rect, Point3(0, 0, -2), 1.0f);
    EXPECT_EQ(back.intensity.r(), 0.0f);
    EXPECT_TRUE(back.intensity.IsBlack());
}

TEST_F(LightEvalTest, AreaLightAxisFollowsTransform) {
    // Rotated to face -Y, hanging at y = 3
    Light rect = MakeRectLight(Transform::FromTRS(Vec3(0, 3, 0), Vec3(90, 0, 0), Vec3(1, 1, 1)),
                               Spectrum(1.0f));
    Vec3 axis = LightAxis(rect);
    EXPECT_NEAR(axis.y(), -1.0f, kTol);

    EXPECT_GT(EvalLightAttributes(rect, Point3(0, 0, 0), 1.0f).intensity.r(), 0.0f);
    EXPECT_EQ(EvalLightAttributes(rect, Point3(0, 6, 0), 1.0f).intensity.r(), 0.0f);
}

// ============================================================================
// Record contract
// ============================================================================

TEST_F(LightEvalTest, ShadowPassedThroughAndPdfLeftZero) {
    Light light = MakePointLight(Point3(0, 0, 5), Spectrum(1.0f));
    LightAttributes attrs = EvalLightAttributes(light, Point3(), 0.25f);
    EXPECT_FLOAT_EQ(attrs.shadow, 0.25f);
    EXPECT_EQ(attrs.pdf, 0.0f);
    EXPECT_TRUE(attrs.n.IsZero());
    for (const Point3& c : attrs.corners) {
        EXPECT_TRUE(c.IsZero());
    }
}

TEST_F(LightEvalTest, IntensityIsFiniteAndNonNegative) {
    Light lights[] = {
        MakePointLight(Point3(0, 1, 0), Spectrum(2.0f)),
        MakeTestSpot(),
        MakeDirectionalLight(Vec3(1, -1, 0), Spectrum(1.0f)),
        MakeRectLight(Transform::Translate(Vec3(0, 0, 1)), Spectrum(5.0f)),
    };

    RNG rng(7, 3);
    for (const Light& light : lights) {
        for (int i = 0; i < 200; ++i) {
            Vec3 u = rng.UniformVec3();
            Point3 p(4.0f * u.x() - 2.0f, 4.0f * u.y() - 2.0f, 4.0f * u.z() - 2.0f);
            LightAttributes attrs = EvalLightAttributes(light, p, 1.0f);
            EXPECT_TRUE(attrs.intensity.IsFinite()) << LightTypeName(light.type);
            EXPECT_GE(attrs.intensity.MinComponent(), 0.0f) << LightTypeName(light.type);
        }
    }
}

}  // namespace glnt
