#include "view/Camera.h"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace Tessera;

TEST(Camera, ZoomStaysPositive) {
  for (float dt : {0.0f, 0.001f, 1.0f / 60.0f, 0.5f, 10.0f, 100.0f}) {
    Camera cam;
    cam.setTargetZoom(0.125f);
    cam.tick(dt);
    EXPECT_GT(cam.zoom(), 0.0f) << "dt=" << dt;

    cam.setTargetZoom(64.0f);
    cam.tick(dt);
    EXPECT_GT(cam.zoom(), 0.0f) << "dt=" << dt;
  }
}

TEST(Camera, ZoomSmoothingIsFrameRateIndependent) {
  Camera coarse;
  Camera fine;
  coarse.setTargetZoom(4.0f);
  fine.setTargetZoom(4.0f);

  coarse.tick(0.5f);
  for (int i = 0; i < 50; ++i)
    fine.tick(0.01f);

  EXPECT_NEAR(coarse.zoom(), fine.zoom(), 1e-3f);
  EXPECT_GT(coarse.zoom(), 1.0f);
  EXPECT_LT(coarse.zoom(), 4.0f);
}

TEST(Camera, NonPositiveTargetZoomIsIgnored) {
  Camera cam;
  cam.setTargetZoom(2.0f);
  cam.setTargetZoom(0.0f);
  cam.setTargetZoom(-3.0f);
  EXPECT_FLOAT_EQ(cam.targetZoom(), 2.0f);
}

TEST(Camera, EasingLandsExactlyOnTargetForAnyStepSplit) {
  const Vector2 target{100.0f, -50.0f};
  const std::vector<std::vector<float>> splits = {
      {0.25f, 0.25f, 0.25f, 0.25f},
      {0.5f, 0.125f, 0.375f},
      {1.0f},
      {0.75f, 0.5f},
  };

  for (const auto &steps : splits) {
    Camera cam;
    cam.setPosition({10.0f, 10.0f});
    cam.easeTo(target);
    for (float dt : steps)
      cam.tick(dt);

    EXPECT_EQ(cam.position(), target);
    EXPECT_FALSE(cam.isEasing());
    EXPECT_EQ(cam.velocity(), Vector2{});
    EXPECT_EQ(cam.acceleration(), Vector2{});
  }
}

TEST(Camera, EasingIsUnfinishedBeforeDuration) {
  Camera cam;
  cam.easeTo({100.0f, 0.0f});
  cam.tick(0.25f);
  cam.tick(0.25f);

  ASSERT_TRUE(cam.isEasing());
  EXPECT_GT(cam.position().x, 0.0f);
  EXPECT_LT(cam.position().x, 100.0f);
  ASSERT_TRUE(cam.easingTarget().has_value());
  EXPECT_EQ(*cam.easingTarget(), Vector2(100.0f, 0.0f));
}

TEST(Camera, EaseToCancelsVelocityAndBlocksAcceleration) {
  Camera cam;
  cam.setVelocity({5.0f, 5.0f});
  cam.setAccelerationX(10.0f);

  cam.easeTo({1.0f, 1.0f});
  EXPECT_EQ(cam.velocity(), Vector2{});
  EXPECT_EQ(cam.acceleration(), Vector2{});

  cam.setAccelerationX(10.0f);
  EXPECT_EQ(cam.acceleration(), Vector2{});
}

TEST(Camera, NewEaseOverridesPendingOne) {
  Camera cam;
  cam.easeTo({100.0f, 0.0f});
  cam.tick(0.5f);
  cam.easeTo({-20.0f, 0.0f});
  EXPECT_EQ(*cam.easingTarget(), Vector2(-20.0f, 0.0f));

  const auto &ease = std::get<EasingMotion>(cam.motion());
  EXPECT_EQ(ease.start, cam.position());
  EXPECT_FLOAT_EQ(ease.elapsed, 0.0f);
}

TEST(Camera, ReleaseEasingIsNoOpWhenInertial) {
  Camera cam;
  cam.setVelocity({3.0f, 4.0f});
  cam.setAccelerationY(-2.0f);
  cam.tick(0.1f);

  const Vector2 pos = cam.position();
  const Vector2 vel = cam.velocity();
  const Vector2 acc = cam.acceleration();

  cam.releaseEasing();

  EXPECT_FALSE(cam.isEasing());
  EXPECT_EQ(cam.position(), pos);
  EXPECT_EQ(cam.velocity(), vel);
  EXPECT_EQ(cam.acceleration(), acc);
}

TEST(Camera, ReleaseEasingBeforeAnyTickGivesZeroVelocity) {
  Camera cam;
  ASSERT_FLOAT_EQ(cam.lastDt(), 0.0f);
  cam.easeTo({100.0f, 100.0f});
  cam.releaseEasing();

  EXPECT_FALSE(cam.isEasing());
  EXPECT_EQ(cam.velocity(), Vector2{});
}

TEST(Camera, ReleaseEasingKeepsApparentVelocity) {
  Camera cam;
  cam.easeTo({100.0f, 0.0f});
  cam.tick(0.1f); // progress 0: still at start
  cam.tick(0.1f); // progress 0.1: half way

  ASSERT_NEAR(cam.position().x, 50.0f, 1e-3f);
  cam.releaseEasing();

  EXPECT_FALSE(cam.isEasing());
  EXPECT_NEAR(cam.velocity().x, 500.0f, 1e-2f);
  EXPECT_FLOAT_EQ(cam.velocity().y, 0.0f);
  EXPECT_EQ(cam.acceleration(), Vector2{});
}

TEST(Camera, DampingLawIsIndependentOfStepSplit) {
  const Vector2 v0{100.0f, -50.0f};
  const float damping = CameraTuning{}.damping;
  const std::vector<std::vector<float>> splits = {
      {1.0f},
      {0.1f, 0.2f, 0.3f, 0.4f},
      {0.5f, 0.5f},
  };

  for (const auto &steps : splits) {
    Camera cam;
    cam.setVelocity(v0);
    for (float dt : steps)
      cam.tick(dt);

    const float f = std::pow(damping, 1.0f);
    EXPECT_NEAR(cam.velocity().x, v0.x * f, 1e-4f);
    EXPECT_NEAR(cam.velocity().y, v0.y * f, 1e-4f);
  }
}

TEST(Camera, InertialIntegrationMovesPosition) {
  Camera cam;
  cam.setVelocity({10.0f, 0.0f});
  cam.tick(0.5f);
  EXPECT_FLOAT_EQ(cam.position().x, 5.0f);
  EXPECT_EQ(cam.lastPosition(), Vector2{});
  EXPECT_FLOAT_EQ(cam.lastDt(), 0.5f);
}

TEST(Camera, TuningChangesConstants) {
  CameraTuning t{};
  t.easingDuration = 0.5f;
  Camera cam(t);
  cam.easeTo({8.0f, 8.0f});
  cam.tick(0.25f);
  cam.tick(0.25f);
  EXPECT_EQ(cam.position(), Vector2(8.0f, 8.0f));
}
