#include "editor/InteractionController.h"

#include <gtest/gtest.h>

using namespace Tessera;

namespace {

// Camera at the origin with zoom 1 and a 200x200 viewport at (0, 0):
// world = screen - (100, 100).
struct Harness {
  InteractionController ctl;
  InputState in{};
  ViewportState vp{true, {0.0f, 0.0f}, {200.0f, 200.0f}};
  Table table{"normal", "table.png", {1000.0f, 1000.0f}, {}};
  bool wantText = false;

  ElementID add(float x, float y) {
    Element e{};
    e.position = {x, y};
    return table.elements.create(std::move(e));
  }

  void mouseAtWorld(float x, float y) {
    in.mouseX = x + 100.0;
    in.mouseY = y + 100.0;
  }

  void tap(Key k) {
    in.press(k);
    in.release(k);
  }

  InteractionEvents step(float dt = 0.0f, Table *t = nullptr,
                         bool useTable = true) {
    Table *active = useTable ? (t ? t : &table) : nullptr;
    const InteractionEvents ev = ctl.update(dt, in, vp, wantText, active);
    in.clearEdges();
    return ev;
  }
};

} // namespace

TEST(InteractionController, DragFollowsMouseWithFixedOffset) {
  Harness h;
  const ElementID id = h.add(50.0f, 50.0f);

  h.mouseAtWorld(55.0f, 55.0f);
  h.in.press(Key::MouseRight);
  h.step();

  ASSERT_TRUE(h.ctl.isDragging());
  EXPECT_EQ(h.ctl.activeElement(), id);
  EXPECT_EQ(h.ctl.dragOffset(), Vector2(-5.0f, -5.0f));
  EXPECT_EQ(h.table.elements.find(id)->position, Vector2(50.0f, 50.0f));

  h.in.release(Key::MouseRight);
  h.mouseAtWorld(80.0f, 80.0f);
  const auto ev = h.step();

  EXPECT_TRUE(ev.elementMoved);
  EXPECT_EQ(h.table.elements.find(id)->position, Vector2(75.0f, 75.0f));
}

TEST(InteractionController, DragPositionsAreFloored) {
  Harness h;
  const ElementID id = h.add(50.0f, 50.0f);

  h.mouseAtWorld(55.0f, 55.0f);
  h.tap(Key::MouseRight);
  h.step();

  h.mouseAtWorld(80.7f, 60.2f);
  h.step();
  EXPECT_EQ(h.table.elements.find(id)->position, Vector2(75.0f, 55.0f));
}

TEST(InteractionController, SecondClickEndsDragAndElementStays) {
  Harness h;
  const ElementID id = h.add(50.0f, 50.0f);

  h.mouseAtWorld(55.0f, 55.0f);
  h.tap(Key::MouseRight);
  h.step();

  h.mouseAtWorld(80.0f, 80.0f);
  h.step();
  ASSERT_EQ(h.table.elements.find(id)->position, Vector2(75.0f, 75.0f));

  h.tap(Key::MouseRight);
  h.step();
  EXPECT_FALSE(h.ctl.isDragging());
  EXPECT_EQ(h.table.elements.find(id)->position, Vector2(75.0f, 75.0f));

  h.mouseAtWorld(300.0f, 300.0f);
  const auto ev = h.step();
  EXPECT_FALSE(ev.elementMoved);
  EXPECT_EQ(h.table.elements.find(id)->position, Vector2(75.0f, 75.0f));
}

TEST(InteractionController, HoldingButtonDoesNotEndDrag) {
  Harness h;
  h.add(50.0f, 50.0f);

  h.mouseAtWorld(55.0f, 55.0f);
  h.in.press(Key::MouseRight);
  h.step();
  h.step();
  h.step();
  EXPECT_TRUE(h.ctl.isDragging());
}

TEST(InteractionController, RemovedElementEndsDrag) {
  Harness h;
  const ElementID id = h.add(50.0f, 50.0f);

  h.mouseAtWorld(55.0f, 55.0f);
  h.tap(Key::MouseRight);
  h.step();
  ASSERT_TRUE(h.ctl.isDragging());

  h.table.elements.destroy(id);
  h.mouseAtWorld(70.0f, 70.0f);
  h.step();
  EXPECT_FALSE(h.ctl.isDragging());
}

TEST(InteractionController, SecondaryOnEmptySpaceDoesNothing) {
  Harness h;
  h.add(50.0f, 50.0f);

  h.mouseAtWorld(-50.0f, -50.0f);
  h.tap(Key::MouseRight);
  h.step();
  EXPECT_FALSE(h.ctl.isDragging());
  EXPECT_FALSE(h.ctl.activeElement());
}

TEST(InteractionController, PrimaryClickSelectsAndClears) {
  Harness h;
  h.add(0.0f, 0.0f);
  const ElementID b = h.add(60.0f, 0.0f);

  h.mouseAtWorld(70.0f, 10.0f);
  h.tap(Key::MouseLeft);
  h.step();
  EXPECT_EQ(h.ctl.activeElement(), b);
  EXPECT_EQ(h.ctl.hoveredElement(), b);

  h.mouseAtWorld(-40.0f, -40.0f);
  h.step();
  EXPECT_EQ(h.ctl.activeElement(), b);
  EXPECT_FALSE(h.ctl.hoveredElement());

  h.tap(Key::MouseLeft);
  h.step();
  EXPECT_FALSE(h.ctl.activeElement());
}

TEST(InteractionController, ClickOutsideSurfaceIsIgnored) {
  Harness h;
  const ElementID a = h.add(0.0f, 0.0f);
  h.ctl.setActiveElement(a);

  h.vp.hovered = false;
  h.mouseAtWorld(-40.0f, -40.0f);
  h.tap(Key::MouseLeft);
  h.step();
  EXPECT_EQ(h.ctl.activeElement(), a);

  h.mouseAtWorld(10.0f, 10.0f);
  h.tap(Key::MouseRight);
  h.step();
  EXPECT_FALSE(h.ctl.isDragging());
}

TEST(InteractionController, ClickOnEmptySpaceWhileDraggingKeepsSelection) {
  Harness h;
  const ElementID a = h.add(0.0f, 0.0f);

  h.mouseAtWorld(10.0f, 10.0f);
  h.tap(Key::MouseRight);
  h.step();

  // Element follows the mouse, so place the click outside its new box.
  h.mouseAtWorld(400.0f, 400.0f);
  h.step();
  h.mouseAtWorld(-200.0f, -200.0f);
  h.in.press(Key::MouseLeft);
  h.step();
  EXPECT_EQ(h.ctl.activeElement(), a);
}

TEST(InteractionController, NavigationFixture) {
  Harness h;
  const ElementID e0 = h.add(0.0f, 0.0f);
  const ElementID e1 = h.add(100.0f, 0.0f);
  const ElementID e2 = h.add(200.0f, 0.0f);

  h.ctl.camera().setPosition({90.0f, 0.0f});
  h.tap(Key::Period);
  h.step();
  EXPECT_EQ(h.ctl.activeElement(), e2);
  ASSERT_TRUE(h.ctl.camera().easingTarget().has_value());
  EXPECT_EQ(*h.ctl.camera().easingTarget(), Vector2(224.0f, 24.0f));

  // Reference is the easing target, not the camera position.
  h.tap(Key::Period);
  h.step();
  EXPECT_EQ(h.ctl.activeElement(), e0);
  EXPECT_EQ(*h.ctl.camera().easingTarget(), Vector2(24.0f, 24.0f));

  h.tap(Key::Comma);
  h.step();
  EXPECT_EQ(h.ctl.activeElement(), e2);

  h.tap(Key::Slash);
  h.step();
  EXPECT_EQ(h.ctl.activeElement(), e2);
  EXPECT_EQ(*h.ctl.camera().easingTarget(), Vector2(224.0f, 24.0f));
  (void)e1;
}

TEST(InteractionController, PreviousAndRecenterFromCamera) {
  Harness h;
  const ElementID e0 = h.add(0.0f, 0.0f);
  const ElementID e1 = h.add(100.0f, 0.0f);
  h.add(200.0f, 0.0f);

  h.ctl.camera().setPosition({90.0f, 0.0f});
  h.ctl.navigate(h.table, -1);
  EXPECT_EQ(h.ctl.activeElement(), e0);

  Harness g;
  g.add(0.0f, 0.0f);
  const ElementID g1 = g.add(100.0f, 0.0f);
  g.add(200.0f, 0.0f);
  g.ctl.camera().setPosition({90.0f, 0.0f});
  g.ctl.navigate(g.table, 0);
  EXPECT_EQ(g.ctl.activeElement(), g1);
  EXPECT_EQ(*g.ctl.camera().easingTarget(), Vector2(124.0f, 24.0f));
  (void)e1;
}

TEST(InteractionController, NavigationOnEmptyTableIsNoOp) {
  Harness h;
  h.ctl.camera().setPosition({5.0f, 5.0f});

  h.tap(Key::Period);
  h.step();
  h.tap(Key::Comma);
  h.step();
  h.tap(Key::Slash);
  h.step();

  EXPECT_FALSE(h.ctl.camera().isEasing());
  EXPECT_FALSE(h.ctl.activeElement());
  EXPECT_EQ(h.ctl.camera().position(), Vector2(5.0f, 5.0f));
}

TEST(InteractionController, NoTableIsHandled) {
  Harness h;
  h.tap(Key::Period);
  h.tap(Key::MouseLeft);
  const auto ev = h.step(0.016f, nullptr, false);
  EXPECT_FALSE(ev.elementMoved);
  EXPECT_FALSE(ev.colorPickAt.has_value());
  EXPECT_FALSE(h.ctl.camera().isEasing());
}

TEST(InteractionController, ZoomKeysDoubleAndHalve) {
  Harness h;
  h.tap(Key::Equal);
  h.step();
  EXPECT_FLOAT_EQ(h.ctl.camera().targetZoom(), 2.0f);

  h.tap(Key::Minus);
  h.step();
  h.tap(Key::Minus);
  h.step();
  EXPECT_FLOAT_EQ(h.ctl.camera().targetZoom(), 0.5f);
}

TEST(InteractionController, DirectionalKeysSetScreenSpaceAcceleration) {
  Harness h;
  const float speed = CameraTuning{}.speed;

  h.in.press(Key::D);
  h.step();
  EXPECT_FLOAT_EQ(h.ctl.camera().acceleration().x, speed);

  h.in.release(Key::D);
  h.step();
  EXPECT_FLOAT_EQ(h.ctl.camera().acceleration().x, 0.0f);

  h.ctl.camera().resetZoom(4.0f);
  h.in.press(Key::ArrowUp);
  h.step();
  EXPECT_FLOAT_EQ(h.ctl.camera().acceleration().y, -speed / 4.0f);

  h.in.press(Key::A);
  h.step();
  EXPECT_FLOAT_EQ(h.ctl.camera().acceleration().x, -speed / 4.0f);
}

TEST(InteractionController, DirectionalKeyInterruptsEasing) {
  Harness h;
  h.add(300.0f, 300.0f);
  h.ctl.navigate(h.table, 0);
  h.step(0.1f);
  h.step(0.1f);
  ASSERT_TRUE(h.ctl.camera().isEasing());

  h.in.press(Key::S);
  h.step(0.0f);
  EXPECT_FALSE(h.ctl.camera().isEasing());
  EXPECT_GT(h.ctl.camera().acceleration().y, 0.0f);
}

TEST(InteractionController, KeyNoLongerDownStopsAccelerationWithoutEdge) {
  Harness h;
  h.in.press(Key::D);
  h.step();
  ASSERT_GT(h.ctl.camera().acceleration().x, 0.0f);

  // Focus lost and its release edges cleared before the controller ran.
  h.in.releaseAll();
  h.in.clearEdges();
  h.step();
  EXPECT_FLOAT_EQ(h.ctl.camera().acceleration().x, 0.0f);
}

TEST(InteractionController, ReleaseEdgesKeptAcrossSkippedFramesApply) {
  Harness h;
  h.in.press(Key::ArrowUp);
  h.step();
  ASSERT_LT(h.ctl.camera().acceleration().y, 0.0f);

  // Skipped frames gather edges without clearing them.
  h.in.releaseAll();
  h.in.press(Key::ArrowUp);
  h.in.release(Key::ArrowUp);
  h.step();
  EXPECT_FLOAT_EQ(h.ctl.camera().acceleration().y, 0.0f);
}

TEST(InteractionController, TextInputSuppressesKeys) {
  Harness h;
  h.add(0.0f, 0.0f);
  h.wantText = true;

  h.in.press(Key::D);
  h.tap(Key::Equal);
  h.tap(Key::Period);
  h.tap(Key::Enter);
  const auto ev = h.step();

  EXPECT_EQ(h.ctl.camera().acceleration(), Vector2{});
  EXPECT_FLOAT_EQ(h.ctl.camera().targetZoom(), 1.0f);
  EXPECT_FALSE(h.ctl.camera().isEasing());
  EXPECT_FALSE(ev.insertAt.has_value());
}

TEST(InteractionController, CtrlChordsDoNotMoveCamera) {
  Harness h;
  h.in.press(Key::LeftCtrl);
  h.in.press(Key::S);
  h.step();
  EXPECT_EQ(h.ctl.camera().acceleration(), Vector2{});
}

TEST(InteractionController, InsertReportsCameraPosition) {
  Harness h;
  h.ctl.camera().setPosition({12.5f, 30.0f});
  h.tap(Key::Enter);
  const auto ev = h.step();
  ASSERT_TRUE(ev.insertAt.has_value());
  EXPECT_EQ(*ev.insertAt, Vector2(12.5f, 30.0f));
}

TEST(InteractionController, ColorPickWaitsForMouseOverCanvas) {
  Harness h;
  h.tap(Key::Backslash);
  h.mouseAtWorld(-5.0f, 10.0f);
  auto ev = h.step();
  EXPECT_FALSE(ev.colorPickAt.has_value());
  EXPECT_TRUE(h.ctl.colorPickArmed());

  h.mouseAtWorld(10.7f, 20.2f);
  ev = h.step();
  ASSERT_TRUE(ev.colorPickAt.has_value());
  EXPECT_EQ(*ev.colorPickAt, Vector2(10.0f, 20.0f));
  EXPECT_FALSE(h.ctl.colorPickArmed());

  ev = h.step();
  EXPECT_FALSE(ev.colorPickAt.has_value());
}

TEST(InteractionController, SwitchTableResetsSelectionAndFlies) {
  Harness h;
  const ElementID a = h.add(0.0f, 0.0f);
  h.ctl.setActiveElement(a);

  Table other{"other", "other.png", {500.0f, 500.0f}, {}};
  Element e{};
  e.position = {40.0f, 60.0f};
  other.elements.create(std::move(e));

  h.ctl.switchTable(other);
  EXPECT_FALSE(h.ctl.activeElement());
  EXPECT_FALSE(h.ctl.isDragging());
  EXPECT_FLOAT_EQ(h.ctl.camera().targetZoom(), 4.0f);
  ASSERT_TRUE(h.ctl.camera().easingTarget().has_value());
  EXPECT_EQ(*h.ctl.camera().easingTarget(), Vector2(40.0f, 60.0f));
}

TEST(InteractionController, StaleSelectionResolvesToNothing) {
  Harness h;
  const ElementID a = h.add(0.0f, 0.0f);
  h.ctl.setActiveElement(a);
  h.table.elements.destroy(a);
  h.add(0.0f, 0.0f);

  EXPECT_EQ(h.table.elements.find(h.ctl.activeElement()), nullptr);
}
