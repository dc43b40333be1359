#include <gtest/gtest.h>

#include <popup_lib/Popup.h>

#include "FakeHost.h"

using namespace Popup_lib;
using namespace Popup_lib::test;

namespace
{
  std::unique_ptr<Popup> makeLongPopup(int labels)
  {
    auto p = std::make_unique<Popup>("Log", "", std::nullopt, std::nullopt, /*preventClose*/ true);
    for (int i = 0; i < labels; ++i) p->add().label("line " + std::to_string(i));
    return p;
  }
}

TEST(PopupLayout, AddsDefaultOkAndCentres)
{
  TestHost host;
  Popup popup("Title", "hello");
  popup.updateLayout(host.ctx);

  ASSERT_EQ(popup.children.size(), 2u);
  Button* ok = popup.children[1]->asButton();
  ASSERT_NE(ok, nullptr);
  EXPECT_EQ(ok->text, "OK");
  EXPECT_TRUE(static_cast<bool>(popup.onEnter));

  EXPECT_FLOAT_EQ(popup.width, 400.f);
  EXPECT_FLOAT_EQ(popup.height, 164.f);
  EXPECT_FLOAT_EQ(popup.x, 200.f);
  EXPECT_FLOAT_EQ(popup.y, 218.f);
  EXPECT_FALSE(popup.isScrollable);

  const Rect label = popup.children[0]->globalRect(host.ctx);
  EXPECT_FLOAT_EQ(label.x, 220.f);
  EXPECT_FLOAT_EQ(label.y, 273.f);
  EXPECT_FLOAT_EQ(label.w, 360.f);
  EXPECT_FLOAT_EQ(label.h, 37.f);

  const Rect button = ok->globalRect(host.ctx);
  EXPECT_FLOAT_EQ(button.y, 320.f);
  EXPECT_FLOAT_EQ(button.h, 42.f);
}

TEST(PopupLayout, DefaultOkFinishesThroughEnterAction)
{
  TestHost host;
  Popup popup("Title", "hello");
  popup.updateLayout(host.ctx);
  popup.onEnter();
  EXPECT_TRUE(popup.finished);
}

TEST(PopupLayout, PreventCloseSkipsDefaultButton)
{
  TestHost host;
  Popup popup("Busy", "working", std::nullopt, std::nullopt, true);
  popup.updateLayout(host.ctx);

  EXPECT_EQ(popup.children.size(), 1u);
  EXPECT_FALSE(popup.hasButton());
  EXPECT_FLOAT_EQ(popup.height, 112.f);
}

TEST(PopupLayout, ButtonInsideRowCountsAsButton)
{
  TestHost host;
  Popup popup("Confirm", "sure?");
  popup.add().row().add().button("Yes").button("No");
  EXPECT_TRUE(popup.hasButton());

  popup.updateLayout(host.ctx);
  EXPECT_EQ(popup.children.size(), 2u);
  EXPECT_NE(popup.children[1]->asRow(), nullptr);
}

TEST(PopupLayout, LongLabelWraps)
{
  TestHost host;
  Popup popup("Title", std::string(80, 'x'), std::nullopt, std::nullopt, true);
  popup.updateLayout(host.ctx);

  auto* label = static_cast<Label*>(popup.children[0].get());
  ASSERT_EQ(label->lines.size(), 2u);
  EXPECT_EQ(label->lines[0].size(), 40u);
  EXPECT_FLOAT_EQ(label->height, 64.f);
}

TEST(PopupLayout, TallContentBecomesScrollable)
{
  TestHost host(800.f, 300.f);
  auto popup = makeLongPopup(10);
  popup->updateLayout(host.ctx);

  EXPECT_TRUE(popup->isScrollable);
  EXPECT_FLOAT_EQ(popup->height, 225.f);
  EXPECT_FLOAT_EQ(popup->visibleContentHeight, 180.f);
  EXPECT_FLOAT_EQ(popup->contentHeight, 490.f);
  EXPECT_FLOAT_EQ(popup->maxScroll, 310.f);
  EXPECT_FLOAT_EQ(popup->y, 37.5f);

  // children narrowed beside the scrollbar
  EXPECT_FLOAT_EQ(popup->children[0]->width, 344.f);

  Scrollbar* sb = popup->scrollbar();
  ASSERT_NE(sb, nullptr);
  EXPECT_FLOAT_EQ(sb->x, 384.f);
  EXPECT_FLOAT_EQ(sb->height, 180.f);
  EXPECT_FLOAT_EQ(sb->maxScroll, 310.f);
}

TEST(PopupLayout, ScrollOffsetMovesChildrenNotScrollbar)
{
  TestHost host(800.f, 300.f);
  auto popup = makeLongPopup(10);
  popup->updateLayout(host.ctx);
  Scrollbar* sb = popup->scrollbar();
  const float sbY = sb->globalY(host.ctx);

  popup->scrollTo(100.f);
  EXPECT_FLOAT_EQ(popup->children[0]->globalY(host.ctx), 37.5f + 45.f + 10.f - 100.f);
  EXPECT_FLOAT_EQ(sb->globalY(host.ctx), sbY);
  EXPECT_FLOAT_EQ(sb->scrollOffset, 100.f);

  popup->scrollTo(1000.f);
  EXPECT_FLOAT_EQ(popup->scrollOffset, 310.f);
  popup->scrollTo(-5.f);
  EXPECT_FLOAT_EQ(popup->scrollOffset, 0.f);
}

TEST(PopupLayout, ShrinkingContentDropsScrolling)
{
  TestHost host(800.f, 300.f);
  auto popup = makeLongPopup(10);
  popup->updateLayout(host.ctx);
  popup->scrollTo(50.f);

  popup->children.resize(1);
  popup->layoutChildren(host.ctx);
  EXPECT_FALSE(popup->isScrollable);
  EXPECT_EQ(popup->scrollbar(), nullptr);
  EXPECT_FLOAT_EQ(popup->scrollOffset, 0.f);
  EXPECT_FLOAT_EQ(popup->height, 112.f);
}

TEST(PopupLayout, ExplicitSizeIsKept)
{
  TestHost host;
  Popup popup("Sized", "hello", 500.f, 250.f);
  popup.updateLayout(host.ctx);

  EXPECT_FLOAT_EQ(popup.width, 500.f);
  EXPECT_FLOAT_EQ(popup.height, 250.f);
  EXPECT_FLOAT_EQ(popup.x, 150.f);
  EXPECT_FLOAT_EQ(popup.y, 175.f);
  EXPECT_FLOAT_EQ(popup.children[0]->width, 460.f);
}

TEST(PopupLayout, ScaleMultipliesEverything)
{
  TestHost host(800.f, 600.f, 2.f);
  Popup popup("Title", "hello");
  popup.updateLayout(host.ctx);

  // logical sizes match the unscaled case
  EXPECT_FLOAT_EQ(popup.height, 164.f);
  EXPECT_FLOAT_EQ(popup.x, 0.f);
  EXPECT_FLOAT_EQ(popup.y, 136.f);

  const Rect label = popup.children[0]->globalRect(host.ctx);
  EXPECT_FLOAT_EQ(label.x, 40.f);
  EXPECT_FLOAT_EQ(label.y, 246.f);
  EXPECT_FLOAT_EQ(label.w, 720.f);
}

TEST(PopupLayout, LabelUpdateRelayoutsOnRenderAroundOldCentre)
{
  TestHost host;
  Popup popup("Status", "hello", std::nullopt, std::nullopt, true);
  popup.updateLayout(host.ctx);
  ASSERT_FLOAT_EQ(popup.y, 244.f);
  auto* label = static_cast<Label*>(popup.children[0].get());
  const size_t before = host.redraw.requestCount();

  label->update("hello\nworld");
  EXPECT_TRUE(popup.layoutDirty());
  EXPECT_EQ(host.redraw.requestCount(), before + 1);
  EXPECT_EQ(label->text(), "hello\nworld");

  popup.render(host.ctx);
  EXPECT_FALSE(popup.layoutDirty());
  EXPECT_EQ(label->lines.size(), 2u);
  EXPECT_FLOAT_EQ(popup.height, 139.f);
  EXPECT_FLOAT_EQ(popup.y, 230.5f);
}

TEST(PopupLayout, AllowingCloseAddsButtonOnNextRender)
{
  TestHost host;
  Popup popup("Busy", "hello", std::nullopt, std::nullopt, true);
  popup.updateLayout(host.ctx);
  const size_t before = host.redraw.requestCount();

  popup.setPreventClose(false);
  EXPECT_FALSE(popup.preventClose());
  EXPECT_TRUE(popup.layoutDirty());
  EXPECT_EQ(host.redraw.requestCount(), before + 1);

  popup.render(host.ctx);
  EXPECT_EQ(popup.children.size(), 2u);
  EXPECT_FLOAT_EQ(popup.height, 164.f);
}

TEST(PopupLayout, CloseButtonBecomesEnterAction)
{
  TestHost host;
  Popup popup("Busy", "hello", std::nullopt, std::nullopt, true);
  popup.updateLayout(host.ctx);

  Button& close = popup.addCloseButton("Done");
  EXPECT_EQ(close.text, "Done");
  EXPECT_TRUE(popup.layoutDirty());
  ASSERT_TRUE(static_cast<bool>(popup.onEnter));

  popup.render(host.ctx);
  EXPECT_EQ(popup.children.size(), 2u);
  popup.onEnter();
  EXPECT_TRUE(popup.finished);
}

TEST(PopupLayout, CloseButtonKeepsExistingEnterAction)
{
  Popup popup("Ask", "name?");
  int calls = 0;
  popup.onEnter = [&] { ++calls; };
  popup.addCloseButton();
  popup.onEnter();
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(popup.finished);
}

TEST(PopupLayout, MaxHeightFallsBackWithoutRegionHeight)
{
  UiContext ctx;
  EXPECT_FLOAT_EQ(ctx.maxPopupHeight(), 600.f);
  ctx.region = { 0, 0, 800, 400 };
  EXPECT_FLOAT_EQ(ctx.maxPopupHeight(), 300.f);
  EXPECT_FALSE(ctx.valid());
}
