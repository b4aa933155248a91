#include <gtest/gtest.h>

#include "TestSupport.h"
#include "core/InputScript.h"
#include "ecs/Components.h"

namespace {

using testsupport::TempDir;

TEST(InputScript, KeyframesHoldUntilChanged) {
  TempDir dir;
  const std::string path = dir.write("run.toml", R"(
version = 1
keyframes = [
  { frame = 10, right = false },
  { frame = 0, right = true },
  { at = 5, jump = true },
  { frame = 7, jump = false, axis = -0.5 },
]
)");

  InputScript script;
  ASSERT_TRUE(script.loadFromToml(path.c_str()));
  EXPECT_TRUE(script.loaded());
  EXPECT_EQ(script.keyframeCount(), 4U);
  EXPECT_EQ(script.lastKeyframe(), 10U);

  InputState in = script.sample(0);
  EXPECT_TRUE(in.right);
  EXPECT_FALSE(in.jumpHeld);

  for (uint64_t f = 1; f < 5; ++f) {
    in = script.sample(f);
  }
  EXPECT_TRUE(in.right);

  in = script.sample(5);
  EXPECT_TRUE(in.jumpPressed);
  EXPECT_TRUE(in.jumpHeld);
  EXPECT_EQ(in.jumpHeldFrames, 1);
  EXPECT_EQ(in.jumpPressedFrames, 0);

  in = script.sample(6);
  EXPECT_FALSE(in.jumpPressed);
  EXPECT_TRUE(in.jumpHeld);
  EXPECT_EQ(in.jumpHeldFrames, 2);

  in = script.sample(7);
  EXPECT_TRUE(in.jumpReleased);
  EXPECT_FALSE(in.jumpHeld);
  EXPECT_FLOAT_EQ(in.axis, -0.5F);

  in = script.sample(10);
  EXPECT_FALSE(in.right);
  EXPECT_FLOAT_EQ(in.horizontal(), -0.5F);
}

TEST(InputScript, SamplingBackwardsRestarts) {
  TempDir dir;
  const std::string path = dir.write("run.toml", R"(
keyframes = [ { frame = 2, tap = true } ]
)");
  InputScript script;
  ASSERT_TRUE(script.loadFromToml(path.c_str()));
  (void)script.sample(0);
  (void)script.sample(1);
  EXPECT_TRUE(script.sample(2).jumpPressed);
  EXPECT_FALSE(script.sample(3).jumpPressed);

  EXPECT_FALSE(script.sample(0).jumpHeld);
  EXPECT_TRUE(script.sample(2).jumpPressed);
}

TEST(InputScript, IncludesAreMergedAndCyclesStop) {
  TempDir dir;
  dir.write("a.toml", R"(
include = "b.toml"
keyframes = [ { frame = 3, left = true } ]
)");
  dir.write("b.toml", R"(
include = "a.toml"
keyframes = [ { frame = 1, right = true } ]
)");

  InputScript script;
  ASSERT_TRUE(script.loadFromToml(dir.file("a.toml").c_str()));
  EXPECT_EQ(script.keyframeCount(), 2U);
  EXPECT_TRUE(script.sample(1).right);
  const InputState at3 = script.sample(3);
  EXPECT_TRUE(at3.left);
  EXPECT_TRUE(at3.right);
  EXPECT_FLOAT_EQ(at3.horizontal(), 0.0F);
}

TEST(InputScript, BrokenFileFailsAndSamplesNothing) {
  TempDir dir;
  const std::string path = dir.write("bad.toml", "keyframes = [ { frame = 1, right = true ]\n");
  InputScript script;
  EXPECT_FALSE(script.loadFromToml(path.c_str()));
  EXPECT_FALSE(script.loaded());
  EXPECT_FALSE(script.sample(1).right);
}

TEST(InputScript, KeyframeWithoutFrameIsSkipped) {
  TempDir dir;
  const std::string path = dir.write("run.toml", R"(
keyframes = [ { right = true }, { frame = 4, jump = true } ]
)");
  InputScript script;
  ASSERT_TRUE(script.loadFromToml(path.c_str()));
  EXPECT_EQ(script.keyframeCount(), 1U);
  EXPECT_FALSE(script.sample(4).right);
}

}  // namespace
