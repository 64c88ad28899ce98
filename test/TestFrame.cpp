// This file is part of avrlink library project.
// Copyright (C) 2026 avrlink contributors
//
// avrlink is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation; either version 3 of the License, or
// (at your option) any later version.
//
// avrlink is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with avrlink. If not, see <http://www.gnu.org/licenses/>.

#include <gtest/gtest.h>
#include <avrlink/Device/Commands.hpp>
#include <avrlink/Device/Frame.hpp>

using namespace avrlink::device;


TEST(FrameUnitTest, SplitsAtFirstEqualsSign) {
  const auto frame = parseFrame("Source2.Name = Tuner=FM ");

  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->key, "Source2.Name");
  EXPECT_EQ(frame->value, "Tuner=FM");
}

TEST(FrameUnitTest, FrameWithoutEqualsSignIsMalformed) {
  EXPECT_FALSE(parseFrame("Main.Power"));
  EXPECT_FALSE(parseFrame(""));
}

TEST(FrameUnitTest, EmptyValueIsKept) {
  const auto frame = parseFrame("Source4.Name=");

  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->value, "");
}

TEST(FrameUnitTest, TruthyValues) {
  EXPECT_TRUE(isTruthy("Yes"));
  EXPECT_TRUE(isTruthy("ON"));
  EXPECT_TRUE(isTruthy("true"));
  EXPECT_TRUE(isTruthy("1"));
  EXPECT_FALSE(isTruthy("No"));
  EXPECT_FALSE(isTruthy("Off"));
  EXPECT_FALSE(isTruthy(""));
}

TEST(FrameUnitTest, CommandCatalog) {
  EXPECT_EQ(commands::setVolume(-35), "Main.Volume=-35");
  EXPECT_EQ(commands::setSource(3), "Main.Source=3");
  EXPECT_EQ(commands::sourceEnabledQuery(7), "Source7.Enabled?");
  EXPECT_EQ(commands::sourceNameQuery(7), "Source7.Name?");
}
