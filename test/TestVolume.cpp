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

#include <cstdlib>
#include <gtest/gtest.h>
#include <avrlink/Device/Volume.hpp>

using namespace avrlink::device;


TEST(VolumeUnitTest, UnitVolumeIsLinearOverDecibelRange) {
  EXPECT_DOUBLE_EQ(toUnitVolume(-90), 0.0);
  EXPECT_DOUBLE_EQ(toUnitVolume(0), 1.0);
  EXPECT_DOUBLE_EQ(toUnitVolume(-45), 0.5);
  EXPECT_NEAR(toUnitVolume(-30), 0.667, 0.001);
}

TEST(VolumeUnitTest, UnitVolumeIsClamped) {
  EXPECT_DOUBLE_EQ(toUnitVolume(-120), 0.0);
  EXPECT_DOUBLE_EQ(toUnitVolume(12), 1.0);
  EXPECT_EQ(toDecibels(-0.5), cVolumeMinDecibels);
  EXPECT_EQ(toDecibels(1.5), cVolumeMaxDecibels);
}

TEST(VolumeUnitTest, DecibelsRoundTripWithinOne) {
  for (int decibels = cVolumeMinDecibels; decibels <= cVolumeMaxDecibels; ++decibels) {
    EXPECT_LE(std::abs(toDecibels(toUnitVolume(decibels)) - decibels), 1) << "at " << decibels << " dB";
  }
}

TEST(VolumeUnitTest, ToDecibelsRoundsToNearest) {
  EXPECT_EQ(toDecibels(0.667), -30);
  EXPECT_EQ(toDecibels(0.5), -45);
}

TEST(VolumeUnitTest, ParseDecibelsAcceptsIntegersOnly) {
  EXPECT_EQ(parseDecibels("-30"), std::optional<int>(-30));
  EXPECT_EQ(parseDecibels("0"), std::optional<int>(0));
  EXPECT_EQ(parseDecibels(""), std::nullopt);
  EXPECT_EQ(parseDecibels("-30dB"), std::nullopt);
  EXPECT_EQ(parseDecibels("loud"), std::nullopt);
}
