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

#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <avrlink/Device/SourceDirectory.hpp>

using avrlink::device::SourceDirectory;
using Names = std::vector<std::string>;
using Ids = std::vector<SourceDirectory::SourceId>;


TEST(SourceDirectoryUnitTest, EmptyDirectoryListsDefaultSources) {
  SourceDirectory directory;

  EXPECT_TRUE(directory.empty());
  EXPECT_EQ(directory.sourceList(), (Names{"CD", "Tuner", "Video 1", "Video 2", "Disc", "Tape 1", "Aux", "TV"}));
}

TEST(SourceDirectoryUnitTest, EnabledAndNameFramesUpdateEntry) {
  SourceDirectory directory;

  EXPECT_TRUE(directory.apply("Source3.Enabled", "Yes"));
  EXPECT_TRUE(directory.apply("Source3.Name", "Aux"));

  EXPECT_EQ(directory.isEnabled(3), std::optional<bool>(true));
  EXPECT_EQ(directory.getName(3), std::optional<std::string>("Aux"));
  EXPECT_EQ(directory.enabledSources(), Ids{3});
}

TEST(SourceDirectoryUnitTest, DisabledSourceIsNotListedDespiteCachedName) {
  SourceDirectory directory;
  directory.apply("Source3.Enabled", "Yes");
  directory.apply("Source3.Name", "Aux");
  directory.apply("Source1.Enabled", "Yes");

  directory.apply("Source3.Enabled", "No");

  EXPECT_EQ(directory.enabledSources(), Ids{1});
  EXPECT_EQ(directory.sourceList(), Names{"CD"});
  EXPECT_EQ(directory.getName(3), std::optional<std::string>("Aux"));
}

TEST(SourceDirectoryUnitTest, EnabledSourcesAreInNumericOrder) {
  SourceDirectory directory;
  directory.setEnabled(10, true);
  directory.setEnabled(2, true);
  directory.setEnabled(9, true);

  EXPECT_EQ(directory.enabledSources(), (Ids{2, 9, 10}));
  EXPECT_EQ(directory.sourceList(), (Names{"Tuner", "Source 9", "Source 10"}));
}

TEST(SourceDirectoryUnitTest, NamesWithoutEnabledDataListEveryNamedSource) {
  SourceDirectory directory;
  directory.setName(2, "Radio");
  directory.setName(5, "Blu-ray");

  EXPECT_EQ(directory.sourceList(), (Names{"Radio", "Blu-ray"}));
}

TEST(SourceDirectoryUnitTest, EmptyNameIsIgnored) {
  SourceDirectory directory;
  directory.setName(2, "Radio");
  directory.apply("Source2.Name", "");

  EXPECT_EQ(directory.getName(2), std::optional<std::string>("Radio"));
}

TEST(SourceDirectoryUnitTest, UnrelatedOrMalformedKeysAreNotConsumed) {
  SourceDirectory directory;

  EXPECT_FALSE(directory.apply("Main.Power", "On"));
  EXPECT_FALSE(directory.apply("SourceX.Enabled", "Yes"));
  EXPECT_FALSE(directory.apply("Source.Name", "Aux"));
  EXPECT_TRUE(directory.empty());
}

TEST(SourceDirectoryUnitTest, FindSourceIdPrefersPolledNames) {
  SourceDirectory directory;
  directory.setName(6, "CD");

  EXPECT_EQ(directory.findSourceId("CD"), std::optional<SourceDirectory::SourceId>(6));
  EXPECT_EQ(directory.findSourceId("Tuner"), std::optional<SourceDirectory::SourceId>(2));
  EXPECT_EQ(directory.findSourceId("Turntable"), std::nullopt);
}

TEST(SourceDirectoryUnitTest, DisplayNameFallsBackToDefaultThenNumber) {
  SourceDirectory directory;
  directory.setName(1, "Streamer");

  EXPECT_EQ(directory.displayName(1), "Streamer");
  EXPECT_EQ(directory.displayName(7), "Aux");
  EXPECT_EQ(directory.displayName(12), "Source 12");
}

TEST(SourceDirectoryUnitTest, FindNameHasNoNumberedFallback) {
  SourceDirectory directory;
  directory.setName(1, "Streamer");

  EXPECT_EQ(directory.findName(1), std::optional<std::string>("Streamer"));
  EXPECT_EQ(directory.findName(2), std::optional<std::string>("Tuner"));
  EXPECT_EQ(directory.findName(12), std::nullopt);
}

TEST(SourceDirectoryUnitTest, ParseSourceId) {
  EXPECT_EQ(avrlink::device::parseSourceId("3"), std::optional<SourceDirectory::SourceId>(3));
  EXPECT_EQ(avrlink::device::parseSourceId("12"), std::optional<SourceDirectory::SourceId>(12));
  EXPECT_EQ(avrlink::device::parseSourceId(""), std::nullopt);
  EXPECT_EQ(avrlink::device::parseSourceId("-1"), std::nullopt);
  EXPECT_EQ(avrlink::device::parseSourceId("3a"), std::nullopt);
}
