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

#pragma once

#include <optional>
#include <string>


namespace avrlink::device {

    constexpr int cVolumeMinDecibels = -90;
    constexpr int cVolumeMaxDecibels = 0;

    /// (db - min) / (max - min), clamped to [0, 1].
    double toUnitVolume(int decibels);

    /// Inverse of toUnitVolume, rounded to the nearest decibel and clamped to the range.
    int toDecibels(double unitVolume);

    /// Parses the integer value of a Main.Volume frame; std::nullopt if it is not one.
    std::optional<int> parseDecibels(const std::string &value);

}
