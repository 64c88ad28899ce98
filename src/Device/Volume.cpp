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

#include <algorithm>
#include <cmath>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <avrlink/Device/Volume.hpp>


namespace avrlink {
  namespace device {

    static constexpr double cVolumeRange = cVolumeMaxDecibels - cVolumeMinDecibels;

    double toUnitVolume(int decibels) {
      const double unit = (decibels - cVolumeMinDecibels) / cVolumeRange;
      return std::clamp(unit, 0.0, 1.0);
    }

    int toDecibels(double unitVolume) {
      const double unit = std::clamp(unitVolume, 0.0, 1.0);
      const auto decibels = static_cast<int>(std::lround(unit * cVolumeRange + cVolumeMinDecibels));
      return std::clamp(decibels, cVolumeMinDecibels, cVolumeMaxDecibels);
    }

    std::optional<int> parseDecibels(const std::string &value) {
      if (value.empty()) {
        return std::nullopt;
      }

      errno = 0;
      char *end = nullptr;
      const long decibels = std::strtol(value.c_str(), &end, 10);
      if (end == value.c_str() || *end != '\0' || errno == ERANGE ||
          decibels < INT_MIN || decibels > INT_MAX) {
        return std::nullopt;
      }

      return static_cast<int>(decibels);
    }

  }
}
