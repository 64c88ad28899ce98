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

#include <avrlink/Device/Commands.hpp>


namespace avrlink {
  namespace device {
    namespace commands {

      std::string setVolume(int decibels) {
        return std::string(cVolumeKey) + "=" + std::to_string(decibels);
      }

      std::string setSource(unsigned int sourceId) {
        return std::string(cSourceKey) + "=" + std::to_string(sourceId);
      }

      std::string sourceEnabledKey(unsigned int sourceId) {
        return "Source" + std::to_string(sourceId) + ".Enabled";
      }

      std::string sourceNameKey(unsigned int sourceId) {
        return "Source" + std::to_string(sourceId) + ".Name";
      }

      std::string sourceEnabledQuery(unsigned int sourceId) {
        return sourceEnabledKey(sourceId) + "?";
      }

      std::string sourceNameQuery(unsigned int sourceId) {
        return sourceNameKey(sourceId) + "?";
      }

    }
  }
}
