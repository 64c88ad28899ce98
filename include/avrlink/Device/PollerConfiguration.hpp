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

#include <chrono>


namespace avrlink::device {

    struct PollerConfiguration {
      // sources 1..sourceCount are queried
      unsigned int sourceCount = 9;
      std::chrono::milliseconds infoQueryTimeout = std::chrono::milliseconds(2000);
      std::chrono::milliseconds sourceQueryTimeout = std::chrono::milliseconds(1500);
      // Main.Power?, Main.Volume?, Main.Mute?, Main.Source? after (re)connect
      std::chrono::milliseconds stateQueryTimeout = std::chrono::milliseconds(2000);
      // pause between consecutive queries so late replies do not overlap
      std::chrono::milliseconds settleDelay = std::chrono::milliseconds(100);
      // state refresh while connected, counted from the end of the device info poll; 0 disables it
      std::chrono::milliseconds refreshInterval = std::chrono::milliseconds(30000);
    };

}
