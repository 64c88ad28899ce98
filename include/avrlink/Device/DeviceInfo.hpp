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
#include <avrlink/Device/SourceDirectory.hpp>


namespace avrlink::device {

    // Result of one DeviceInfoPoller run. Unanswered fields stay unset.
    struct DeviceInfo {
      std::optional<std::string> model;
      std::optional<std::string> firmwareVersion;
      SourceDirectory sources;
    };

}
