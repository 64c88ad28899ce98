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

    struct Frame {
      std::string key;
      std::string value;
    };

    /// Splits "Key=Value" at the first '=' and trims both halves.
    /// Returns std::nullopt for frames without '='.
    std::optional<Frame> parseFrame(const std::string &text);

    /// "yes", "on", "true" and "1", compared case-insensitively.
    bool isTruthy(const std::string &value);

    bool equalsIgnoreCase(const std::string &lhs, const std::string &rhs);

}
