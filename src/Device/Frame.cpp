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
#include <cctype>
#include <avrlink/Codec/FrameDecoder.hpp>
#include <avrlink/Device/Frame.hpp>


namespace avrlink {
  namespace device {

    std::optional<Frame> parseFrame(const std::string &text) {
      const auto separator = text.find('=');
      if (separator == std::string::npos) {
        return std::nullopt;
      }

      Frame frame;
      frame.key = codec::trim(text.substr(0, separator));
      frame.value = codec::trim(text.substr(separator + 1));
      return frame;
    }

    bool equalsIgnoreCase(const std::string &lhs, const std::string &rhs) {
      return lhs.size() == rhs.size() &&
             std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
             });
    }

    bool isTruthy(const std::string &value) {
      return equalsIgnoreCase(value, "yes") || equalsIgnoreCase(value, "on") || equalsIgnoreCase(value, "true") ||
             value == "1";
    }

  }
}
