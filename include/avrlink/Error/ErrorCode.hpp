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

#include <cstdint>


namespace avrlink::error {

    enum class ErrorCode : uint32_t {
      NONE = 0,
      OPERATION_ABORTED = 1,
      OPERATION_IN_PROGRESS = 2,
      NOT_CONNECTED = 3,
      CONNECT_FAILED = 4,
      CONNECT_TIMEOUT = 5,
      CONNECTION_LOST = 6,
      CONNECTION_CLOSED = 7,
      TCP_TRANSFER = 8,
      QUERY_TIMEOUT = 9,
      QUERY_SUPERSEDED = 10,
      UNKNOWN_SOURCE = 11
    };

    const char *toString(ErrorCode code);

}
