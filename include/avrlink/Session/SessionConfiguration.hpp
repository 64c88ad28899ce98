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
#include <cstddef>
#include <cstdint>
#include <string>


namespace avrlink::session {

    struct SessionConfiguration {
      static constexpr uint16_t cDefaultPort = 23;

      std::string host;
      // older protocol generations listen on 50001
      uint16_t port = cDefaultPort;
      std::chrono::milliseconds connectTimeout = std::chrono::seconds(10);
      // period of the idle read watchdog; silence never disconnects
      std::chrono::milliseconds readTimeout = std::chrono::seconds(10);
      // fixed interval between reconnect attempts, no backoff, no cap
      std::chrono::milliseconds reconnectDelay = std::chrono::seconds(5);
      size_t receiveBufferSize = 1024;
      size_t maxFrameLength = 4096;
    };

}
