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

#include <memory>
#include <string>


namespace avrlink::session {

    /**
     * @interface ISessionEventHandler
     * @brief Notification sink of a session.
     *
     * Both callbacks run on the session strand, in wire order. They must not
     * block: a handler that needs to talk to the receiver uses the asynchronous
     * ISession calls, never the blocking CommandGateway. Exceptions derived from
     * std::exception are caught and logged by the session.
     *
     * The session keeps only a weak reference; the owner controls the lifetime.
     */
    class ISessionEventHandler {
    public:
      using Pointer = std::shared_ptr<ISessionEventHandler>;

      virtual ~ISessionEventHandler() = default;

      /// Called once per transition into or out of CONNECTED.
      virtual void onConnectionStateChanged(bool connected) = 0;

      /// Called for every inbound frame that was not consumed as a query reply.
      virtual void onFrameReceived(const std::string &frame) = 0;
    };

}
