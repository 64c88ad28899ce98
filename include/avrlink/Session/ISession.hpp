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
#include <memory>
#include <string>
#include <avrlink/IO/Promise.hpp>
#include <avrlink/Session/ConnectionState.hpp>
#include <avrlink/Session/ISessionEventHandler.hpp>
#include <avrlink/Session/SessionConfiguration.hpp>


namespace avrlink::session {

    /**
     * @interface ISession
     * @brief Asynchronous operation surface of one receiver connection.
     *
     * **Lifecycle:**
     * ```
     *   DISCONNECTED --connect()--> CONNECTING --ok--> CONNECTED
     *        ^                          |                  |
     *        |                        fail            EOF / I/O error
     *        +--------------------------+                  |
     *        |                                             v
     *        +--disconnect()-- RECONNECTING <--wait delay, connect again--+
     * ```
     * An initial connect() that fails never retries on its own. Losing an
     * established connection starts exactly one reconnect loop that retries at
     * a fixed interval until it succeeds or disconnect() is called.
     *
     * **Promise Contract:**
     * - connect: resolves when CONNECTED; rejects CONNECT_FAILED, CONNECT_TIMEOUT
     *   or OPERATION_ABORTED (disconnect() during the attempt)
     * - send: resolves once the command is written; rejects NOT_CONNECTED,
     *   TCP_TRANSFER, CONNECTION_LOST or OPERATION_ABORTED
     * - query: resolves with the next inbound frame; rejects NOT_CONNECTED,
     *   QUERY_TIMEOUT, QUERY_SUPERSEDED, CONNECTION_LOST or OPERATION_ABORTED
     * - disconnect: resolves once no asynchronous operation of the session is
     *   outstanding; never rejects
     *
     * **Thread Safety:** every call may be made from any thread; work is
     * serialised on the session strand.
     */
    class ISession {
    public:
      using Pointer = std::shared_ptr<ISession>;
      using ConnectPromise = io::Promise<void>;
      using DisconnectPromise = io::Promise<void>;
      using SendPromise = io::Promise<void>;
      using QueryPromise = io::Promise<std::string>;

      virtual ~ISession() = default;

      /// Replaces the notification sink; the session keeps a weak reference only.
      virtual void setEventHandler(ISessionEventHandler::Pointer eventHandler) = 0;

      virtual void connect(ConnectPromise::Pointer promise) = 0;

      virtual void disconnect(DisconnectPromise::Pointer promise) = 0;

      /// Writes a command without waiting for a reply. The CRLF terminator is added here.
      virtual void send(std::string command, SendPromise::Pointer promise) = 0;

      /**
       * @brief Writes a query and binds the next inbound frame to it.
       *
       * The slot is armed before the write is queued, on the same strand the
       * reader runs on, so the reply cannot be classified as unsolicited. A
       * query issued while another one is outstanding supersedes it.
       */
      virtual void query(std::string command, std::chrono::milliseconds timeout, QueryPromise::Pointer promise) = 0;

      /**
       * @brief Abandons one query with OPERATION_ABORTED.
       *
       * Only acts while the promise is still the armed one. A query that has
       * already settled, or was superseded by another caller's query, is left
       * alone, and so is that other caller. No other effect.
       */
      virtual void cancelQuery(QueryPromise::Pointer promise) = 0;

      virtual ConnectionState getState() const = 0;

      virtual bool isConnected() const = 0;

      virtual const SessionConfiguration &getConfiguration() const = 0;
    };

}
