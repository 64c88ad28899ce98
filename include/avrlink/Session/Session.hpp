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

#include <atomic>
#include <list>
#include <memory>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <avrlink/Codec/FrameDecoder.hpp>
#include <avrlink/Common/Data.hpp>
#include <avrlink/Session/ISession.hpp>
#include <avrlink/Session/PendingQuery.hpp>
#include <avrlink/TCP/ITCPWrapper.hpp>


namespace avrlink::session {

    /**
     * @class Session
     * @brief Connection session: socket lifecycle, reader, pending query slot,
     * write queue and reconnect loop of one receiver.
     *
     * **Exclusive section:**
     * The strand is the only lock. Writes are queued and issued one at a time
     * on it, the pending query slot is armed and cancelled on it, and the
     * reader classifies frames on it. Arming therefore happens-before the write
     * that provokes the reply, and unsolicited frames reach the event handler
     * in wire order.
     *
     * **Connection ids:**
     * Every connect attempt, loss and disconnect bumps connectionId_. Completion
     * handlers carry the id they were started with and ignore themselves once it
     * is stale, so a late read from a closed socket can never touch the next
     * connection.
     *
     * **Outstanding operations:**
     * Each started asynchronous operation (connect, read, write, timer wait)
     * increments outstandingOperations_; its handler decrements it first thing.
     * disconnect() resolves its promise only when the count is back to zero,
     * so no reader or reconnect wait outlives a completed disconnect.
     */
    class Session : public ISession, public std::enable_shared_from_this<Session> {
    public:
      Session(boost::asio::io_service &ioService, tcp::ITCPWrapper &tcpWrapper, SessionConfiguration configuration);

      void setEventHandler(ISessionEventHandler::Pointer eventHandler) override;

      void connect(ConnectPromise::Pointer promise) override;

      void disconnect(DisconnectPromise::Pointer promise) override;

      void send(std::string command, SendPromise::Pointer promise) override;

      void query(std::string command, std::chrono::milliseconds timeout, QueryPromise::Pointer promise) override;

      void cancelQuery(QueryPromise::Pointer promise) override;

      ConnectionState getState() const override;

      bool isConnected() const override;

      const SessionConfiguration &getConfiguration() const override;

    private:
      using std::enable_shared_from_this<Session>::shared_from_this;
      using SocketPointer = std::shared_ptr<boost::asio::ip::tcp::socket>;
      using SendQueue = std::list<std::pair<std::shared_ptr<common::Data>, SendPromise::Pointer>>;

      void startConnect();

      void connectHandler(uint64_t connectionId, const SocketPointer &socket, const boost::system::error_code &ec);

      void connectTimeoutHandler(uint64_t connectionId, const boost::system::error_code &ec);

      void connectFailed(const error::Error &e);

      void startReceive();

      void receiveHandler(uint64_t connectionId, const boost::system::error_code &ec, size_t bytesTransferred);

      void armReadWatchdog();

      void readWatchdogHandler(uint64_t connectionId, const boost::system::error_code &ec);

      void dispatchFrame(std::string frame);

      void queryTimeoutHandler(uint64_t queryId, const std::string &command, const boost::system::error_code &ec);

      void enqueueWrite(common::Data data, SendPromise::Pointer promise);

      void writeNext();

      void writeHandler(uint64_t connectionId, const boost::system::error_code &ec);

      void handleConnectionLost(const error::Error &e);

      void scheduleReconnect();

      void reconnectHandler(uint64_t reconnectId, const boost::system::error_code &ec);

      void closeSocket();

      void rejectSendQueue(const error::Error &e);

      void rejectConnectPromises(const error::Error &e);

      void notifyConnectionState(bool connected);

      void completeDisconnect();

      boost::asio::io_service &ioService_;
      boost::asio::io_service::strand strand_;
      tcp::ITCPWrapper &tcpWrapper_;
      SessionConfiguration configuration_;
      std::weak_ptr<ISessionEventHandler> eventHandler_;
      std::atomic<ConnectionState> state_;
      SocketPointer socket_;
      boost::asio::ip::tcp::resolver resolver_;
      uint64_t connectionId_;
      uint64_t reconnectId_;
      size_t outstandingOperations_;
      bool reconnectEnabled_;
      bool reconnectLoopActive_;
      bool reconnectScheduled_;
      bool connectInProgress_;
      bool writeInProgress_;
      boost::asio::steady_timer connectTimer_;
      boost::asio::steady_timer reconnectTimer_;
      boost::asio::steady_timer readWatchdog_;
      boost::asio::steady_timer queryTimer_;
      common::Data receiveBuffer_;
      codec::FrameDecoder frameDecoder_;
      PendingQuery pendingQuery_;
      SendQueue sendQueue_;
      std::vector<ConnectPromise::Pointer> connectPromises_;
      std::vector<DisconnectPromise::Pointer> disconnectPromises_;
    };

}
