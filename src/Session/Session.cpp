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

/**
 * @file Session.cpp
 * @brief Connection session of one receiver on top of the socket seam.
 *
 * The session owns the socket, a FrameDecoder, the pending query slot, the
 * write queue, the name resolver and four timers. Everything runs on one
 * strand; public calls only dispatch onto it.
 *
 * Timers:
 *   - connectTimer_: bounds one connect attempt (CONNECT_TIMEOUT)
 *   - reconnectTimer_: fixed delay between reconnect attempts
 *   - readWatchdog_: idle read period; silence is logged and never disconnects
 *   - queryTimer_: bounds the outstanding query (QUERY_TIMEOUT)
 *
 * Scenario: receiver reboots while a query is outstanding
 *   - T+0ms: query("Main.Volume?") arms the slot, queues the write
 *   - T+3ms: read completes with EOF
 *   - T+3ms: connection id bumped, socket closed, query rejected with
 *     CONNECTION_LOST, handler notified false, reconnect wait started
 *   - T+5003ms: connect attempt 1 refused, next wait started (no notification)
 *   - T+10003ms: connect attempt 2 succeeds, handler notified true
 *
 * Scenario: disconnect() with a read in flight
 *   - T+0ms: disconnect() bumps the id, cancels timers, closes the socket
 *   - T+0ms: outstanding = 2 (read, watchdog), promise parked
 *   - T+1ms: read completes aborted, stale id, outstanding = 1
 *   - T+1ms: watchdog completes aborted, outstanding = 0, promise resolved
 *
 * Scenario: disconnect() while the host name is still resolving
 *   - T+0ms: connect() starts a lookup of "avr.local", outstanding = 2
 *   - T+10ms: disconnect() cancels the resolver and the connect timer
 *   - T+10ms: connect handler completes aborted, promise resolved at once
 */

#include <avrlink/Codec/FrameDecoder.hpp>
#include <avrlink/Common/Log.hpp>
#include <avrlink/Error/Error.hpp>
#include <avrlink/Session/Session.hpp>


namespace avrlink {
  namespace session {

    const char *toString(ConnectionState state) {
      switch (state) {
        case ConnectionState::DISCONNECTED:
          return "DISCONNECTED";
        case ConnectionState::CONNECTING:
          return "CONNECTING";
        case ConnectionState::CONNECTED:
          return "CONNECTED";
        case ConnectionState::RECONNECTING:
          return "RECONNECTING";
      }
      return "UNKNOWN";
    }

    Session::Session(boost::asio::io_service &ioService, tcp::ITCPWrapper &tcpWrapper,
                     SessionConfiguration configuration)
        : ioService_(ioService)
        , strand_(ioService)
        , tcpWrapper_(tcpWrapper)
        , configuration_(std::move(configuration))
        , state_(ConnectionState::DISCONNECTED)
        , resolver_(ioService)
        , connectionId_(0)
        , reconnectId_(0)
        , outstandingOperations_(0)
        , reconnectEnabled_(true)
        , reconnectLoopActive_(false)
        , reconnectScheduled_(false)
        , connectInProgress_(false)
        , writeInProgress_(false)
        , connectTimer_(ioService)
        , reconnectTimer_(ioService)
        , readWatchdog_(ioService)
        , queryTimer_(ioService)
        , receiveBuffer_(configuration_.receiveBufferSize)
        , frameDecoder_(configuration_.maxFrameLength) {

    }

    void Session::setEventHandler(ISessionEventHandler::Pointer eventHandler) {
      strand_.dispatch([this, self = this->shared_from_this(), eventHandler = std::move(eventHandler)]() mutable {
        eventHandler_ = eventHandler;
      });
    }

    void Session::connect(ConnectPromise::Pointer promise) {
      strand_.dispatch([this, self = this->shared_from_this(), promise = std::move(promise)]() mutable {
        reconnectEnabled_ = true;

        if (state_ == ConnectionState::CONNECTED) {
          promise->resolve();
          return;
        }

        connectPromises_.push_back(std::move(promise));

        // joins the running attempt, or starts once a pending disconnect completes
        if (connectInProgress_ || !disconnectPromises_.empty()) {
          return;
        }

        if (reconnectScheduled_) {
          reconnectScheduled_ = false;
          ++reconnectId_;
          reconnectTimer_.cancel();
        }

        this->startConnect();
      });
    }

    void Session::disconnect(DisconnectPromise::Pointer promise) {
      strand_.dispatch([this, self = this->shared_from_this(), promise = std::move(promise)]() mutable {
        AVRLINK_LOG_SESSION(info, "Disconnecting from " << configuration_.host << ":" << configuration_.port);

        const bool wasConnected = state_ == ConnectionState::CONNECTED;

        reconnectEnabled_ = false;
        reconnectLoopActive_ = false;
        reconnectScheduled_ = false;
        connectInProgress_ = false;
        ++connectionId_;
        ++reconnectId_;

        connectTimer_.cancel();
        reconnectTimer_.cancel();
        readWatchdog_.cancel();
        queryTimer_.cancel();
        this->closeSocket();

        const error::Error e(error::ErrorCode::OPERATION_ABORTED);
        pendingQuery_.cancel(e);
        this->rejectSendQueue(e);
        this->rejectConnectPromises(e);

        state_ = ConnectionState::DISCONNECTED;
        if (wasConnected) {
          this->notifyConnectionState(false);
        }

        disconnectPromises_.push_back(std::move(promise));
        this->completeDisconnect();
      });
    }

    void Session::send(std::string command, SendPromise::Pointer promise) {
      strand_.dispatch(
          [this, self = this->shared_from_this(), command = std::move(command), promise = std::move(promise)]() mutable {
            if (state_ != ConnectionState::CONNECTED) {
              AVRLINK_LOG_SESSION(warning, "Cannot send command, not connected: " << codec::trim(command));
              promise->reject(error::Error(error::ErrorCode::NOT_CONNECTED));
              return;
            }

            AVRLINK_LOG_SESSION(debug, "Sending: " << codec::trim(command));
            this->enqueueWrite(codec::encodeCommand(command), std::move(promise));
          });
    }

    void Session::query(std::string command, std::chrono::milliseconds timeout, QueryPromise::Pointer promise) {
      strand_.dispatch([this, self = this->shared_from_this(), command = std::move(command), timeout,
                        promise = std::move(promise)]() mutable {
        if (state_ != ConnectionState::CONNECTED) {
          AVRLINK_LOG_SESSION(warning, "Cannot query, not connected: " << codec::trim(command));
          promise->reject(error::Error(error::ErrorCode::NOT_CONNECTED));
          return;
        }

        AVRLINK_LOG_SESSION(debug, "Querying: " << codec::trim(command));

        const auto queryId = pendingQuery_.arm(std::move(promise));

        ++outstandingOperations_;
        queryTimer_.expires_from_now(timeout);
        queryTimer_.async_wait(
            strand_.wrap([this, self, queryId, command](const boost::system::error_code &ec) {
              this->queryTimeoutHandler(queryId, command, ec);
            }));

        this->enqueueWrite(codec::encodeCommand(command), nullptr);
      });
    }

    void Session::cancelQuery(QueryPromise::Pointer promise) {
      strand_.dispatch([this, self = this->shared_from_this(), promise = std::move(promise)]() {
        if (pendingQuery_.cancel(promise, error::Error(error::ErrorCode::OPERATION_ABORTED))) {
          AVRLINK_LOG_SESSION(debug, "Query cancelled");
          queryTimer_.cancel();
        }
      });
    }

    ConnectionState Session::getState() const {
      return state_;
    }

    bool Session::isConnected() const {
      return state_ == ConnectionState::CONNECTED;
    }

    const SessionConfiguration &Session::getConfiguration() const {
      return configuration_;
    }

    void Session::startConnect() {
      const auto connectionId = ++connectionId_;
      socket_ = std::make_shared<boost::asio::ip::tcp::socket>(ioService_);
      connectInProgress_ = true;
      state_ = ConnectionState::CONNECTING;

      AVRLINK_LOG_SESSION(info, "Connecting to " << configuration_.host << ":" << configuration_.port);

      auto self = this->shared_from_this();

      ++outstandingOperations_;
      connectTimer_.expires_from_now(configuration_.connectTimeout);
      connectTimer_.async_wait(strand_.wrap([this, self, connectionId](const boost::system::error_code &ec) {
        this->connectTimeoutHandler(connectionId, ec);
      }));

      auto socket = socket_;
      ++outstandingOperations_;
      tcpWrapper_.asyncConnect(*socket, resolver_, configuration_.host, configuration_.port,
                               strand_.wrap([this, self, connectionId, socket](const boost::system::error_code &ec) {
                                 this->connectHandler(connectionId, socket, ec);
                               }));
    }

    void Session::connectHandler(uint64_t connectionId, const SocketPointer &socket,
                                 const boost::system::error_code &ec) {
      --outstandingOperations_;

      if (connectionId != connectionId_ || !connectInProgress_) {
        // attempt abandoned by timeout or disconnect; a late success must not leave the socket open
        tcpWrapper_.close(*socket);
        this->completeDisconnect();
        return;
      }

      connectInProgress_ = false;
      connectTimer_.cancel();

      if (ec) {
        this->connectFailed(error::Error(error::ErrorCode::CONNECT_FAILED, ec.value(), ec.message()));
      } else {
        AVRLINK_LOG_SESSION(info, "Connected to " << configuration_.host << ":" << configuration_.port);

        state_ = ConnectionState::CONNECTED;
        reconnectLoopActive_ = false;
        frameDecoder_.reset();

        this->startReceive();
        this->armReadWatchdog();

        auto promises = std::move(connectPromises_);
        connectPromises_.clear();
        for (auto &promise: promises) {
          promise->resolve();
        }

        this->notifyConnectionState(true);
      }

      this->completeDisconnect();
    }

    void Session::connectTimeoutHandler(uint64_t connectionId, const boost::system::error_code &ec) {
      --outstandingOperations_;

      if (ec == boost::asio::error::operation_aborted || connectionId != connectionId_ || !connectInProgress_) {
        this->completeDisconnect();
        return;
      }

      AVRLINK_LOG_SESSION(warning, "Connect to " << configuration_.host << ":" << configuration_.port
                                                 << " timed out after " << configuration_.connectTimeout.count()
                                                 << " ms");

      connectInProgress_ = false;
      // the pending connect handler becomes stale and closes its own socket
      ++connectionId_;
      this->closeSocket();

      this->connectFailed(error::Error(error::ErrorCode::CONNECT_TIMEOUT));
      this->completeDisconnect();
    }

    void Session::connectFailed(const error::Error &e) {
      AVRLINK_LOG_SESSION(error, "Failed to connect to " << configuration_.host << ":" << configuration_.port
                                                         << ": " << e.what());

      this->closeSocket();
      this->rejectConnectPromises(e);

      if (reconnectLoopActive_ && reconnectEnabled_) {
        state_ = ConnectionState::RECONNECTING;
        this->scheduleReconnect();
      } else {
        reconnectLoopActive_ = false;
        state_ = ConnectionState::DISCONNECTED;
        this->notifyConnectionState(false);
      }
    }

    void Session::startReceive() {
      const auto connectionId = connectionId_;
      auto socket = socket_;

      ++outstandingOperations_;
      tcpWrapper_.asyncRead(*socket, common::DataBuffer(receiveBuffer_),
                            strand_.wrap([this, self = this->shared_from_this(), connectionId, socket](
                                const boost::system::error_code &ec, size_t bytesTransferred) {
                              this->receiveHandler(connectionId, ec, bytesTransferred);
                            }));
    }

    /**
     * @brief Completion of one socket read.
     *
     * Feeds the bytes to the FrameDecoder and dispatches every complete frame,
     * to the pending query first, else to the event handler. A read belonging
     * to an older connection id only counts down outstanding operations.
     *
     * Scenario: reply split across two reads
     *   - T+0ms: query("Main.Volume?") armed, read pending
     *   - T+4ms: read of "Main.Vol": no frame yet, next read started
     *   - T+5ms: read of "ume=-30\r\n": frame completes, query resolved
     *   - T+5ms: watchdog re-armed, next read started
     *
     * Scenario: receiver closes the socket
     *   - T+0ms: read completes with eof
     *   - T+0ms: handleConnectionLost(CONNECTION_CLOSED), no further read
     *
     * Thread Safety: runs on strand_.
     */
    void Session::receiveHandler(uint64_t connectionId, const boost::system::error_code &ec,
                                 size_t bytesTransferred) {
      --outstandingOperations_;

      if (connectionId != connectionId_ || state_ != ConnectionState::CONNECTED) {
        this->completeDisconnect();
        return;
      }

      if (ec == boost::asio::error::eof || (!ec && bytesTransferred == 0)) {
        this->handleConnectionLost(error::Error(error::ErrorCode::CONNECTION_CLOSED, 0, "closed by receiver"));
        this->completeDisconnect();
        return;
      }

      if (ec) {
        this->handleConnectionLost(error::Error(error::ErrorCode::TCP_TRANSFER, ec.value(), ec.message()));
        this->completeDisconnect();
        return;
      }

      const common::DataConstBuffer received(receiveBuffer_.data(), bytesTransferred);
      AVRLINK_LOG_SESSION(trace, "Read " << bytesTransferred << " bytes: " << common::dump(received));
      frameDecoder_.feed(received);

      std::string frame;
      while (connectionId == connectionId_ && frameDecoder_.next(frame)) {
        this->dispatchFrame(std::move(frame));
      }

      // a handler may have disconnected from inside its callback
      if (connectionId == connectionId_ && state_ == ConnectionState::CONNECTED) {
        this->armReadWatchdog();
        this->startReceive();
      }

      this->completeDisconnect();
    }

    void Session::armReadWatchdog() {
      const auto connectionId = connectionId_;

      ++outstandingOperations_;
      readWatchdog_.expires_from_now(configuration_.readTimeout);
      readWatchdog_.async_wait(
          strand_.wrap([this, self = this->shared_from_this(), connectionId](const boost::system::error_code &ec) {
            this->readWatchdogHandler(connectionId, ec);
          }));
    }

    void Session::readWatchdogHandler(uint64_t connectionId, const boost::system::error_code &ec) {
      --outstandingOperations_;

      if (ec == boost::asio::error::operation_aborted || connectionId != connectionId_ ||
          state_ != ConnectionState::CONNECTED) {
        this->completeDisconnect();
        return;
      }

      AVRLINK_LOG_SESSION(trace, "No data for " << configuration_.readTimeout.count() << " ms, still waiting");
      this->armReadWatchdog();
    }

    void Session::dispatchFrame(std::string frame) {
      AVRLINK_LOG_SESSION(debug, "Received: " << frame);

      if (pendingQuery_.fulfill(frame)) {
        queryTimer_.cancel();
        return;
      }

      auto eventHandler = eventHandler_.lock();
      if (eventHandler == nullptr) {
        return;
      }

      try {
        eventHandler->onFrameReceived(frame);
      } catch (const std::exception &e) {
        AVRLINK_LOG_SESSION(error, "Frame handler failed: " << e.what());
      }
    }

    void Session::queryTimeoutHandler(uint64_t queryId, const std::string &command,
                                      const boost::system::error_code &ec) {
      --outstandingOperations_;

      if (ec != boost::asio::error::operation_aborted && pendingQuery_.isArmed() &&
          pendingQuery_.getId() == queryId) {
        AVRLINK_LOG_SESSION(warning, "Query timeout: " << codec::trim(command));
        pendingQuery_.cancel(error::Error(error::ErrorCode::QUERY_TIMEOUT));
      }

      this->completeDisconnect();
    }

    void Session::enqueueWrite(common::Data data, SendPromise::Pointer promise) {
      sendQueue_.emplace_back(std::make_shared<common::Data>(std::move(data)), std::move(promise));

      if (!writeInProgress_) {
        this->writeNext();
      }
    }

    void Session::writeNext() {
      if (sendQueue_.empty()) {
        return;
      }

      writeInProgress_ = true;

      const auto connectionId = connectionId_;
      auto socket = socket_;
      auto data = sendQueue_.front().first;

      ++outstandingOperations_;
      tcpWrapper_.asyncWrite(*socket, common::DataConstBuffer(*data),
                             strand_.wrap([this, self = this->shared_from_this(), connectionId, socket, data](
                                 const boost::system::error_code &ec, size_t) {
                               this->writeHandler(connectionId, ec);
                             }));
    }

    void Session::writeHandler(uint64_t connectionId, const boost::system::error_code &ec) {
      --outstandingOperations_;

      if (connectionId != connectionId_) {
        // the queue was already rejected by the loss or disconnect that bumped the id
        this->completeDisconnect();
        return;
      }

      writeInProgress_ = false;
      auto promise = std::move(sendQueue_.front().second);
      sendQueue_.pop_front();

      if (ec) {
        const error::Error e(error::ErrorCode::TCP_TRANSFER, ec.value(), ec.message());
        AVRLINK_LOG_SESSION(error, "Write failed: " << e.what());

        if (promise != nullptr) {
          promise->reject(e);
        }
        this->handleConnectionLost(e);
      } else {
        if (promise != nullptr) {
          promise->resolve();
        }
        this->writeNext();
      }

      this->completeDisconnect();
    }

    /**
     * @brief Tears down a connection that failed underneath the session.
     *
     * Only acts while CONNECTED. Bumps the connection id so completions still
     * in flight are ignored, rejects the pending query and the write queue
     * with CONNECTION_LOST, notifies false, then enters RECONNECTING unless
     * the event handler reconnected or disconnected from its callback.
     *
     * Scenario: write fails while a query waits
     *   - T+0ms: write of "Main.Power?" fails with broken_pipe
     *   - T+0ms: query rejected CONNECTION_LOST, handler notified false
     *   - T+0ms: reconnect wait started (reconnectDelay)
     *   - T+2ms: aborted read completes with a stale id, nothing else happens
     */
    void Session::handleConnectionLost(const error::Error &e) {
      if (state_ != ConnectionState::CONNECTED) {
        return;
      }

      AVRLINK_LOG_SESSION(warning, "Connection to " << configuration_.host << ":" << configuration_.port
                                                    << " lost: " << e.what());

      ++connectionId_;
      this->closeSocket();
      readWatchdog_.cancel();
      queryTimer_.cancel();

      const error::Error lost(error::ErrorCode::CONNECTION_LOST, e.getNativeCode(), e.getInformation());
      pendingQuery_.cancel(lost);
      this->rejectSendQueue(lost);

      state_ = ConnectionState::DISCONNECTED;
      this->notifyConnectionState(false);

      // the handler may have called connect() or disconnect() from its callback
      if (reconnectEnabled_ && state_ == ConnectionState::DISCONNECTED && !connectInProgress_) {
        reconnectLoopActive_ = true;
        state_ = ConnectionState::RECONNECTING;
        this->scheduleReconnect();
      }
    }

    void Session::scheduleReconnect() {
      if (!reconnectEnabled_ || reconnectScheduled_) {
        return;
      }

      reconnectScheduled_ = true;
      const auto reconnectId = ++reconnectId_;

      AVRLINK_LOG_SESSION(info, "Reconnecting to " << configuration_.host << ":" << configuration_.port << " in "
                                                   << configuration_.reconnectDelay.count() << " ms");

      ++outstandingOperations_;
      reconnectTimer_.expires_from_now(configuration_.reconnectDelay);
      reconnectTimer_.async_wait(
          strand_.wrap([this, self = this->shared_from_this(), reconnectId](const boost::system::error_code &ec) {
            this->reconnectHandler(reconnectId, ec);
          }));
    }

    void Session::reconnectHandler(uint64_t reconnectId, const boost::system::error_code &ec) {
      --outstandingOperations_;

      if (ec == boost::asio::error::operation_aborted || reconnectId != reconnectId_) {
        this->completeDisconnect();
        return;
      }

      reconnectScheduled_ = false;

      if (!reconnectEnabled_ || !reconnectLoopActive_ || state_ == ConnectionState::CONNECTED ||
          connectInProgress_) {
        this->completeDisconnect();
        return;
      }

      this->startConnect();
    }

    void Session::closeSocket() {
      // aborts a name lookup still in flight; its connect handler sees operation_aborted
      tcpWrapper_.cancel(resolver_);

      if (socket_ != nullptr) {
        tcpWrapper_.close(*socket_);
      }
    }

    void Session::rejectSendQueue(const error::Error &e) {
      auto queue = std::move(sendQueue_);
      sendQueue_.clear();
      writeInProgress_ = false;

      for (auto &entry: queue) {
        if (entry.second != nullptr) {
          entry.second->reject(e);
        }
      }
    }

    void Session::rejectConnectPromises(const error::Error &e) {
      auto promises = std::move(connectPromises_);
      connectPromises_.clear();

      for (auto &promise: promises) {
        promise->reject(e);
      }
    }

    void Session::notifyConnectionState(bool connected) {
      auto eventHandler = eventHandler_.lock();
      if (eventHandler == nullptr) {
        return;
      }

      try {
        eventHandler->onConnectionStateChanged(connected);
      } catch (const std::exception &e) {
        AVRLINK_LOG_SESSION(error, "Connection state handler failed: " << e.what());
      }
    }

    /**
     * @brief Resolves parked disconnect promises once nothing is in flight.
     *
     * Every completion handler calls this last. Promises stay parked while
     * outstandingOperations_ is non-zero, so disconnect() resolves only after
     * each aborted read, write, timer and connect attempt has returned.
     *
     * Scenario: disconnect() followed by connect()
     *   - T+0ms: disconnect() parks its promise, outstanding = 2
     *   - T+0ms: connect() parks its promise behind the disconnect
     *   - T+1ms: last aborted completion, outstanding = 0
     *   - T+1ms: disconnect promise resolved, then the connect attempt starts
     */
    void Session::completeDisconnect() {
      if (disconnectPromises_.empty() || outstandingOperations_ != 0) {
        return;
      }

      AVRLINK_LOG_SESSION(info, "Disconnected from " << configuration_.host << ":" << configuration_.port);

      auto promises = std::move(disconnectPromises_);
      disconnectPromises_.clear();
      for (auto &promise: promises) {
        promise->resolve();
      }

      // a connect() issued while the disconnect was completing starts now
      if (!connectPromises_.empty() && reconnectEnabled_) {
        this->startConnect();
      }
    }

  }
}
