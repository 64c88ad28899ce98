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
 * @file CommandGateway.cpp
 * @brief Blocking connect/send/query on top of the asynchronous session.
 *
 * Each call defers an io::Promise on the io_service, registers continuations
 * that fill a std::promise, starts the session operation and waits on the
 * matching std::future. The session enforces its own timeouts; the local
 * wait adds cGracePeriod so that a missing continuation can never block the
 * caller forever.
 *
 * Scenario: query with a slow receiver
 *   - T+0ms: query("Main.Model?", 2000ms), caller blocks
 *   - T+2000ms: session query timer fires, promise rejected QUERY_TIMEOUT
 *   - T+2000ms: continuation sets std::nullopt, caller returns
 *   - T+2500ms: local wait deadline (not reached)
 */

#include <future>
#include <memory>
#include <utility>
#include <avrlink/Common/Log.hpp>
#include <avrlink/Session/CommandGateway.hpp>


namespace avrlink {
  namespace session {

    QueryCancellation::QueryCancellation()
        : cancelled_(false) {

    }

    bool QueryCancellation::isCancelled() const {
      std::lock_guard<decltype(mutex_)> lock(mutex_);
      return cancelled_;
    }

    constexpr std::chrono::milliseconds CommandGateway::cGracePeriod;
    constexpr std::chrono::milliseconds CommandGateway::cDisconnectTimeout;

    CommandGateway::CommandGateway(boost::asio::io_service &ioService, ISession::Pointer session)
        : ioService_(ioService), session_(std::move(session)) {

    }

    bool CommandGateway::connect() {
      auto result = std::make_shared<std::promise<bool>>();
      auto future = result->get_future();

      auto promise = ISession::ConnectPromise::defer(ioService_);
      promise->then([result]() { result->set_value(true); },
                    [result](const error::Error &e) {
                      AVRLINK_LOG_GATEWAY(error, "Connect failed: " << e.what());
                      result->set_value(false);
                    });
      session_->connect(std::move(promise));

      const auto deadline = session_->getConfiguration().connectTimeout + cGracePeriod;
      if (future.wait_for(deadline) != std::future_status::ready) {
        AVRLINK_LOG_GATEWAY(error, "Connect did not complete within " << deadline.count() << " ms");
        return false;
      }

      return future.get();
    }

    void CommandGateway::disconnect() {
      auto result = std::make_shared<std::promise<void>>();
      auto future = result->get_future();

      auto promise = ISession::DisconnectPromise::defer(ioService_);
      promise->then([result]() { result->set_value(); },
                    [result](const error::Error &e) {
                      AVRLINK_LOG_GATEWAY(error, "Disconnect failed: " << e.what());
                      result->set_value();
                    });
      session_->disconnect(std::move(promise));

      if (future.wait_for(cDisconnectTimeout) != std::future_status::ready) {
        AVRLINK_LOG_GATEWAY(warning, "Disconnect still has operations outstanding after "
                                         << cDisconnectTimeout.count() << " ms");
      }
    }

    bool CommandGateway::send(const std::string &command) {
      auto result = std::make_shared<std::promise<bool>>();
      auto future = result->get_future();

      auto promise = ISession::SendPromise::defer(ioService_);
      promise->then([result]() { result->set_value(true); },
                    [result, command](const error::Error &e) {
                      AVRLINK_LOG_GATEWAY(warning, "Send failed: " << command << ", " << e.what());
                      result->set_value(false);
                    });
      session_->send(command, std::move(promise));

      // a write never outlives the socket; the connect timeout bounds a stuck kernel buffer
      const auto deadline = session_->getConfiguration().connectTimeout + cGracePeriod;
      if (future.wait_for(deadline) != std::future_status::ready) {
        AVRLINK_LOG_GATEWAY(error, "Send did not complete within " << deadline.count() << " ms: " << command);
        return false;
      }

      return future.get();
    }

    std::optional<std::string> CommandGateway::query(const std::string &command, std::chrono::milliseconds timeout,
                                                     QueryCancellation::Pointer cancellation) {
      auto result = std::make_shared<std::promise<std::optional<std::string>>>();
      auto future = result->get_future();

      auto promise = ISession::QueryPromise::defer(ioService_);
      promise->then([result](std::string reply) { result->set_value(std::move(reply)); },
                    [result, command](const error::Error &e) {
                      if (e == error::ErrorCode::QUERY_TIMEOUT || e == error::ErrorCode::OPERATION_ABORTED) {
                        AVRLINK_LOG_GATEWAY(debug, "No reply to " << command << ": " << e.what());
                      } else {
                        AVRLINK_LOG_GATEWAY(warning, "Query failed: " << command << ", " << e.what());
                      }
                      result->set_value(std::nullopt);
                    });

      if (cancellation != nullptr) {
        // issued under the token lock so a concurrent cancelQuery() reaches the strand after the query
        std::lock_guard<decltype(cancellation->mutex_)> lock(cancellation->mutex_);
        if (cancellation->cancelled_) {
          AVRLINK_LOG_GATEWAY(debug, "Query cancelled before it was issued: " << command);
          return std::nullopt;
        }

        cancellation->promise_ = promise;
        session_->query(command, timeout, std::move(promise));
      } else {
        session_->query(command, timeout, std::move(promise));
      }

      std::optional<std::string> reply;
      if (future.wait_for(timeout + cGracePeriod) != std::future_status::ready) {
        AVRLINK_LOG_GATEWAY(error, "Query did not settle within " << (timeout + cGracePeriod).count()
                                                                  << " ms: " << command);
      } else {
        reply = future.get();
      }

      if (cancellation != nullptr) {
        std::lock_guard<decltype(cancellation->mutex_)> lock(cancellation->mutex_);
        cancellation->promise_.reset();
      }

      return reply;
    }

    void CommandGateway::cancelQuery(const QueryCancellation::Pointer &cancellation) {
      if (cancellation == nullptr) {
        return;
      }

      std::lock_guard<decltype(cancellation->mutex_)> lock(cancellation->mutex_);
      cancellation->cancelled_ = true;
      if (cancellation->promise_ != nullptr) {
        session_->cancelQuery(cancellation->promise_);
      }
    }

    bool CommandGateway::isConnected() const {
      return session_->isConnected();
    }

    ConnectionState CommandGateway::getState() const {
      return session_->getState();
    }

  }
}
