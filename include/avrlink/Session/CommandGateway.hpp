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
#include <mutex>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include <avrlink/Session/ISession.hpp>


namespace avrlink::session {

    /**
     * @class QueryCancellation
     * @brief Lets another thread abandon one caller's blocking query().
     *
     * Cancelling affects only the query the token was passed to. A token
     * cancelled before its query starts makes that query return std::nullopt
     * without writing anything.
     */
    class QueryCancellation {
    public:
      using Pointer = std::shared_ptr<QueryCancellation>;

      QueryCancellation();

      bool isCancelled() const;

    private:
      friend class CommandGateway;

      ISession::QueryPromise::Pointer promise_;
      bool cancelled_;
      mutable std::mutex mutex_;
    };

    /**
     * @class CommandGateway
     * @brief Blocking facade over ISession for application threads.
     *
     * Every call hands a promise to the session and waits for it to settle.
     * Failures are reported as false or std::nullopt and logged, never thrown.
     *
     * The io_service must be run by at least one other thread, and none of the
     * calls may be made from such a thread: the continuation that releases the
     * waiting caller is posted to the same io_service.
     */
    class CommandGateway {
    public:
      // extra wait on top of the session's own timeout before giving up locally
      static constexpr std::chrono::milliseconds cGracePeriod{500};
      static constexpr std::chrono::milliseconds cDisconnectTimeout{5000};

      CommandGateway(boost::asio::io_service &ioService, ISession::Pointer session);

      CommandGateway(const CommandGateway &) = delete;
      CommandGateway &operator=(const CommandGateway &) = delete;

      bool connect();

      /// Returns once the session has no asynchronous operation left.
      void disconnect();

      bool send(const std::string &command);

      std::optional<std::string> query(const std::string &command,
                                       std::chrono::milliseconds timeout = std::chrono::seconds(2),
                                       QueryCancellation::Pointer cancellation = nullptr);

      /// Releases the caller blocked in query() with this token. Other callers are not affected.
      void cancelQuery(const QueryCancellation::Pointer &cancellation);

      bool isConnected() const;

      ConnectionState getState() const;

    private:
      boost::asio::io_service &ioService_;
      ISession::Pointer session_;
    };

}
