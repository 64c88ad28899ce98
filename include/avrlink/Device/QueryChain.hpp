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
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <avrlink/IO/Promise.hpp>
#include <avrlink/Session/ISession.hpp>


namespace avrlink::device {

    /**
     * @class QueryChain
     * @brief Runs queries one after another over a session.
     *
     * Only one query of a session can be outstanding, so a battery of queries
     * must be serialised. The chain issues a step, waits for its outcome, waits
     * the settle delay and issues the next step.
     *
     * Each step's handler gets the reply, or std::nullopt when the query timed
     * out or was superseded; the chain continues either way. NOT_CONNECTED,
     * CONNECTION_LOST and OPERATION_ABORTED end the chain and reject its promise.
     *
     * Steps added from inside a handler run right after the step that added
     * them, in the order they were added.
     */
    class QueryChain : public std::enable_shared_from_this<QueryChain> {
    public:
      using Pointer = std::shared_ptr<QueryChain>;
      using Promise = io::Promise<void>;
      using ReplyHandler = std::function<void(const std::optional<std::string> &reply)>;

      QueryChain(boost::asio::io_service &ioService, session::ISession::Pointer session,
                 std::chrono::milliseconds settleDelay);

      /// Call before run(), or from a reply handler.
      void add(std::string command, std::chrono::milliseconds timeout, ReplyHandler handler);

      void run(Promise::Pointer promise);

      /// Stops the chain and abandons the query in flight; the promise rejects with OPERATION_ABORTED.
      void cancel();

    private:
      using std::enable_shared_from_this<QueryChain>::shared_from_this;

      struct Step {
        std::string command;
        std::chrono::milliseconds timeout;
        ReplyHandler handler;
      };

      void runNext();

      void issue(std::shared_ptr<Step> step);

      void onReply(const std::shared_ptr<Step> &step, std::optional<std::string> reply);

      void onError(const std::shared_ptr<Step> &step, const error::Error &e);

      void settleHandler(std::shared_ptr<Step> step, const boost::system::error_code &ec);

      void finish(const error::Error &e);

      boost::asio::io_service::strand strand_;
      session::ISession::Pointer session_;
      std::chrono::milliseconds settleDelay_;
      boost::asio::steady_timer settleTimer_;
      std::deque<Step> steps_;
      std::deque<Step> followUps_;
      Promise::Pointer promise_;
      session::ISession::QueryPromise::Pointer inFlight_;
      bool inHandler_;
      bool firstStep_;
      bool finished_;
    };

}
