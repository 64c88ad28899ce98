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
 * @file QueryChain.cpp
 * @brief Sequential query runner with a settle delay between steps.
 *
 * Scenario: probing two sources, the second one disabled
 *   - T+0ms: Source1.Enabled? issued
 *   - T+8ms: "Source1.Enabled=Yes", handler adds Source1.Name? as follow-up
 *   - T+108ms: Source1.Name? issued (settle delay 100ms)
 *   - T+115ms: "Source1.Name=Blu-ray"
 *   - T+215ms: Source2.Enabled? issued
 *   - T+1715ms: QUERY_TIMEOUT, handler gets std::nullopt, chain continues
 *   - T+1715ms: no steps left, promise resolved
 *
 * Thread Safety: all state lives on the chain strand; query promises are
 * deferred on it, so handlers never run concurrently with each other.
 */

#include <iterator>
#include <utility>
#include <avrlink/Common/Log.hpp>
#include <avrlink/Device/QueryChain.hpp>


namespace avrlink {
  namespace device {

    QueryChain::QueryChain(boost::asio::io_service &ioService, session::ISession::Pointer session,
                           std::chrono::milliseconds settleDelay)
        : strand_(ioService)
        , session_(std::move(session))
        , settleDelay_(settleDelay)
        , settleTimer_(ioService)
        , inHandler_(false)
        , firstStep_(true)
        , finished_(false) {

    }

    void QueryChain::add(std::string command, std::chrono::milliseconds timeout, ReplyHandler handler) {
      auto &steps = inHandler_ ? followUps_ : steps_;
      steps.push_back(Step{std::move(command), timeout, std::move(handler)});
    }

    void QueryChain::run(Promise::Pointer promise) {
      strand_.dispatch([this, self = this->shared_from_this(), promise = std::move(promise)]() mutable {
        if (promise_ != nullptr) {
          promise->reject(error::Error(error::ErrorCode::OPERATION_IN_PROGRESS));
          return;
        }

        promise_ = std::move(promise);
        this->runNext();
      });
    }

    void QueryChain::cancel() {
      strand_.dispatch([this, self = this->shared_from_this()]() {
        if (promise_ != nullptr && !finished_) {
          this->finish(error::Error(error::ErrorCode::OPERATION_ABORTED));
        }
      });
    }

    void QueryChain::runNext() {
      if (finished_) {
        return;
      }

      if (steps_.empty()) {
        finished_ = true;
        promise_->resolve();
        return;
      }

      auto step = std::make_shared<Step>(std::move(steps_.front()));
      steps_.pop_front();

      if (firstStep_) {
        firstStep_ = false;
        this->issue(std::move(step));
        return;
      }

      settleTimer_.expires_from_now(settleDelay_);
      settleTimer_.async_wait(
          strand_.wrap([this, self = this->shared_from_this(), step](const boost::system::error_code &ec) {
            this->settleHandler(step, ec);
          }));
    }

    void QueryChain::settleHandler(std::shared_ptr<Step> step, const boost::system::error_code &ec) {
      if (finished_ || ec == boost::asio::error::operation_aborted) {
        return;
      }

      this->issue(std::move(step));
    }

    void QueryChain::issue(std::shared_ptr<Step> step) {
      auto promise = session::ISession::QueryPromise::defer(strand_);
      promise->then([this, self = this->shared_from_this(), step](std::string reply) {
                      this->onReply(step, std::move(reply));
                    },
                    [this, self = this->shared_from_this(), step](const error::Error &e) {
                      this->onError(step, e);
                    });
      inFlight_ = promise;
      session_->query(step->command, step->timeout, std::move(promise));
    }

    /**
     * @brief Hands a reply, or std::nullopt for no reply, to the step's handler.
     *
     * Steps the handler added through add() run next, ahead of the remaining
     * steps. A throwing handler is logged and the chain moves on.
     *
     * Scenario: power reply adds follow-ups
     *   - steps: [Main.Power?, Tuner.Band?]
     *   - Main.Power=On: handler adds Main.Volume? and Main.Mute?
     *   - steps: [Main.Volume?, Main.Mute?, Tuner.Band?], settle delay started
     */
    void QueryChain::onReply(const std::shared_ptr<Step> &step, std::optional<std::string> reply) {
      inFlight_.reset();
      if (finished_) {
        return;
      }

      inHandler_ = true;
      try {
        step->handler(reply);
      } catch (const std::exception &e) {
        AVRLINK_LOG_DEVICE(error, "Reply handler of " << step->command << " failed: " << e.what());
      }
      inHandler_ = false;

      steps_.insert(steps_.begin(), std::make_move_iterator(followUps_.begin()),
                    std::make_move_iterator(followUps_.end()));
      followUps_.clear();

      this->runNext();
    }

    void QueryChain::onError(const std::shared_ptr<Step> &step, const error::Error &e) {
      inFlight_.reset();
      if (finished_) {
        return;
      }

      if (e == error::ErrorCode::NOT_CONNECTED || e == error::ErrorCode::CONNECTION_LOST ||
          e == error::ErrorCode::OPERATION_ABORTED) {
        AVRLINK_LOG_DEVICE(warning, "Query chain stopped at " << step->command << ": " << e.what());
        this->finish(e);
        return;
      }

      AVRLINK_LOG_DEVICE(debug, "No reply to " << step->command << ": " << e.what());
      this->onReply(step, std::nullopt);
    }

    void QueryChain::finish(const error::Error &e) {
      finished_ = true;
      settleTimer_.cancel();
      steps_.clear();
      followUps_.clear();

      // frees the session's query slot so the next frame is not taken by an abandoned step
      if (inFlight_ != nullptr) {
        session_->cancelQuery(std::move(inFlight_));
        inFlight_.reset();
      }

      promise_->reject(e);
    }

  }
}
