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

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <avrlink/Device/QueryChain.hpp>
#include "mock/SessionMock.hpp"

using namespace testing;
using namespace std::chrono_literals;
using avrlink::device::QueryChain;
using avrlink::error::Error;
using avrlink::error::ErrorCode;
using avrlink::session::ISession;
using avrlink::session::ut::SessionMock;
using Replies = std::vector<std::optional<std::string>>;


class QueryChainUnitTest : public testing::Test {
protected:
  QueryChainUnitTest()
      : session_(std::make_shared<NiceMock<SessionMock>>()) {
    ON_CALL(*session_, query(_, _, _))
        .WillByDefault(Invoke([this](std::string command, std::chrono::milliseconds,
                                     ISession::QueryPromise::Pointer promise) {
          issued_.push_back(command);

          const auto error = errors_.find(command);
          if (error != errors_.end()) {
            promise->reject(Error(error->second));
            return;
          }

          const auto reply = replies_.find(command);
          if (reply != replies_.end()) {
            promise->resolve(reply->second);
          } else if (hold_) {
            held_.push_back(promise);
          } else {
            promise->reject(Error(ErrorCode::QUERY_TIMEOUT));
          }
        }));

    chain_ = std::make_shared<QueryChain>(ioService_, session_, 1ms);
  }

  QueryChain::ReplyHandler record() {
    return [this](const std::optional<std::string> &reply) {
      received_.push_back(reply);
    };
  }

  void run() {
    auto promise = QueryChain::Promise::defer(ioService_);
    promise->then([this]() { resolved_ = true; },
                  [this](const Error &e) { rejected_ = e.getCode(); });
    chain_->run(std::move(promise));
    this->runAll();
  }

  void runAll() {
    ioService_.restart();
    ioService_.run();
  }

  boost::asio::io_service ioService_;
  std::shared_ptr<NiceMock<SessionMock>> session_;
  QueryChain::Pointer chain_;
  std::map<std::string, std::string> replies_;
  std::map<std::string, ErrorCode> errors_;
  bool hold_ = false;
  std::vector<ISession::QueryPromise::Pointer> held_;
  std::vector<std::string> issued_;
  Replies received_;
  bool resolved_ = false;
  std::optional<ErrorCode> rejected_;
};

TEST_F(QueryChainUnitTest, RunsStepsInOrder) {
  replies_["Main.Model?"] = "Main.Model=T 758";
  replies_["Main.Version?"] = "Main.Version=v2.1";

  chain_->add("Main.Model?", 100ms, this->record());
  chain_->add("Main.Version?", 100ms, this->record());
  this->run();

  EXPECT_EQ(issued_, (std::vector<std::string>{"Main.Model?", "Main.Version?"}));
  EXPECT_EQ(received_, (Replies{std::string("Main.Model=T 758"), std::string("Main.Version=v2.1")}));
  EXPECT_TRUE(resolved_);
}

TEST_F(QueryChainUnitTest, TimeoutGivesNulloptAndChainContinues) {
  replies_["Main.Version?"] = "Main.Version=v2.1";

  chain_->add("Main.Model?", 100ms, this->record());
  chain_->add("Main.Version?", 100ms, this->record());
  this->run();

  EXPECT_EQ(received_, (Replies{std::nullopt, std::string("Main.Version=v2.1")}));
  EXPECT_TRUE(resolved_);
}

TEST_F(QueryChainUnitTest, SupersededQueryGivesNullopt) {
  errors_["Main.Model?"] = ErrorCode::QUERY_SUPERSEDED;
  replies_["Main.Version?"] = "Main.Version=v2.1";

  chain_->add("Main.Model?", 100ms, this->record());
  chain_->add("Main.Version?", 100ms, this->record());
  this->run();

  EXPECT_EQ(received_, (Replies{std::nullopt, std::string("Main.Version=v2.1")}));
  EXPECT_TRUE(resolved_);
}

TEST_F(QueryChainUnitTest, FollowUpStepsRunRightAfterTheirParent) {
  replies_["Source1.Enabled?"] = "Source1.Enabled=Yes";
  replies_["Source1.Name?"] = "Source1.Name=CD";
  replies_["Source2.Enabled?"] = "Source2.Enabled=No";

  chain_->add("Source1.Enabled?", 100ms, [this](const std::optional<std::string> &) {
    chain_->add("Source1.Name?", 100ms, this->record());
  });
  chain_->add("Source2.Enabled?", 100ms, this->record());
  this->run();

  EXPECT_EQ(issued_, (std::vector<std::string>{"Source1.Enabled?", "Source1.Name?", "Source2.Enabled?"}));
  EXPECT_EQ(received_, (Replies{std::string("Source1.Name=CD"), std::string("Source2.Enabled=No")}));
  EXPECT_TRUE(resolved_);
}

TEST_F(QueryChainUnitTest, ConnectionLossStopsChain) {
  errors_["Main.Model?"] = ErrorCode::CONNECTION_LOST;
  replies_["Main.Version?"] = "Main.Version=v2.1";

  chain_->add("Main.Model?", 100ms, this->record());
  chain_->add("Main.Version?", 100ms, this->record());
  this->run();

  EXPECT_EQ(issued_, std::vector<std::string>{"Main.Model?"});
  EXPECT_TRUE(received_.empty());
  EXPECT_FALSE(resolved_);
  EXPECT_EQ(rejected_, ErrorCode::CONNECTION_LOST);
}

TEST_F(QueryChainUnitTest, NotConnectedStopsChain) {
  errors_["Main.Model?"] = ErrorCode::NOT_CONNECTED;

  chain_->add("Main.Model?", 100ms, this->record());
  chain_->add("Main.Version?", 100ms, this->record());
  this->run();

  EXPECT_EQ(issued_.size(), 1u);
  EXPECT_EQ(rejected_, ErrorCode::NOT_CONNECTED);
}

TEST_F(QueryChainUnitTest, ThrowingHandlerDoesNotStopChain) {
  replies_["Main.Model?"] = "Main.Model=T 758";
  replies_["Main.Version?"] = "Main.Version=v2.1";

  chain_->add("Main.Model?", 100ms, [](const std::optional<std::string> &) {
    throw std::runtime_error("handler failure");
  });
  chain_->add("Main.Version?", 100ms, this->record());
  this->run();

  EXPECT_EQ(received_, Replies{std::string("Main.Version=v2.1")});
  EXPECT_TRUE(resolved_);
}

TEST_F(QueryChainUnitTest, CancelRejectsAndIgnoresLateReply) {
  hold_ = true;

  chain_->add("Main.Model?", 100ms, this->record());
  chain_->add("Main.Version?", 100ms, this->record());
  this->run();
  ASSERT_EQ(held_.size(), 1u);

  EXPECT_CALL(*session_, cancelQuery(Eq(held_.front()))).Times(1);
  chain_->cancel();
  this->runAll();
  EXPECT_EQ(rejected_, ErrorCode::OPERATION_ABORTED);

  held_.front()->resolve("Main.Model=T 758");
  this->runAll();
  EXPECT_TRUE(received_.empty());
  EXPECT_EQ(issued_.size(), 1u);
}

TEST_F(QueryChainUnitTest, ConnectionLossDoesNotCancelSettledQuery) {
  errors_["Main.Model?"] = ErrorCode::CONNECTION_LOST;
  EXPECT_CALL(*session_, cancelQuery(_)).Times(0);

  chain_->add("Main.Model?", 100ms, this->record());
  this->run();

  EXPECT_EQ(rejected_, ErrorCode::CONNECTION_LOST);
}

TEST_F(QueryChainUnitTest, SecondRunIsRejected) {
  hold_ = true;
  chain_->add("Main.Model?", 100ms, this->record());
  this->run();

  std::optional<ErrorCode> secondRun;
  auto promise = QueryChain::Promise::defer(ioService_);
  promise->then([]() {}, [&secondRun](const Error &e) { secondRun = e.getCode(); });
  chain_->run(std::move(promise));
  this->runAll();

  EXPECT_EQ(secondRun, ErrorCode::OPERATION_IN_PROGRESS);
}

TEST_F(QueryChainUnitTest, EmptyChainResolves) {
  this->run();

  EXPECT_TRUE(issued_.empty());
  EXPECT_TRUE(resolved_);
}
