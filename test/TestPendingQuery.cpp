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

#include <optional>
#include <string>
#include <gtest/gtest.h>
#include <avrlink/Session/PendingQuery.hpp>

using avrlink::error::ErrorCode;
using avrlink::session::PendingQuery;


class PendingQueryUnitTest : public testing::Test {
protected:
  PendingQuery::Promise::Pointer makePromise(std::optional<std::string> &reply, std::optional<ErrorCode> &error) {
    auto promise = PendingQuery::Promise::defer(ioService_);
    promise->then([&reply](std::string frame) { reply = std::move(frame); },
                  [&error](const avrlink::error::Error &e) { error = e.getCode(); });
    return promise;
  }

  void run() {
    ioService_.restart();
    ioService_.run();
  }

  boost::asio::io_service ioService_;
  PendingQuery pendingQuery_;
};

TEST_F(PendingQueryUnitTest, FulfillWithoutArmedQueryIsRejected) {
  EXPECT_FALSE(pendingQuery_.isArmed());
  EXPECT_FALSE(pendingQuery_.fulfill("Main.Power=On"));
}

TEST_F(PendingQueryUnitTest, FulfillResolvesArmedQueryOnce) {
  std::optional<std::string> reply;
  std::optional<ErrorCode> error;

  pendingQuery_.arm(this->makePromise(reply, error));
  EXPECT_TRUE(pendingQuery_.isArmed());

  EXPECT_TRUE(pendingQuery_.fulfill("Main.Volume=-30"));
  EXPECT_FALSE(pendingQuery_.isArmed());
  EXPECT_FALSE(pendingQuery_.fulfill("Main.Volume=-31"));

  this->run();
  EXPECT_EQ(reply, std::optional<std::string>("Main.Volume=-30"));
  EXPECT_FALSE(error);
}

TEST_F(PendingQueryUnitTest, ArmingAgainSupersedesOutstandingQuery) {
  std::optional<std::string> firstReply;
  std::optional<ErrorCode> firstError;
  std::optional<std::string> secondReply;
  std::optional<ErrorCode> secondError;

  const auto firstId = pendingQuery_.arm(this->makePromise(firstReply, firstError));
  const auto secondId = pendingQuery_.arm(this->makePromise(secondReply, secondError));
  EXPECT_NE(firstId, secondId);
  EXPECT_EQ(pendingQuery_.getId(), secondId);

  EXPECT_TRUE(pendingQuery_.fulfill("Main.Mute=Off"));

  this->run();
  EXPECT_FALSE(firstReply);
  EXPECT_EQ(firstError, ErrorCode::QUERY_SUPERSEDED);
  EXPECT_EQ(secondReply, std::optional<std::string>("Main.Mute=Off"));
}

TEST_F(PendingQueryUnitTest, CancelRejectsAndClearsSlot) {
  std::optional<std::string> reply;
  std::optional<ErrorCode> error;

  pendingQuery_.arm(this->makePromise(reply, error));
  pendingQuery_.cancel(avrlink::error::Error(ErrorCode::QUERY_TIMEOUT));

  EXPECT_FALSE(pendingQuery_.isArmed());
  EXPECT_FALSE(pendingQuery_.fulfill("Main.Power=On"));

  this->run();
  EXPECT_FALSE(reply);
  EXPECT_EQ(error, ErrorCode::QUERY_TIMEOUT);
}

TEST_F(PendingQueryUnitTest, CancelOnEmptySlotIsNoOp) {
  pendingQuery_.cancel(avrlink::error::Error(ErrorCode::OPERATION_ABORTED));
  EXPECT_FALSE(pendingQuery_.isArmed());
}

TEST_F(PendingQueryUnitTest, ScopedCancelOnlyRejectsMatchingPromise) {
  std::optional<std::string> firstReply;
  std::optional<ErrorCode> firstError;
  std::optional<std::string> secondReply;
  std::optional<ErrorCode> secondError;

  auto first = this->makePromise(firstReply, firstError);
  pendingQuery_.arm(first);
  pendingQuery_.arm(this->makePromise(secondReply, secondError));

  EXPECT_FALSE(pendingQuery_.cancel(first, avrlink::error::Error(ErrorCode::OPERATION_ABORTED)));
  EXPECT_TRUE(pendingQuery_.isArmed());
  EXPECT_TRUE(pendingQuery_.fulfill("Main.Mute=Off"));

  this->run();
  EXPECT_EQ(firstError, ErrorCode::QUERY_SUPERSEDED);
  EXPECT_EQ(secondReply, std::optional<std::string>("Main.Mute=Off"));
  EXPECT_FALSE(secondError);
}

TEST_F(PendingQueryUnitTest, ScopedCancelRejectsArmedPromise) {
  std::optional<std::string> reply;
  std::optional<ErrorCode> error;

  auto promise = this->makePromise(reply, error);
  pendingQuery_.arm(promise);

  EXPECT_TRUE(pendingQuery_.cancel(promise, avrlink::error::Error(ErrorCode::OPERATION_ABORTED)));
  EXPECT_FALSE(pendingQuery_.isArmed());

  this->run();
  EXPECT_EQ(error, ErrorCode::OPERATION_ABORTED);
}
