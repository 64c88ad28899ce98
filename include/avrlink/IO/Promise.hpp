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

#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <boost/asio.hpp>
#include <avrlink/Error/Error.hpp>
#include <avrlink/IO/IOContextWrapper.hpp>


namespace avrlink::io {

// One-shot promise: settles at most once, either resolved with a value or
// rejected with an error. The continuation registered through then() is
// posted to the io_service or strand the promise was deferred on, never run
// inline by resolve()/reject().
template<typename ResolveArgumentType, typename ErrorArgumentType = error::Error>
class Promise {
public:
  Promise(const Promise &) = delete;
  Promise &operator=(const Promise &) = delete;

  using ValueType = ResolveArgumentType;
  using ErrorType = ErrorArgumentType;
  using ResolveHandler = std::function<void(ResolveArgumentType)>;
  using RejectHandler = std::function<void(ErrorArgumentType)>;
  using Pointer = std::shared_ptr<Promise>;

  static Pointer defer(boost::asio::io_service &ioService) {
    return std::make_shared<Promise>(ioService);
  }

  static Pointer defer(boost::asio::io_service::strand &strand) {
    return std::make_shared<Promise>(strand);
  }

  explicit Promise(boost::asio::io_service &ioService)
      : ioContextWrapper_(ioService) {}

  explicit Promise(boost::asio::io_service::strand &strand)
      : ioContextWrapper_(strand) {}

  void then(ResolveHandler resolveHandler, RejectHandler rejectHandler = RejectHandler()) {
    std::lock_guard<decltype(mutex_)> lock(mutex_);

    resolveHandler_ = std::move(resolveHandler);
    rejectHandler_ = std::move(rejectHandler);
  }

  void resolve(ResolveArgumentType argument) {
    std::lock_guard<decltype(mutex_)> lock(mutex_);

    if (resolveHandler_ != nullptr && isPending()) {
      ioContextWrapper_.post(
          [argument = std::move(argument), resolveHandler = std::move(resolveHandler_)]() mutable {
            resolveHandler(std::move(argument));
          });
    }

    settle();
  }

  void reject(ErrorArgumentType error) {
    std::lock_guard<decltype(mutex_)> lock(mutex_);

    if (rejectHandler_ != nullptr && isPending()) {
      ioContextWrapper_.post([error = std::move(error), rejectHandler = std::move(rejectHandler_)]() mutable {
        rejectHandler(std::move(error));
      });
    }

    settle();
  }

private:
  bool isPending() const {
    return ioContextWrapper_.isActive();
  }

  void settle() {
    ioContextWrapper_.reset();
    resolveHandler_ = ResolveHandler();
    rejectHandler_ = RejectHandler();
  }

  ResolveHandler resolveHandler_;
  RejectHandler rejectHandler_;
  IOContextWrapper ioContextWrapper_;
  std::mutex mutex_;
};

// Promise that resolves without a value and rejects with an error.
template<typename ErrorArgumentType>
class Promise<void, ErrorArgumentType> {
public:
  Promise(const Promise &) = delete;
  Promise &operator=(const Promise &) = delete;

  using ErrorType = ErrorArgumentType;
  using ResolveHandler = std::function<void()>;
  using RejectHandler = std::function<void(ErrorArgumentType)>;
  using Pointer = std::shared_ptr<Promise>;

  static Pointer defer(boost::asio::io_service &ioService) {
    return std::make_shared<Promise>(ioService);
  }

  static Pointer defer(boost::asio::io_service::strand &strand) {
    return std::make_shared<Promise>(strand);
  }

  explicit Promise(boost::asio::io_service &ioService)
      : ioContextWrapper_(ioService) {}

  explicit Promise(boost::asio::io_service::strand &strand)
      : ioContextWrapper_(strand) {}

  void then(ResolveHandler resolveHandler, RejectHandler rejectHandler = RejectHandler()) {
    std::lock_guard<decltype(mutex_)> lock(mutex_);

    resolveHandler_ = std::move(resolveHandler);
    rejectHandler_ = std::move(rejectHandler);
  }

  void resolve() {
    std::lock_guard<decltype(mutex_)> lock(mutex_);

    if (resolveHandler_ != nullptr && isPending()) {
      ioContextWrapper_.post([resolveHandler = std::move(resolveHandler_)]() mutable {
        resolveHandler();
      });
    }

    settle();
  }

  void reject(ErrorArgumentType error) {
    std::lock_guard<decltype(mutex_)> lock(mutex_);

    if (rejectHandler_ != nullptr && isPending()) {
      ioContextWrapper_.post([error = std::move(error), rejectHandler = std::move(rejectHandler_)]() mutable {
        rejectHandler(std::move(error));
      });
    }

    settle();
  }

private:
  bool isPending() const {
    return ioContextWrapper_.isActive();
  }

  void settle() {
    ioContextWrapper_.reset();
    resolveHandler_ = ResolveHandler();
    rejectHandler_ = RejectHandler();
  }

  ResolveHandler resolveHandler_;
  RejectHandler rejectHandler_;
  IOContextWrapper ioContextWrapper_;
  std::mutex mutex_;
};

}
