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

#include <utility>
#include <avrlink/Session/PendingQuery.hpp>


namespace avrlink {
  namespace session {

    PendingQuery::PendingQuery()
        : id_(0) {

    }

    uint64_t PendingQuery::arm(Promise::Pointer promise) {
      std::lock_guard<decltype(mutex_)> lock(mutex_);

      if (promise_ != nullptr) {
        promise_->reject(error::Error(error::ErrorCode::QUERY_SUPERSEDED));
      }

      promise_ = std::move(promise);
      return ++id_;
    }

    bool PendingQuery::fulfill(std::string frame) {
      std::lock_guard<decltype(mutex_)> lock(mutex_);

      if (promise_ == nullptr) {
        return false;
      }

      promise_->resolve(std::move(frame));
      promise_.reset();
      return true;
    }

    void PendingQuery::cancel(const error::Error &e) {
      std::lock_guard<decltype(mutex_)> lock(mutex_);

      if (promise_ != nullptr) {
        promise_->reject(e);
        promise_.reset();
      }
    }

    bool PendingQuery::cancel(const Promise::Pointer &promise, const error::Error &e) {
      std::lock_guard<decltype(mutex_)> lock(mutex_);

      if (promise_ == nullptr || promise_ != promise) {
        return false;
      }

      promise_->reject(e);
      promise_.reset();
      return true;
    }

    bool PendingQuery::isArmed() const {
      std::lock_guard<decltype(mutex_)> lock(mutex_);
      return promise_ != nullptr;
    }

    uint64_t PendingQuery::getId() const {
      std::lock_guard<decltype(mutex_)> lock(mutex_);
      return id_;
    }

  }
}
