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
 * @file Error.cpp
 * @brief Error value for every failure avrlink reports.
 *
 * Error categories:
 *   - Connect failures (CONNECT_FAILED, CONNECT_TIMEOUT)
 *   - Connection loss (CONNECTION_LOST, CONNECTION_CLOSED, TCP_TRANSFER)
 *   - Query outcomes without a reply (QUERY_TIMEOUT, QUERY_SUPERSEDED)
 *   - Caller state (NOT_CONNECTED, OPERATION_ABORTED, OPERATION_IN_PROGRESS)
 *   - Device commands (UNKNOWN_SOURCE)
 *
 * Usage: promises reject with Error; callers compare against an ErrorCode:
 *   - promise->then(onReply, [](const Error &e) { if (e == ErrorCode::QUERY_TIMEOUT) ... })
 *   - e.getNativeCode() keeps the boost::system::error_code value, if any
 *
 * Thread Safety: immutable after construction; safe to copy across strands.
 */

#include <utility>
#include <avrlink/Error/Error.hpp>


namespace avrlink {
  namespace error {

    const char *toString(ErrorCode code) {
      switch (code) {
        case ErrorCode::NONE:
          return "NONE";
        case ErrorCode::OPERATION_ABORTED:
          return "OPERATION_ABORTED";
        case ErrorCode::OPERATION_IN_PROGRESS:
          return "OPERATION_IN_PROGRESS";
        case ErrorCode::NOT_CONNECTED:
          return "NOT_CONNECTED";
        case ErrorCode::CONNECT_FAILED:
          return "CONNECT_FAILED";
        case ErrorCode::CONNECT_TIMEOUT:
          return "CONNECT_TIMEOUT";
        case ErrorCode::CONNECTION_LOST:
          return "CONNECTION_LOST";
        case ErrorCode::CONNECTION_CLOSED:
          return "CONNECTION_CLOSED";
        case ErrorCode::TCP_TRANSFER:
          return "TCP_TRANSFER";
        case ErrorCode::QUERY_TIMEOUT:
          return "QUERY_TIMEOUT";
        case ErrorCode::QUERY_SUPERSEDED:
          return "QUERY_SUPERSEDED";
        case ErrorCode::UNKNOWN_SOURCE:
          return "UNKNOWN_SOURCE";
      }

      return "UNKNOWN";
    }

    Error::Error()
        : code_(ErrorCode::NONE), nativeCode_(0) {

    }

    Error::Error(ErrorCode code, uint32_t nativeCode, std::string information)
        : code_(code), nativeCode_(nativeCode), information_(std::move(information)) {
      message_ = std::string("AvrLink Error: ") + toString(code_)
                 + ", Native Code: " + std::to_string(nativeCode_);
      if (!information_.empty()) {
        message_ += ", Additional Information: " + information_;
      }
    }

    ErrorCode Error::getCode() const {
      return code_;
    }

    uint32_t Error::getNativeCode() const {
      return nativeCode_;
    }

    const std::string &Error::getInformation() const {
      return information_;
    }

    const char *Error::what() const noexcept {
      return message_.c_str();
    }

    bool Error::operator!() const {
      return code_ == ErrorCode::NONE;
    }

    bool Error::operator==(const Error &other) const {
      return code_ == other.code_ && nativeCode_ == other.nativeCode_;
    }

    bool Error::operator==(const ErrorCode &code) const {
      return code_ == code;
    }

    bool Error::operator!=(const ErrorCode &code) const {
      return !operator==(code);
    }

  }
}
