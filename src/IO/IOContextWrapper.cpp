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
 * @file IOContextWrapper.cpp
 * @brief Context a promise continuation is posted to.
 *
 * A wrapper built from an io_service posts to the shared pool; one built from
 * a strand posts serialised with the strand's other work. reset() detaches
 * the wrapper, which is how a promise marks itself settled: isActive() is
 * false once resolve() or reject() has run.
 */

#include <avrlink/IO/IOContextWrapper.hpp>


namespace avrlink {
  namespace io {

    IOContextWrapper::IOContextWrapper()
        : ioService_(nullptr), strand_(nullptr) {

    }

    IOContextWrapper::IOContextWrapper(boost::asio::io_service &ioService)
        : ioService_(&ioService), strand_(nullptr) {

    }

    IOContextWrapper::IOContextWrapper(boost::asio::io_service::strand &strand)
        : ioService_(nullptr), strand_(&strand) {

    }

    void IOContextWrapper::reset() {
      ioService_ = nullptr;
      strand_ = nullptr;
    }

    bool IOContextWrapper::isActive() const {
      return ioService_ != nullptr || strand_ != nullptr;
    }

  }
}
