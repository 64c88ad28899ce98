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

#include <utility>
#include <boost/asio.hpp>


namespace avrlink::io {

    /**
     * @class IOContextWrapper
     * @brief Execution context a promise posts its continuation to.
     *
     * Holds either an io_service or a strand (or nothing). Promises created on a
     * strand run their handlers serialised with everything else on that strand,
     * which is how the session keeps its state single-threaded.
     */
    class IOContextWrapper {
    public:
      IOContextWrapper();

      explicit IOContextWrapper(boost::asio::io_service &ioService);

      explicit IOContextWrapper(boost::asio::io_service::strand &strand);

      template<typename CompletionHandlerType>
      void post(CompletionHandlerType &&handler) {
        if (ioService_ != nullptr) {
          ioService_->post(std::forward<CompletionHandlerType>(handler));
        } else if (strand_ != nullptr) {
          strand_->post(std::forward<CompletionHandlerType>(handler));
        }
      }

      void reset();

      bool isActive() const;

    private:
      boost::asio::io_service *ioService_;
      boost::asio::io_service::strand *strand_;
    };

}
