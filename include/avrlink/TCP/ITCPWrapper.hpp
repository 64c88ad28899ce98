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

#include <cstdint>
#include <functional>
#include <string>
#include <boost/asio.hpp>
#include <avrlink/Common/Data.hpp>


namespace avrlink::tcp {

    /**
     * @interface ITCPWrapper
     * @brief Seam between the session and Boost.Asio socket calls.
     *
     * The session never touches boost::asio free functions directly; it goes
     * through this interface so the unit tests can capture completion handlers
     * and play the receiver side (connect result, inbound bytes, EOF, write
     * errors) deterministically.
     *
     * Handlers are invoked exactly once, from the socket's executor. Callers
     * that need serialisation wrap them in a strand before passing them in.
     */
    class ITCPWrapper {
    public:
      using Handler = std::function<void(const boost::system::error_code &, size_t)>;
      using ConnectHandler = std::function<void(const boost::system::error_code &)>;

      virtual ~ITCPWrapper() = default;

      /// Write the whole buffer; the handler sees the total byte count or the first error.
      virtual void asyncWrite(boost::asio::ip::tcp::socket &socket, common::DataConstBuffer buffer, Handler handler) = 0;

      /// Read whatever is available, at most buffer.size bytes. EOF is reported as boost::asio::error::eof.
      virtual void asyncRead(boost::asio::ip::tcp::socket &socket, common::DataBuffer buffer, Handler handler) = 0;

      /**
       * @brief Open a connection to hostname:port.
       *
       * hostname may be a literal IPv4/IPv6 address or a name; names are
       * resolved first through the caller's resolver and every returned
       * endpoint is tried in order. The resolver must outlive the operation.
       */
      virtual void asyncConnect(boost::asio::ip::tcp::socket &socket, boost::asio::ip::tcp::resolver &resolver,
                                const std::string &hostname, uint16_t port, ConnectHandler handler) = 0;

      /// Shutdown both directions and close; errors are ignored. Cancels outstanding operations.
      virtual void close(boost::asio::ip::tcp::socket &socket) = 0;

      /// Aborts a name resolution started by asyncConnect(); its handler sees operation_aborted.
      virtual void cancel(boost::asio::ip::tcp::resolver &resolver) = 0;
    };

}
