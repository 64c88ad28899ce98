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
 * @file TCPWrapper.cpp
 * @brief Boost.Asio implementation of the socket seam.
 *
 * Operations:
 *   - asyncWrite: boost::asio::async_write, completes once every byte is in
 *     the kernel buffer (loops internally on short writes)
 *   - asyncRead: async_receive, completes as soon as any bytes are available
 *   - asyncConnect: literal addresses connect directly; host names go through
 *     a resolver and boost::asio::async_connect over the endpoint list
 *   - close: shutdown both directions, then close; errors are ignored
 *   - cancel: aborts the resolver's pending resolution
 *
 * Scenario: connecting to a receiver by name
 *   - T+0ms: asyncConnect(socket, resolver, "avr.local", 23)
 *   - T+0ms: make_address fails, the caller's resolver is started
 *   - T+20ms: two endpoints returned (IPv6, IPv4); IPv6 refused, IPv4 accepted
 *   - T+25ms: handler invoked with success; TCP_NODELAY set for short commands
 *
 * Scenario: disconnect while the name is still resolving
 *   - T+0ms: asyncConnect(socket, resolver, "avr.local", 23), resolver started
 *   - T+5ms: cancel(resolver); handler invoked with operation_aborted, the
 *     socket is never opened
 *
 * Thread Safety: delegates to Asio; the caller wraps handlers in its strand.
 */

#include <utility>
#include <avrlink/TCP/TCPWrapper.hpp>


namespace avrlink {
  namespace tcp {

    void TCPWrapper::asyncWrite(boost::asio::ip::tcp::socket &socket, common::DataConstBuffer buffer, Handler handler) {
      boost::asio::async_write(socket, boost::asio::buffer(buffer.cdata, buffer.size), std::move(handler));
    }

    void TCPWrapper::asyncRead(boost::asio::ip::tcp::socket &socket, common::DataBuffer buffer, Handler handler) {
      socket.async_receive(boost::asio::buffer(buffer.data, buffer.size), std::move(handler));
    }

    void TCPWrapper::asyncConnect(boost::asio::ip::tcp::socket &socket, boost::asio::ip::tcp::resolver &resolver,
                                  const std::string &hostname, uint16_t port, ConnectHandler handler) {
      auto onConnected = [&socket, handler = std::move(handler)](const boost::system::error_code &ec) {
        if (!ec) {
          boost::system::error_code optionError;
          socket.set_option(boost::asio::ip::tcp::no_delay(true), optionError);
        }
        handler(ec);
      };

      boost::system::error_code ec;
      auto address = boost::asio::ip::make_address(hostname, ec);
      if (!ec) {
        socket.async_connect(boost::asio::ip::tcp::endpoint(address, port), std::move(onConnected));
        return;
      }

      resolver.async_resolve(
          hostname, std::to_string(port),
          [&socket, onConnected = std::move(onConnected)](
              const boost::system::error_code &resolveError,
              boost::asio::ip::tcp::resolver::results_type results) mutable {
            if (resolveError) {
              onConnected(resolveError);
              return;
            }

            boost::asio::async_connect(
                socket, results,
                [onConnected = std::move(onConnected)](const boost::system::error_code &connectError,
                                                       const boost::asio::ip::tcp::endpoint &) mutable {
                  onConnected(connectError);
                });
          });
    }

    void TCPWrapper::close(boost::asio::ip::tcp::socket &socket) {
      boost::system::error_code ec;
      socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
      socket.close(ec);
    }

    void TCPWrapper::cancel(boost::asio::ip::tcp::resolver &resolver) {
      resolver.cancel();
    }

  }
}
