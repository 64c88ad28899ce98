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

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>


namespace avrlink::ut {

    /**
     * Loopback stand-in for a receiver: accepts one client at a time on
     * 127.0.0.1, records every line it gets and answers the ones it has a reply
     * for. Runs blocking Asio calls on its own thread.
     */
    class FakeReceiver {
    public:
      FakeReceiver()
          : acceptor_(ioService_, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0))
          , stopped_(false)
          , acceptedCount_(0) {
        thread_ = std::thread([this]() { this->serve(); });
      }

      ~FakeReceiver() {
        this->stop();
      }

      uint16_t getPort() const {
        return acceptor_.local_endpoint().port();
      }

      void setReply(const std::string &line, const std::string &reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_[line] = reply;
      }

      /// Writes an unsolicited frame to the connected client.
      void push(const std::string &frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (client_ != nullptr) {
          boost::system::error_code ec;
          boost::asio::write(*client_, boost::asio::buffer(frame + "\r\n"), ec);
        }
      }

      /// Shuts the connection down the way a rebooting receiver would.
      void dropClient() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (client_ != nullptr) {
          boost::system::error_code ec;
          client_->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        }
      }

      size_t getAcceptedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return acceptedCount_;
      }

      bool waitForLine(const std::string &line, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return condition_.wait_for(lock, timeout, [&]() {
          for (const auto &received: received_) {
            if (received == line) {
              return true;
            }
          }
          return false;
        });
      }

      bool waitForAccepted(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return condition_.wait_for(lock, timeout, [&]() { return acceptedCount_ >= count; });
      }

      void stop() {
        if (stopped_.exchange(true)) {
          return;
        }

        this->dropClient();

        // unblock accept()
        boost::system::error_code ec;
        boost::asio::io_service ioService;
        boost::asio::ip::tcp::socket wakeUp(ioService);
        wakeUp.connect(acceptor_.local_endpoint(), ec);

        if (thread_.joinable()) {
          thread_.join();
        }

        acceptor_.close(ec);
      }

    private:
      void serve() {
        while (!stopped_) {
          auto socket = std::make_shared<boost::asio::ip::tcp::socket>(ioService_);
          boost::system::error_code ec;
          acceptor_.accept(*socket, ec);
          if (ec || stopped_) {
            break;
          }

          {
            std::lock_guard<std::mutex> lock(mutex_);
            client_ = socket;
            ++acceptedCount_;
          }
          condition_.notify_all();

          this->readLines(*socket);

          std::lock_guard<std::mutex> lock(mutex_);
          socket->close(ec);
          client_.reset();
        }
      }

      void readLines(boost::asio::ip::tcp::socket &socket) {
        boost::asio::streambuf buffer;

        while (!stopped_) {
          boost::system::error_code ec;
          boost::asio::read_until(socket, buffer, '\n', ec);
          if (ec) {
            return;
          }

          std::istream stream(&buffer);
          std::string line;
          std::getline(stream, line);
          if (!line.empty() && line.back() == '\r') {
            line.pop_back();
          }

          std::lock_guard<std::mutex> lock(mutex_);
          received_.push_back(line);
          condition_.notify_all();

          const auto reply = replies_.find(line);
          if (reply != replies_.end()) {
            boost::asio::write(socket, boost::asio::buffer(reply->second + "\r\n"), ec);
          }
        }
      }

      boost::asio::io_service ioService_;
      boost::asio::ip::tcp::acceptor acceptor_;
      std::atomic<bool> stopped_;
      size_t acceptedCount_;
      std::shared_ptr<boost::asio::ip::tcp::socket> client_;
      std::map<std::string, std::string> replies_;
      std::vector<std::string> received_;
      mutable std::mutex mutex_;
      std::condition_variable condition_;
      std::thread thread_;
    };

}
