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
 * @file avrlink_cli.cpp
 * @brief Diagnostic command line client for a receiver.
 *
 * Usage:
 *   avrlink-cli --host 192.168.1.20 Main.Power? Main.Volume=-35
 *   avrlink-cli --host avr.local --poll
 *   avrlink-cli --host avr.local --monitor -v
 *
 * Commands ending in '?' are queries and print the reply; anything else is
 * sent without waiting. --monitor keeps the session open and prints every
 * unsolicited frame until SIGINT/SIGTERM.
 */

#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>
#include <avrlink/Common/Log.hpp>
#include <avrlink/Device/DeviceInfoPoller.hpp>
#include <avrlink/Session/CommandGateway.hpp>
#include <avrlink/Session/Session.hpp>
#include <avrlink/TCP/TCPWrapper.hpp>

namespace po = boost::program_options;


namespace {

  class FramePrinter : public avrlink::session::ISessionEventHandler {
  public:
    void onConnectionStateChanged(bool connected) override {
      std::cout << (connected ? "# connected" : "# disconnected") << std::endl;
    }

    void onFrameReceived(const std::string &frame) override {
      std::cout << frame << std::endl;
    }
  };

  bool isQuery(const std::string &command) {
    return !command.empty() && command.back() == '?';
  }

  void printDeviceInfo(const avrlink::device::DeviceInfo &info) {
    std::cout << "Model:    " << info.model.value_or("(unknown)") << "\n"
              << "Firmware: " << info.firmwareVersion.value_or("(unknown)") << "\n"
              << "Sources:" << "\n";

    for (const auto &name: info.sources.sourceList()) {
      std::cout << "  " << name << "\n";
    }
    std::cout.flush();
  }

  bool pollDeviceInfo(boost::asio::io_service &ioService, const avrlink::session::ISession::Pointer &session) {
    avrlink::device::DeviceInfoPoller poller(ioService, session, avrlink::device::PollerConfiguration());

    auto result = std::make_shared<std::promise<bool>>();
    auto future = result->get_future();

    auto promise = avrlink::device::DeviceInfoPoller::Promise::defer(ioService);
    promise->then([result](avrlink::device::DeviceInfo info) {
                    printDeviceInfo(info);
                    result->set_value(true);
                  },
                  [result](const avrlink::error::Error &e) {
                    std::cerr << "Poll failed: " << e.what() << std::endl;
                    result->set_value(false);
                  });
    poller.poll(std::move(promise));

    return future.get();
  }

}

int main(int argc, char *argv[]) {
  std::string host;
  uint16_t port;
  unsigned int connectTimeout;
  unsigned int reconnectDelay;
  bool poll;
  bool monitor;
  bool verbose;
  std::vector<std::string> commands;

  po::options_description desc("Allowed options");
  desc.add_options()
      ("help,h", "produce help message")
      ("host,H", po::value<std::string>(&host)->required(), "receiver host name or address")
      ("port,p", po::value<uint16_t>(&port)->default_value(avrlink::session::SessionConfiguration::cDefaultPort),
       "receiver port (older models: 50001)")
      ("connect-timeout", po::value<unsigned int>(&connectTimeout)->default_value(10000), "connect timeout [ms]")
      ("reconnect-delay", po::value<unsigned int>(&reconnectDelay)->default_value(5000),
       "delay between reconnect attempts [ms]")
      ("poll", po::bool_switch(&poll)->default_value(false), "print model, firmware and sources")
      ("monitor,m", po::bool_switch(&monitor)->default_value(false), "print unsolicited frames until interrupted")
      ("verbose,v", po::bool_switch(&verbose)->default_value(false), "debug logging")
      ("command", po::value<std::vector<std::string>>(&commands), "commands to send, e.g. Main.Power?");

  po::positional_options_description positional;
  positional.add("command", -1);

  try {
    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);

    if (vm.count("help")) {
      std::cout << desc << "\n";
      return 1;
    }

    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << e.what() << "\n" << desc << std::endl;
    return 1;
  }

  boost::log::core::get()->set_filter(boost::log::trivial::severity >=
                                      (verbose ? boost::log::trivial::debug : boost::log::trivial::warning));

  boost::asio::io_service ioService;
  auto work = std::make_unique<boost::asio::io_service::work>(ioService);
  std::vector<std::thread> threadPool;
  for (int i = 0; i < 2; ++i) {
    threadPool.emplace_back([&ioService]() { ioService.run(); });
  }

  avrlink::session::SessionConfiguration configuration;
  configuration.host = host;
  configuration.port = port;
  configuration.connectTimeout = std::chrono::milliseconds(connectTimeout);
  configuration.reconnectDelay = std::chrono::milliseconds(reconnectDelay);

  avrlink::tcp::TCPWrapper tcpWrapper;
  auto session = std::make_shared<avrlink::session::Session>(ioService, tcpWrapper, configuration);
  auto printer = std::make_shared<FramePrinter>();
  if (monitor) {
    session->setEventHandler(printer);
  }

  avrlink::session::CommandGateway gateway(ioService, session);
  int exitCode = 0;

  if (!gateway.connect()) {
    std::cerr << "Could not connect to " << host << ":" << port << std::endl;
    exitCode = 2;
  } else {
    for (const auto &command: commands) {
      if (isQuery(command)) {
        const auto reply = gateway.query(command);
        std::cout << command << " -> " << reply.value_or("(no reply)") << std::endl;
      } else if (!gateway.send(command)) {
        std::cerr << "Could not send " << command << std::endl;
        exitCode = 3;
      }
    }

    if (poll && !pollDeviceInfo(ioService, session)) {
      exitCode = 3;
    }

    if (monitor) {
      auto interrupted = std::make_shared<std::promise<void>>();
      boost::asio::signal_set signals(ioService, SIGINT, SIGTERM);
      signals.async_wait([interrupted](const boost::system::error_code &, int) { interrupted->set_value(); });
      interrupted->get_future().wait();
    }
  }

  gateway.disconnect();

  work.reset();
  ioService.stop();
  for (auto &thread: threadPool) {
    thread.join();
  }

  return exitCode;
}
