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
#include <avrlink/Common/Log.hpp>
#include <avrlink/Device/Commands.hpp>
#include <avrlink/Device/DeviceInfoPoller.hpp>
#include <avrlink/Device/Frame.hpp>


namespace avrlink {
  namespace device {

    namespace {
      // value of a reply whose key matches the one the query asked for
      std::optional<std::string> valueOf(const std::optional<std::string> &reply, const std::string &key) {
        if (!reply) {
          return std::nullopt;
        }

        const auto frame = parseFrame(*reply);
        if (!frame || frame->key != key) {
          AVRLINK_LOG_DEVICE(debug, "Unexpected reply to " << key << "?: " << *reply);
          return std::nullopt;
        }

        return frame->value;
      }
    }

    DeviceInfoPoller::DeviceInfoPoller(boost::asio::io_service &ioService, session::ISession::Pointer session,
                                       PollerConfiguration configuration)
        : ioService_(ioService), session_(std::move(session)), configuration_(std::move(configuration)) {

    }

    void DeviceInfoPoller::poll(Promise::Pointer promise) {
      this->cancel();

      auto deviceInfo = std::make_shared<DeviceInfo>();
      auto chain = std::make_shared<QueryChain>(ioService_, session_, configuration_.settleDelay);
      std::weak_ptr<QueryChain> weakChain = chain;

      chain->add(commands::cModelQuery, configuration_.infoQueryTimeout,
                 [deviceInfo](const std::optional<std::string> &reply) {
                   const auto model = valueOf(reply, commands::cModelKey);
                   if (model && !model->empty()) {
                     AVRLINK_LOG_DEVICE(debug, "Model: " << *model);
                     deviceInfo->model = *model;
                   }
                 });

      chain->add(commands::cVersionQuery, configuration_.infoQueryTimeout,
                 [deviceInfo](const std::optional<std::string> &reply) {
                   const auto version = valueOf(reply, commands::cVersionKey);
                   if (version && !version->empty()) {
                     AVRLINK_LOG_DEVICE(debug, "Firmware version: " << *version);
                     deviceInfo->firmwareVersion = *version;
                   }
                 });

      const auto sourceQueryTimeout = configuration_.sourceQueryTimeout;
      for (unsigned int id = 1; id <= configuration_.sourceCount; ++id) {
        chain->add(commands::sourceEnabledQuery(id), sourceQueryTimeout,
                   [deviceInfo, weakChain, id, sourceQueryTimeout](const std::optional<std::string> &reply) {
                     const auto enabled = valueOf(reply, commands::sourceEnabledKey(id));
                     if (!enabled) {
                       return;
                     }

                     deviceInfo->sources.setEnabled(id, isTruthy(*enabled));
                     if (!isTruthy(*enabled)) {
                       return;
                     }

                     auto chain = weakChain.lock();
                     if (chain == nullptr) {
                       return;
                     }

                     chain->add(commands::sourceNameQuery(id), sourceQueryTimeout,
                                [deviceInfo, id](const std::optional<std::string> &reply) {
                                  const auto name = valueOf(reply, commands::sourceNameKey(id));
                                  if (name) {
                                    deviceInfo->sources.setName(id, *name);
                                  }
                                });
                   });
      }

      auto chainPromise = QueryChain::Promise::defer(ioService_);
      chainPromise->then([deviceInfo, promise, sourceCount = configuration_.sourceCount]() {
                           AVRLINK_LOG_DEVICE(info, "Polled " << sourceCount << " sources: "
                                                              << deviceInfo->sources.enabledSources().size()
                                                              << " enabled");
                           promise->resolve(*deviceInfo);
                         },
                         [promise](const error::Error &e) {
                           promise->reject(e);
                         });

      chain_ = chain;
      chain->run(std::move(chainPromise));
    }

    void DeviceInfoPoller::cancel() {
      if (chain_ != nullptr) {
        chain_->cancel();
        chain_.reset();
      }
    }

  }
}
