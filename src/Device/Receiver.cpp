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
 * @file Receiver.cpp
 * @brief Receiver state tracking on top of a session.
 *
 * Scenario: receiver comes up while already playing
 *   - connected: state available, device info poll started
 *   - poll done: model, firmware and source table applied
 *   - refresh: Main.Power? -> On, so Main.Volume?, Main.Mute?, Main.Source? follow
 *   - unsolicited "Main.Volume=-40" later: volume 0.556, state handler called
 *   - every refreshInterval: the refresh above runs again
 *   - disconnected: state unavailable and off, pollers and refresh timer stopped
 *
 * Thread Safety: lifecycle work (poller, refresh chain) runs on the receiver
 * strand; state and source table are guarded by mutex_ because reply
 * handlers run on chain strands and unsolicited frames on the session strand.
 */

#include <algorithm>
#include <utility>
#include <avrlink/Common/Log.hpp>
#include <avrlink/Device/Commands.hpp>
#include <avrlink/Device/Receiver.hpp>
#include <avrlink/Device/Volume.hpp>


namespace avrlink {
  namespace device {

    Receiver::Receiver(boost::asio::io_service &ioService, session::ISession::Pointer session,
                       PollerConfiguration configuration)
        : ioService_(ioService)
        , strand_(ioService)
        , session_(std::move(session))
        , configuration_(std::move(configuration))
        , poller_(ioService, session_, configuration_)
        , refreshTimer_(ioService)
        , refreshTimerId_(0) {
      state_.sourceList = sources_.sourceList();
    }

    void Receiver::start() {
      session_->setEventHandler(this->shared_from_this());

      if (session_->isConnected()) {
        this->onConnectionStateChanged(true);
      }
    }

    void Receiver::stop() {
      session_->setEventHandler(nullptr);

      strand_.dispatch([this, self = this->shared_from_this()]() {
        poller_.cancel();
        this->cancelScheduledRefresh();
        if (refreshChain_ != nullptr) {
          refreshChain_->cancel();
          refreshChain_.reset();
        }
      });
    }

    void Receiver::setStateHandler(StateHandler handler) {
      std::lock_guard<decltype(mutex_)> lock(mutex_);
      stateHandler_ = std::move(handler);
    }

    void Receiver::onConnectionStateChanged(bool connected) {
      strand_.dispatch([this, self = this->shared_from_this(), connected]() {
        if (connected) {
          this->handleConnected();
        } else {
          this->handleDisconnected();
        }
      });
    }

    void Receiver::onFrameReceived(const std::string &frame) {
      const auto parsed = parseFrame(frame);
      if (!parsed) {
        AVRLINK_LOG_DEVICE(debug, "Dropping malformed frame: " << frame);
        return;
      }

      this->applyFrame(*parsed);
      this->notifyState();
    }

    void Receiver::refresh(CommandPromise::Pointer promise) {
      strand_.dispatch([this, self = this->shared_from_this(), promise = std::move(promise)]() mutable {
        this->startRefresh(std::move(promise));
      });
    }

    void Receiver::turnOn(CommandPromise::Pointer promise) {
      this->sendCommand(commands::cPowerOn, std::move(promise), [](ReceiverState &state) {
        state.powerOn = true;
      });
    }

    void Receiver::turnOff(CommandPromise::Pointer promise) {
      this->sendCommand(commands::cPowerStandby, std::move(promise), [](ReceiverState &state) {
        state.powerOn = false;
      });
    }

    void Receiver::setVolume(double unitVolume, CommandPromise::Pointer promise) {
      const auto volume = std::clamp(unitVolume, 0.0, 1.0);
      this->sendCommand(commands::setVolume(toDecibels(volume)), std::move(promise), [volume](ReceiverState &state) {
        state.volume = volume;
      });
    }

    void Receiver::volumeUp(CommandPromise::Pointer promise) {
      this->sendCommand(commands::cVolumeUp, std::move(promise), nullptr);
    }

    void Receiver::volumeDown(CommandPromise::Pointer promise) {
      this->sendCommand(commands::cVolumeDown, std::move(promise), nullptr);
    }

    void Receiver::setMute(bool muted, CommandPromise::Pointer promise) {
      this->sendCommand(muted ? commands::cMuteOn : commands::cMuteOff, std::move(promise),
                        [muted](ReceiverState &state) {
                          state.muted = muted;
                        });
    }

    void Receiver::selectSource(const std::string &name, CommandPromise::Pointer promise) {
      std::optional<SourceDirectory::SourceId> sourceId;
      {
        std::lock_guard<decltype(mutex_)> lock(mutex_);
        sourceId = sources_.findSourceId(name);
      }

      if (!sourceId) {
        AVRLINK_LOG_DEVICE(warning, "Unknown source: " << name);
        promise->reject(error::Error(error::ErrorCode::UNKNOWN_SOURCE, 0, name));
        return;
      }

      this->sendCommand(commands::setSource(*sourceId), std::move(promise), [name](ReceiverState &state) {
        state.source = name;
      });
    }

    ReceiverState Receiver::getState() const {
      std::lock_guard<decltype(mutex_)> lock(mutex_);
      return state_;
    }

    void Receiver::handleConnected() {
      this->cancelScheduledRefresh();
      {
        std::lock_guard<decltype(mutex_)> lock(mutex_);
        state_.available = true;
      }
      this->notifyState();

      auto promise = DeviceInfoPoller::Promise::defer(strand_);
      promise->then([this, self = this->shared_from_this()](DeviceInfo info) {
                      this->applyDeviceInfo(info);
                      this->notifyState();
                      this->startRefresh(nullptr);
                      this->scheduleRefresh();
                    },
                    [](const error::Error &e) {
                      AVRLINK_LOG_DEVICE(warning, "Device info poll stopped: " << e.what());
                    });
      poller_.poll(std::move(promise));
    }

    void Receiver::handleDisconnected() {
      poller_.cancel();
      this->cancelScheduledRefresh();
      if (refreshChain_ != nullptr) {
        refreshChain_->cancel();
        refreshChain_.reset();
      }

      {
        std::lock_guard<decltype(mutex_)> lock(mutex_);
        state_.available = false;
        state_.powerOn = false;
      }
      this->notifyState();
    }

    void Receiver::startRefresh(CommandPromise::Pointer promise) {
      if (refreshChain_ != nullptr) {
        refreshChain_->cancel();
      }

      auto chain = std::make_shared<QueryChain>(ioService_, session_, configuration_.settleDelay);
      std::weak_ptr<QueryChain> weakChain = chain;
      const auto timeout = configuration_.stateQueryTimeout;

      chain->add(commands::cPowerQuery, timeout,
                 [this, self = this->shared_from_this(), weakChain, timeout](const std::optional<std::string> &reply) {
                   this->applyReply(reply);

                   auto chain = weakChain.lock();
                   if (chain == nullptr || !this->getState().powerOn) {
                     return;
                   }

                   auto applyReply = [this, self](const std::optional<std::string> &reply) {
                     this->applyReply(reply);
                   };
                   chain->add(commands::cVolumeQuery, timeout, applyReply);
                   chain->add(commands::cMuteQuery, timeout, applyReply);
                   chain->add(commands::cSourceQuery, timeout, applyReply);
                 });

      auto chainPromise = QueryChain::Promise::defer(strand_);
      chainPromise->then([this, self = this->shared_from_this(), promise]() {
                           this->notifyState();
                           if (promise != nullptr) {
                             promise->resolve();
                           }
                         },
                         [promise](const error::Error &e) {
                           AVRLINK_LOG_DEVICE(debug, "State refresh stopped: " << e.what());
                           if (promise != nullptr) {
                             promise->reject(e);
                           }
                         });

      refreshChain_ = chain;
      chain->run(std::move(chainPromise));
    }

    void Receiver::scheduleRefresh() {
      if (configuration_.refreshInterval.count() <= 0) {
        return;
      }

      const auto timerId = ++refreshTimerId_;
      refreshTimer_.expires_from_now(configuration_.refreshInterval);
      refreshTimer_.async_wait(
          strand_.wrap([this, self = this->shared_from_this(), timerId](const boost::system::error_code &ec) {
            if (ec == boost::asio::error::operation_aborted || timerId != refreshTimerId_) {
              return;
            }

            AVRLINK_LOG_DEVICE(trace, "Periodic state refresh");
            this->startRefresh(nullptr);
            this->scheduleRefresh();
          }));
    }

    void Receiver::cancelScheduledRefresh() {
      ++refreshTimerId_;
      refreshTimer_.cancel();
    }

    void Receiver::applyReply(const std::optional<std::string> &reply) {
      if (!reply) {
        return;
      }

      if (const auto frame = parseFrame(*reply)) {
        this->applyFrame(*frame);
      }
    }

    void Receiver::applyFrame(const Frame &frame) {
      std::lock_guard<decltype(mutex_)> lock(mutex_);

      if (frame.key == commands::cPowerKey) {
        state_.powerOn = equalsIgnoreCase(frame.value, "on");
      } else if (frame.key == commands::cVolumeKey) {
        if (const auto decibels = parseDecibels(frame.value)) {
          state_.volume = toUnitVolume(*decibels);
        } else {
          AVRLINK_LOG_DEVICE(debug, "Could not parse volume: " << frame.value);
        }
      } else if (frame.key == commands::cMuteKey) {
        state_.muted = equalsIgnoreCase(frame.value, "on");
      } else if (frame.key == commands::cSourceKey) {
        // an id without a known name is shown as reported
        const auto sourceId = parseSourceId(frame.value);
        const auto name = sourceId ? sources_.findName(*sourceId) : std::nullopt;
        state_.source = name ? *name : frame.value;
      } else if (frame.key == commands::cModelKey) {
        state_.model = frame.value;
      } else if (frame.key == commands::cVersionKey) {
        state_.firmwareVersion = frame.value;
      } else if (sources_.apply(frame.key, frame.value)) {
        state_.sourceList = sources_.sourceList();
      } else {
        AVRLINK_LOG_DEVICE(trace, "Ignoring " << frame.key << "=" << frame.value);
      }
    }

    void Receiver::applyDeviceInfo(const DeviceInfo &info) {
      std::lock_guard<decltype(mutex_)> lock(mutex_);

      if (info.model) {
        state_.model = info.model;
      }
      if (info.firmwareVersion) {
        state_.firmwareVersion = info.firmwareVersion;
      }

      sources_ = info.sources;
      state_.sourceList = sources_.sourceList();
    }

    void Receiver::sendCommand(std::string command, CommandPromise::Pointer promise, StateUpdate update) {
      auto sendPromise = session::ISession::SendPromise::defer(strand_);
      sendPromise->then([this, self = this->shared_from_this(), promise, update = std::move(update)]() {
                          if (update != nullptr) {
                            {
                              std::lock_guard<decltype(mutex_)> lock(mutex_);
                              update(state_);
                            }
                            this->notifyState();
                          }
                          promise->resolve();
                        },
                        [promise, command](const error::Error &e) {
                          AVRLINK_LOG_DEVICE(warning, "Command failed: " << command << ", " << e.what());
                          promise->reject(e);
                        });
      session_->send(std::move(command), std::move(sendPromise));
    }

    void Receiver::notifyState() {
      StateHandler handler;
      ReceiverState state;
      {
        std::lock_guard<decltype(mutex_)> lock(mutex_);
        handler = stateHandler_;
        state = state_;
      }

      if (handler == nullptr) {
        return;
      }

      try {
        handler(state);
      } catch (const std::exception &e) {
        AVRLINK_LOG_DEVICE(error, "State handler failed: " << e.what());
      }
    }

  }
}
