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
#include <memory>
#include <mutex>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <avrlink/Device/DeviceInfoPoller.hpp>
#include <avrlink/Device/Frame.hpp>
#include <avrlink/Device/PollerConfiguration.hpp>
#include <avrlink/Device/QueryChain.hpp>
#include <avrlink/Device/ReceiverState.hpp>
#include <avrlink/Device/SourceDirectory.hpp>
#include <avrlink/IO/Promise.hpp>
#include <avrlink/Session/ISession.hpp>
#include <avrlink/Session/ISessionEventHandler.hpp>


namespace avrlink::device {

    /**
     * @class Receiver
     * @brief Media player view of one receiver, kept in sync over its session.
     *
     * Registers itself as the session's event handler. On every transition to
     * connected it polls device info and the source table, then refreshes
     * power and, when the receiver is on, volume, mute and source. That refresh
     * repeats every refreshInterval while connected. Unsolicited frames update
     * the state as they arrive. Commands are sends; the state is
     * updated optimistically once the write succeeded, and corrected by the
     * receiver's own echo.
     *
     * The owner creates the Receiver, calls start() and connects the session.
     */
    class Receiver : public session::ISessionEventHandler, public std::enable_shared_from_this<Receiver> {
    public:
      using Pointer = std::shared_ptr<Receiver>;
      using CommandPromise = io::Promise<void>;
      using StateHandler = std::function<void(const ReceiverState &state)>;

      Receiver(boost::asio::io_service &ioService, session::ISession::Pointer session,
               PollerConfiguration configuration);

      void start();

      /// Stops polling and detaches from the session. The session stays connected.
      void stop();

      /// Called after every state change, from an io_service thread.
      void setStateHandler(StateHandler handler);

      void onConnectionStateChanged(bool connected) override;

      void onFrameReceived(const std::string &frame) override;

      /// Re-reads power, and volume, mute and source when on.
      void refresh(CommandPromise::Pointer promise);

      void turnOn(CommandPromise::Pointer promise);

      void turnOff(CommandPromise::Pointer promise);

      void setVolume(double unitVolume, CommandPromise::Pointer promise);

      void volumeUp(CommandPromise::Pointer promise);

      void volumeDown(CommandPromise::Pointer promise);

      void setMute(bool muted, CommandPromise::Pointer promise);

      /// Rejects with UNKNOWN_SOURCE when neither a polled nor a default name matches.
      void selectSource(const std::string &name, CommandPromise::Pointer promise);

      ReceiverState getState() const;

    private:
      using std::enable_shared_from_this<Receiver>::shared_from_this;
      using StateUpdate = std::function<void(ReceiverState &state)>;

      void handleConnected();

      void handleDisconnected();

      void startRefresh(CommandPromise::Pointer promise);

      void scheduleRefresh();

      void cancelScheduledRefresh();

      void applyReply(const std::optional<std::string> &reply);

      void applyFrame(const Frame &frame);

      void applyDeviceInfo(const DeviceInfo &info);

      void sendCommand(std::string command, CommandPromise::Pointer promise, StateUpdate update);

      void notifyState();

      boost::asio::io_service &ioService_;
      boost::asio::io_service::strand strand_;
      session::ISession::Pointer session_;
      PollerConfiguration configuration_;
      DeviceInfoPoller poller_;
      QueryChain::Pointer refreshChain_;
      boost::asio::steady_timer refreshTimer_;
      uint64_t refreshTimerId_;
      SourceDirectory sources_;
      ReceiverState state_;
      StateHandler stateHandler_;
      mutable std::mutex mutex_;
    };

}
