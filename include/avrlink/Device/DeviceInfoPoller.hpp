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

#include <memory>
#include <boost/asio.hpp>
#include <avrlink/Device/DeviceInfo.hpp>
#include <avrlink/Device/PollerConfiguration.hpp>
#include <avrlink/Device/QueryChain.hpp>
#include <avrlink/IO/Promise.hpp>
#include <avrlink/Session/ISession.hpp>


namespace avrlink::device {

    /**
     * @class DeviceInfoPoller
     * @brief Reads model, firmware version and the source table of a receiver.
     *
     * Query battery, in order:
     *   - Main.Model?, Main.Version? (infoQueryTimeout each)
     *   - for N in 1..sourceCount: SourceN.Enabled?, and SourceN.Name? only when
     *     the source answered enabled (sourceQueryTimeout each)
     *
     * A query without a usable reply leaves its field unset. The promise
     * resolves with whatever was collected, and rejects only when the chain is
     * stopped by a lost connection or a cancel().
     */
    class DeviceInfoPoller {
    public:
      using Pointer = std::shared_ptr<DeviceInfoPoller>;
      using Promise = io::Promise<DeviceInfo>;

      DeviceInfoPoller(boost::asio::io_service &ioService, session::ISession::Pointer session,
                       PollerConfiguration configuration);

      /// One poll at a time; a second call while one runs cancels the first.
      void poll(Promise::Pointer promise);

      void cancel();

    private:
      boost::asio::io_service &ioService_;
      session::ISession::Pointer session_;
      PollerConfiguration configuration_;
      QueryChain::Pointer chain_;
    };

}
