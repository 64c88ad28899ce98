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

#include <gmock/gmock.h>
#include <avrlink/Session/ISession.hpp>


namespace avrlink::session::ut {

    class SessionMock : public ISession {
    public:
      MOCK_METHOD(void, setEventHandler, (ISessionEventHandler::Pointer eventHandler), (override));
      MOCK_METHOD(void, connect, (ConnectPromise::Pointer promise), (override));
      MOCK_METHOD(void, disconnect, (DisconnectPromise::Pointer promise), (override));
      MOCK_METHOD(void, send, (std::string command, SendPromise::Pointer promise), (override));
      MOCK_METHOD(void, query, (std::string command, std::chrono::milliseconds timeout, QueryPromise::Pointer promise),
                  (override));
      MOCK_METHOD(void, cancelQuery, (QueryPromise::Pointer promise), (override));
      MOCK_METHOD(ConnectionState, getState, (), (const, override));
      MOCK_METHOD(bool, isConnected, (), (const, override));
      MOCK_METHOD(const SessionConfiguration &, getConfiguration, (), (const, override));
    };

}
