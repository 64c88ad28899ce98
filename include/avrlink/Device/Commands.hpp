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

#include <string>


// Command catalog of the line protocol. Commands are written without the CRLF
// terminator; the session adds it on the wire.
namespace avrlink::device::commands {

    constexpr const char *cPowerKey = "Main.Power";
    constexpr const char *cVolumeKey = "Main.Volume";
    constexpr const char *cMuteKey = "Main.Mute";
    constexpr const char *cSourceKey = "Main.Source";
    constexpr const char *cModelKey = "Main.Model";
    constexpr const char *cVersionKey = "Main.Version";

    constexpr const char *cPowerOn = "Main.Power=On";
    constexpr const char *cPowerStandby = "Main.Power=Standby";
    constexpr const char *cPowerQuery = "Main.Power?";
    constexpr const char *cVolumeUp = "Main.Volume+";
    constexpr const char *cVolumeDown = "Main.Volume-";
    constexpr const char *cVolumeQuery = "Main.Volume?";
    constexpr const char *cMuteOn = "Main.Mute=On";
    constexpr const char *cMuteOff = "Main.Mute=Off";
    constexpr const char *cMuteQuery = "Main.Mute?";
    constexpr const char *cSourceQuery = "Main.Source?";
    constexpr const char *cModelQuery = "Main.Model?";
    constexpr const char *cVersionQuery = "Main.Version?";

    std::string setVolume(int decibels);

    std::string setSource(unsigned int sourceId);

    std::string sourceEnabledKey(unsigned int sourceId);

    std::string sourceNameKey(unsigned int sourceId);

    std::string sourceEnabledQuery(unsigned int sourceId);

    std::string sourceNameQuery(unsigned int sourceId);

}
