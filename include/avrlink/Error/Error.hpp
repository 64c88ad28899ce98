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

#include <stdexcept>
#include <string>
#include <avrlink/Error/ErrorCode.hpp>


namespace avrlink::error {

    /**
     * @class Error
     * @brief Failure value carried by rejected promises.
     *
     * Combines an avrlink ErrorCode with the native code of the failing layer
     * (the boost::system::error_code value for socket failures) and free text.
     * A default constructed Error means "no error"; operator! is true for it.
     */
    class Error : public std::exception {
    public:
      Error();

      explicit Error(ErrorCode code, uint32_t nativeCode = 0, std::string information = "");

      ErrorCode getCode() const;

      uint32_t getNativeCode() const;

      const std::string &getInformation() const;

      const char *what() const noexcept override;

      bool operator!() const;

      bool operator==(const Error &other) const;

      bool operator==(const ErrorCode &code) const;

      bool operator!=(const ErrorCode &code) const;

    private:
      ErrorCode code_;
      uint32_t nativeCode_;
      std::string information_;
      std::string message_;
    };

}
