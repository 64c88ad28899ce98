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

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>


namespace avrlink::common {

    /// Owned byte storage used for socket reads and encoded commands
    using Data = std::vector<uint8_t>;

    /**
     * @brief Non-owning mutable view over a byte range.
     *
     * Used to hand a receive buffer to the socket layer. An offset past the end
     * or an empty source yields a null view (data == nullptr, size == 0).
     */
    struct DataBuffer {
      DataBuffer();
      DataBuffer(Data::value_type *_data, Data::size_type _size, Data::size_type offset = 0);
      explicit DataBuffer(Data &_data, Data::size_type offset = 0);

      bool operator==(const std::nullptr_t &) const;

      Data::value_type *data;
      Data::size_type size;
    };

    /**
     * @brief Non-owning read-only view over a byte range.
     *
     * Same null view rules as DataBuffer.
     */
    struct DataConstBuffer {
      DataConstBuffer();
      DataConstBuffer(const DataBuffer &other);
      DataConstBuffer(const Data::value_type *_data, Data::size_type _size, Data::size_type offset = 0);
      explicit DataConstBuffer(const Data &_data, Data::size_type offset = 0);

      bool operator==(const std::nullptr_t &) const;

      const Data::value_type *cdata;
      Data::size_type size;
    };

    Data createData(const std::string &text);

    /// Hex rendering used when logging bytes that could not be decoded as text.
    std::string dump(const DataConstBuffer &buffer);

}
