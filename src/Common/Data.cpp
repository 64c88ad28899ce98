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
 * @file Data.cpp
 * @brief Byte buffers shared by the socket layer and the frame codec.
 *
 * Data owns bytes; DataBuffer and DataConstBuffer are views with an optional
 * offset. The session reads from the socket into one fixed Data block through
 * a DataBuffer view and hands the filled prefix to the frame decoder as a
 * DataConstBuffer, so no bytes are copied until a frame is complete.
 *
 * Offset safety: an offset beyond the end, a null pointer or an empty range
 * produce a null view (size 0) instead of an out-of-bounds pointer.
 */

#include <iomanip>
#include <sstream>
#include <avrlink/Common/Data.hpp>


namespace avrlink {
  namespace common {

    DataBuffer::DataBuffer()
        : data(nullptr), size(0) {

    }

    DataBuffer::DataBuffer(Data::value_type *_data, Data::size_type _size, Data::size_type offset)
        : data(nullptr), size(0) {
      if (_data != nullptr && _size != 0 && offset < _size) {
        data = _data + offset;
        size = _size - offset;
      }
    }

    DataBuffer::DataBuffer(Data &_data, Data::size_type offset)
        : DataBuffer(_data.empty() ? nullptr : _data.data(), _data.size(), offset) {

    }

    bool DataBuffer::operator==(const std::nullptr_t &) const {
      return data == nullptr || size == 0;
    }

    DataConstBuffer::DataConstBuffer()
        : cdata(nullptr), size(0) {

    }

    DataConstBuffer::DataConstBuffer(const DataBuffer &other)
        : cdata(other.data), size(other.size) {

    }

    DataConstBuffer::DataConstBuffer(const Data::value_type *_data, Data::size_type _size, Data::size_type offset)
        : cdata(nullptr), size(0) {
      if (_data != nullptr && _size != 0 && offset < _size) {
        cdata = _data + offset;
        size = _size - offset;
      }
    }

    DataConstBuffer::DataConstBuffer(const Data &_data, Data::size_type offset)
        : DataConstBuffer(_data.empty() ? nullptr : _data.data(), _data.size(), offset) {

    }

    bool DataConstBuffer::operator==(const std::nullptr_t &) const {
      return cdata == nullptr || size == 0;
    }

    Data createData(const std::string &text) {
      return Data(text.begin(), text.end());
    }

    std::string dump(const DataConstBuffer &buffer) {
      if (buffer.size == 0) {
        return "[0] null";
      }

      std::stringstream ss;
      ss << "[" << buffer.size << "]" << std::hex << std::setfill('0');
      for (Data::size_type i = 0; i < buffer.size; ++i) {
        ss << " " << std::setw(2) << static_cast<int>(buffer.cdata[i]);
      }

      return ss.str();
    }

  }
}
