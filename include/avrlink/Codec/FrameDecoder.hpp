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
#include <string>
#include <avrlink/Common/Data.hpp>


namespace avrlink::codec {

    /**
     * @class FrameDecoder
     * @brief Splits an inbound byte stream into newline terminated text frames.
     *
     * Bytes are fed as they arrive from the socket; complete frames are pulled
     * one by one with next(). The decoder keeps no protocol semantics:
     *   - a frame ends at a single '\n' byte ("\r\n" works because '\r' is trimmed)
     *   - invalid UTF-8 sequences are dropped, never raised
     *   - surrounding whitespace is stripped and empty frames are skipped
     *   - a partial line longer than maxFrameLength is discarded up to the next
     *     '\n', so a peer that never terminates a line cannot grow the buffer
     *
     * Not thread-safe; the session uses one decoder per connection on its strand.
     */
    class FrameDecoder {
    public:
      static constexpr size_t cDefaultMaxFrameLength = 4096;

      explicit FrameDecoder(size_t maxFrameLength = cDefaultMaxFrameLength);

      void feed(const common::DataConstBuffer &buffer);

      /// Pops the next complete, non-empty frame. Returns false when none is buffered.
      bool next(std::string &frame);

      /// Drops buffered bytes; used when a new connection starts.
      void reset();

      size_t getBufferedSize() const;

    private:
      std::string pending_;
      size_t scanOffset_;
      size_t maxFrameLength_;
      bool discarding_;
    };

    /// Drops bytes that do not form valid UTF-8 sequences.
    std::string sanitizeUtf8(const std::string &raw);

    /// Strips leading and trailing whitespace, '\r' included.
    std::string trim(const std::string &text);

    /// Wire encoding of a command: trailing CR/LF removed, then exactly one "\r\n" appended.
    common::Data encodeCommand(const std::string &command);

}
