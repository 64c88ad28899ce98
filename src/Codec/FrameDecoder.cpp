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
 * @file FrameDecoder.cpp
 * @brief Newline framing and tolerant text decoding of the receiver stream.
 *
 * Scenario: a reply split across two socket reads
 *   - read 1: "Main.Volume=-3"  -> buffered, next() returns false
 *   - read 2: "0\r\nMain.Mute=Off\n" -> next() yields "Main.Volume=-30",
 *     then "Main.Mute=Off", then false
 *
 * Scenario: line noise on the wire
 *   - read: "\xff\xfeMain.Power=On\r\n\r\n"
 *   - invalid bytes dropped, blank line skipped -> one frame "Main.Power=On"
 */

#include <cstdint>
#include <avrlink/Codec/FrameDecoder.hpp>
#include <avrlink/Common/Log.hpp>


namespace avrlink {
  namespace codec {

    namespace {

      bool isContinuation(unsigned char byte) {
        return (byte & 0xC0) == 0x80;
      }

      bool isSpace(char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
      }

    }

    FrameDecoder::FrameDecoder(size_t maxFrameLength)
        : scanOffset_(0), maxFrameLength_(maxFrameLength), discarding_(false) {

    }

    void FrameDecoder::feed(const common::DataConstBuffer &buffer) {
      if (buffer == nullptr) {
        return;
      }

      pending_.append(reinterpret_cast<const char *>(buffer.cdata), buffer.size);
    }

    bool FrameDecoder::next(std::string &frame) {
      while (true) {
        auto newline = pending_.find('\n', scanOffset_);

        if (newline == std::string::npos) {
          scanOffset_ = pending_.size();
          if (pending_.size() > maxFrameLength_) {
            AVRLINK_LOG_CODEC(warning, "Discarding " << pending_.size() << " bytes without line terminator");
            pending_.clear();
            scanOffset_ = 0;
            discarding_ = true;
          }
          return false;
        }

        std::string raw = pending_.substr(0, newline);
        pending_.erase(0, newline + 1);
        scanOffset_ = 0;

        if (discarding_) {
          // tail of an oversized line
          discarding_ = false;
          continue;
        }

        if (raw.size() > maxFrameLength_) {
          AVRLINK_LOG_CODEC(warning, "Dropping oversized frame of " << raw.size() << " bytes");
          continue;
        }

        auto text = trim(sanitizeUtf8(raw));
        if (!text.empty()) {
          frame = std::move(text);
          return true;
        }
      }
    }

    void FrameDecoder::reset() {
      pending_.clear();
      scanOffset_ = 0;
      discarding_ = false;
    }

    size_t FrameDecoder::getBufferedSize() const {
      return pending_.size();
    }

    std::string sanitizeUtf8(const std::string &raw) {
      std::string result;
      result.reserve(raw.size());

      size_t i = 0;
      while (i < raw.size()) {
        const auto lead = static_cast<unsigned char>(raw[i]);
        size_t length = 0;
        uint32_t minimum = 0;

        if (lead < 0x80) {
          result.push_back(raw[i]);
          ++i;
          continue;
        } else if ((lead & 0xE0) == 0xC0) {
          length = 2;
          minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
          length = 3;
          minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
          length = 4;
          minimum = 0x10000;
        } else {
          ++i;
          continue;
        }

        if (i + length > raw.size()) {
          ++i;
          continue;
        }

        uint32_t codePoint = lead & (0xFF >> (length + 1));
        bool valid = true;
        for (size_t k = 1; k < length; ++k) {
          const auto byte = static_cast<unsigned char>(raw[i + k]);
          if (!isContinuation(byte)) {
            valid = false;
            break;
          }
          codePoint = (codePoint << 6) | (byte & 0x3F);
        }

        // overlong forms, surrogates and values past U+10FFFF are rejected
        if (valid && codePoint >= minimum && codePoint <= 0x10FFFF && (codePoint < 0xD800 || codePoint > 0xDFFF)) {
          result.append(raw, i, length);
          i += length;
        } else {
          ++i;
        }
      }

      return result;
    }

    std::string trim(const std::string &text) {
      size_t begin = 0;
      size_t end = text.size();

      while (begin < end && isSpace(text[begin])) {
        ++begin;
      }

      while (end > begin && isSpace(text[end - 1])) {
        --end;
      }

      return text.substr(begin, end - begin);
    }

    common::Data encodeCommand(const std::string &command) {
      auto end = command.size();
      while (end > 0 && (command[end - 1] == '\r' || command[end - 1] == '\n')) {
        --end;
      }

      common::Data data(command.begin(), command.begin() + static_cast<std::string::difference_type>(end));
      data.push_back('\r');
      data.push_back('\n');
      return data;
    }

  }
}
