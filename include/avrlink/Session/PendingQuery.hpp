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
#include <mutex>
#include <string>
#include <avrlink/IO/Promise.hpp>


namespace avrlink::session {

    /**
     * @class PendingQuery
     * @brief Single-occupancy rendezvous between one query caller and the reader.
     *
     * At most one promise is armed. Arming while another is still armed rejects
     * the older one with QUERY_SUPERSEDED (last query wins, nothing is queued).
     * The reader offers every inbound frame to fulfill(); a false return is
     * what makes a frame unsolicited.
     *
     * Every arm() hands out a new id so that a timer started for one query can
     * tell whether the slot still belongs to it.
     */
    class PendingQuery {
    public:
      using Promise = io::Promise<std::string>;

      PendingQuery();

      PendingQuery(const PendingQuery &) = delete;
      PendingQuery &operator=(const PendingQuery &) = delete;

      uint64_t arm(Promise::Pointer promise);

      bool fulfill(std::string frame);

      void cancel(const error::Error &e);

      /// Rejects the armed promise only if it is the given one; true when it was.
      bool cancel(const Promise::Pointer &promise, const error::Error &e);

      bool isArmed() const;

      /// Id of the armed query, or of the last one armed if the slot is empty.
      uint64_t getId() const;

    private:
      Promise::Pointer promise_;
      uint64_t id_;
      mutable std::mutex mutex_;
    };

}
