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

#include <map>
#include <optional>
#include <string>
#include <vector>


namespace avrlink::device {

    /**
     * @class SourceDirectory
     * @brief Input sources of a receiver: enabled flag and display name per id.
     *
     * Fed by SourceN.Enabled / SourceN.Name frames, from polling or unsolicited.
     * Ids are the receiver's 1-based source numbers and list in numeric order.
     *
     * Not thread-safe; the owner serialises access.
     */
    class SourceDirectory {
    public:
      using SourceId = unsigned int;
      using NameMap = std::map<SourceId, std::string>;

      /// Names used when the receiver did not report its own.
      static const NameMap &defaultNames();

      /// Consumes a SourceN.Enabled or SourceN.Name pair. Returns false for any other key.
      bool apply(const std::string &key, const std::string &value);

      void setEnabled(SourceId id, bool enabled);

      /// Empty names are ignored.
      void setName(SourceId id, std::string name);

      std::optional<bool> isEnabled(SourceId id) const;

      std::optional<std::string> getName(SourceId id) const;

      /// Ids reported enabled, in numeric order. A cached name does not make a disabled source enabled.
      std::vector<SourceId> enabledSources() const;

      /**
       * @brief Names offered for source selection.
       *
       * - enabled data known: the enabled sources, by polled name or default name
       * - only names known: every named source
       * - nothing known: the default table
       */
      std::vector<std::string> sourceList() const;

      /// Polled name, else default name.
      std::optional<std::string> findName(SourceId id) const;

      /// Polled name, else default name, else "Source N".
      std::string displayName(SourceId id) const;

      /// Polled names first, then the default table.
      std::optional<SourceId> findSourceId(const std::string &name) const;

      bool empty() const;

      void clear();

    private:
      std::map<SourceId, bool> enabled_;
      NameMap names_;
    };

    /// Parses a decimal source id ("3"); std::nullopt for anything else.
    std::optional<SourceDirectory::SourceId> parseSourceId(const std::string &text);

}
