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

#include <cctype>
#include <utility>
#include <avrlink/Common/Log.hpp>
#include <avrlink/Device/Frame.hpp>
#include <avrlink/Device/SourceDirectory.hpp>


namespace avrlink {
  namespace device {

    namespace {
      constexpr const char *cSourcePrefix = "Source";
      constexpr const char *cEnabledSuffix = ".Enabled";
      constexpr const char *cNameSuffix = ".Name";

      bool endsWith(const std::string &text, const std::string &suffix) {
        return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
      }

      // "Source3.Enabled" -> 3
      std::optional<SourceDirectory::SourceId> extractSourceId(const std::string &key, const std::string &suffix) {
        const std::string prefix(cSourcePrefix);
        if (key.compare(0, prefix.size(), prefix) != 0 || !endsWith(key, suffix) ||
            key.size() <= prefix.size() + suffix.size()) {
          return std::nullopt;
        }

        return parseSourceId(key.substr(prefix.size(), key.size() - prefix.size() - suffix.size()));
      }
    }

    std::optional<SourceDirectory::SourceId> parseSourceId(const std::string &text) {
      if (text.empty() || text.size() > 4) {
        return std::nullopt;
      }

      SourceDirectory::SourceId id = 0;
      for (const char c: text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
          return std::nullopt;
        }
        id = id * 10 + static_cast<SourceDirectory::SourceId>(c - '0');
      }

      return id;
    }

    const SourceDirectory::NameMap &SourceDirectory::defaultNames() {
      static const NameMap names{
          {1, "CD"},
          {2, "Tuner"},
          {3, "Video 1"},
          {4, "Video 2"},
          {5, "Disc"},
          {6, "Tape 1"},
          {7, "Aux"},
          {8, "TV"}
      };
      return names;
    }

    bool SourceDirectory::apply(const std::string &key, const std::string &value) {
      if (const auto id = extractSourceId(key, cEnabledSuffix)) {
        this->setEnabled(*id, isTruthy(value));
        return true;
      }

      if (const auto id = extractSourceId(key, cNameSuffix)) {
        this->setName(*id, value);
        return true;
      }

      if (endsWith(key, cEnabledSuffix) || endsWith(key, cNameSuffix)) {
        AVRLINK_LOG_DEVICE(debug, "Could not parse source update: " << key << "=" << value);
      }

      return false;
    }

    void SourceDirectory::setEnabled(SourceId id, bool enabled) {
      enabled_[id] = enabled;
    }

    void SourceDirectory::setName(SourceId id, std::string name) {
      if (!name.empty()) {
        names_[id] = std::move(name);
      }
    }

    std::optional<bool> SourceDirectory::isEnabled(SourceId id) const {
      const auto it = enabled_.find(id);
      return it == enabled_.end() ? std::nullopt : std::optional<bool>(it->second);
    }

    std::optional<std::string> SourceDirectory::getName(SourceId id) const {
      const auto it = names_.find(id);
      return it == names_.end() ? std::nullopt : std::optional<std::string>(it->second);
    }

    std::vector<SourceDirectory::SourceId> SourceDirectory::enabledSources() const {
      std::vector<SourceId> ids;
      for (const auto &entry: enabled_) {
        if (entry.second) {
          ids.push_back(entry.first);
        }
      }
      return ids;
    }

    std::vector<std::string> SourceDirectory::sourceList() const {
      std::vector<std::string> list;

      if (!enabled_.empty()) {
        for (const auto id: this->enabledSources()) {
          list.push_back(this->displayName(id));
        }
      } else if (!names_.empty()) {
        for (const auto &entry: names_) {
          list.push_back(entry.second);
        }
      } else {
        for (const auto &entry: defaultNames()) {
          list.push_back(entry.second);
        }
      }

      return list;
    }

    std::optional<std::string> SourceDirectory::findName(SourceId id) const {
      if (const auto name = this->getName(id)) {
        return name;
      }

      const auto &defaults = defaultNames();
      const auto it = defaults.find(id);
      return it == defaults.end() ? std::nullopt : std::optional<std::string>(it->second);
    }

    std::string SourceDirectory::displayName(SourceId id) const {
      const auto name = this->findName(id);
      return name ? *name : "Source " + std::to_string(id);
    }

    std::optional<SourceDirectory::SourceId> SourceDirectory::findSourceId(const std::string &name) const {
      for (const auto &entry: names_) {
        if (entry.second == name) {
          return entry.first;
        }
      }

      for (const auto &entry: defaultNames()) {
        if (entry.second == name) {
          return entry.first;
        }
      }

      return std::nullopt;
    }

    bool SourceDirectory::empty() const {
      return enabled_.empty() && names_.empty();
    }

    void SourceDirectory::clear() {
      enabled_.clear();
      names_.clear();
    }

  }
}
