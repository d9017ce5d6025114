/*
 * WifiSort - Kismet Capture Classification Toolkit
 * Copyright (C) 2026 WifiSort Authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "pch.h"
#include "ManufacturerLookup.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <functional>

namespace WifiSort {
    namespace Capture {

        namespace {

            constexpr int kMacBits = 48;

            int hexValue(char c) noexcept {
                if (c >= '0' && c <= '9') return c - '0';
                if (c >= 'a' && c <= 'f') return c - 'a' + 10;
                if (c >= 'A' && c <= 'F') return c - 'A' + 10;
                return -1;
            }

            bool isSeparator(char c) noexcept {
                return c == ':' || c == '-' || c == '.';
            }

            // Reads hex digits, ignoring separators. Returns the digit count, 0 on bad input.
            size_t parseHexPrefix(std::string_view text, uint64_t& value) noexcept {
                value = 0;
                size_t digits = 0;
                for (const char c : text) {
                    if (isSeparator(c)) continue;
                    const int v = hexValue(c);
                    if (v < 0 || digits >= 12) return 0;
                    value = (value << 4) | static_cast<uint64_t>(v);
                    ++digits;
                }
                return digits;
            }

        } // anonymous namespace

        std::optional<uint64_t> ManufacturerLookup::ParseMac(std::string_view mac) noexcept {
            uint64_t value = 0;
            if (parseHexPrefix(Utils::StringUtils::Trim(mac), value) != 12) {
                return std::nullopt;
            }
            return value;
        }

        bool ManufacturerLookup::addLine(std::string_view rawLine) {
            const std::string_view line = Utils::StringUtils::Trim(rawLine);
            if (line.empty() || line.front() == '#') {
                return false;
            }

            // Columns are tab separated; tolerate runs of tabs
            std::vector<std::string> fields;
            for (auto& f : Utils::StringUtils::Split(line, '\t')) {
                const std::string_view t = Utils::StringUtils::Trim(f);
                if (!t.empty()) fields.emplace_back(t);
            }
            if (fields.size() < 2) {
                return false;
            }

            std::string_view prefix = fields[0];
            int bits = -1;
            const size_t slash = prefix.find('/');
            if (slash != std::string_view::npos) {
                bits = 0;
                for (const char c : prefix.substr(slash + 1)) {
                    if (c < '0' || c > '9') return false;
                    bits = bits * 10 + (c - '0');
                    if (bits > kMacBits) return false;
                }
                prefix = prefix.substr(0, slash);
            }

            uint64_t value = 0;
            const size_t digits = parseHexPrefix(prefix, value);
            if (digits == 0 || digits % 2 != 0) {
                return false;
            }
            if (bits < 0) {
                bits = static_cast<int>(digits * 4);
            }
            if (bits == 0) {
                return false;
            }

            // Left-align to 48 bits, then keep the top `bits`
            value <<= (kMacBits - static_cast<int>(digits * 4));
            const uint64_t key = value >> (kMacBits - bits);

            const std::string& name = fields.size() >= 3 ? fields[2] : fields[1];
            auto& table = m_byLength[bits];
            if (table.emplace(key, name).second) {
                ++m_count;
            }
            return true;
        }

        size_t ManufacturerLookup::LoadFromString(std::string_view text) {
            size_t added = 0;
            size_t start = 0;
            while (start <= text.size()) {
                size_t nl = text.find('\n', start);
                if (nl == std::string_view::npos) nl = text.size();
                if (addLine(text.substr(start, nl - start))) {
                    ++added;
                }
                start = nl + 1;
            }
            return added;
        }

        bool ManufacturerLookup::LoadFromFile(const std::filesystem::path& path, ManufError* err) {
            if (err) err->clear();

            std::string text;
            Utils::FileUtils::Error ferr;
            if (!Utils::FileUtils::ReadAllTextUtf8(path, text, &ferr)) {
                if (err) {
                    err->message = "Cannot read manufacturer file: " + ferr.message;
                    err->path = path;
                }
                WS_LOG_ERROR("Manuf", "Cannot read %s: %s", path.string().c_str(), ferr.message.c_str());
                return false;
            }

            const size_t added = LoadFromString(text);
            WS_LOG_INFO("Manuf", "Loaded %zu manufacturer prefixes from %s", added, path.string().c_str());
            return true;
        }

        std::string ManufacturerLookup::Lookup(std::string_view mac) const {
            const auto value = ParseMac(mac);
            if (!value) {
                return std::string();
            }
            for (const auto& [bits, table] : m_byLength) {
                const auto it = table.find(*value >> (kMacBits - bits));
                if (it != table.end()) {
                    return it->second;
                }
            }
            return std::string();
        }

    }  // namespace Capture
}  // namespace WifiSort
