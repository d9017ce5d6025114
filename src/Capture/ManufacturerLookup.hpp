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
#pragma once

/**
 * @file ManufacturerLookup.hpp
 * @brief OUI -> vendor name table in Wireshark "manuf" format.
 *
 * Line format:
 * @code
 *   00:00:0C<TAB>Cisco<TAB>Cisco Systems, Inc
 *   00:1B:C5:00:00:00/36<TAB>Convergi<TAB>Converging Systems Inc.
 * @endcode
 * A prefix without "/bits" covers as many bits as it has bytes.
 */

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace WifiSort {
    namespace Capture {

        struct ManufError {
            std::string message;
            std::filesystem::path path;

            [[nodiscard]] bool hasError() const noexcept { return !message.empty(); }
            void clear() noexcept { message.clear(); path.clear(); }
        };

        class ManufacturerLookup {
        public:
            ManufacturerLookup() = default;

            [[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, ManufError* err = nullptr);

            /// @brief Parse table text; malformed lines are skipped. Returns entries added.
            size_t LoadFromString(std::string_view text);

            /**
             * @brief Vendor for a MAC address, longest prefix first.
             * @return Long name if present, else short name; empty when unknown
             */
            [[nodiscard]] std::string Lookup(std::string_view mac) const;

            [[nodiscard]] size_t size() const noexcept { return m_count; }
            [[nodiscard]] bool empty() const noexcept { return m_count == 0; }

            /// @brief 48-bit value of "AA:BB:CC:DD:EE:FF" (':' '-' '.' separators)
            [[nodiscard]] static std::optional<uint64_t> ParseMac(std::string_view mac) noexcept;

        private:
            bool addLine(std::string_view line);

            // prefix length in bits -> (prefix value -> vendor name), longest first
            std::map<int, std::unordered_map<uint64_t, std::string>, std::greater<int>> m_byLength;
            size_t m_count = 0;
        };

    }  // namespace Capture
}  // namespace WifiSort
