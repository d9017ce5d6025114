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
 * @file DeviceParser.hpp
 * @brief Conversion of Kismet device JSON documents into DeviceRecords.
 */

#include "DeviceRecord.hpp"
#include "../Utils/JSONUtils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace WifiSort {
    namespace Capture {

        /// @brief Kismet phy name of 802.11 devices
        inline constexpr std::string_view kPhy80211 = "IEEE802.11";

        enum class ParseStatus : uint8_t {
            Ok = 0,         ///< record filled
            NotWifi = 1,    ///< valid document of another phy (Bluetooth, RTL433, ...)
            Malformed = 2   ///< not JSON, or not a JSON object
        };

        class DeviceParser {
        public:
            /**
             * @brief Convert one parsed device document.
             *
             * Missing fields never fail the conversion; they leave the
             * corresponding DeviceRecord member at its default.
             */
            [[nodiscard]] static ParseStatus Parse(const Utils::JSON::Json& device, DeviceRecord& out);

            /// @brief Parse the raw text of a `devices.device` column, then convert it
            [[nodiscard]] static ParseStatus ParseText(
                std::string_view deviceJson,
                DeviceRecord& out,
                Utils::JSON::Error* err = nullptr
            );

            /**
             * @brief Map a frequency to an 802.11 channel number.
             *
             * Accepts MHz or kHz (values above 10000 are taken as kHz).
             * Covers 2.4 GHz (2412-2484), 5 GHz (5170-5825) and 6 GHz (5955-7115).
             */
            [[nodiscard]] static std::optional<int> FrequencyToChannel(double frequency) noexcept;

            /**
             * @brief Channel from Kismet's channel string ("6", "36HT40+", "149-W80").
             *
             * Uses the digits within the first three characters before any '-' or 'W'.
             */
            [[nodiscard]] static std::optional<int> ParseChannelString(std::string_view channel) noexcept;

            /// @brief "WEP", "WPA2/PSK", ..., "Open" when no bit is set
            [[nodiscard]] static std::string CryptSetToString(uint64_t cryptSet);

            /// @brief Local time "YYYY-MM-DD HH:MM:SS"; empty for 0
            [[nodiscard]] static std::string FormatTimestamp(int64_t epochSeconds);
        };

    }  // namespace Capture
}  // namespace WifiSort
