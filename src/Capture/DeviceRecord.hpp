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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace WifiSort {
    namespace Capture {

        /**
         * @brief One 802.11 device observed in a Kismet capture.
         *
         * Built once by the capture reader and only read afterwards.
         * An SSID that the capture does not carry is the empty string.
         */
        struct DeviceRecord {
            std::string mac;
            std::string ssid;
            std::string type = "Unknown";
            std::string manufacturer;
            std::string encryption;           // "WPA2/PSK", "Open", or empty without advertised SSID

            std::optional<int> channel;
            double frequencyMHz = 0.0;

            std::optional<int> rssiLast;
            std::optional<int> rssiMin;
            std::optional<int> rssiMax;

            int64_t packetsTotal = 0;
            int64_t packetsData = 0;
            int64_t dataSizeBytes = 0;

            std::string firstSeen;            // local time "YYYY-MM-DD HH:MM:SS", empty if unknown
            std::string lastSeen;

            std::optional<double> latitude;
            std::optional<double> longitude;
            std::optional<double> altitudeM;
        };

        using DeviceList = std::vector<DeviceRecord>;

    }  // namespace Capture
}  // namespace WifiSort
