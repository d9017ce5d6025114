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

#include "CaptureDatabase.hpp"
#include "DeviceRecord.hpp"
#include "ManufacturerLookup.hpp"

#include <filesystem>

namespace WifiSort {
    namespace Capture {

        struct ReadStatistics {
            size_t rows = 0;            ///< device rows visited
            size_t wifiDevices = 0;     ///< records produced
            size_t otherPhy = 0;        ///< non-802.11 devices skipped
            size_t malformed = 0;       ///< unparsable documents skipped
        };

        class CaptureReader {
        public:
            /**
             * @brief Read every 802.11 device of a capture in row order.
             *
             * Unparsable device documents are skipped with a warning. When a
             * lookup table is given it fills the manufacturer of records whose
             * capture value is empty or "Unknown".
             *
             * @return false with err set when the capture cannot be opened or has
             *         no devices table; an empty result is not a failure here
             */
            [[nodiscard]] static bool ReadDevices(
                const std::filesystem::path& path,
                const ManufacturerLookup* lookup,
                DeviceList& out,
                CaptureError* err = nullptr,
                ReadStatistics* stats = nullptr
            );
        };

    }  // namespace Capture
}  // namespace WifiSort
