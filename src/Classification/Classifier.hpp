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
/*
 * ============================================================================
 * WifiSort Classification - DEVICE CLASSIFIER
 * ============================================================================
 *
 * Precedence (first rule that applies wins):
 *   1. empty SSID                 -> UnknownDevice
 *   2. client set matches         -> ClientNamed
 *   3. exclude set matches        -> Excluded (reported nowhere)
 *   4. otherwise                  -> NonClientNamed
 *
 * ============================================================================
 */

#pragma once

#include "PatternSet.hpp"
#include "../Capture/DeviceRecord.hpp"

#include <vector>

namespace WifiSort {
    namespace Classification {

        enum class Outcome : uint8_t {
            ClientNamed = 0,
            NonClientNamed = 1,
            UnknownDevice = 2,
            Excluded = 3
        };

        [[nodiscard]] const char* OutcomeToString(Outcome outcome) noexcept;

        struct ClassificationResult {
            Capture::DeviceList clientNamed;
            Capture::DeviceList nonClientNamed;
            Capture::DeviceList unknownDevices;
            Capture::DeviceList excluded;       // console summary only

            [[nodiscard]] size_t TotalCount() const noexcept {
                return clientNamed.size() + nonClientNamed.size() + unknownDevices.size() + excluded.size();
            }
        };

        class Classifier {
        public:
            // exclude may be null (no exclude file)
            [[nodiscard]] static Outcome Classify(
                const Capture::DeviceRecord& record,
                const PatternSet& client,
                const PatternSet* exclude
            ) noexcept;

            // Classify every record, preserving input order inside each bucket
            [[nodiscard]] static ClassificationResult Partition(
                const Capture::DeviceList& records,
                const PatternSet& client,
                const PatternSet* exclude
            );
        };

    }  // namespace Classification
}  // namespace WifiSort
