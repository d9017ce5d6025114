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
#include "Classifier.hpp"
#include "../Utils/Logger.hpp"

namespace WifiSort {
    namespace Classification {

        const char* OutcomeToString(Outcome outcome) noexcept {
            switch (outcome) {
            case Outcome::ClientNamed:    return "ClientNamed";
            case Outcome::NonClientNamed: return "NonClientNamed";
            case Outcome::UnknownDevice:  return "UnknownDevice";
            case Outcome::Excluded:       return "Excluded";
            }
            return "Unknown";
        }

        Outcome Classifier::Classify(
            const Capture::DeviceRecord& record,
            const PatternSet& client,
            const PatternSet* exclude
        ) noexcept {
            if (record.ssid.empty()) {
                return Outcome::UnknownDevice;
            }
            if (client.Matches(record.ssid)) {
                return Outcome::ClientNamed;
            }
            if (exclude && exclude->Matches(record.ssid)) {
                return Outcome::Excluded;
            }
            return Outcome::NonClientNamed;
        }

        ClassificationResult Classifier::Partition(
            const Capture::DeviceList& records,
            const PatternSet& client,
            const PatternSet* exclude
        ) {
            WS_LOG_SCOPE("Classifier");

            ClassificationResult result;
            for (const auto& record : records) {
                const Outcome outcome = Classify(record, client, exclude);
                switch (outcome) {
                case Outcome::ClientNamed:
                    result.clientNamed.push_back(record);
                    break;
                case Outcome::NonClientNamed:
                    result.nonClientNamed.push_back(record);
                    break;
                case Outcome::UnknownDevice:
                    result.unknownDevices.push_back(record);
                    break;
                case Outcome::Excluded:
                    result.excluded.push_back(record);
                    break;
                }
                WS_LOG_TRACE("Classifier", "%s '%s' -> %s",
                    record.mac.c_str(), record.ssid.c_str(), OutcomeToString(outcome));
            }

            WS_LOG_INFO("Classifier", "Classified %zu devices: %zu client, %zu non-client, %zu unknown, %zu excluded",
                records.size(), result.clientNamed.size(), result.nonClientNamed.size(),
                result.unknownDevices.size(), result.excluded.size());
            return result;
        }

    }  // namespace Classification
}  // namespace WifiSort
