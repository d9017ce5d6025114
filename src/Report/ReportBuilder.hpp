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
 * @file ReportBuilder.hpp
 * @brief Turns a classification result into the three-tab report and the
 *        console summary.
 */

#include "Workbook.hpp"
#include "../Classification/Classifier.hpp"

#include <array>
#include <ostream>
#include <string_view>

namespace WifiSort {
    namespace Report {

        inline constexpr std::string_view kSheetClientNamed = "Client-Named";
        inline constexpr std::string_view kSheetNonClientNamed = "Non-Client-Named";
        inline constexpr std::string_view kSheetUnknownDevices = "Unknown Devices";

        /// Text of cell A1 on a tab without devices
        inline constexpr std::string_view kNoEntriesText = "No matching entries";

        /// Column widths never exceed this
        inline constexpr double kMaxColumnWidth = 30.0;

        /// Only the first rows are measured for the column width
        inline constexpr size_t kWidthSampleRows = 100;

        inline constexpr std::array<std::string_view, 18> kColumns = {
            "MAC", "SSID", "Type", "Manufacturer", "Encryption", "Channel",
            "Frequency_MHz", "RSSI_Last", "RSSI_Min", "RSSI_Max",
            "Packets_Total", "Packets_Data", "Data_Size_Bytes",
            "First_Seen", "Last_Seen", "Latitude", "Longitude", "Altitude_m"
        };

        class ReportBuilder {
        public:
            /// @brief Client-Named, Non-Client-Named, Unknown Devices, in that order
            [[nodiscard]] static Workbook BuildWorkbook(const Classification::ClassificationResult& result);

            /// @brief One formatted tab (header row, data rows, column widths)
            [[nodiscard]] static Sheet BuildSheet(std::string_view name, const Capture::DeviceList& devices);

            /// @brief Cells of one device in kColumns order
            [[nodiscard]] static Row DeviceRow(const Capture::DeviceRecord& device);

            /**
             * @brief Print per-tab counts; with verbose also per-SSID counts
             *        and the SSIDs that were excluded from the report.
             */
            static void PrintSummary(
                std::ostream& os,
                const Classification::ClassificationResult& result,
                const std::string& outputPath,
                bool verbose
            );
        };

    }  // namespace Report
}  // namespace WifiSort
