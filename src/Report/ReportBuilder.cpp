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
#include "ReportBuilder.hpp"
#include "../Utils/Logger.hpp"

#include <map>

namespace WifiSort {
    namespace Report {

        namespace {

            /// Display length in characters (UTF-8 code points)
            size_t displayLength(const std::string& s) noexcept {
                size_t n = 0;
                for (const char ch : s) {
                    if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) ++n;
                }
                return n;
            }

            void printSsidCounts(std::ostream& os, const char* title, const Capture::DeviceList& devices) {
                std::map<std::string, size_t> counts;
                for (const auto& d : devices) {
                    ++counts[d.ssid];
                }
                os << "\n" << title << "\n";
                for (const auto& [ssid, count] : counts) {
                    os << "    " << ssid << " (" << count << ")\n";
                }
            }

        } // anonymous namespace

        Row ReportBuilder::DeviceRow(const Capture::DeviceRecord& d) {
            Row row;
            row.reserve(kColumns.size());

            row.push_back(Cell::String(d.mac));
            row.push_back(Cell::String(d.ssid));
            row.push_back(Cell::String(d.type));
            row.push_back(Cell::String(d.manufacturer));
            row.push_back(Cell::String(d.encryption));
            row.push_back(Cell::Optional(d.channel));
            row.push_back(Cell::Number(d.frequencyMHz));
            row.push_back(Cell::Optional(d.rssiLast));
            row.push_back(Cell::Optional(d.rssiMin));
            row.push_back(Cell::Optional(d.rssiMax));
            row.push_back(Cell::Number(static_cast<double>(d.packetsTotal)));
            row.push_back(Cell::Number(static_cast<double>(d.packetsData)));
            row.push_back(Cell::Number(static_cast<double>(d.dataSizeBytes)));
            row.push_back(Cell::String(d.firstSeen));
            row.push_back(Cell::String(d.lastSeen));
            row.push_back(Cell::Optional(d.latitude));
            row.push_back(Cell::Optional(d.longitude));
            row.push_back(Cell::Optional(d.altitudeM));

            return row;
        }

        Sheet ReportBuilder::BuildSheet(std::string_view name, const Capture::DeviceList& devices) {
            Sheet sheet;
            sheet.name.assign(name);

            if (devices.empty()) {
                sheet.rows.push_back(Row{ Cell::String(std::string(kNoEntriesText)) });
                return sheet;
            }

            Row header;
            header.reserve(kColumns.size());
            for (const auto& title : kColumns) {
                Cell c = Cell::String(std::string(title));
                c.header = true;
                header.push_back(std::move(c));
            }
            sheet.rows.push_back(std::move(header));

            std::vector<size_t> longest(kColumns.size());
            for (size_t i = 0; i < kColumns.size(); ++i) {
                longest[i] = kColumns[i].size();
            }

            sheet.rows.reserve(devices.size() + 1);
            for (size_t r = 0; r < devices.size(); ++r) {
                Row row = DeviceRow(devices[r]);
                if (r < kWidthSampleRows) {
                    for (size_t c = 0; c < row.size(); ++c) {
                        longest[c] = std::max(longest[c], displayLength(row[c].DisplayText()));
                    }
                }
                sheet.rows.push_back(std::move(row));
            }

            sheet.columnWidths.reserve(kColumns.size());
            for (const size_t len : longest) {
                sheet.columnWidths.push_back(std::min(static_cast<double>(len + 2), kMaxColumnWidth));
            }
            return sheet;
        }

        Workbook ReportBuilder::BuildWorkbook(const Classification::ClassificationResult& result) {
            Workbook wb;
            wb.sheets.push_back(BuildSheet(kSheetClientNamed, result.clientNamed));
            wb.sheets.push_back(BuildSheet(kSheetNonClientNamed, result.nonClientNamed));
            wb.sheets.push_back(BuildSheet(kSheetUnknownDevices, result.unknownDevices));

            WS_LOG_DEBUG("Report", "Built workbook: %zu/%zu/%zu rows",
                result.clientNamed.size(), result.nonClientNamed.size(), result.unknownDevices.size());
            return wb;
        }

        void ReportBuilder::PrintSummary(
            std::ostream& os,
            const Classification::ClassificationResult& result,
            const std::string& outputPath,
            bool verbose
        ) {
            os << "Created " << outputPath << ":\n"
               << "  Client-Named:     " << result.clientNamed.size() << " devices\n"
               << "  Non-Client-Named: " << result.nonClientNamed.size() << " devices\n"
               << "  Unknown Devices:  " << result.unknownDevices.size() << " devices\n";

            if (!verbose) {
                return;
            }

            printSsidCounts(os, "Client-Named SSIDs:", result.clientNamed);
            printSsidCounts(os, "Non-Client-Named SSIDs:", result.nonClientNamed);
            if (!result.excluded.empty()) {
                printSsidCounts(os, "Excluded SSIDs (not in output):", result.excluded);
            }
        }

    }  // namespace Report
}  // namespace WifiSort
