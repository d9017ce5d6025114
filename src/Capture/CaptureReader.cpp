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
#include "CaptureReader.hpp"
#include "DeviceParser.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace WifiSort {
    namespace Capture {

        bool CaptureReader::ReadDevices(
            const std::filesystem::path& path,
            const ManufacturerLookup* lookup,
            DeviceList& out,
            CaptureError* err,
            ReadStatistics* stats
        ) {
            WS_LOG_SCOPE("Capture");
            out.clear();

            CaptureDatabase db;
            if (!db.Open(path, err)) {
                return false;
            }

            std::vector<std::string> tables;
            if (db.ListTables(tables)) {
                WS_LOG_DEBUG("Capture", "Tables in %s: %s", path.string().c_str(),
                    Utils::StringUtils::Join(tables, ", ").c_str());
            }
            WS_LOG_DEBUG("Capture", "Kismet db_version %d", db.DatabaseVersion());

            ReadStatistics local;
            const bool ok = db.ForEachDeviceBlob([&](const std::string& blob) {
                ++local.rows;

                DeviceRecord rec;
                Utils::JSON::Error jerr;
                switch (DeviceParser::ParseText(blob, rec, &jerr)) {
                case ParseStatus::Ok:
                    break;
                case ParseStatus::NotWifi:
                    ++local.otherPhy;
                    return true;
                case ParseStatus::Malformed:
                    ++local.malformed;
                    WS_LOG_WARN("Capture", "Could not parse device row %zu: %s",
                        local.rows, jerr.message.c_str());
                    return true;
                }

                if (lookup && (rec.manufacturer.empty() || rec.manufacturer == "Unknown")) {
                    std::string vendor = lookup->Lookup(rec.mac);
                    if (!vendor.empty()) {
                        rec.manufacturer = std::move(vendor);
                    }
                }

                out.push_back(std::move(rec));
                ++local.wifiDevices;
                return true;
            }, err);

            if (stats) *stats = local;
            if (!ok) {
                out.clear();
                return false;
            }

            WS_LOG_INFO("Capture", "Extracted %zu WiFi devices from %zu rows (%zu other phy, %zu malformed)",
                local.wifiDevices, local.rows, local.otherPhy, local.malformed);
            return true;
        }

    }  // namespace Capture
}  // namespace WifiSort
