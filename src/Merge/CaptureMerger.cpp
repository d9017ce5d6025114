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
#include "CaptureMerger.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"

#include <cstdio>
#include <ctime>
#include <unordered_set>

namespace WifiSort {
    namespace Merge {

        using Utils::JSON::Json;
        namespace JSON = Utils::JSON;

        namespace {

            // Top-level device keys
            constexpr const char* kMac = "kismet.device.base.macaddr";
            constexpr const char* kKey = "kismet.device.base.key";
            constexpr const char* kPhyName = "kismet.device.base.phyname";
            constexpr const char* kType = "kismet.device.base.type";
            constexpr const char* kPacketsTotal = "kismet.device.base.packets.total";
            constexpr const char* kPacketsData = "kismet.device.base.packets.data";
            constexpr const char* kDataSize = "kismet.device.base.datasize";
            constexpr const char* kFirstTime = "kismet.device.base.first_time";
            constexpr const char* kLastTime = "kismet.device.base.last_time";
            constexpr const char* kSignal = "kismet.device.base.signal";
            constexpr const char* kLocation = "kismet.device.base.location";

            // Nested keys
            constexpr const char* kMaxSignal = "kismet.common.signal.max_signal";
            constexpr const char* kMinSignal = "kismet.common.signal.min_signal";
            constexpr const char* kLastSignal = "kismet.common.signal.last_signal";
            constexpr const char* kAvgLoc = "kismet.common.location.avg_loc";
            constexpr const char* kMinLoc = "kismet.common.location.min_loc";
            constexpr const char* kMaxLoc = "kismet.common.location.max_loc";
            constexpr const char* kGeopoint = "kismet.common.location.geopoint";

            constexpr const char* kCreateDevicesSql =
                "CREATE TABLE devices ("
                "first_time INT, "
                "last_time INT, "
                "devkey TEXT, "
                "phyname TEXT, "
                "devmac TEXT, "
                "strongest_signal INT, "
                "min_lat REAL, "
                "min_lon REAL, "
                "max_lat REAL, "
                "max_lon REAL, "
                "avg_lat REAL, "
                "avg_lon REAL, "
                "bytes_data INT, "
                "type TEXT, "
                "device BLOB)";

            constexpr const char* kCreateIndexSql[] = {
                "CREATE INDEX devices_devkey ON devices (devkey)",
                "CREATE INDEX devices_devmac ON devices (devmac)",
                "CREATE INDEX devices_first_time ON devices (first_time)",
                "CREATE INDEX devices_last_time ON devices (last_time)",
                "CREATE INDEX devices_phyname ON devices (phyname)",
                "CREATE INDEX devices_type ON devices (type)",
            };

            constexpr const char* kInsertDeviceSql =
                "INSERT INTO devices "
                "(first_time, last_time, devkey, phyname, devmac, strongest_signal, "
                "min_lat, min_lon, max_lat, max_lon, avg_lat, avg_lon, bytes_data, type, device) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

            constexpr const char* kCreateKismetSql =
                "CREATE TABLE IF NOT EXISTS KISMET ("
                "kismet_version TEXT, "
                "build_uuid TEXT, "
                "build_compile TEXT, "
                "db_version INT)";

            constexpr const char* kInsertKismetSql =
                "INSERT INTO KISMET (kismet_version, build_uuid, build_compile, db_version) "
                "VALUES (?, ?, ?, ?)";

            std::string pointer(const char* key) {
                return std::string("/") + key;
            }

            std::string pointer(const char* key, const char* nested) {
                return std::string("/") + key + "/" + nested;
            }

            int64_t intOr(const Json& obj, const char* key, int64_t def = 0) {
                return JSON::GetOr<int64_t>(obj, pointer(key), def);
            }

            /// Non-empty object at obj[key], or nullptr
            const Json* nonEmptyObject(const Json& obj, const char* key) {
                const Json* node = JSON::Find(obj, pointer(key));
                if (!node || !node->is_object() || node->empty()) {
                    return nullptr;
                }
                return node;
            }

            const Json* numberAt(const Json& obj, const char* key) {
                const auto it = obj.find(key);
                if (it == obj.end() || !it->is_number()) {
                    return nullptr;
                }
                return &*it;
            }

            bool hasAvgLocation(const Json* location) {
                if (!location) return false;
                const auto it = location->find(kAvgLoc);
                // an empty or null avg_loc counts as no fix
                return it != location->end() && !it->is_null() && !(it->is_object() && it->empty());
            }

            double geoAt(const Json& device, const char* loc, size_t index) {
                const std::string path = pointer(kLocation, loc) + "/" + kGeopoint + "/" + std::to_string(index);
                return JSON::GetOr<double>(device, path, 0.0);
            }

            std::string isoTimestampNow() {
                using namespace std::chrono;
                const auto now = system_clock::now();
                const std::time_t secs = system_clock::to_time_t(now);
                const auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;

                std::tm tmv{};
                ::localtime_r(&secs, &tmv);
                char buf[40];
                const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmv);
                std::snprintf(buf + n, sizeof(buf) - n, ".%06lld", static_cast<long long>(micros));
                return buf;
            }

            void fillError(Capture::CaptureError* err, const SQLite::Exception& ex,
                           const std::filesystem::path& path, const char* context) {
                if (!err) return;
                err->sqliteCode = ex.getErrorCode();
                err->extendedCode = ex.getExtendedErrorCode();
                err->message = ex.what();
                err->path = path;
                err->context = context;
            }

        } // anonymous namespace

        // ============================================================================
        // Device merge
        // ============================================================================

        void MergeDeviceJson(Json& existing, const Json& incoming) {
            existing[kPacketsTotal] = intOr(existing, kPacketsTotal) + intOr(incoming, kPacketsTotal);
            existing[kPacketsData] = intOr(existing, kPacketsData) + intOr(incoming, kPacketsData);
            existing[kDataSize] = intOr(existing, kDataSize) + intOr(incoming, kDataSize);

            // Earliest non-zero first_time
            const int64_t newFirst = intOr(incoming, kFirstTime);
            if (newFirst > 0) {
                const int64_t oldFirst = intOr(existing, kFirstTime);
                existing[kFirstTime] = oldFirst == 0 ? newFirst : std::min(oldFirst, newFirst);
            }

            // Latest last_time; remember who was newer for last_signal
            const int64_t oldLast = intOr(existing, kLastTime);
            const int64_t newLast = intOr(incoming, kLastTime);
            const bool incomingIsNewer = newLast >= oldLast;
            existing[kLastTime] = std::max(oldLast, newLast);

            if (const Json* newSignal = nonEmptyObject(incoming, kSignal)) {
                if (!nonEmptyObject(existing, kSignal)) {
                    existing[kSignal] = *newSignal;
                }
                else {
                    Json& signal = existing[kSignal];

                    if (const Json* newMax = numberAt(*newSignal, kMaxSignal)) {
                        const Json* oldMax = numberAt(signal, kMaxSignal);
                        if (!oldMax || newMax->get<double>() > oldMax->get<double>()) {
                            signal[kMaxSignal] = *newMax;
                        }
                    }

                    if (const Json* newMin = numberAt(*newSignal, kMinSignal)) {
                        const Json* oldMin = numberAt(signal, kMinSignal);
                        if (!oldMin || newMin->get<double>() < oldMin->get<double>()) {
                            signal[kMinSignal] = *newMin;
                        }
                    }

                    if (incomingIsNewer) {
                        const auto it = newSignal->find(kLastSignal);
                        if (it != newSignal->end() && !it->is_null()) {
                            signal[kLastSignal] = *it;
                        }
                    }
                }
            }

            const Json* newLocation = nonEmptyObject(incoming, kLocation);
            if (newLocation && hasAvgLocation(newLocation)) {
                if (!hasAvgLocation(nonEmptyObject(existing, kLocation))) {
                    existing[kLocation] = *newLocation;
                }
            }
        }

        // ============================================================================
        // CaptureMerger
        // ============================================================================

        bool CaptureMerger::AddDevice(const Json& device) {
            const std::string mac = device.is_object()
                ? JSON::GetOr<std::string>(device, pointer(kMac), std::string())
                : std::string();
            if (mac.empty()) {
                ++m_stats.skippedNoMac;
                return false;
            }

            ++m_stats.rawEntries;
            const auto it = m_index.find(mac);
            if (it == m_index.end()) {
                m_index.emplace(mac, m_devices.size());
                m_devices.push_back(device);
            }
            else {
                MergeDeviceJson(m_devices[it->second], device);
            }
            return true;
        }

        bool CaptureMerger::AddCapture(const std::filesystem::path& path, Capture::CaptureError* err) {
            WS_LOG_INFO("Merge", "Reading %s", path.string().c_str());

            Capture::CaptureDatabase db;
            if (!db.Open(path, err)) {
                ++m_stats.filesFailed;
                return false;
            }

            // A capture without a devices table contributes nothing but is not an error
            if (!db.HasTable("devices")) {
                WS_LOG_WARN("Merge", "%s has no devices table", path.string().c_str());
                ++m_stats.filesRead;
                return true;
            }

            size_t fileCount = 0;
            const bool ok = db.ForEachDeviceBlob([&](const std::string& blob) {
                Json device;
                JSON::Error jerr;
                if (!JSON::Parse(blob, device, &jerr)) {
                    ++m_stats.malformed;
                    WS_LOG_WARN("Merge", "Could not parse device in %s: %s",
                        path.string().c_str(), jerr.message.c_str());
                    return true;
                }
                if (AddDevice(device)) {
                    ++fileCount;
                }
                return true;
            }, err);

            if (!ok) {
                ++m_stats.filesFailed;
                return false;
            }

            ++m_stats.filesRead;
            WS_LOG_INFO("Merge", "  -> %zu devices", fileCount);
            return true;
        }

        bool CaptureMerger::WriteCapture(const std::filesystem::path& path, Capture::CaptureError* err) const {
            if (err) err->clear();
            if (m_devices.empty()) {
                if (err) {
                    err->message = "No devices to write";
                    err->path = path;
                    err->context = "WriteCapture";
                }
                return false;
            }

            const std::filesystem::path tempPath = path.string() + ".partial";
            Utils::FileUtils::Error ferr;
            if (!Utils::FileUtils::RemoveFile(tempPath, &ferr)) {
                if (err) {
                    err->message = ferr.message;
                    err->path = tempPath;
                    err->context = "WriteCapture";
                }
                return false;
            }

            try {
                {
                    SQLite::Database db(tempPath.string(), SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
                    SQLite::Transaction transaction(db);

                    db.exec(kCreateDevicesSql);
                    for (const char* sql : kCreateIndexSql) {
                        db.exec(sql);
                    }

                    SQLite::Statement insert(db, kInsertDeviceSql);
                    for (const auto& device : m_devices) {
                        std::string blob;
                        if (!JSON::Stringify(device, blob)) {
                            WS_LOG_WARN("Merge", "Cannot serialise device %s, skipped",
                                JSON::GetOr<std::string>(device, pointer(kMac), std::string()).c_str());
                            continue;
                        }

                        insert.bind(1, static_cast<int64_t>(intOr(device, kFirstTime)));
                        insert.bind(2, static_cast<int64_t>(intOr(device, kLastTime)));
                        insert.bind(3, JSON::GetOr<std::string>(device, pointer(kKey), std::string()));
                        insert.bind(4, JSON::GetOr<std::string>(device, pointer(kPhyName), std::string()));
                        insert.bind(5, JSON::GetOr<std::string>(device, pointer(kMac), std::string()));
                        insert.bind(6, static_cast<int64_t>(JSON::GetOr<int64_t>(device, pointer(kSignal, kMaxSignal), 0)));
                        insert.bind(7, geoAt(device, kMinLoc, 1));
                        insert.bind(8, geoAt(device, kMinLoc, 0));
                        insert.bind(9, geoAt(device, kMaxLoc, 1));
                        insert.bind(10, geoAt(device, kMaxLoc, 0));
                        insert.bind(11, geoAt(device, kAvgLoc, 1));
                        insert.bind(12, geoAt(device, kAvgLoc, 0));
                        insert.bind(13, static_cast<int64_t>(intOr(device, kDataSize)));
                        insert.bind(14, JSON::GetOr<std::string>(device, pointer(kType), std::string()));
                        insert.bind(15, static_cast<const void*>(blob.data()), static_cast<int>(blob.size()));

                        insert.exec();
                        insert.reset();
                        insert.clearBindings();
                    }

                    db.exec(kCreateKismetSql);
                    SQLite::Statement meta(db, kInsertKismetSql);
                    meta.bind(1, kMergedKismetVersion);
                    meta.bind(2, kMergedBuildUuid);
                    meta.bind(3, isoTimestampNow());
                    meta.bind(4, kMergedDbVersion);
                    meta.exec();

                    transaction.commit();
                }

                std::error_code ec;
                std::filesystem::rename(tempPath, path, ec);
                if (ec) {
                    if (err) {
                        err->message = "rename() failed: " + ec.message();
                        err->path = path;
                        err->context = "WriteCapture";
                    }
                    (void)Utils::FileUtils::RemoveFile(tempPath);
                    return false;
                }

                WS_LOG_INFO("Merge", "Wrote %zu devices to %s", m_devices.size(), path.string().c_str());
                return true;
            }
            catch (const SQLite::Exception& ex) {
                fillError(err, ex, path, "WriteCapture");
                WS_LOG_ERROR("Merge", "Cannot write %s: %s", path.string().c_str(), ex.what());
                (void)Utils::FileUtils::RemoveFile(tempPath);
                return false;
            }
        }

        std::vector<std::string> CaptureMerger::ResolveInputs(
            const std::vector<std::string>& patterns,
            const std::filesystem::path& output,
            std::vector<std::string>& missing
        ) {
            std::vector<std::string> expanded;
            for (const auto& pattern : patterns) {
                std::vector<std::string> matches;
                Utils::FileUtils::ExpandGlob(pattern, matches);
                for (auto& m : matches) {
                    std::error_code ec;
                    if (std::filesystem::exists(m, ec)) {
                        expanded.push_back(std::move(m));
                    }
                    else {
                        missing.push_back(std::move(m));
                    }
                }
            }

            std::error_code ec;
            const auto outputResolved = std::filesystem::weakly_canonical(output, ec);

            std::vector<std::string> inputs;
            std::unordered_set<std::string> seen;
            for (auto& file : expanded) {
                if (!seen.insert(file).second) {
                    continue;
                }
                std::error_code fec;
                const auto resolved = std::filesystem::weakly_canonical(file, fec);
                if (!ec && !fec && resolved == outputResolved) {
                    WS_LOG_DEBUG("Merge", "Skipping output file %s in inputs", file.c_str());
                    continue;
                }
                inputs.push_back(std::move(file));
            }
            return inputs;
        }

    }  // namespace Merge
}  // namespace WifiSort
