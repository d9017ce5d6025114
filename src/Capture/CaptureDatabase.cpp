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
#include "CaptureDatabase.hpp"
#include "../Utils/Logger.hpp"

namespace WifiSort {
    namespace Capture {

        namespace {
            constexpr const char* kDevicesTable = "devices";
            constexpr const char* kMetadataTable = "KISMET";

            // SQLite rejects non-database files lazily; touch the schema to force the check
            constexpr const char* kProbeSql = "SELECT count(*) FROM sqlite_master";
        }

        void CaptureDatabase::fillError(CaptureError* err, const SQLite::Exception& ex, const char* context) const {
            if (!err) return;
            err->sqliteCode = ex.getErrorCode();
            err->extendedCode = ex.getExtendedErrorCode();
            err->message = ex.what();
            err->path = m_path;
            err->context = context;
        }

        bool CaptureDatabase::Open(const std::filesystem::path& path, CaptureError* err) {
            if (err) err->clear();
            Close();
            m_path = path;

            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec)) {
                if (err) {
                    err->message = "Capture file not found";
                    err->path = path;
                    err->context = "Open";
                }
                WS_LOG_ERROR("Capture", "Capture file not found: %s", path.string().c_str());
                return false;
            }

            try {
                auto db = std::make_unique<SQLite::Database>(path.string(), SQLite::OPEN_READONLY);
                SQLite::Statement probe(*db, kProbeSql);
                probe.executeStep();

                m_db = std::move(db);
                WS_LOG_DEBUG("Capture", "Opened capture %s", path.string().c_str());
                return true;
            }
            catch (const SQLite::Exception& ex) {
                fillError(err, ex, "Open");
                WS_LOG_ERROR("Capture", "Cannot open capture %s: %s", path.string().c_str(), ex.what());
                m_db.reset();
                return false;
            }
        }

        void CaptureDatabase::Close() noexcept {
            m_db.reset();
        }

        bool CaptureDatabase::ListTables(std::vector<std::string>& out, CaptureError* err) const {
            out.clear();
            if (!m_db) {
                if (err) {
                    err->message = "Capture not open";
                    err->context = "ListTables";
                }
                return false;
            }

            try {
                SQLite::Statement query(*m_db, "SELECT name FROM sqlite_master WHERE type='table'");
                while (query.executeStep()) {
                    out.push_back(query.getColumn(0).getString());
                }
                return true;
            }
            catch (const SQLite::Exception& ex) {
                fillError(err, ex, "ListTables");
                WS_LOG_ERROR("Capture", "Failed to list tables: %s", ex.what());
                return false;
            }
        }

        bool CaptureDatabase::HasTable(const std::string& name) const noexcept {
            if (!m_db) return false;
            try {
                return m_db->tableExists(name);
            }
            catch (const SQLite::Exception& ex) {
                WS_LOG_WARN("Capture", "tableExists(%s) failed: %s", name.c_str(), ex.what());
                return false;
            }
        }

        int CaptureDatabase::DatabaseVersion() const noexcept {
            if (!HasTable(kMetadataTable)) {
                return 0;
            }
            try {
                SQLite::Statement query(*m_db, "SELECT db_version FROM KISMET LIMIT 1");
                if (query.executeStep() && !query.getColumn(0).isNull()) {
                    return query.getColumn(0).getInt();
                }
            }
            catch (const SQLite::Exception& ex) {
                WS_LOG_WARN("Capture", "Cannot read db_version: %s", ex.what());
            }
            return 0;
        }

        bool CaptureDatabase::CountDevices(int64_t& out, CaptureError* err) const {
            out = 0;
            if (!HasTable(kDevicesTable)) {
                if (err) {
                    err->message = "Capture has no devices table";
                    err->path = m_path;
                    err->context = "CountDevices";
                }
                return false;
            }
            try {
                SQLite::Statement query(*m_db, "SELECT count(*) FROM devices");
                if (query.executeStep()) {
                    out = query.getColumn(0).getInt64();
                }
                return true;
            }
            catch (const SQLite::Exception& ex) {
                fillError(err, ex, "CountDevices");
                return false;
            }
        }

        bool CaptureDatabase::ForEachDeviceBlob(const BlobCallback& callback, CaptureError* err) const {
            if (!HasTable(kDevicesTable)) {
                if (err) {
                    err->message = "Capture has no devices table";
                    err->path = m_path;
                    err->context = "ForEachDeviceBlob";
                }
                WS_LOG_ERROR("Capture", "No devices table in %s", m_path.string().c_str());
                return false;
            }

            try {
                SQLite::Statement query(*m_db, "SELECT device FROM devices");
                size_t rows = 0;
                while (query.executeStep()) {
                    const SQLite::Column col = query.getColumn(0);
                    if (col.isNull()) {
                        continue;
                    }
                    ++rows;
                    // Kismet stores the document as TEXT in older schemas, BLOB in newer ones
                    const int bytes = col.getBytes();
                    const std::string blob = bytes > 0
                        ? std::string(static_cast<const char*>(col.getBlob()), static_cast<size_t>(bytes))
                        : std::string();
                    if (!callback(blob)) {
                        break;
                    }
                }
                WS_LOG_DEBUG("Capture", "Visited %zu device rows in %s", rows, m_path.string().c_str());
                return true;
            }
            catch (const SQLite::Exception& ex) {
                fillError(err, ex, "ForEachDeviceBlob");
                WS_LOG_ERROR("Capture", "Failed to read devices: %s", ex.what());
                return false;
            }
        }

    }  // namespace Capture
}  // namespace WifiSort
