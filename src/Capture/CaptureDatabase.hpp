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
 * @file CaptureDatabase.hpp
 * @brief Read-only access to a Kismet .kismet capture (SQLite).
 *
 * A Kismet capture is a SQLite database with one JSON document per tracked
 * device in the `devices` table and a `KISMET` metadata table carrying the
 * schema version. This class only reads; it never modifies the capture.
 */

#include <SQLiteCpp/SQLiteCpp.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace WifiSort {
    namespace Capture {

        // ============================================================================
        // ERRORS
        // ============================================================================

        struct CaptureError {
            int sqliteCode = 0;             ///< SQLite primary result code (0 = not a SQLite failure)
            int extendedCode = 0;           ///< SQLite extended result code
            std::string message;
            std::filesystem::path path;
            std::string context;            ///< Operation that failed

            [[nodiscard]] bool hasError() const noexcept { return !message.empty(); }

            void clear() noexcept {
                sqliteCode = 0;
                extendedCode = 0;
                message.clear();
                path.clear();
                context.clear();
            }
        };

        // ============================================================================
        // CAPTURE DATABASE
        // ============================================================================

        class CaptureDatabase {
        public:
            /// Callback receiving the raw JSON text of one device row; return false to stop
            using BlobCallback = std::function<bool(const std::string& deviceJson)>;

            CaptureDatabase() = default;
            ~CaptureDatabase() = default;

            CaptureDatabase(const CaptureDatabase&) = delete;
            CaptureDatabase& operator=(const CaptureDatabase&) = delete;
            CaptureDatabase(CaptureDatabase&&) noexcept = default;
            CaptureDatabase& operator=(CaptureDatabase&&) noexcept = default;

            /**
             * @brief Open a capture read-only.
             *
             * Fails when the file does not exist or is not a SQLite database.
             */
            [[nodiscard]] bool Open(const std::filesystem::path& path, CaptureError* err = nullptr);

            void Close() noexcept;

            [[nodiscard]] bool IsOpen() const noexcept { return m_db != nullptr; }

            [[nodiscard]] const std::filesystem::path& Path() const noexcept { return m_path; }

            /// @brief Names of all tables in sqlite_master order
            [[nodiscard]] bool ListTables(std::vector<std::string>& out, CaptureError* err = nullptr) const;

            [[nodiscard]] bool HasTable(const std::string& name) const noexcept;

            /// @brief `db_version` from the KISMET table, 0 when the table is absent
            [[nodiscard]] int DatabaseVersion() const noexcept;

            /// @brief Number of rows in the devices table
            [[nodiscard]] bool CountDevices(int64_t& out, CaptureError* err = nullptr) const;

            /**
             * @brief Visit every device JSON document in row order.
             *
             * Rows whose `device` column is NULL are skipped.
             * Fails with a CaptureError when the devices table is missing.
             */
            [[nodiscard]] bool ForEachDeviceBlob(const BlobCallback& callback, CaptureError* err = nullptr) const;

        private:
            void fillError(CaptureError* err, const SQLite::Exception& ex, const char* context) const;

            std::unique_ptr<SQLite::Database> m_db;
            std::filesystem::path m_path;
        };

    }  // namespace Capture
}  // namespace WifiSort
