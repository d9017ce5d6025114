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
 * @file XlsxWriter.hpp
 * @brief Office Open XML (SpreadsheetML) serialisation of a Workbook.
 *
 * Package layout:
 * @code
 *   [Content_Types].xml
 *   _rels/.rels
 *   xl/workbook.xml
 *   xl/_rels/workbook.xml.rels
 *   xl/styles.xml
 *   xl/worksheets/sheet1.xml ... sheetN.xml
 * @endcode
 * Strings are written inline (no shared string table). Header cells use
 * style 1: bold white text on a 4472C4 solid fill, centred.
 */

#include "Workbook.hpp"

#include <filesystem>
#include <string>

namespace WifiSort {
    namespace Report {

        /// Fill colour of header cells (RGB)
        inline constexpr const char* kHeaderFillRgb = "4472C4";

        /// Maximum sheet name length accepted by spreadsheet applications
        inline constexpr size_t kMaxSheetNameLength = 31;

        class XlsxWriter {
        public:
            /**
             * @brief Serialise and write atomically (temporary file + rename).
             */
            [[nodiscard]] static bool Write(
                const Workbook& workbook,
                const std::filesystem::path& path,
                ReportError* err = nullptr
            );

            /// @brief Serialise the whole package into memory
            [[nodiscard]] static bool Serialize(
                const Workbook& workbook,
                std::string& outBytes,
                ReportError* err = nullptr
            );

            // Individual parts, exposed for inspection
            [[nodiscard]] static std::string ContentTypesXml(size_t sheetCount);
            [[nodiscard]] static std::string PackageRelsXml();
            [[nodiscard]] static std::string WorkbookXml(const Workbook& workbook);
            [[nodiscard]] static std::string WorkbookRelsXml(size_t sheetCount);
            [[nodiscard]] static std::string StylesXml();
            [[nodiscard]] static std::string WorksheetXml(const Sheet& sheet);

            /// @brief Drop characters XML 1.0 cannot carry (C0 controls except TAB, LF, CR)
            [[nodiscard]] static std::string SanitizeText(const std::string& text);
        };

    }  // namespace Report
}  // namespace WifiSort
