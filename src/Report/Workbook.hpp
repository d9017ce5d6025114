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
 * @file Workbook.hpp
 * @brief In-memory spreadsheet model handed from the report builder to the writer.
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace WifiSort {
    namespace Report {

        // ============================================================================
        // ERRORS
        // ============================================================================

        struct ReportError {
            std::string message;
            std::filesystem::path path;
            std::string context;        ///< Part or step that failed

            [[nodiscard]] bool hasError() const noexcept { return !message.empty(); }
            void clear() noexcept { message.clear(); path.clear(); context.clear(); }
        };

        // ============================================================================
        // MODEL
        // ============================================================================

        struct Cell {
            enum class Type : uint8_t {
                Empty = 0,
                String = 1,
                Number = 2
            };

            Type type = Type::Empty;
            std::string text;
            double number = 0.0;
            bool header = false;        ///< rendered with the header style

            [[nodiscard]] static Cell Empty() { return Cell{}; }

            [[nodiscard]] static Cell String(std::string value) {
                Cell c;
                c.type = Type::String;
                c.text = std::move(value);
                return c;
            }

            [[nodiscard]] static Cell Number(double value) {
                Cell c;
                c.type = Type::Number;
                c.number = value;
                return c;
            }

            template <typename T>
            [[nodiscard]] static Cell Optional(const std::optional<T>& value) {
                return value ? Number(static_cast<double>(*value)) : Empty();
            }

            /// @brief Text as shown to the user (numbers in shortest round-trip form)
            [[nodiscard]] std::string DisplayText() const;
        };

        using Row = std::vector<Cell>;

        struct Sheet {
            std::string name;
            std::vector<Row> rows;
            std::vector<double> columnWidths;   ///< index 0 = column A; empty = default widths
        };

        struct Workbook {
            std::vector<Sheet> sheets;
        };

        /// @brief Spreadsheet column letters: 0 -> "A", 25 -> "Z", 26 -> "AA"
        [[nodiscard]] std::string ColumnName(size_t index);

        /// @brief Shortest decimal form of a number; integral values have no fraction
        [[nodiscard]] std::string FormatNumber(double value);

    }  // namespace Report
}  // namespace WifiSort
