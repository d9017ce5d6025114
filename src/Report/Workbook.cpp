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
#include "Workbook.hpp"

#include <charconv>
#include <cmath>

namespace WifiSort {
    namespace Report {

        std::string ColumnName(size_t index) {
            std::string name;
            size_t n = index + 1;
            while (n > 0) {
                const size_t rem = (n - 1) % 26;
                name.insert(name.begin(), static_cast<char>('A' + rem));
                n = (n - 1) / 26;
            }
            return name;
        }

        std::string FormatNumber(double value) {
            if (!std::isfinite(value)) {
                return std::string();
            }

            char buf[64];
            std::to_chars_result res{};
            if (std::trunc(value) == value && std::fabs(value) < 1e15) {
                res = std::to_chars(buf, buf + sizeof(buf), static_cast<int64_t>(value));
            }
            else {
                res = std::to_chars(buf, buf + sizeof(buf), value);
            }
            if (res.ec != std::errc()) {
                return std::string();
            }
            return std::string(buf, res.ptr);
        }

        std::string Cell::DisplayText() const {
            switch (type) {
            case Type::Empty:  return std::string();
            case Type::String: return text;
            case Type::Number: return FormatNumber(number);
            }
            return std::string();
        }

    }  // namespace Report
}  // namespace WifiSort
