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
 * @file StringUtils.hpp
 * @brief Small ASCII string helpers shared by the pattern, capture and config modules.
 */

#include <string>
#include <string_view>
#include <vector>

namespace WifiSort {
	namespace Utils {
		namespace StringUtils {

			/// Characters stripped by Trim(): space, \t, \n, \r, \v, \f
			inline constexpr std::string_view kWhitespace = " \t\n\r\v\f";

			[[nodiscard]] std::string_view Trim(std::string_view s) noexcept;

			/// @brief ASCII case-insensitive equality
			[[nodiscard]] bool IEquals(std::string_view a, std::string_view b) noexcept;

			/// @brief Split on a single delimiter, keeping empty fields
			[[nodiscard]] std::vector<std::string> Split(std::string_view s, char delim);

			/// @brief Join with a separator
			[[nodiscard]] std::string Join(const std::vector<std::string>& parts, std::string_view sep);

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace WifiSort
