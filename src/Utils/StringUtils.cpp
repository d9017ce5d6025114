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
#include "StringUtils.hpp"

namespace WifiSort {
	namespace Utils {
		namespace StringUtils {

			namespace {
				inline char lowerAscii(char c) noexcept {
					return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
				}
			}

			std::string_view Trim(std::string_view s) noexcept {
				const size_t first = s.find_first_not_of(kWhitespace);
				if (first == std::string_view::npos) {
					return std::string_view();
				}
				const size_t last = s.find_last_not_of(kWhitespace);
				return s.substr(first, last - first + 1);
			}

			bool IEquals(std::string_view a, std::string_view b) noexcept {
				if (a.size() != b.size()) return false;
				for (size_t i = 0; i < a.size(); ++i) {
					if (lowerAscii(a[i]) != lowerAscii(b[i])) return false;
				}
				return true;
			}

			std::vector<std::string> Split(std::string_view s, char delim) {
				std::vector<std::string> parts;
				size_t start = 0;
				for (;;) {
					const size_t pos = s.find(delim, start);
					if (pos == std::string_view::npos) {
						parts.emplace_back(s.substr(start));
						break;
					}
					parts.emplace_back(s.substr(start, pos - start));
					start = pos + 1;
				}
				return parts;
			}

			std::string Join(const std::vector<std::string>& parts, std::string_view sep) {
				std::string out;
				for (size_t i = 0; i < parts.size(); ++i) {
					if (i) out.append(sep);
					out.append(parts[i]);
				}
				return out;
			}

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace WifiSort
