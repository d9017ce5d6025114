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
 * @file FileUtils.hpp
 * @brief File system helpers used by the pattern loader, the report writer
 *        and the capture merger.
 *
 * Provides:
 * - Existence and type checks
 * - Whole-file reads (bytes, UTF-8 text, lines with BOM stripping)
 * - Atomic writes through a temporary sibling file and rename
 * - Glob expansion of command-line inputs
 *
 * @note All functions report failures through the optional Error out-parameter.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace WifiSort {

	namespace Utils {

		namespace FileUtils {

			/// Upper bound for whole-file reads (256MB)
			inline constexpr uintmax_t MAX_READ_SIZE = 256ULL * 1024 * 1024;

			/**
			 * @brief Error information for file operations.
			 */
			struct Error {
				int errnoValue = 0;                 ///< errno / std::error_code value (0 = none recorded)
				std::string message;                ///< Human-readable error description
				std::filesystem::path path;         ///< Path involved in the failure

				/// @brief Check if error is set
				[[nodiscard]] bool hasError() const noexcept { return !message.empty(); }

				/// @brief Clear the error state
				void clear() noexcept { errnoValue = 0; message.clear(); path.clear(); }
			};

			/// @brief True if the path exists (file or directory)
			[[nodiscard]] bool Exists(const std::filesystem::path& path, Error* err = nullptr);

			/// @brief True if the path exists and is a regular file
			[[nodiscard]] bool IsRegularFile(const std::filesystem::path& path, Error* err = nullptr);

			/**
			 * @brief Read an entire file as raw bytes.
			 * @return false if the file is missing, unreadable or larger than MAX_READ_SIZE
			 */
			[[nodiscard]] bool ReadAllBytes(const std::filesystem::path& path, std::string& out, Error* err = nullptr);

			/**
			 * @brief Read an entire file as UTF-8 text, stripping a leading BOM.
			 */
			[[nodiscard]] bool ReadAllTextUtf8(const std::filesystem::path& path, std::string& out, Error* err = nullptr);

			/**
			 * @brief Read a text file split into lines.
			 *
			 * Splits on '\n'; a trailing '\r' stays on the line (callers trim).
			 * A final line without terminator is kept, an empty tail is not.
			 */
			[[nodiscard]] bool ReadAllLines(const std::filesystem::path& path, std::vector<std::string>& out, Error* err = nullptr);

			/**
			 * @brief Write data to path atomically.
			 *
			 * The data goes to a temporary file in the destination directory which
			 * is then renamed over the destination. The destination is never left
			 * half written.
			 */
			[[nodiscard]] bool WriteAllBytesAtomic(const std::filesystem::path& path, std::string_view data, Error* err = nullptr);

			/// @brief Remove a file; a missing file is not an error
			[[nodiscard]] bool RemoveFile(const std::filesystem::path& path, Error* err = nullptr);

			/**
			 * @brief Expand a shell glob pattern (glob(3)).
			 *
			 * Matches are appended in glob's sorted order. A pattern without
			 * matches is appended verbatim so the caller can report it.
			 */
			void ExpandGlob(const std::string& pattern, std::vector<std::string>& out);

		}//namespace FileUtils
	}//namespace Utils
}//namespace WifiSort
