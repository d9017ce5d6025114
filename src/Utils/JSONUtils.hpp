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
 * @file JSONUtils.hpp
 * @brief JSON parsing, serialization and path access for WifiSort.
 *
 * Used for the Kismet device blobs stored in capture databases and for the
 * optional JSON configuration file.
 *
 * Provides:
 * - Safe parsing with depth limits
 * - File loading with size limits and BOM stripping
 * - JSON Pointer and dot/bracket path navigation
 * - Typed getters that never throw
 *
 * Implementation uses the nlohmann/json library.
 *
 * @note All functions are noexcept and return success/failure status.
 * @warning Kismet field names contain dots ("kismet.device.base.macaddr"),
 *          so paths into device blobs must be written as JSON Pointers.
 */

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <cstdint>
#include <optional>
#include <utility>

#include <nlohmann/json.hpp>

namespace WifiSort {
	namespace Utils {
		namespace JSON {

			/// @brief Type alias for nlohmann::json
			using Json = nlohmann::json;

			// ============================================================================
			// Limits
			// ============================================================================

			/// Maximum nesting depth accepted by Parse()
			inline constexpr size_t MAX_JSON_DEPTH = 1000;

			/// Default file size limit for LoadFromFile (32MB)
			inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 32ULL * 1024 * 1024;

			// ============================================================================
			// Error Handling
			// ============================================================================

			/**
			 * @brief Error information structure for JSON operations.
			 *
			 * Captures detailed error information including file path,
			 * byte offset, and approximate line/column for parse errors.
			 */
			struct Error {
				std::string message;              ///< Human-readable error description
				std::filesystem::path path;       ///< File path (if applicable)
				size_t byteOffset = 0;            ///< Byte offset in JSON text (0 = unknown)
				size_t line = 0;                  ///< Approximate line number (1-based, 0 = unknown)
				size_t column = 0;                ///< Approximate column number (1-based, 0 = unknown)

				/// @brief Check if an error occurred
				[[nodiscard]] bool hasError() const noexcept {
					return !message.empty();
				}

				/// @brief Clear error state
				void clear() noexcept {
					message.clear();
					path.clear();
					byteOffset = 0;
					line = 0;
					column = 0;
				}
			};

			/**
			 * @brief Options for JSON parsing operations.
			 */
			struct ParseOptions {
				bool allowComments = true;         ///< Allow // and /* */ comments
				size_t maxDepth = MAX_JSON_DEPTH;  ///< Maximum nesting depth
			};

			/**
			 * @brief Options for JSON stringification.
			 */
			struct StringifyOptions {
				bool pretty = false;               ///< Enable pretty printing with indentation
				int indentSpaces = 2;              ///< Number of spaces per indent level
				bool ensureAscii = false;          ///< Escape non-ASCII characters
			};

			// ============================================================================
			// Text Parsing Functions
			// ============================================================================

			/**
			 * @brief Parse JSON text into a Json object.
			 *
			 * @param jsonText Input JSON text
			 * @param out Output Json object (null on failure)
			 * @param err Optional error output
			 * @param opt Parse options
			 * @return true on success, false on parse error
			 */
			[[nodiscard]] bool Parse(std::string_view jsonText, Json& out, Error* err = nullptr,
			                         const ParseOptions& opt = {}) noexcept;

			/**
			 * @brief Serialize Json object to string.
			 *
			 * Invalid UTF-8 in strings is replaced rather than rejected.
			 */
			[[nodiscard]] bool Stringify(const Json& j, std::string& out,
			                             const StringifyOptions& opt = {}) noexcept;

			// ============================================================================
			// File I/O Functions
			// ============================================================================

			/**
			 * @brief Load JSON from file.
			 *
			 * Reads and parses a JSON file with size and depth limits.
			 * Automatically strips UTF-8 BOM if present.
			 */
			[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Json& out,
			                                Error* err = nullptr, const ParseOptions& opt = {},
			                                size_t maxBytes = DEFAULT_MAX_FILE_SIZE) noexcept;

			// ============================================================================
			// JSON Pointer / Path Helpers
			// ============================================================================

			/**
			 * @brief Convert path-like string to JSON Pointer.
			 *
			 * Accepts either JSON Pointer ("/a/b/0") or dot/bracket notation ("a.b[0].c").
			 * Strings starting with '/' are treated as JSON Pointers and returned as is.
			 * An empty path maps to "/" (the root).
			 */
			[[nodiscard]] std::string ToJsonPointer(std::string_view pathLike) noexcept;

			/**
			 * @brief Check if a path exists in a Json object.
			 */
			[[nodiscard]] bool Contains(const Json& j, std::string_view pathLike) noexcept;

			/**
			 * @brief Locate the value at a path.
			 * @return Pointer into j, or nullptr when the path does not resolve
			 */
			[[nodiscard]] const Json* Find(const Json& j, std::string_view pathLike) noexcept;

			// ============================================================================
			// Typed Getters
			// ============================================================================

			/**
			 * @brief Get typed value from Json using path.
			 *
			 * Retrieves a value at the specified path and converts to type T.
			 * T must be compatible with nlohmann::json::get<T>().
			 *
			 * @return true if path exists and conversion succeeded, false otherwise
			 */
			template <typename T>
			[[nodiscard]] bool Get(const Json& j, std::string_view pathLike, T& out) noexcept {
				const Json* node = Find(j, pathLike);
				if (!node || node->is_null()) {
					return false;
				}
				try {
					out = node->template get<T>();
					return true;
				}
				catch (const nlohmann::json::exception&) {
					return false;
				}
			}

			/**
			 * @brief Get typed value or return default.
			 */
			template <typename T>
			[[nodiscard]] T GetOr(const Json& j, std::string_view pathLike, T defaultValue) noexcept {
				T val{};
				if (Get<T>(j, pathLike, val)) {
					return val;
				}
				return defaultValue;
			}

			/**
			 * @brief Get typed value as std::optional (nullopt when absent or mistyped).
			 */
			template <typename T>
			[[nodiscard]] std::optional<T> GetOptional(const Json& j, std::string_view pathLike) noexcept {
				T val{};
				if (Get<T>(j, pathLike, val)) {
					return val;
				}
				return std::nullopt;
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace WifiSort
