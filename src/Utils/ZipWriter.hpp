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
 * @file ZipWriter.hpp
 * @brief Minimal in-memory ZIP archive builder (stored entries only).
 *
 * Produces the PKZIP container used by Office Open XML documents:
 * local file headers, uncompressed entry data, central directory and
 * end-of-central-directory record. Entries are never compressed and
 * ZIP64 is not supported (every entry and the archive stay below 4GB).
 */

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace WifiSort {
	namespace Utils {

		// ============================================================================
		// CRC32 (IEEE 802.3 polynomial)
		// ============================================================================

		namespace Detail {

			/// @brief CRC32 lookup table (generated at compile time)
			constexpr std::array<uint32_t, 256> GenerateCRC32Table() noexcept {
				std::array<uint32_t, 256> table{};
				for (uint32_t i = 0; i < 256; ++i) {
					uint32_t crc = i;
					for (int j = 0; j < 8; ++j) {
						if (crc & 1) {
							crc = (crc >> 1) ^ 0xEDB88320;
						}
						else {
							crc >>= 1;
						}
					}
					table[i] = crc;
				}
				return table;
			}

			inline constexpr auto CRC32_TABLE = GenerateCRC32Table();

		}  // namespace Detail

		/// @brief Compute CRC32 of data (the checksum ZIP stores per entry)
		[[nodiscard]] uint32_t ComputeCRC32(std::string_view data) noexcept;

		// ============================================================================
		// Error Handling
		// ============================================================================

		struct ZipError {
			std::string message;      ///< Human-readable error description
			std::string entryName;    ///< Entry involved (if any)

			[[nodiscard]] bool hasError() const noexcept { return !message.empty(); }
			void clear() noexcept { message.clear(); entryName.clear(); }
		};

		// ============================================================================
		// ZipWriter
		// ============================================================================

		/**
		 * @brief Builds a ZIP archive in memory.
		 *
		 * Usage:
		 * @code
		 *   ZipWriter zip;
		 *   zip.AddEntry("[Content_Types].xml", xml);
		 *   std::string bytes;
		 *   zip.Finish(bytes);
		 * @endcode
		 */
		class ZipWriter {
		public:
			/// Largest size representable without ZIP64
			static constexpr uint64_t kMaxEntrySize = 0xFFFFFFFEULL;

			/// Entry count limit of the classic end record
			static constexpr size_t kMaxEntries = 0xFFFF;

			ZipWriter();

			/**
			 * @brief Append an entry.
			 * @return false for an empty or duplicate name, or oversized data
			 */
			[[nodiscard]] bool AddEntry(std::string_view name, std::string_view data, ZipError* err = nullptr);

			/**
			 * @brief Write the central directory and hand over the archive bytes.
			 *
			 * The writer is reset afterwards and can be reused.
			 */
			[[nodiscard]] bool Finish(std::string& out, ZipError* err = nullptr);

			[[nodiscard]] size_t EntryCount() const noexcept { return m_entries.size(); }

		private:
			struct CentralEntry {
				std::string name;
				uint32_t crc = 0;
				uint32_t size = 0;
				uint32_t localHeaderOffset = 0;
			};

			std::string m_buffer;
			std::vector<CentralEntry> m_entries;
			uint16_t m_dosTime = 0;
			uint16_t m_dosDate = 0;
		};

	}  // namespace Utils
}  // namespace WifiSort
