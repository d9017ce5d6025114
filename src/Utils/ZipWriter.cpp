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
#include "ZipWriter.hpp"

#include <ctime>

namespace WifiSort {
	namespace Utils {

		namespace {

			// PKZIP record signatures
			constexpr uint32_t kLocalHeaderSig = 0x04034B50;
			constexpr uint32_t kCentralHeaderSig = 0x02014B50;
			constexpr uint32_t kEndOfCentralSig = 0x06054B50;

			constexpr uint16_t kVersionNeeded = 20;       // 2.0
			constexpr uint16_t kVersionMadeBy = 0x0314;   // UNIX, 2.0
			constexpr uint16_t kFlagUtf8Names = 0x0800;
			constexpr uint16_t kMethodStored = 0;

			void putU16(std::string& out, uint16_t v) {
				out.push_back(static_cast<char>(v & 0xFF));
				out.push_back(static_cast<char>((v >> 8) & 0xFF));
			}

			void putU32(std::string& out, uint32_t v) {
				out.push_back(static_cast<char>(v & 0xFF));
				out.push_back(static_cast<char>((v >> 8) & 0xFF));
				out.push_back(static_cast<char>((v >> 16) & 0xFF));
				out.push_back(static_cast<char>((v >> 24) & 0xFF));
			}

			void setErr(ZipError* err, std::string msg, std::string_view entry = {}) {
				if (!err) return;
				err->message = std::move(msg);
				err->entryName.assign(entry);
			}

		} // anonymous namespace

		uint32_t ComputeCRC32(std::string_view data) noexcept {
			uint32_t crc = 0xFFFFFFFFu;
			for (const char ch : data) {
				crc = Detail::CRC32_TABLE[(crc ^ static_cast<uint8_t>(ch)) & 0xFF] ^ (crc >> 8);
			}
			return crc ^ 0xFFFFFFFFu;
		}

		ZipWriter::ZipWriter() {
			// MS-DOS timestamp of construction, local time
			const std::time_t now = std::time(nullptr);
			std::tm tmv{};
			::localtime_r(&now, &tmv);

			const int year = std::max(tmv.tm_year + 1900, 1980);
			m_dosTime = static_cast<uint16_t>((tmv.tm_hour << 11) | (tmv.tm_min << 5) | (tmv.tm_sec / 2));
			m_dosDate = static_cast<uint16_t>(((year - 1980) << 9) | ((tmv.tm_mon + 1) << 5) | tmv.tm_mday);
		}

		bool ZipWriter::AddEntry(std::string_view name, std::string_view data, ZipError* err) {
			if (name.empty() || name.size() > 0xFFFF) {
				setErr(err, "Invalid entry name length", name);
				return false;
			}
			if (data.size() > kMaxEntrySize) {
				setErr(err, "Entry exceeds 4GB", name);
				return false;
			}
			if (m_entries.size() >= kMaxEntries) {
				setErr(err, "Too many entries", name);
				return false;
			}
			for (const auto& e : m_entries) {
				if (e.name == name) {
					setErr(err, "Duplicate entry", name);
					return false;
				}
			}

			const uint64_t offset = m_buffer.size();
			if (offset + 30 + name.size() + data.size() > kMaxEntrySize) {
				setErr(err, "Archive exceeds 4GB", name);
				return false;
			}

			CentralEntry entry;
			entry.name.assign(name);
			entry.crc = ComputeCRC32(data);
			entry.size = static_cast<uint32_t>(data.size());
			entry.localHeaderOffset = static_cast<uint32_t>(offset);

			putU32(m_buffer, kLocalHeaderSig);
			putU16(m_buffer, kVersionNeeded);
			putU16(m_buffer, kFlagUtf8Names);
			putU16(m_buffer, kMethodStored);
			putU16(m_buffer, m_dosTime);
			putU16(m_buffer, m_dosDate);
			putU32(m_buffer, entry.crc);
			putU32(m_buffer, entry.size);     // compressed
			putU32(m_buffer, entry.size);     // uncompressed
			putU16(m_buffer, static_cast<uint16_t>(name.size()));
			putU16(m_buffer, 0);              // extra field length
			m_buffer.append(name);
			m_buffer.append(data);

			m_entries.push_back(std::move(entry));
			return true;
		}

		bool ZipWriter::Finish(std::string& out, ZipError* err) {
			if (m_entries.empty()) {
				setErr(err, "Archive has no entries");
				return false;
			}

			const uint64_t cdOffset = m_buffer.size();
			for (const auto& e : m_entries) {
				putU32(m_buffer, kCentralHeaderSig);
				putU16(m_buffer, kVersionMadeBy);
				putU16(m_buffer, kVersionNeeded);
				putU16(m_buffer, kFlagUtf8Names);
				putU16(m_buffer, kMethodStored);
				putU16(m_buffer, m_dosTime);
				putU16(m_buffer, m_dosDate);
				putU32(m_buffer, e.crc);
				putU32(m_buffer, e.size);
				putU32(m_buffer, e.size);
				putU16(m_buffer, static_cast<uint16_t>(e.name.size()));
				putU16(m_buffer, 0);          // extra field length
				putU16(m_buffer, 0);          // comment length
				putU16(m_buffer, 0);          // disk number start
				putU16(m_buffer, 0);          // internal attributes
				putU32(m_buffer, 0100644u << 16); // external attributes: regular file, rw-r--r--
				putU32(m_buffer, e.localHeaderOffset);
				m_buffer.append(e.name);
			}
			const uint64_t cdSize = m_buffer.size() - cdOffset;

			if (cdOffset + cdSize > kMaxEntrySize) {
				setErr(err, "Archive exceeds 4GB");
				return false;
			}

			putU32(m_buffer, kEndOfCentralSig);
			putU16(m_buffer, 0);              // this disk
			putU16(m_buffer, 0);              // disk with central directory
			putU16(m_buffer, static_cast<uint16_t>(m_entries.size()));
			putU16(m_buffer, static_cast<uint16_t>(m_entries.size()));
			putU32(m_buffer, static_cast<uint32_t>(cdSize));
			putU32(m_buffer, static_cast<uint32_t>(cdOffset));
			putU16(m_buffer, 0);              // comment length

			out = std::move(m_buffer);
			m_buffer.clear();
			m_entries.clear();
			return true;
		}

	}  // namespace Utils
}  // namespace WifiSort
