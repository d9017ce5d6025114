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
#include "FileUtils.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>

#include <glob.h>
#include <unistd.h>

namespace WifiSort {
	namespace Utils {
		namespace FileUtils {

			namespace {

				void setErr(Error* err, std::string msg, const std::filesystem::path& path, int code = 0) {
					if (!err) return;
					err->message = std::move(msg);
					err->path = path;
					err->errnoValue = code;
				}

				void setErr(Error* err, const std::string& what, const std::filesystem::path& path, const std::error_code& ec) {
					setErr(err, what + ": " + ec.message(), path, ec.value());
				}

				std::filesystem::path makeTempSibling(const std::filesystem::path& target) {
					const auto dir = target.parent_path().empty() ? std::filesystem::path(".") : target.parent_path();

					std::random_device rd;
					std::mt19937_64 rng((static_cast<uint64_t>(rd()) << 32) ^
						static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));

					std::ostringstream name;
					name << "." << target.filename().string() << ".tmp_"
						<< std::hex << ::getpid() << "_" << rng();
					return dir / name.str();
				}

			} // anonymous namespace

			bool Exists(const std::filesystem::path& path, Error* err) {
				std::error_code ec;
				const bool ok = std::filesystem::exists(path, ec);
				if (ec) {
					setErr(err, "exists() failed", path, ec);
					return false;
				}
				return ok;
			}

			bool IsRegularFile(const std::filesystem::path& path, Error* err) {
				std::error_code ec;
				const bool ok = std::filesystem::is_regular_file(path, ec);
				if (ec && ec != std::errc::no_such_file_or_directory) {
					setErr(err, "is_regular_file() failed", path, ec);
					return false;
				}
				return ok;
			}

			bool ReadAllBytes(const std::filesystem::path& path, std::string& out, Error* err) {
				out.clear();

				std::error_code ec;
				if (!std::filesystem::is_regular_file(path, ec)) {
					setErr(err, "File not found", path, ENOENT);
					return false;
				}

				const auto size = std::filesystem::file_size(path, ec);
				if (ec) {
					setErr(err, "file_size() failed", path, ec);
					return false;
				}
				if (size > MAX_READ_SIZE) {
					setErr(err, "File too large", path, EFBIG);
					return false;
				}

				std::ifstream in(path, std::ios::in | std::ios::binary);
				if (!in) {
					setErr(err, std::string("Cannot open file: ") + std::strerror(errno), path, errno);
					return false;
				}

				out.resize(static_cast<size_t>(size));
				if (size > 0 && !in.read(out.data(), static_cast<std::streamsize>(size))) {
					out.clear();
					setErr(err, "Read failed", path, EIO);
					return false;
				}
				return true;
			}

			bool ReadAllTextUtf8(const std::filesystem::path& path, std::string& out, Error* err) {
				if (!ReadAllBytes(path, out, err)) {
					return false;
				}
				if (out.size() >= 3 &&
					static_cast<unsigned char>(out[0]) == 0xEF &&
					static_cast<unsigned char>(out[1]) == 0xBB &&
					static_cast<unsigned char>(out[2]) == 0xBF) {
					out.erase(0, 3);
				}
				return true;
			}

			bool ReadAllLines(const std::filesystem::path& path, std::vector<std::string>& out, Error* err) {
				out.clear();

				std::string text;
				if (!ReadAllTextUtf8(path, text, err)) {
					return false;
				}

				size_t start = 0;
				while (start < text.size()) {
					const size_t nl = text.find('\n', start);
					if (nl == std::string::npos) {
						out.emplace_back(text.substr(start));
						break;
					}
					out.emplace_back(text.substr(start, nl - start));
					start = nl + 1;
				}
				return true;
			}

			bool WriteAllBytesAtomic(const std::filesystem::path& path, std::string_view data, Error* err) {
				if (path.empty()) {
					setErr(err, "Empty output path", path, EINVAL);
					return false;
				}

				std::error_code ec;
				if (path.has_parent_path()) {
					std::filesystem::create_directories(path.parent_path(), ec);
					if (ec) {
						setErr(err, "create_directories() failed", path.parent_path(), ec);
						return false;
					}
				}

				const auto tempPath = makeTempSibling(path);
				{
					std::ofstream ofs(tempPath, std::ios::out | std::ios::binary | std::ios::trunc);
					if (!ofs) {
						setErr(err, std::string("Cannot create temporary file: ") + std::strerror(errno), tempPath, errno);
						return false;
					}
					ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
					ofs.flush();
					if (!ofs) {
						ofs.close();
						std::filesystem::remove(tempPath, ec);
						setErr(err, "Write failed", tempPath, EIO);
						return false;
					}
				}

				std::filesystem::rename(tempPath, path, ec);
				if (ec) {
					const std::error_code renameEc = ec;
					std::filesystem::remove(tempPath, ec);
					setErr(err, "rename() failed", path, renameEc);
					return false;
				}

				WS_LOG_DEBUG("FileUtils", "Wrote %zu bytes to %s", data.size(), path.string().c_str());
				return true;
			}

			bool RemoveFile(const std::filesystem::path& path, Error* err) {
				std::error_code ec;
				std::filesystem::remove(path, ec);
				if (ec) {
					setErr(err, "remove() failed", path, ec);
					return false;
				}
				return true;
			}

			void ExpandGlob(const std::string& pattern, std::vector<std::string>& out) {
				glob_t g{};
				const int rc = ::glob(pattern.c_str(), 0, nullptr, &g);
				if (rc == 0) {
					for (size_t i = 0; i < g.gl_pathc; ++i) {
						out.emplace_back(g.gl_pathv[i]);
					}
				}
				else {
					out.push_back(pattern);
				}
				::globfree(&g);
			}

		}//namespace FileUtils
	}//namespace Utils
}//namespace WifiSort
