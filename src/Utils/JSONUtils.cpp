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
#include "JSONUtils.hpp"
#include "FileUtils.hpp"

namespace WifiSort {
	namespace Utils {
		namespace JSON {

			// ============================================================================
			// Internal Helpers
			// ============================================================================

			namespace {

				void fillLineCol(std::string_view text, size_t byteOffset, size_t& line, size_t& col) noexcept {
					line = 1;
					col = 1;
					if (byteOffset > text.size()) byteOffset = text.size();
					for (size_t i = 0; i < byteOffset; ++i) {
						if (text[i] == '\n') {
							++line;
							col = 1;
						}
						else {
							++col;
						}
					}
				}

				void setErr(Error* err, std::string msg, const std::filesystem::path& path = {}) {
					if (!err) return;
					err->message = std::move(msg);
					err->path = path;
				}

				void appendEscapedToken(std::string& out, std::string_view token) {
					out.push_back('/');
					for (char c : token) {
						if (c == '~') out += "~0";
						else if (c == '/') out += "~1";
						else out.push_back(c);
					}
				}

			} // anonymous namespace

			// ============================================================================
			// Parse / Stringify
			// ============================================================================

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				if (err) err->clear();
				out = nullptr;

				bool tooDeep = false;
				const size_t maxDepth = opt.maxDepth;
				Json::parser_callback_t depthGuard =
					[&tooDeep, maxDepth](int depth, Json::parse_event_t, Json&) {
						if (static_cast<size_t>(depth) > maxDepth) {
							tooDeep = true;
							return false;
						}
						return true;
					};

				try {
					Json parsed = Json::parse(jsonText.begin(), jsonText.end(), depthGuard,
						/*allow_exceptions*/ true, /*ignore_comments*/ opt.allowComments);
					if (tooDeep) {
						setErr(err, "JSON nesting exceeds maximum depth");
						return false;
					}
					out = std::move(parsed);
					return true;
				}
				catch (const Json::parse_error& e) {
					if (err) {
						err->message = e.what();
						err->byteOffset = e.byte;
						fillLineCol(jsonText, e.byte > 0 ? e.byte - 1 : 0, err->line, err->column);
					}
					return false;
				}
				catch (const Json::exception& e) {
					setErr(err, e.what());
					return false;
				}
				catch (const std::bad_alloc&) {
					setErr(err, "Out of memory while parsing JSON");
					return false;
				}
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					out = j.dump(opt.pretty ? opt.indentSpaces : -1, ' ', opt.ensureAscii,
						Json::error_handler_t::replace);
					return true;
				}
				catch (const Json::exception&) {
					out.clear();
					return false;
				}
				catch (const std::bad_alloc&) {
					out.clear();
					return false;
				}
			}

			// ============================================================================
			// File I/O
			// ============================================================================

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
			                  const ParseOptions& opt, size_t maxBytes) noexcept {
				if (err) err->clear();
				out = nullptr;

				try {
					std::error_code ec;
					const auto size = std::filesystem::file_size(path, ec);
					if (ec) {
						setErr(err, "Cannot access file: " + ec.message(), path);
						return false;
					}
					if (size > maxBytes) {
						setErr(err, "File exceeds maximum JSON size", path);
						return false;
					}

					std::string text;
					FileUtils::Error ferr;
					if (!FileUtils::ReadAllTextUtf8(path, text, &ferr)) {
						setErr(err, ferr.message, path);
						return false;
					}

					if (!Parse(text, out, err, opt)) {
						if (err) err->path = path;
						return false;
					}
					return true;
				}
				catch (const std::exception& e) {
					setErr(err, e.what(), path);
					return false;
				}
			}

			// ============================================================================
			// Path Helpers
			// ============================================================================

			std::string ToJsonPointer(std::string_view pathLike) noexcept {
				try {
					if (pathLike.empty()) return "/";
					if (pathLike.front() == '/') return std::string(pathLike);

					std::string out;
					out.reserve(pathLike.size() + 8);
					std::string token;

					for (size_t i = 0; i < pathLike.size(); ++i) {
						const char c = pathLike[i];
						if (c == '.') {
							if (!token.empty()) {
								appendEscapedToken(out, token);
								token.clear();
							}
						}
						else if (c == '[') {
							if (!token.empty()) {
								appendEscapedToken(out, token);
								token.clear();
							}
							const size_t close = pathLike.find(']', i + 1);
							if (close == std::string_view::npos) {
								// unterminated bracket: take the rest literally
								token.assign(pathLike.substr(i + 1));
								break;
							}
							appendEscapedToken(out, pathLike.substr(i + 1, close - i - 1));
							i = close;
						}
						else {
							token.push_back(c);
						}
					}
					if (!token.empty()) {
						appendEscapedToken(out, token);
					}
					return out.empty() ? std::string("/") : out;
				}
				catch (const std::bad_alloc&) {
					return std::string();
				}
			}

			const Json* Find(const Json& j, std::string_view pathLike) noexcept {
				try {
					const std::string jp = ToJsonPointer(pathLike);
					if (jp == "/") {
						return &j;
					}
					if (jp.empty()) {
						return nullptr;
					}

					const Json::json_pointer ptr(jp);
					if (!j.contains(ptr)) {
						return nullptr;
					}
					return &j.at(ptr);
				}
				catch (const Json::exception&) {
					return nullptr;
				}
				catch (const std::bad_alloc&) {
					return nullptr;
				}
			}

			bool Contains(const Json& j, std::string_view pathLike) noexcept {
				return Find(j, pathLike) != nullptr;
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace WifiSort
