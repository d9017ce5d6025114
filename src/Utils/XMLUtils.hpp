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
//=============================================================================
// XMLUtils.hpp
//
// WifiSort - XML Utility Library
//
// Purpose:
//   Thin, non-throwing wrappers around pugixml used to build and inspect the
//   Office Open XML parts of the spreadsheet report.
//
// Thread Safety:
//   - All functions are thread-safe for distinct Document instances
//   - Concurrent access to the same Document requires external synchronization
//=============================================================================

#ifndef WIFISORT_XMLUTILS_HPP
#define WIFISORT_XMLUTILS_HPP

#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <cstdint>

#include <pugixml.hpp>


namespace WifiSort {
namespace Utils {
namespace XML {

//-----------------------------------------------------------------------------
// Type Aliases
//-----------------------------------------------------------------------------

/// @brief XML document container (wraps pugi::xml_document)
using Document = pugi::xml_document;

/// @brief XML node handle (wraps pugi::xml_node)
using Node = pugi::xml_node;

//-----------------------------------------------------------------------------
// Error Information
//-----------------------------------------------------------------------------

/**
 * @brief Error information structure for XML operations.
 */
struct Error {
    std::string message;           ///< Human-readable error description
    std::filesystem::path path;    ///< File path (if applicable)
    size_t byteOffset = 0;         ///< Byte offset in source (if known)
    size_t line = 0;               ///< 1-based line number (if calculable)
    size_t column = 0;             ///< 1-based column number (if calculable)

    [[nodiscard]] bool hasError() const noexcept { return !message.empty(); }
    void clear() noexcept { message.clear(); path.clear(); byteOffset = line = column = 0; }
};

//-----------------------------------------------------------------------------
// Configuration Options
//-----------------------------------------------------------------------------

struct ParseOptions {
    /// Preserve whitespace in PCDATA sections
    bool preserveWhitespace = false;

    /// Allow XML comments in document
    bool allowComments = true;
};

struct StringifyOptions {
    /// Enable pretty-printing with indentation
    bool pretty = false;

    /// Number of spaces per indentation level (when pretty=true)
    int indentSpaces = 2;
};

//-----------------------------------------------------------------------------
// Functions
//-----------------------------------------------------------------------------

/**
 * @brief Parse UTF-8 XML text into a document.
 *
 * DOCTYPE declarations are not processed.
 *
 * @return true on success; on failure err carries the pugixml description
 *         and the line/column of the offending byte
 */
[[nodiscard]]
bool Parse(std::string_view xmlText, Document& out, Error* err = nullptr,
           const ParseOptions& opt = {}) noexcept;

/**
 * @brief Serialize a node (or a whole document) to UTF-8 text.
 *
 * No declaration is synthesized; use AddDeclaration() on the document.
 */
[[nodiscard]]
bool Stringify(const Node& node, std::string& out,
               const StringifyOptions& opt = {}) noexcept;

/**
 * @brief Prepend <?xml version="1.0" encoding="UTF-8" standalone="yes"?>.
 */
void AddDeclaration(Document& doc);

} // namespace XML
} // namespace Utils
} // namespace WifiSort

#endif // WIFISORT_XMLUTILS_HPP
