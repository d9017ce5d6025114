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
#include"pch.h"
//=============================================================================
// XMLUtils.cpp
//
// WifiSort - XML Utility Library Implementation
//=============================================================================

#include "XMLUtils.hpp"

#include <algorithm>

namespace WifiSort {
namespace Utils {
namespace XML {

//=============================================================================
// Internal Helper Functions
//=============================================================================

/**
 * @brief Calculate line and column numbers from byte offset in UTF-8 text.
 *
 * Handles LF, CRLF and CR-only line endings. UTF-8 continuation bytes do
 * not advance the column.
 */
static inline void fillLineCol(
    std::string_view text,
    size_t byteOffset,
    size_t& line,
    size_t& col
) noexcept {
    line = 1;
    col = 1;

    if (byteOffset > text.size()) {
        byteOffset = text.size();
    }

    for (size_t i = 0; i < byteOffset; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '\n') {
            ++line;
            col = 1;
        }
        else if (c == '\r') {
            if (i + 1 < byteOffset && text[i + 1] == '\n') {
                continue;
            }
            ++line;
            col = 1;
        }
        else if ((c & 0xC0) != 0x80) {
            ++col;
        }
    }
}

static inline void setErr(
    Error* err,
    std::string msg,
    std::string_view text,
    size_t byteOffset
) {
    if (!err) return;
    err->message = std::move(msg);
    err->path.clear();
    err->byteOffset = byteOffset;
    fillLineCol(text, byteOffset, err->line, err->column);
}

/**
 * @brief pugixml writer that appends to a std::string.
 */
struct StringWriter : pugi::xml_writer {
    std::string s;

    void write(const void* data, size_t size) override {
        if (data && size > 0) {
            s.append(static_cast<const char*>(data), size);
        }
    }
};

//=============================================================================
// Public API
//=============================================================================

bool Parse(std::string_view xmlText, Document& out, Error* err, const ParseOptions& opt) noexcept {
    try {
        unsigned int flags = pugi::parse_default | pugi::parse_declaration;

        if (opt.preserveWhitespace) {
            flags |= pugi::parse_ws_pcdata;
        }
        if (!opt.allowComments) {
            flags &= ~pugi::parse_comments;
        }
        flags &= ~pugi::parse_doctype;

        const pugi::xml_parse_result res = out.load_buffer(
            xmlText.data(),
            xmlText.size(),
            flags,
            pugi::encoding_utf8);

        if (!res) {
            setErr(err, res.description(), xmlText, static_cast<size_t>(res.offset));
            return false;
        }
        return true;
    }
    catch (const std::bad_alloc&) {
        setErr(err, "Out of memory while parsing XML", xmlText, 0);
        return false;
    }
}

bool Stringify(const Node& node, std::string& out, const StringifyOptions& opt) noexcept {
    try {
        out.clear();
        StringWriter wr;

        unsigned int fmt = opt.pretty ? pugi::format_indent : pugi::format_raw;
        fmt |= pugi::format_no_declaration;

        std::string indent;
        if (opt.pretty && opt.indentSpaces > 0) {
            indent.assign(static_cast<size_t>(std::clamp(opt.indentSpaces, 0, 16)), ' ');
        }

        node.print(wr, indent.c_str(), fmt, pugi::encoding_utf8);
        out = std::move(wr.s);
        return true;
    }
    catch (const std::bad_alloc&) {
        out.clear();
        return false;
    }
}

void AddDeclaration(Document& doc) {
    Node decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";
    decl.append_attribute("standalone") = "yes";
}

} // namespace XML
} // namespace Utils
} // namespace WifiSort
