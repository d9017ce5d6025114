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
#include "XlsxWriter.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/XMLUtils.hpp"
#include "../Utils/ZipWriter.hpp"

#include <cmath>
#include <set>

namespace WifiSort {
    namespace Report {

        namespace XML = Utils::XML;

        namespace {

            // ========================================================================
            // Namespaces and content types
            // ========================================================================

            constexpr const char* kNsMain = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
            constexpr const char* kNsRel = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
            constexpr const char* kNsPkgRel = "http://schemas.openxmlformats.org/package/2006/relationships";
            constexpr const char* kNsContentTypes = "http://schemas.openxmlformats.org/package/2006/content-types";

            constexpr const char* kRelOfficeDocument = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
            constexpr const char* kRelWorksheet = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet";
            constexpr const char* kRelStyles = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles";

            constexpr const char* kCtRels = "application/vnd.openxmlformats-package.relationships+xml";
            constexpr const char* kCtXml = "application/xml";
            constexpr const char* kCtWorkbook = "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml";
            constexpr const char* kCtWorksheet = "application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml";
            constexpr const char* kCtStyles = "application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml";

            // cellXfs index of header cells
            constexpr int kHeaderStyleIndex = 1;

            std::string toXmlString(XML::Document& doc) {
                XML::AddDeclaration(doc);
                std::string out;
                if (!XML::Stringify(doc, out)) {
                    return std::string();
                }
                return out;
            }

            void appendRelationship(XML::Node& parent, const std::string& id, const char* type, const std::string& target) {
                XML::Node rel = parent.append_child("Relationship");
                rel.append_attribute("Id") = id.c_str();
                rel.append_attribute("Type") = type;
                rel.append_attribute("Target") = target.c_str();
            }

            std::string sheetPartName(size_t index) {
                return "worksheets/sheet" + std::to_string(index + 1) + ".xml";
            }

            bool hasEdgeWhitespace(const std::string& s) noexcept {
                if (s.empty()) return false;
                const auto isWs = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
                return isWs(s.front()) || isWs(s.back());
            }

            bool validateWorkbook(const Workbook& workbook, ReportError* err) {
                if (workbook.sheets.empty()) {
                    if (err) { err->message = "Workbook has no sheets"; err->context = "validate"; }
                    return false;
                }

                std::set<std::string> names;
                for (const auto& sheet : workbook.sheets) {
                    if (sheet.name.empty() || sheet.name.size() > kMaxSheetNameLength ||
                        sheet.name.find_first_of("[]:*?/\\") != std::string::npos) {
                        if (err) { err->message = "Invalid sheet name '" + sheet.name + "'"; err->context = "validate"; }
                        return false;
                    }
                    if (!names.insert(sheet.name).second) {
                        if (err) { err->message = "Duplicate sheet name '" + sheet.name + "'"; err->context = "validate"; }
                        return false;
                    }
                }
                return true;
            }

        } // anonymous namespace

        // ============================================================================
        // Parts
        // ============================================================================

        std::string XlsxWriter::SanitizeText(const std::string& text) {
            std::string out;
            out.reserve(text.size());
            for (size_t i = 0; i < text.size(); ++i) {
                const auto c = static_cast<unsigned char>(text[i]);
                if (c < 0x20 && c != '\t' && c != '\n' && c != '\r') {
                    continue;
                }
                // U+FFFE and U+FFFF (EF BF BE / EF BF BF) are not XML characters either
                if (c == 0xEF && i + 2 < text.size()
                    && static_cast<unsigned char>(text[i + 1]) == 0xBF
                    && (static_cast<unsigned char>(text[i + 2]) & 0xFE) == 0xBE) {
                    i += 2;
                    continue;
                }
                out.push_back(text[i]);
            }
            return out;
        }

        std::string XlsxWriter::ContentTypesXml(size_t sheetCount) {
            XML::Document doc;
            XML::Node types = doc.append_child("Types");
            types.append_attribute("xmlns") = kNsContentTypes;

            XML::Node rels = types.append_child("Default");
            rels.append_attribute("Extension") = "rels";
            rels.append_attribute("ContentType") = kCtRels;

            XML::Node xml = types.append_child("Default");
            xml.append_attribute("Extension") = "xml";
            xml.append_attribute("ContentType") = kCtXml;

            XML::Node wb = types.append_child("Override");
            wb.append_attribute("PartName") = "/xl/workbook.xml";
            wb.append_attribute("ContentType") = kCtWorkbook;

            for (size_t i = 0; i < sheetCount; ++i) {
                const std::string part = "/xl/" + sheetPartName(i);
                XML::Node ws = types.append_child("Override");
                ws.append_attribute("PartName") = part.c_str();
                ws.append_attribute("ContentType") = kCtWorksheet;
            }

            XML::Node styles = types.append_child("Override");
            styles.append_attribute("PartName") = "/xl/styles.xml";
            styles.append_attribute("ContentType") = kCtStyles;

            return toXmlString(doc);
        }

        std::string XlsxWriter::PackageRelsXml() {
            XML::Document doc;
            XML::Node rels = doc.append_child("Relationships");
            rels.append_attribute("xmlns") = kNsPkgRel;
            appendRelationship(rels, "rId1", kRelOfficeDocument, "xl/workbook.xml");
            return toXmlString(doc);
        }

        std::string XlsxWriter::WorkbookXml(const Workbook& workbook) {
            XML::Document doc;
            XML::Node wb = doc.append_child("workbook");
            wb.append_attribute("xmlns") = kNsMain;
            wb.append_attribute("xmlns:r") = kNsRel;

            XML::Node sheets = wb.append_child("sheets");
            for (size_t i = 0; i < workbook.sheets.size(); ++i) {
                const std::string rid = "rId" + std::to_string(i + 1);
                XML::Node sheet = sheets.append_child("sheet");
                sheet.append_attribute("name") = workbook.sheets[i].name.c_str();
                sheet.append_attribute("sheetId") = static_cast<unsigned int>(i + 1);
                sheet.append_attribute("r:id") = rid.c_str();
            }
            return toXmlString(doc);
        }

        std::string XlsxWriter::WorkbookRelsXml(size_t sheetCount) {
            XML::Document doc;
            XML::Node rels = doc.append_child("Relationships");
            rels.append_attribute("xmlns") = kNsPkgRel;

            for (size_t i = 0; i < sheetCount; ++i) {
                appendRelationship(rels, "rId" + std::to_string(i + 1), kRelWorksheet, sheetPartName(i));
            }
            appendRelationship(rels, "rId" + std::to_string(sheetCount + 1), kRelStyles, "styles.xml");
            return toXmlString(doc);
        }

        std::string XlsxWriter::StylesXml() {
            XML::Document doc;
            XML::Node ss = doc.append_child("styleSheet");
            ss.append_attribute("xmlns") = kNsMain;

            // fonts: 0 default, 1 bold white
            XML::Node fonts = ss.append_child("fonts");
            fonts.append_attribute("count") = 2;
            {
                XML::Node f = fonts.append_child("font");
                f.append_child("sz").append_attribute("val") = 11;
                f.append_child("name").append_attribute("val") = "Calibri";
            }
            {
                XML::Node f = fonts.append_child("font");
                f.append_child("b");
                f.append_child("sz").append_attribute("val") = 11;
                f.append_child("color").append_attribute("rgb") = "FFFFFFFF";
                f.append_child("name").append_attribute("val") = "Calibri";
            }

            // fills: 0 and 1 are reserved by the format, 2 is the header fill
            XML::Node fills = ss.append_child("fills");
            fills.append_attribute("count") = 3;
            fills.append_child("fill").append_child("patternFill").append_attribute("patternType") = "none";
            fills.append_child("fill").append_child("patternFill").append_attribute("patternType") = "gray125";
            {
                const std::string argb = std::string("FF") + kHeaderFillRgb;
                XML::Node pf = fills.append_child("fill").append_child("patternFill");
                pf.append_attribute("patternType") = "solid";
                pf.append_child("fgColor").append_attribute("rgb") = argb.c_str();
                pf.append_child("bgColor").append_attribute("indexed") = 64;
            }

            XML::Node borders = ss.append_child("borders");
            borders.append_attribute("count") = 1;
            {
                XML::Node b = borders.append_child("border");
                b.append_child("left");
                b.append_child("right");
                b.append_child("top");
                b.append_child("bottom");
                b.append_child("diagonal");
            }

            XML::Node styleXfs = ss.append_child("cellStyleXfs");
            styleXfs.append_attribute("count") = 1;
            {
                XML::Node xf = styleXfs.append_child("xf");
                xf.append_attribute("numFmtId") = 0;
                xf.append_attribute("fontId") = 0;
                xf.append_attribute("fillId") = 0;
                xf.append_attribute("borderId") = 0;
            }

            XML::Node cellXfs = ss.append_child("cellXfs");
            cellXfs.append_attribute("count") = 2;
            {
                XML::Node xf = cellXfs.append_child("xf");
                xf.append_attribute("numFmtId") = 0;
                xf.append_attribute("fontId") = 0;
                xf.append_attribute("fillId") = 0;
                xf.append_attribute("borderId") = 0;
                xf.append_attribute("xfId") = 0;
            }
            {
                XML::Node xf = cellXfs.append_child("xf");
                xf.append_attribute("numFmtId") = 0;
                xf.append_attribute("fontId") = 1;
                xf.append_attribute("fillId") = 2;
                xf.append_attribute("borderId") = 0;
                xf.append_attribute("xfId") = 0;
                xf.append_attribute("applyFont") = 1;
                xf.append_attribute("applyFill") = 1;
                xf.append_attribute("applyAlignment") = 1;
                xf.append_child("alignment").append_attribute("horizontal") = "center";
            }

            XML::Node cellStyles = ss.append_child("cellStyles");
            cellStyles.append_attribute("count") = 1;
            {
                XML::Node cs = cellStyles.append_child("cellStyle");
                cs.append_attribute("name") = "Normal";
                cs.append_attribute("xfId") = 0;
                cs.append_attribute("builtinId") = 0;
            }

            return toXmlString(doc);
        }

        std::string XlsxWriter::WorksheetXml(const Sheet& sheet) {
            XML::Document doc;
            XML::Node ws = doc.append_child("worksheet");
            ws.append_attribute("xmlns") = kNsMain;
            ws.append_attribute("xmlns:r") = kNsRel;

            if (!sheet.columnWidths.empty()) {
                XML::Node cols = ws.append_child("cols");
                for (size_t i = 0; i < sheet.columnWidths.size(); ++i) {
                    XML::Node col = cols.append_child("col");
                    col.append_attribute("min") = static_cast<unsigned int>(i + 1);
                    col.append_attribute("max") = static_cast<unsigned int>(i + 1);
                    col.append_attribute("width") = sheet.columnWidths[i];
                    col.append_attribute("customWidth") = 1;
                }
            }

            XML::Node data = ws.append_child("sheetData");
            for (size_t r = 0; r < sheet.rows.size(); ++r) {
                const std::string rowRef = std::to_string(r + 1);
                XML::Node row = data.append_child("row");
                row.append_attribute("r") = rowRef.c_str();

                const Row& cells = sheet.rows[r];
                for (size_t c = 0; c < cells.size(); ++c) {
                    const Cell& cell = cells[c];
                    const bool numeric = cell.type == Cell::Type::Number && std::isfinite(cell.number);
                    if (cell.type == Cell::Type::Empty || (cell.type == Cell::Type::Number && !numeric)) {
                        if (!cell.header) continue;
                    }

                    const std::string ref = ColumnName(c) + rowRef;
                    XML::Node xc = row.append_child("c");
                    xc.append_attribute("r") = ref.c_str();
                    if (cell.header) {
                        xc.append_attribute("s") = kHeaderStyleIndex;
                    }

                    if (numeric) {
                        const std::string value = FormatNumber(cell.number);
                        xc.append_child("v").text().set(value.c_str());
                    }
                    else if (cell.type == Cell::Type::String) {
                        xc.append_attribute("t") = "inlineStr";
                        const std::string text = SanitizeText(cell.text);
                        XML::Node t = xc.append_child("is").append_child("t");
                        if (hasEdgeWhitespace(text)) {
                            t.append_attribute("xml:space") = "preserve";
                        }
                        t.text().set(text.c_str());
                    }
                }
            }

            return toXmlString(doc);
        }

        // ============================================================================
        // Package
        // ============================================================================

        bool XlsxWriter::Serialize(const Workbook& workbook, std::string& outBytes, ReportError* err) {
            outBytes.clear();
            if (!validateWorkbook(workbook, err)) {
                return false;
            }

            const size_t sheetCount = workbook.sheets.size();
            Utils::ZipWriter zip;
            Utils::ZipError zerr;

            const auto add = [&](const std::string& name, const std::string& xml) {
                if (xml.empty()) {
                    zerr.message = "XML serialisation failed";
                    zerr.entryName = name;
                    return false;
                }
                return zip.AddEntry(name, xml, &zerr);
            };

            bool ok = add("[Content_Types].xml", ContentTypesXml(sheetCount))
                && add("_rels/.rels", PackageRelsXml())
                && add("xl/workbook.xml", WorkbookXml(workbook))
                && add("xl/_rels/workbook.xml.rels", WorkbookRelsXml(sheetCount))
                && add("xl/styles.xml", StylesXml());

            for (size_t i = 0; ok && i < sheetCount; ++i) {
                ok = add("xl/" + sheetPartName(i), WorksheetXml(workbook.sheets[i]));
            }

            if (ok) {
                ok = zip.Finish(outBytes, &zerr);
            }

            if (!ok) {
                if (err) {
                    err->message = "Cannot build workbook package: " + zerr.message;
                    err->context = zerr.entryName;
                }
                WS_LOG_ERROR("Report", "Cannot build workbook package (%s): %s",
                    zerr.entryName.c_str(), zerr.message.c_str());
                outBytes.clear();
                return false;
            }
            return true;
        }

        bool XlsxWriter::Write(const Workbook& workbook, const std::filesystem::path& path, ReportError* err) {
            if (err) err->clear();

            std::string bytes;
            if (!Serialize(workbook, bytes, err)) {
                if (err) err->path = path;
                return false;
            }

            Utils::FileUtils::Error ferr;
            if (!Utils::FileUtils::WriteAllBytesAtomic(path, bytes, &ferr)) {
                if (err) {
                    err->message = "Cannot write workbook: " + ferr.message;
                    err->path = path;
                    err->context = "write";
                }
                WS_LOG_ERROR("Report", "Cannot write %s: %s", path.string().c_str(), ferr.message.c_str());
                return false;
            }

            WS_LOG_INFO("Report", "Wrote %zu sheets (%zu bytes) to %s",
                workbook.sheets.size(), bytes.size(), path.string().c_str());
            return true;
        }

    }  // namespace Report
}  // namespace WifiSort
