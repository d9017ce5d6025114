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
#include "PatternSet.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"

namespace WifiSort {
    namespace Classification {

        bool PatternSet::LoadFromFile(const std::filesystem::path& path, PatternSet& out, PatternFileError* err) {
            if (err) err->clear();

            std::vector<std::string> lines;
            Utils::FileUtils::Error ferr;
            if (!Utils::FileUtils::ReadAllLines(path, lines, &ferr)) {
                if (err) {
                    err->message = "Cannot read pattern file: " + ferr.message;
                    err->path = path;
                }
                WS_LOG_ERROR("Patterns", "Cannot read pattern file %s: %s",
                    path.string().c_str(), ferr.message.c_str());
                return false;
            }

            out = FromLines(lines);
            WS_LOG_DEBUG("Patterns", "Loaded %zu patterns from %s (%zu lines)",
                out.size(), path.string().c_str(), lines.size());
            return true;
        }

        PatternSet PatternSet::FromLines(const std::vector<std::string>& lines) {
            std::vector<Pattern> patterns;
            patterns.reserve(lines.size());

            for (const auto& line : lines) {
                if (auto p = PatternCompiler::Compile(line)) {
                    WS_LOG_TRACE("Patterns", "%s pattern '%s'", PatternKindToString(p->kind), p->text.c_str());
                    patterns.push_back(std::move(*p));
                }
            }
            return PatternSet(std::move(patterns));
        }

        bool PatternSet::Matches(std::string_view ssid) const noexcept {
            return std::any_of(m_patterns.begin(), m_patterns.end(),
                [ssid](const Pattern& p) { return p.Matches(ssid); });
        }

    }  // namespace Classification
}  // namespace WifiSort
