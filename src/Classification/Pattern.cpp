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
#include "Pattern.hpp"
#include "../Utils/StringUtils.hpp"

namespace WifiSort {
    namespace Classification {

        using Utils::StringUtils::Trim;
        using Utils::StringUtils::IEquals;

        const char* PatternKindToString(PatternKind kind) noexcept {
            switch (kind) {
            case PatternKind::Exact:          return "Exact";
            case PatternKind::PrefixWildcard: return "Prefix";
            case PatternKind::SuffixWildcard: return "Suffix";
            case PatternKind::Contains:       return "Contains";
            case PatternKind::EmptyMatch:     return "Empty";
            }
            return "Unknown";
        }

        bool Pattern::Matches(std::string_view ssid) const noexcept {
            if (kind == PatternKind::EmptyMatch) {
                return ssid.empty();
            }
            if (ssid.empty()) {
                // Hidden networks only match <empty>
                return false;
            }

            switch (kind) {
            case PatternKind::Exact:
                return ssid == text;
            case PatternKind::PrefixWildcard:
                return ssid.size() >= text.size() && ssid.compare(0, text.size(), text) == 0;
            case PatternKind::SuffixWildcard:
                return ssid.size() >= text.size() &&
                    ssid.compare(ssid.size() - text.size(), text.size(), text) == 0;
            case PatternKind::Contains:
                return ssid.find(text) != std::string_view::npos;
            case PatternKind::EmptyMatch:
                break;
            }
            return false;
        }

        // ============================================================================
        // PATTERN COMPILER
        // ============================================================================

        bool PatternCompiler::IsIgnorable(std::string_view line) noexcept {
            const std::string_view t = Trim(line);
            return t.empty() || t.front() == '#';
        }

        std::optional<Pattern> PatternCompiler::Compile(std::string_view line) {
            const std::string_view t = Trim(line);
            if (t.empty() || t.front() == '#') {
                return std::nullopt;
            }

            Pattern p;
            if (IEquals(t, kEmptySsidToken)) {
                p.kind = PatternKind::EmptyMatch;
                return p;
            }

            const bool leading = t.front() == '*';
            const bool trailing = t.back() == '*';

            if (t.size() == 1 && leading) {
                p.kind = PatternKind::Contains;
            }
            else if (leading && trailing) {
                p.kind = PatternKind::Contains;
                p.text.assign(t.substr(1, t.size() - 2));
            }
            else if (leading) {
                p.kind = PatternKind::SuffixWildcard;
                p.text.assign(t.substr(1));
            }
            else if (trailing) {
                p.kind = PatternKind::PrefixWildcard;
                p.text.assign(t.substr(0, t.size() - 1));
            }
            else {
                p.kind = PatternKind::Exact;
                p.text.assign(t);
            }
            return p;
        }

    }  // namespace Classification
}  // namespace WifiSort
