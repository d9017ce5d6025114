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
/*
 * ============================================================================
 * WifiSort Classification - SSID PATTERNS
 * ============================================================================
 *
 * Supported Pattern Types:
 * - Exact SSID            "MyNetwork"
 * - Prefix wildcard       "ssid*"
 * - Suffix wildcard       "*guest"
 * - Contains wildcard     "*xfinity*"  ("*" alone matches any named SSID)
 * - Hidden network        "<empty>"
 *
 * '*' only has wildcard meaning as the first and/or last character.
 * Matching is case-sensitive; only the "<empty>" token is recognised
 * regardless of case.
 *
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace WifiSort {
    namespace Classification {

        // ============================================================================
        // PATTERN KIND
        // ============================================================================

        enum class PatternKind : uint8_t {
            Exact = 0,          // ssid == text
            PrefixWildcard = 1, // ssid starts with text
            SuffixWildcard = 2, // ssid ends with text
            Contains = 3,       // text occurs in ssid
            EmptyMatch = 4      // ssid is empty (hidden network)
        };

        [[nodiscard]] const char* PatternKindToString(PatternKind kind) noexcept;

        /// Token that compiles to PatternKind::EmptyMatch
        inline constexpr std::string_view kEmptySsidToken = "<empty>";

        // ============================================================================
        // PATTERN
        // ============================================================================

        struct Pattern {
            PatternKind kind = PatternKind::Exact;
            std::string text;       // literal part, '*' markers stripped

            [[nodiscard]] bool Matches(std::string_view ssid) const noexcept;

            bool operator==(const Pattern& other) const noexcept {
                return kind == other.kind && text == other.text;
            }
        };

        // ============================================================================
        // PATTERN COMPILER
        // ============================================================================

        class PatternCompiler {
        public:
            // Compile one raw pattern-file line.
            // Returns nullopt for blank lines and '#' comments.
            [[nodiscard]] static std::optional<Pattern> Compile(std::string_view line);

            // True if the (untrimmed) line carries no pattern
            [[nodiscard]] static bool IsIgnorable(std::string_view line) noexcept;
        };

    }  // namespace Classification
}  // namespace WifiSort
