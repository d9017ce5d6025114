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

#include "Pattern.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace WifiSort {
    namespace Classification {

        // ============================================================================
        // ERRORS
        // ============================================================================

        struct PatternFileError {
            std::string message;
            std::filesystem::path path;

            [[nodiscard]] bool hasError() const noexcept { return !message.empty(); }
            void clear() noexcept { message.clear(); path.clear(); }
        };

        // ============================================================================
        // PATTERN SET
        // ============================================================================

        /**
         * @brief Ordered, immutable collection of patterns loaded from one file.
         *
         * Order only affects iteration; Matches() is an "any of" test.
         */
        class PatternSet {
        public:
            PatternSet() = default;

            // Load a pattern file. Blank lines and '#' comments are skipped,
            // a UTF-8 BOM is ignored. Fails if the file is missing or unreadable.
            [[nodiscard]] static bool LoadFromFile(
                const std::filesystem::path& path,
                PatternSet& out,
                PatternFileError* err = nullptr
            );

            // Build from in-memory lines (same rules as LoadFromFile)
            [[nodiscard]] static PatternSet FromLines(const std::vector<std::string>& lines);

            // True iff at least one pattern matches ssid
            [[nodiscard]] bool Matches(std::string_view ssid) const noexcept;

            [[nodiscard]] size_t size() const noexcept { return m_patterns.size(); }
            [[nodiscard]] bool empty() const noexcept { return m_patterns.empty(); }

            [[nodiscard]] const std::vector<Pattern>& Patterns() const noexcept { return m_patterns; }
            [[nodiscard]] std::vector<Pattern>::const_iterator begin() const noexcept { return m_patterns.begin(); }
            [[nodiscard]] std::vector<Pattern>::const_iterator end() const noexcept { return m_patterns.end(); }

        private:
            explicit PatternSet(std::vector<Pattern> patterns) noexcept
                : m_patterns(std::move(patterns)) {}

            std::vector<Pattern> m_patterns;
        };

    }  // namespace Classification
}  // namespace WifiSort
