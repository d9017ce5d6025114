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
 * WifiSort Merge - CAPTURE MERGER
 * ============================================================================
 *
 * Combines several Kismet captures into one, keyed by device MAC.
 * A device seen in more than one capture is merged:
 * - packets.total, packets.data and datasize are summed
 * - first_time keeps the earliest non-zero value, last_time the latest
 * - max_signal keeps the highest value, min_signal the lowest
 * - last_signal comes from the most recently seen copy
 * - location is adopted only when the kept copy has no average location
 *
 * ============================================================================
 */

#pragma once

#include "../Capture/CaptureDatabase.hpp"
#include "../Utils/JSONUtils.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace WifiSort {
    namespace Merge {

        /// Values written to the KISMET metadata table of a merged capture
        inline constexpr const char* kMergedKismetVersion = "merged";
        inline constexpr const char* kMergedBuildUuid = "wifi-sort-merge";
        inline constexpr int kMergedDbVersion = 6;

        struct MergeStatistics {
            size_t filesRead = 0;
            size_t filesFailed = 0;
            size_t rawEntries = 0;          ///< devices read (with MAC), before de-duplication
            size_t skippedNoMac = 0;
            size_t malformed = 0;
        };

        /// @brief Merge `incoming` into `existing` (both Kismet device documents)
        void MergeDeviceJson(Utils::JSON::Json& existing, const Utils::JSON::Json& incoming);

        class CaptureMerger {
        public:
            CaptureMerger() = default;

            /**
             * @brief Read every device of one capture into the merge set.
             *
             * Returns false (err set) when the capture cannot be read; devices
             * gathered from earlier captures are kept.
             */
            [[nodiscard]] bool AddCapture(const std::filesystem::path& path, Capture::CaptureError* err = nullptr);

            /// @brief Add one parsed device document; false if it has no MAC
            bool AddDevice(const Utils::JSON::Json& device);

            /**
             * @brief Write the merged set as a new capture.
             *
             * An existing file at `path` is replaced. The `devices` table, its
             * indexes and the KISMET metadata row are written in one
             * transaction into a temporary file that is renamed into place.
             */
            [[nodiscard]] bool WriteCapture(const std::filesystem::path& path, Capture::CaptureError* err = nullptr) const;

            [[nodiscard]] size_t UniqueDevices() const noexcept { return m_devices.size(); }
            [[nodiscard]] const std::vector<Utils::JSON::Json>& Devices() const noexcept { return m_devices; }
            [[nodiscard]] const MergeStatistics& Statistics() const noexcept { return m_stats; }

            /**
             * @brief Expand glob patterns into the list of inputs to merge.
             *
             * Duplicates are removed (first occurrence wins) as are inputs that
             * resolve to `output`. Patterns matching nothing that do not exist
             * are reported in `missing`.
             */
            [[nodiscard]] static std::vector<std::string> ResolveInputs(
                const std::vector<std::string>& patterns,
                const std::filesystem::path& output,
                std::vector<std::string>& missing
            );

        private:
            std::vector<Utils::JSON::Json> m_devices;           // first-seen order
            std::unordered_map<std::string, size_t> m_index;    // MAC -> m_devices index
            MergeStatistics m_stats;
        };

    }  // namespace Merge
}  // namespace WifiSort
