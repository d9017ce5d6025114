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
/**
 * @file Commands.hpp
 * @brief The wifi-sort and kismet-merge runs behind the two executables.
 *
 * Each command takes its parsed configuration, writes progress and the
 * summary to `out` and every diagnostic to `err`, and returns the process
 * exit code (0 on success, 1 on any failure). Logger setup stays with the
 * executables.
 */

#pragma once

#include "../Config/AppConfig.hpp"

#include <ostream>

namespace WifiSort {
    namespace App {

        /**
         * @brief Classify a capture and write the three-tab workbook.
         *
         * Validates the input files, loads the client, exclude and manuf
         * files, reads the Wi-Fi devices, partitions them and writes
         * cfg.output. Nothing is written when any step fails.
         */
        [[nodiscard]] int RunSort(const Config::SortConfig& cfg, std::ostream& out, std::ostream& err);

        /// @brief Merge the captures named by cfg.inputs into cfg.output
        [[nodiscard]] int RunMerge(const Config::MergeConfig& cfg, std::ostream& out, std::ostream& err);

    }  // namespace App
}  // namespace WifiSort
