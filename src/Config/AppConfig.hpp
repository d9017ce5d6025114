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
 * ============================================================================
 * WifiSort - APPLICATION CONFIGURATION
 * ============================================================================
 *
 * @file AppConfig.hpp
 * @brief Command line and configuration file handling for wifi-sort and
 *        kismet-merge.
 *
 * Settings are layered:
 *    1. Built-in defaults
 *    2. JSON configuration file (--config FILE)
 *    3. Command-line flags
 *
 * A later layer overrides an earlier one field by field. The resulting
 * value is read once at startup and passed down explicitly.
 *
 * Configuration file example:
 * @code
 *   {
 *     "output": "report.xlsx",
 *     "client": "client.txt",
 *     "exclude": "exclude.txt",
 *     "manuf": "/usr/share/wireshark/manuf",
 *     "verbose": true,
 *     "log": {
 *       "level": "info",
 *       "file": "logs/wifi-sort.log",
 *       "format": "json",
 *       "async": true,
 *       "max_size": 1048576,
 *       "max_files": 3,
 *       "source_location": false
 *     }
 *   }
 * @endcode
 *
 * Relative paths in the file (output, client, exclude, manuf, log.file)
 * are taken relative to the directory holding the configuration file.
 * Paths given on the command line stay relative to the working directory.
 *
 * ============================================================================
 */

#pragma once

#include "../Utils/Logger.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace WifiSort {
    namespace Config {

        inline constexpr const char* kDefaultOutput = "output.xlsx";

        struct ConfigError {
            std::string message;
            std::filesystem::path path;     ///< offending file, if any
            bool showUsage = false;         ///< print usage after the message

            [[nodiscard]] bool hasError() const noexcept { return !message.empty(); }
            void clear() noexcept {
                message.clear();
                path.clear();
                showUsage = false;
            }
        };

        /// @brief Settings of one wifi-sort run
        struct SortConfig {
            std::string input;
            std::string output = kDefaultOutput;
            std::string client;
            std::string exclude;            ///< empty: no exclude set
            std::string manuf;              ///< empty: no OUI lookup
            std::string configFile;
            bool verbose = false;
            Utils::LogLevel logLevel = Utils::LogLevel::Warn;
            std::string logFile;            ///< empty: console only
            bool logJson = false;           ///< JSON Lines instead of text
            bool logAsync = false;
            uint64_t logMaxSizeBytes = 10ULL * 1024ULL * 1024ULL;
            size_t logMaxFiles = 5;
            bool logSourceLocation = false;
            bool showHelp = false;
        };

        /// @brief Settings of one kismet-merge run
        struct MergeConfig {
            std::vector<std::string> inputs;    ///< paths or glob patterns
            std::string output;
            bool verbose = false;
            bool showHelp = false;
        };

        class AppConfig {
        public:
            /**
             * @brief Parse the wifi-sort command line.
             *
             * Loads --config first when given, then applies the remaining
             * flags on top. -h sets showHelp and stops further checks.
             */
            [[nodiscard]] static bool ParseSortCommandLine(int argc, char* argv[], SortConfig& out,
                                                           ConfigError* err = nullptr);

            /// @brief Parse the kismet-merge command line
            [[nodiscard]] static bool ParseMergeCommandLine(int argc, char* argv[], MergeConfig& out,
                                                            ConfigError* err = nullptr);

            /// @brief Apply the keys present in a JSON configuration file to `inOut`
            [[nodiscard]] static bool LoadConfigFile(const std::filesystem::path& path, SortConfig& inOut,
                                                     ConfigError* err = nullptr);

            /**
             * @brief Check that the input capture and pattern files exist.
             *
             * The client file is mandatory; the exclude and manuf files only
             * when set.
             */
            [[nodiscard]] static bool Validate(const SortConfig& cfg, ConfigError* err = nullptr);

            /// @brief Logger settings for a wifi-sort run (console always, file when logFile is set)
            [[nodiscard]] static Utils::LoggerConfig MakeLoggerConfig(const SortConfig& cfg);

            [[nodiscard]] static std::string SortUsage(const char* program);
            [[nodiscard]] static std::string MergeUsage(const char* program);
        };

    }  // namespace Config
}  // namespace WifiSort
