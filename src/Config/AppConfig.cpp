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
#include "AppConfig.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/JSONUtils.hpp"

#include <getopt.h>

namespace WifiSort {
    namespace Config {

        namespace {

            enum LongOnlyOption {
                OPT_CLIENT = 1000,
                OPT_EXCLUDE,
                OPT_MANUF,
                OPT_CONFIG,
                OPT_LOG_FILE,
                OPT_LOG_LEVEL,
                OPT_LOG_FORMAT,
            };

            /// Flags seen on the command line, applied over the config file
            struct SortOverrides {
                std::optional<std::string> input;
                std::optional<std::string> output;
                std::optional<std::string> client;
                std::optional<std::string> exclude;
                std::optional<std::string> manuf;
                std::optional<std::string> logFile;
                std::optional<Utils::LogLevel> logLevel;
                std::optional<bool> logJson;
                bool verbose = false;
            };

            bool fail(ConfigError* err, std::string message, bool showUsage,
                      const std::filesystem::path& path = {}) {
                if (err) {
                    err->message = std::move(message);
                    err->path = path;
                    err->showUsage = showUsage;
                }
                return false;
            }

            std::string unknownOption(int argc, char* argv[]) {
                if (optopt != 0) {
                    return std::string("Unrecognised option '-") + static_cast<char>(optopt) + "'";
                }
                const int idx = optind - 1;
                if (idx > 0 && idx < argc) {
                    return std::string("Unrecognised option '") + argv[idx] + "'";
                }
                return "Unrecognised option";
            }

            std::string missingArgument(int argc, char* argv[]) {
                const int idx = optind - 1;
                if (idx > 0 && idx < argc) {
                    return std::string("Option '") + argv[idx] + "' requires an argument";
                }
                return "Option requires an argument";
            }

            /// "text" or "json"
            bool parseLogFormat(const std::string& name, bool& json) {
                if (name == "text") { json = false; return true; }
                if (name == "json") { json = true; return true; }
                return false;
            }

            /// Relative paths from a config file are anchored at the file's directory
            void anchorTo(const std::filesystem::path& dir, std::string& value) {
                if (value.empty() || dir.empty()) return;
                const std::filesystem::path p(value);
                if (p.is_relative()) {
                    value = (dir / p).string();
                }
            }

            bool requireFile(const std::string& file, const char* what, ConfigError* err) {
                if (!Utils::FileUtils::IsRegularFile(file)) {
                    return fail(err, std::string(what) + " '" + file + "' not found", false, file);
                }
                return true;
            }

        } // anonymous namespace

        // ============================================================================
        // wifi-sort
        // ============================================================================

        bool AppConfig::ParseSortCommandLine(int argc, char* argv[], SortConfig& out, ConfigError* err) {
            if (err) err->clear();

            static const struct option longOptions[] = {
                { "output",    required_argument, nullptr, 'o' },
                { "client",    required_argument, nullptr, OPT_CLIENT },
                { "exclude",   required_argument, nullptr, OPT_EXCLUDE },
                { "manuf",     required_argument, nullptr, OPT_MANUF },
                { "config",    required_argument, nullptr, OPT_CONFIG },
                { "log-file",  required_argument, nullptr, OPT_LOG_FILE },
                { "log-level", required_argument, nullptr, OPT_LOG_LEVEL },
                { "log-format", required_argument, nullptr, OPT_LOG_FORMAT },
                { "verbose",   no_argument,       nullptr, 'v' },
                { "help",      no_argument,       nullptr, 'h' },
                { nullptr,     0,                 nullptr, 0 }
            };

            SortOverrides cli;
            std::string configFile;

            // glibc: 0 re-initialises the scanner between calls
            optind = 0;
            opterr = 0;

            int r;
            int optionIndex = 0;
            while ((r = getopt_long(argc, argv, ":o:vh", longOptions, &optionIndex)) != -1) {
                switch (r) {
                case 'o':
                    cli.output = optarg;
                    break;
                case OPT_CLIENT:
                    cli.client = optarg;
                    break;
                case OPT_EXCLUDE:
                    cli.exclude = optarg;
                    break;
                case OPT_MANUF:
                    cli.manuf = optarg;
                    break;
                case OPT_CONFIG:
                    configFile = optarg;
                    break;
                case OPT_LOG_FILE:
                    cli.logFile = optarg;
                    break;
                case OPT_LOG_LEVEL: {
                    Utils::LogLevel level;
                    if (!Utils::ParseLogLevel(optarg, level)) {
                        return fail(err, std::string("Unknown log level '") + optarg + "'", true);
                    }
                    cli.logLevel = level;
                    break;
                }
                case OPT_LOG_FORMAT: {
                    bool json = false;
                    if (!parseLogFormat(optarg, json)) {
                        return fail(err, std::string("Unknown log format '") + optarg + "'", true);
                    }
                    cli.logJson = json;
                    break;
                }
                case 'v':
                    cli.verbose = true;
                    break;
                case 'h':
                    out.showHelp = true;
                    return true;
                case ':':
                    return fail(err, missingArgument(argc, argv), true);
                default:
                    return fail(err, unknownOption(argc, argv), true);
                }
            }

            if (optind < argc) {
                cli.input = argv[optind++];
            }
            if (optind < argc) {
                return fail(err, std::string("Unexpected argument '") + argv[optind] + "'", true);
            }

            SortConfig cfg;
            if (!configFile.empty()) {
                if (!LoadConfigFile(configFile, cfg, err)) {
                    return false;
                }
                cfg.configFile = configFile;
            }

            if (cli.input) cfg.input = *cli.input;
            if (cli.output) cfg.output = *cli.output;
            if (cli.client) cfg.client = *cli.client;
            if (cli.exclude) cfg.exclude = *cli.exclude;
            if (cli.manuf) cfg.manuf = *cli.manuf;
            if (cli.logFile) cfg.logFile = *cli.logFile;
            if (cli.logLevel) cfg.logLevel = *cli.logLevel;
            if (cli.logJson) cfg.logJson = *cli.logJson;
            if (cli.verbose) cfg.verbose = true;

            if (cfg.input.empty()) {
                return fail(err, "Missing input capture file", true);
            }
            if (cfg.client.empty()) {
                return fail(err, "Missing required option --client", true);
            }
            if (cfg.output.empty()) {
                cfg.output = kDefaultOutput;
            }

            out = std::move(cfg);
            return true;
        }

        bool AppConfig::LoadConfigFile(const std::filesystem::path& path, SortConfig& inOut, ConfigError* err) {
            namespace JSON = Utils::JSON;

            JSON::Json root;
            JSON::Error jerr;
            if (!JSON::LoadFromFile(path, root, &jerr)) {
                std::string msg = "Cannot load config file '" + path.string() + "': " + jerr.message;
                if (jerr.line != 0) {
                    msg += " (line " + std::to_string(jerr.line) + ")";
                }
                return fail(err, std::move(msg), false, path);
            }
            if (!root.is_object()) {
                return fail(err, "Config file '" + path.string() + "' must contain a JSON object", false, path);
            }

            SortConfig cfg = inOut;
            const std::filesystem::path baseDir = path.parent_path();
            const auto readPath = [&](const char* key, std::string& target) -> bool {
                if (!JSON::Contains(root, key)) return true;
                if (!JSON::Get<std::string>(root, key, target)) {
                    return fail(err, "Config key '" + std::string(key) + "' must be a string", false, path);
                }
                anchorTo(baseDir, target);
                return true;
            };
            const auto readBool = [&](const char* key, bool& target) -> bool {
                if (!JSON::Contains(root, key)) return true;
                const JSON::Json* v = JSON::Find(root, key);
                if (!v || !v->is_boolean()) {
                    return fail(err, "Config key '" + std::string(key) + "' must be a boolean", false, path);
                }
                target = v->get<bool>();
                return true;
            };
            const auto readCount = [&](const char* key, uint64_t& target) -> bool {
                if (!JSON::Contains(root, key)) return true;
                const JSON::Json* v = JSON::Find(root, key);
                if (!v || !v->is_number_unsigned()) {
                    return fail(err, "Config key '" + std::string(key) + "' must be a non-negative integer",
                        false, path);
                }
                target = v->get<uint64_t>();
                return true;
            };

            if (!readPath("output", cfg.output)) return false;
            if (!readPath("client", cfg.client)) return false;
            if (!readPath("exclude", cfg.exclude)) return false;
            if (!readPath("manuf", cfg.manuf)) return false;
            if (!readPath("log.file", cfg.logFile)) return false;
            if (!readBool("verbose", cfg.verbose)) return false;
            if (!readBool("log.async", cfg.logAsync)) return false;
            if (!readBool("log.source_location", cfg.logSourceLocation)) return false;
            if (!readCount("log.max_size", cfg.logMaxSizeBytes)) return false;

            uint64_t maxFiles = cfg.logMaxFiles;
            if (!readCount("log.max_files", maxFiles)) return false;
            if (maxFiles == 0) {
                return fail(err, "Config key 'log.max_files' must be at least 1", false, path);
            }
            cfg.logMaxFiles = static_cast<size_t>(maxFiles);

            if (JSON::Contains(root, "log.level")) {
                std::string name;
                if (!JSON::Get<std::string>(root, "log.level", name) || !Utils::ParseLogLevel(name, cfg.logLevel)) {
                    return fail(err, "Config key 'log.level' must be one of trace, debug, info, warn, error, fatal",
                        false, path);
                }
            }

            if (JSON::Contains(root, "log.format")) {
                std::string name;
                if (!JSON::Get<std::string>(root, "log.format", name) || !parseLogFormat(name, cfg.logJson)) {
                    return fail(err, "Config key 'log.format' must be 'text' or 'json'", false, path);
                }
            }

            inOut = std::move(cfg);
            return true;
        }

        bool AppConfig::Validate(const SortConfig& cfg, ConfigError* err) {
            if (err) err->clear();
            if (!requireFile(cfg.input, "Input file", err)) return false;
            if (!requireFile(cfg.client, "Pattern file", err)) return false;
            if (!cfg.exclude.empty() && !requireFile(cfg.exclude, "Exclude file", err)) return false;
            if (!cfg.manuf.empty() && !requireFile(cfg.manuf, "Manufacturer file", err)) return false;
            return true;
        }

        Utils::LoggerConfig AppConfig::MakeLoggerConfig(const SortConfig& cfg) {
            Utils::LoggerConfig lc{};
            lc.toConsole = true;
            lc.async = cfg.logAsync;
            lc.jsonLines = cfg.logJson;
            lc.includeSrcLocation = cfg.logSourceLocation;
            lc.minimalLevel = cfg.verbose && cfg.logLevel > Utils::LogLevel::Debug
                ? Utils::LogLevel::Debug
                : cfg.logLevel;

            if (!cfg.logFile.empty()) {
                lc.toFile = true;
                lc.filePath = cfg.logFile;
                lc.maxFileSizeBytes = cfg.logMaxSizeBytes;
                lc.maxFileCount = cfg.logMaxFiles;
            }
            return lc;
        }

        std::string AppConfig::SortUsage(const char* program) {
            std::ostringstream os;
            os << "Usage: " << program << " INPUT --client FILE [options]\n"
               << "\n"
               << "Sort the WiFi devices of a Kismet capture into an xlsx report with\n"
               << "the tabs Client-Named, Non-Client-Named and Unknown Devices.\n"
               << "\n"
               << "  INPUT                  Kismet capture (.kismet)\n"
               << "  -o, --output FILE      Output workbook (default: " << kDefaultOutput << ")\n"
               << "      --client FILE      Client SSID patterns (required)\n"
               << "      --exclude FILE     SSID patterns left out of the report\n"
               << "      --manuf FILE       Wireshark manuf file for vendor lookup\n"
               << "      --config FILE      JSON configuration file\n"
               << "      --log-file FILE    Also write the log to FILE\n"
               << "      --log-level LEVEL  trace, debug, info, warn, error or fatal\n"
               << "      --log-format FMT   text or json (one JSON object per line)\n"
               << "  -v, --verbose          Print SSID details\n"
               << "  -h, --help             Show this help\n"
               << "\n"
               << "Pattern files hold one pattern per line. '*' at the start and/or end\n"
               << "is a wildcard, '<empty>' matches hidden networks, '#' starts a comment.\n"
               << "Relative paths inside the --config file are relative to that file.\n";
            return os.str();
        }

        // ============================================================================
        // kismet-merge
        // ============================================================================

        bool AppConfig::ParseMergeCommandLine(int argc, char* argv[], MergeConfig& out, ConfigError* err) {
            if (err) err->clear();

            static const struct option longOptions[] = {
                { "output",  required_argument, nullptr, 'o' },
                { "verbose", no_argument,       nullptr, 'v' },
                { "help",    no_argument,       nullptr, 'h' },
                { nullptr,   0,                 nullptr, 0 }
            };

            MergeConfig cfg;
            optind = 0;
            opterr = 0;

            int r;
            int optionIndex = 0;
            while ((r = getopt_long(argc, argv, ":o:vh", longOptions, &optionIndex)) != -1) {
                switch (r) {
                case 'o':
                    cfg.output = optarg;
                    break;
                case 'v':
                    cfg.verbose = true;
                    break;
                case 'h':
                    out.showHelp = true;
                    return true;
                case ':':
                    return fail(err, missingArgument(argc, argv), true);
                default:
                    return fail(err, unknownOption(argc, argv), true);
                }
            }

            for (int i = optind; i < argc; ++i) {
                cfg.inputs.emplace_back(argv[i]);
            }

            if (cfg.output.empty()) {
                return fail(err, "Missing required option -o/--output", true);
            }
            if (cfg.inputs.empty()) {
                return fail(err, "Need at least 1 input file", true);
            }

            out = std::move(cfg);
            return true;
        }

        std::string AppConfig::MergeUsage(const char* program) {
            std::ostringstream os;
            os << "Usage: " << program << " INPUT... -o OUTPUT [-v]\n"
               << "\n"
               << "Merge Kismet captures into one, de-duplicating devices by MAC.\n"
               << "Inputs may be glob patterns such as 'captures/*.kismet'.\n"
               << "\n"
               << "  -o, --output FILE  Merged capture to create (replaced if present)\n"
               << "  -v, --verbose      Report progress per file\n"
               << "  -h, --help         Show this help\n";
            return os.str();
        }

    }  // namespace Config
}  // namespace WifiSort
