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
#include <gtest/gtest.h>

#include "Config/AppConfig.hpp"
#include "TestHelpers.hpp"

using namespace WifiSort::Config;
using WifiSort::Testing::TempDir;
using WifiSort::Testing::WriteTextFile;
using WifiSort::Utils::LogLevel;

namespace {

    /// Owns a writable argv built from string arguments (getopt may permute it)
    class Args {
    public:
        Args(std::initializer_list<std::string> args) : m_storage(args) {
            for (auto& s : m_storage) {
                m_argv.push_back(s.data());
            }
            m_argv.push_back(nullptr);
        }

        int argc() const { return static_cast<int>(m_storage.size()); }
        char** argv() { return m_argv.data(); }

    private:
        std::vector<std::string> m_storage;
        std::vector<char*> m_argv;
    };

}

// ============================================================================
// wifi-sort command line
// ============================================================================

TEST(SortCommandLine, MinimalArgumentsUseDefaults) {
    Args args{ "wifi-sort", "capture.kismet", "--client", "client.txt" };
    SortConfig cfg;
    ConfigError err;
    ASSERT_TRUE(AppConfig::ParseSortCommandLine(args.argc(), args.argv(), cfg, &err)) << err.message;

    EXPECT_EQ(cfg.input, "capture.kismet");
    EXPECT_EQ(cfg.client, "client.txt");
    EXPECT_EQ(cfg.output, "output.xlsx");
    EXPECT_TRUE(cfg.exclude.empty());
    EXPECT_TRUE(cfg.manuf.empty());
    EXPECT_FALSE(cfg.verbose);
    EXPECT_EQ(cfg.logLevel, LogLevel::Warn);
    EXPECT_FALSE(cfg.showHelp);
}

TEST(SortCommandLine, AllOptions) {
    Args args{ "wifi-sort", "-o", "report.xlsx", "--client", "c.txt", "--exclude", "x.txt",
               "--manuf", "manuf", "--log-level", "debug", "--log-file", "run.log", "-v", "in.kismet" };
    SortConfig cfg;
    ConfigError err;
    ASSERT_TRUE(AppConfig::ParseSortCommandLine(args.argc(), args.argv(), cfg, &err)) << err.message;

    EXPECT_EQ(cfg.input, "in.kismet");
    EXPECT_EQ(cfg.output, "report.xlsx");
    EXPECT_EQ(cfg.exclude, "x.txt");
    EXPECT_EQ(cfg.manuf, "manuf");
    EXPECT_EQ(cfg.logLevel, LogLevel::Debug);
    EXPECT_EQ(cfg.logFile, "run.log");
    EXPECT_TRUE(cfg.verbose);
}

TEST(SortCommandLine, MissingArgumentsAreReported) {
    SortConfig cfg;
    ConfigError err;

    Args noClient{ "wifi-sort", "capture.kismet" };
    EXPECT_FALSE(AppConfig::ParseSortCommandLine(noClient.argc(), noClient.argv(), cfg, &err));
    EXPECT_EQ(err.message, "Missing required option --client");
    EXPECT_TRUE(err.showUsage);

    Args noInput{ "wifi-sort", "--client", "c.txt" };
    EXPECT_FALSE(AppConfig::ParseSortCommandLine(noInput.argc(), noInput.argv(), cfg, &err));
    EXPECT_EQ(err.message, "Missing input capture file");

    Args noValue{ "wifi-sort", "capture.kismet", "--client" };
    EXPECT_FALSE(AppConfig::ParseSortCommandLine(noValue.argc(), noValue.argv(), cfg, &err));
    EXPECT_TRUE(err.hasError());
}

TEST(SortCommandLine, RejectsUnknownAndExtraArguments) {
    SortConfig cfg;
    ConfigError err;

    Args unknown{ "wifi-sort", "capture.kismet", "--client", "c.txt", "--bogus" };
    EXPECT_FALSE(AppConfig::ParseSortCommandLine(unknown.argc(), unknown.argv(), cfg, &err));
    EXPECT_NE(err.message.find("--bogus"), std::string::npos);

    Args extra{ "wifi-sort", "one.kismet", "two.kismet", "--client", "c.txt" };
    EXPECT_FALSE(AppConfig::ParseSortCommandLine(extra.argc(), extra.argv(), cfg, &err));
    EXPECT_EQ(err.message, "Unexpected argument 'two.kismet'");

    Args level{ "wifi-sort", "capture.kismet", "--client", "c.txt", "--log-level", "loud" };
    EXPECT_FALSE(AppConfig::ParseSortCommandLine(level.argc(), level.argv(), cfg, &err));
    EXPECT_EQ(err.message, "Unknown log level 'loud'");
}

TEST(SortCommandLine, LogFormatFlag) {
    SortConfig cfg;
    ConfigError err;

    Args json{ "wifi-sort", "capture.kismet", "--client", "c.txt", "--log-format", "json" };
    ASSERT_TRUE(AppConfig::ParseSortCommandLine(json.argc(), json.argv(), cfg, &err)) << err.message;
    EXPECT_TRUE(cfg.logJson);

    Args bad{ "wifi-sort", "capture.kismet", "--client", "c.txt", "--log-format", "xml" };
    EXPECT_FALSE(AppConfig::ParseSortCommandLine(bad.argc(), bad.argv(), cfg, &err));
    EXPECT_EQ(err.message, "Unknown log format 'xml'");
    EXPECT_TRUE(err.showUsage);
}

TEST(SortCommandLine, HelpStopsParsing) {
    Args args{ "wifi-sort", "-h" };
    SortConfig cfg;
    ConfigError err;
    ASSERT_TRUE(AppConfig::ParseSortCommandLine(args.argc(), args.argv(), cfg, &err));
    EXPECT_TRUE(cfg.showHelp);
    EXPECT_NE(AppConfig::SortUsage("wifi-sort").find("--client FILE"), std::string::npos);
}

// ============================================================================
// Configuration file
// ============================================================================

TEST(SortConfigFile, FlagsOverrideFileValues) {
    TempDir dir;
    const auto file = dir.File("wifi-sort.json");
    WriteTextFile(file, R"({
        "output": "from-file.xlsx",
        "client": "file-client.txt",
        "exclude": "file-exclude.txt",
        "verbose": true,
        "log": { "level": "info", "file": "file.log" }
    })");

    Args args{ "wifi-sort", "--config", file.string(), "capture.kismet", "--client", "cli-client.txt" };
    SortConfig cfg;
    ConfigError err;
    ASSERT_TRUE(AppConfig::ParseSortCommandLine(args.argc(), args.argv(), cfg, &err)) << err.message;

    EXPECT_EQ(cfg.client, "cli-client.txt");
    EXPECT_EQ(cfg.output, dir.File("from-file.xlsx").string());
    EXPECT_EQ(cfg.exclude, dir.File("file-exclude.txt").string());
    EXPECT_TRUE(cfg.verbose);
    EXPECT_EQ(cfg.logLevel, LogLevel::Info);
    EXPECT_EQ(cfg.logFile, dir.File("file.log").string());
    EXPECT_EQ(cfg.configFile, file.string());
}

TEST(SortConfigFile, FileCanSupplyClientPatterns) {
    TempDir dir;
    const auto file = dir.File("cfg.json");
    WriteTextFile(file, R"({ "client": "client.txt" })");

    Args args{ "wifi-sort", "capture.kismet", "--config", file.string() };
    SortConfig cfg;
    ASSERT_TRUE(AppConfig::ParseSortCommandLine(args.argc(), args.argv(), cfg));
    EXPECT_EQ(cfg.client, dir.File("client.txt").string());
    // Built-in default output is not read from the file and stays as is
    EXPECT_EQ(cfg.output, "output.xlsx");
}

TEST(SortConfigFile, RelativePathsFollowTheConfigFile) {
    TempDir dir;
    const auto sub = dir.File("profiles");
    std::filesystem::create_directories(sub);
    const auto file = sub / "site.json";
    const std::string manuf = dir.File("manuf").string();
    WriteTextFile(file, R"({
        "client": "client.txt",
        "exclude": "lists/exclude.txt",
        "manuf": ")" + manuf + R"(",
        "log": { "file": "run.txt" }
    })");

    Args args{ "wifi-sort", "capture.kismet", "--config", file.string(), "-o", "out.xlsx" };
    SortConfig cfg;
    ConfigError err;
    ASSERT_TRUE(AppConfig::ParseSortCommandLine(args.argc(), args.argv(), cfg, &err)) << err.message;

    EXPECT_EQ(cfg.client, (sub / "client.txt").string());
    EXPECT_EQ(cfg.exclude, (sub / "lists/exclude.txt").string());
    EXPECT_EQ(cfg.manuf, manuf);
    EXPECT_EQ(cfg.logFile, (sub / "run.txt").string());
    // Command-line paths are not rewritten
    EXPECT_EQ(cfg.output, "out.xlsx");
    EXPECT_EQ(cfg.input, "capture.kismet");
}

TEST(SortConfigFile, LogSettingsAreRead) {
    TempDir dir;
    const auto file = dir.File("log.json");
    WriteTextFile(file, R"({
        "log": {
            "format": "json",
            "async": true,
            "max_size": 4096,
            "max_files": 2,
            "source_location": true
        }
    })");

    SortConfig cfg;
    ConfigError err;
    ASSERT_TRUE(AppConfig::LoadConfigFile(file, cfg, &err)) << err.message;
    EXPECT_TRUE(cfg.logJson);
    EXPECT_TRUE(cfg.logAsync);
    EXPECT_EQ(cfg.logMaxSizeBytes, 4096u);
    EXPECT_EQ(cfg.logMaxFiles, 2u);
    EXPECT_TRUE(cfg.logSourceLocation);
}

TEST(SortConfigFile, BadLogSettingsAreRejected) {
    TempDir dir;
    SortConfig cfg;
    ConfigError err;

    const auto format = dir.File("format.json");
    WriteTextFile(format, R"({ "log": { "format": "xml" } })");
    EXPECT_FALSE(AppConfig::LoadConfigFile(format, cfg, &err));
    EXPECT_EQ(err.message, "Config key 'log.format' must be 'text' or 'json'");

    const auto async = dir.File("async.json");
    WriteTextFile(async, R"({ "log": { "async": 1 } })");
    err.clear();
    EXPECT_FALSE(AppConfig::LoadConfigFile(async, cfg, &err));
    EXPECT_EQ(err.message, "Config key 'log.async' must be a boolean");

    const auto size = dir.File("size.json");
    WriteTextFile(size, R"({ "log": { "max_size": -1 } })");
    err.clear();
    EXPECT_FALSE(AppConfig::LoadConfigFile(size, cfg, &err));
    EXPECT_EQ(err.message, "Config key 'log.max_size' must be a non-negative integer");

    const auto files = dir.File("files.json");
    WriteTextFile(files, R"({ "log": { "max_files": 0 } })");
    err.clear();
    EXPECT_FALSE(AppConfig::LoadConfigFile(files, cfg, &err));
    EXPECT_EQ(err.message, "Config key 'log.max_files' must be at least 1");

    EXPECT_FALSE(cfg.logJson);
    EXPECT_FALSE(cfg.logAsync);
}

// ============================================================================
// Logger settings
// ============================================================================

TEST(SortLoggerConfig, LogFileIsUsedVerbatim) {
    SortConfig cfg;
    cfg.logFile = "logs/run.txt";
    cfg.logJson = true;
    cfg.logAsync = true;
    cfg.logMaxSizeBytes = 2048;
    cfg.logMaxFiles = 3;
    cfg.logSourceLocation = true;

    const auto lc = AppConfig::MakeLoggerConfig(cfg);
    EXPECT_TRUE(lc.toConsole);
    EXPECT_TRUE(lc.toFile);
    EXPECT_EQ(lc.filePath, "logs/run.txt");
    EXPECT_TRUE(lc.jsonLines);
    EXPECT_TRUE(lc.async);
    EXPECT_EQ(lc.maxFileSizeBytes, 2048u);
    EXPECT_EQ(lc.maxFileCount, 3u);
    EXPECT_TRUE(lc.includeSrcLocation);
    EXPECT_EQ(lc.minimalLevel, LogLevel::Warn);
}

TEST(SortLoggerConfig, VerboseLowersLevelToDebug) {
    SortConfig cfg;
    cfg.verbose = true;
    auto lc = AppConfig::MakeLoggerConfig(cfg);
    EXPECT_FALSE(lc.toFile);
    EXPECT_EQ(lc.minimalLevel, LogLevel::Debug);

    cfg.logLevel = LogLevel::Trace;
    lc = AppConfig::MakeLoggerConfig(cfg);
    EXPECT_EQ(lc.minimalLevel, LogLevel::Trace);
}

TEST(SortConfigFile, InvalidFilesAreRejected) {
    TempDir dir;
    SortConfig cfg;
    ConfigError err;

    EXPECT_FALSE(AppConfig::LoadConfigFile(dir.File("absent.json"), cfg, &err));
    EXPECT_TRUE(err.hasError());

    const auto notObject = dir.File("array.json");
    WriteTextFile(notObject, "[1, 2]");
    err.clear();
    EXPECT_FALSE(AppConfig::LoadConfigFile(notObject, cfg, &err));
    EXPECT_EQ(err.path.string(), notObject.string());

    const auto wrongType = dir.File("types.json");
    WriteTextFile(wrongType, R"({ "output": "kept.xlsx", "verbose": "yes" })");
    err.clear();
    EXPECT_FALSE(AppConfig::LoadConfigFile(wrongType, cfg, &err));
    EXPECT_EQ(err.message, "Config key 'verbose' must be a boolean");
    // Nothing is applied from a rejected file
    EXPECT_EQ(cfg.output, "output.xlsx");

    const auto badLevel = dir.File("level.json");
    WriteTextFile(badLevel, R"({ "log": { "level": "chatty" } })");
    EXPECT_FALSE(AppConfig::LoadConfigFile(badLevel, cfg, &err));
}

// ============================================================================
// Validation
// ============================================================================

TEST(SortValidate, ReportsFirstMissingFile) {
    TempDir dir;
    SortConfig cfg;
    cfg.input = dir.File("capture.kismet").string();
    cfg.client = dir.File("client.txt").string();
    ConfigError err;

    EXPECT_FALSE(AppConfig::Validate(cfg, &err));
    EXPECT_EQ(err.message, "Input file '" + cfg.input + "' not found");

    WriteTextFile(cfg.input, "");
    EXPECT_FALSE(AppConfig::Validate(cfg, &err));
    EXPECT_EQ(err.message, "Pattern file '" + cfg.client + "' not found");
    EXPECT_FALSE(err.showUsage);

    WriteTextFile(cfg.client, "Acme*\n");
    EXPECT_TRUE(AppConfig::Validate(cfg, &err));
    EXPECT_FALSE(err.hasError());

    cfg.exclude = dir.File("exclude.txt").string();
    EXPECT_FALSE(AppConfig::Validate(cfg, &err));
    EXPECT_EQ(err.message, "Exclude file '" + cfg.exclude + "' not found");

    cfg.exclude.clear();
    cfg.manuf = dir.Path().string();
    EXPECT_FALSE(AppConfig::Validate(cfg, &err));
    EXPECT_EQ(err.message, "Manufacturer file '" + cfg.manuf + "' not found");
}

// ============================================================================
// kismet-merge command line
// ============================================================================

TEST(MergeCommandLine, CollectsInputs) {
    Args args{ "kismet-merge", "a.kismet", "-o", "merged.kismet", "b.kismet", "caps/*.kismet", "-v" };
    MergeConfig cfg;
    ConfigError err;
    ASSERT_TRUE(AppConfig::ParseMergeCommandLine(args.argc(), args.argv(), cfg, &err)) << err.message;

    EXPECT_EQ(cfg.output, "merged.kismet");
    EXPECT_EQ(cfg.inputs, (std::vector<std::string>{ "a.kismet", "b.kismet", "caps/*.kismet" }));
    EXPECT_TRUE(cfg.verbose);
}

TEST(MergeCommandLine, RequiresOutputAndInputs) {
    MergeConfig cfg;
    ConfigError err;

    Args noOutput{ "kismet-merge", "a.kismet" };
    EXPECT_FALSE(AppConfig::ParseMergeCommandLine(noOutput.argc(), noOutput.argv(), cfg, &err));
    EXPECT_EQ(err.message, "Missing required option -o/--output");

    Args noInputs{ "kismet-merge", "--output", "merged.kismet" };
    EXPECT_FALSE(AppConfig::ParseMergeCommandLine(noInputs.argc(), noInputs.argv(), cfg, &err));
    EXPECT_EQ(err.message, "Need at least 1 input file");

    Args help{ "kismet-merge", "--help" };
    EXPECT_TRUE(AppConfig::ParseMergeCommandLine(help.argc(), help.argv(), cfg, &err));
    EXPECT_TRUE(cfg.showHelp);
}
