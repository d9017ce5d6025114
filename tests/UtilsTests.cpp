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

#include "Utils/FileUtils.hpp"
#include "Utils/JSONUtils.hpp"
#include "Utils/Logger.hpp"
#include "Utils/StringUtils.hpp"
#include "TestHelpers.hpp"

using namespace WifiSort::Utils;
using WifiSort::Testing::TempDir;
using WifiSort::Testing::WriteTextFile;

// ============================================================================
// FileUtils
// ============================================================================

TEST(FileUtils, AtomicWriteCreatesParentsAndReplaces) {
    TempDir dir;
    const auto path = dir.File("nested") / "deeper" / "data.bin";

    FileUtils::Error err;
    ASSERT_TRUE(FileUtils::WriteAllBytesAtomic(path, std::string("first\0x", 7), &err)) << err.message;
    ASSERT_TRUE(FileUtils::WriteAllBytesAtomic(path, "second", &err)) << err.message;

    std::string bytes;
    ASSERT_TRUE(FileUtils::ReadAllBytes(path, bytes, &err));
    EXPECT_EQ(bytes, "second");
    EXPECT_TRUE(FileUtils::IsRegularFile(path));
    EXPECT_FALSE(FileUtils::IsRegularFile(path.parent_path()));

    size_t files = 0;
    for (const auto& e : std::filesystem::directory_iterator(path.parent_path())) {
        (void)e;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST(FileUtils, ReadAllLinesStripsBomAndKeepsCarriageReturns) {
    TempDir dir;
    const auto path = dir.File("lines.txt");
    WriteTextFile(path, "\xEF\xBB\xBF" "one\r\ntwo\n\nthree");

    std::vector<std::string> lines;
    ASSERT_TRUE(FileUtils::ReadAllLines(path, lines));
    EXPECT_EQ(lines, (std::vector<std::string>{ "one\r", "two", "", "three" }));

    WriteTextFile(path, "only\n");
    ASSERT_TRUE(FileUtils::ReadAllLines(path, lines));
    EXPECT_EQ(lines, (std::vector<std::string>{ "only" }));

    FileUtils::Error err;
    EXPECT_FALSE(FileUtils::ReadAllLines(dir.File("missing.txt"), lines, &err));
    EXPECT_TRUE(err.hasError());
}

TEST(FileUtils, RemoveFileToleratesMissing) {
    TempDir dir;
    const auto path = dir.File("gone.txt");
    WriteTextFile(path, "x");
    EXPECT_TRUE(FileUtils::RemoveFile(path));
    EXPECT_FALSE(FileUtils::Exists(path));
    EXPECT_TRUE(FileUtils::RemoveFile(path));
}

TEST(FileUtils, ExpandGlobSortsMatchesAndKeepsUnmatchedPattern) {
    TempDir dir;
    WriteTextFile(dir.File("b.kismet"), "");
    WriteTextFile(dir.File("a.kismet"), "");
    WriteTextFile(dir.File("notes.txt"), "");

    std::vector<std::string> out;
    FileUtils::ExpandGlob((dir.Path() / "*.kismet").string(), out);
    EXPECT_EQ(out, (std::vector<std::string>{ dir.File("a.kismet").string(), dir.File("b.kismet").string() }));

    out.clear();
    const std::string none = (dir.Path() / "*.pcap").string();
    FileUtils::ExpandGlob(none, out);
    EXPECT_EQ(out, (std::vector<std::string>{ none }));
}

// ============================================================================
// StringUtils
// ============================================================================

TEST(StringUtils, TrimAndCaseInsensitiveCompare) {
    EXPECT_EQ(StringUtils::Trim("  Acme Guest \r\n"), "Acme Guest");
    EXPECT_EQ(StringUtils::Trim(" \t "), "");
    EXPECT_TRUE(StringUtils::IEquals("<EMPTY>", "<empty>"));
    EXPECT_FALSE(StringUtils::IEquals("abc", "abcd"));
}

TEST(StringUtils, SplitKeepsEmptyFieldsAndJoinRestores) {
    const auto parts = StringUtils::Split("00:00:0C\t\tCisco", '\t');
    EXPECT_EQ(parts, (std::vector<std::string>{ "00:00:0C", "", "Cisco" }));
    EXPECT_EQ(StringUtils::Join(parts, "\t"), "00:00:0C\t\tCisco");
    EXPECT_EQ(StringUtils::Split("", ','), (std::vector<std::string>{ "" }));
    EXPECT_EQ(StringUtils::Join({}, ","), "");
}

// ============================================================================
// JSON
// ============================================================================

TEST(JSONUtils, PathsBecomeJsonPointers) {
    EXPECT_EQ(JSON::ToJsonPointer(""), "/");
    EXPECT_EQ(JSON::ToJsonPointer("/already/pointer"), "/already/pointer");
    EXPECT_EQ(JSON::ToJsonPointer("log.level"), "/log/level");
    EXPECT_EQ(JSON::ToJsonPointer("a.b[0].c"), "/a/b/0/c");
    EXPECT_EQ(JSON::ToJsonPointer("x[a/b~c]"), "/x/a~1b~0c");
}

TEST(JSONUtils, TypedGettersFollowDottedKeysViaPointer) {
    JSON::Json j;
    ASSERT_TRUE(JSON::Parse(R"({
        "kismet.device.base.signal": { "kismet.common.signal.max_signal": -40 },
        "log": { "level": "info" },
        "list": [1, 2, 3]
    })", j));

    EXPECT_EQ(JSON::GetOr<int>(j, "/kismet.device.base.signal/kismet.common.signal.max_signal", 0), -40);
    EXPECT_EQ(JSON::GetOr<std::string>(j, "log.level", ""), "info");
    EXPECT_EQ(JSON::GetOr<int>(j, "list[2]", 0), 3);
    EXPECT_EQ(JSON::GetOr<int>(j, "log.level", 7), 7);
    EXPECT_FALSE(JSON::GetOptional<int>(j, "missing.key").has_value());
    EXPECT_TRUE(JSON::Contains(j, "log"));
    EXPECT_FALSE(JSON::Contains(j, "log.file"));
}

TEST(JSONUtils, ParseReportsPosition) {
    JSON::Json j;
    JSON::Error err;
    EXPECT_FALSE(JSON::Parse("{\n  \"a\": ,\n}", j, &err));
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.line, 2u);

    TempDir dir;
    err.clear();
    EXPECT_FALSE(JSON::LoadFromFile(dir.File("absent.json"), j, &err));
    EXPECT_TRUE(err.hasError());
}

// ============================================================================
// Logger
// ============================================================================

TEST(Logger, LevelNames) {
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(ParseLogLevel("DEBUG", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(ParseLogLevel("warning", level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_FALSE(ParseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::Warn);

    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
}

namespace {

    /// Re-points the shared logger at scratch files and restores the test setup afterwards
    class LoggerSinks : public ::testing::Test {
    protected:
        void TearDown() override {
            Logger::Instance().ShutDown();
            LoggerConfig cfg{};
            cfg.toConsole = true;
            cfg.minimalLevel = LogLevel::Error;
            Logger::Instance().Initialize(cfg);
        }

        static LoggerConfig FileOnly(const std::filesystem::path& path) {
            LoggerConfig cfg{};
            cfg.toConsole = false;
            cfg.toFile = true;
            cfg.filePath = path.string();
            cfg.minimalLevel = LogLevel::Warn;
            return cfg;
        }

        static std::vector<std::string> Lines(const std::filesystem::path& path) {
            std::vector<std::string> lines;
            FileUtils::Error err;
            EXPECT_TRUE(FileUtils::ReadAllLines(path, lines, &err)) << err.message;
            return lines;
        }

        TempDir m_dir;
    };

}

TEST_F(LoggerSinks, FileIsWrittenAtTheGivenPath) {
    const auto path = m_dir.File("logs") / "run.txt";
    Logger::Instance().Initialize(FileOnly(path));

    WS_LOG_ERROR("Report", "cannot write %s", "out.xlsx");
    WS_LOG_INFO("Report", "below the threshold");
    Logger::Instance().ShutDown();

    EXPECT_FALSE(std::filesystem::exists(m_dir.File("logs") / "run.log"));
    const auto lines = Lines(path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find(" [ERROR] [Report] cannot write out.xlsx"), std::string::npos);
}

TEST_F(LoggerSinks, AsyncJsonLinesKeepOrderAndEscape) {
    const auto path = m_dir.File("run.jsonl");
    LoggerConfig cfg = FileOnly(path);
    cfg.async = true;
    cfg.jsonLines = true;
    Logger::Instance().Initialize(cfg);

    for (int i = 0; i < 50; ++i) {
        WS_LOG_WARN("Capture", "device %d", i);
    }
    WS_LOG_WARN("Capture", "ssid \"%s\"", "Guest\nNet");
    // ShutDown drains the queue
    Logger::Instance().ShutDown();

    const auto lines = Lines(path);
    ASSERT_EQ(lines.size(), 51u);
    for (int i = 0; i < 50; ++i) {
        JSON::Json j;
        ASSERT_TRUE(JSON::Parse(lines[i], j)) << lines[i];
        EXPECT_EQ(j.value("message", ""), "device " + std::to_string(i));
    }

    JSON::Json last;
    ASSERT_TRUE(JSON::Parse(lines.back(), last)) << lines.back();
    EXPECT_EQ(last.value("level", ""), "WARN");
    EXPECT_EQ(last.value("category", ""), "Capture");
    EXPECT_EQ(last.value("message", ""), "ssid \"Guest\nNet\"");
    EXPECT_FALSE(last.contains("file"));
}

TEST_F(LoggerSinks, SourceLocationIsOptional) {
    const auto path = m_dir.File("loc.jsonl");
    LoggerConfig cfg = FileOnly(path);
    cfg.jsonLines = true;
    cfg.includeSrcLocation = true;
    Logger::Instance().Initialize(cfg);

    WS_LOG_WARN("Config", "located");
    Logger::Instance().ShutDown();

    const auto lines = Lines(path);
    ASSERT_EQ(lines.size(), 1u);
    JSON::Json j;
    ASSERT_TRUE(JSON::Parse(lines[0], j));
    EXPECT_EQ(j.value("file", ""), "UtilsTests.cpp");
    EXPECT_GT(j.value("line", 0), 0);
}

TEST_F(LoggerSinks, RotationKeepsConfiguredFileCount) {
    const auto path = m_dir.File("rot.txt");
    LoggerConfig cfg = FileOnly(path);
    cfg.maxFileSizeBytes = 64;
    cfg.maxFileCount = 3;
    Logger::Instance().Initialize(cfg);

    // Every line is longer than the limit, so each write starts a new file
    const std::string pad(60, 'x');
    for (int i = 1; i <= 5; ++i) {
        WS_LOG_WARN("Rot", "line %d %s", i, pad.c_str());
    }
    Logger::Instance().ShutDown();

    const std::string base = path.string();
    EXPECT_FALSE(std::filesystem::exists(base + ".3"));

    const auto live = Lines(path);
    ASSERT_EQ(live.size(), 1u);
    EXPECT_NE(live[0].find("line 5 "), std::string::npos);

    const auto previous = Lines(base + ".1");
    ASSERT_EQ(previous.size(), 1u);
    EXPECT_NE(previous[0].find("line 4 "), std::string::npos);

    const auto oldest = Lines(base + ".2");
    ASSERT_EQ(oldest.size(), 1u);
    EXPECT_NE(oldest[0].find("line 3 "), std::string::npos);
}
