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

#include "App/Commands.hpp"
#include "Capture/CaptureReader.hpp"
#include "Utils/FileUtils.hpp"
#include "Utils/XMLUtils.hpp"
#include "TestHelpers.hpp"

using namespace WifiSort;
using Testing::CreateCapture;
using Testing::FakeDevice;
using Testing::MakeDeviceJson;
using Testing::ReadStoredZip;
using Testing::TempDir;
using Testing::WriteTextFile;
namespace XML = Utils::XML;

namespace {

    std::string wifi(const std::string& mac, const std::optional<std::string>& ssid) {
        FakeDevice d;
        d.mac = mac;
        d.advertisedSsid = ssid;
        return MakeDeviceJson(d).dump();
    }

    std::string bluetooth(const std::string& mac) {
        FakeDevice d;
        d.mac = mac;
        d.phy = "Bluetooth";
        return MakeDeviceJson(d).dump();
    }

    /// Data rows of one worksheet part (header row included), plus its inline strings
    size_t countRows(const std::string& sheetXml, std::vector<std::string>* texts = nullptr) {
        XML::Document doc;
        XML::Error err;
        EXPECT_TRUE(XML::Parse(sheetXml, doc, &err)) << err.message;
        size_t rows = 0;
        for (auto row : doc.child("worksheet").child("sheetData").children("row")) {
            ++rows;
            if (!texts) continue;
            for (auto c : row.children("c")) {
                const auto t = c.child("is").child("t");
                if (t) texts->emplace_back(t.text().as_string());
            }
        }
        return rows;
    }

    class SortCommand : public ::testing::Test {
    protected:
        void SetUp() override {
            cfg.input = dir.File("capture.kismet").string();
            cfg.client = dir.File("client.txt").string();
            cfg.output = dir.File("report.xlsx").string();
            WriteTextFile(cfg.client, "# client networks\nAcme*\n");
        }

        int run() {
            out.str("");
            err.str("");
            return App::RunSort(cfg, out, err);
        }

        TempDir dir;
        Config::SortConfig cfg;
        std::ostringstream out;
        std::ostringstream err;
    };

}

// ============================================================================
// wifi-sort
// ============================================================================

TEST_F(SortCommand, WritesThreeTabWorkbook) {
    CreateCapture(cfg.input, {
        wifi("00:00:00:00:00:01", std::string("Acme-Guest")),
        wifi("00:00:00:00:00:02", std::string("CoffeeShop")),
        wifi("00:00:00:00:00:03", std::nullopt),
        wifi("00:00:00:00:00:04", std::string("xfinitywifi")),
        wifi("00:00:00:00:00:05", std::string("AcmeCorp")),
        bluetooth("00:00:00:00:00:BB"),
    });
    cfg.exclude = dir.File("exclude.txt").string();
    WriteTextFile(cfg.exclude, "*xfinity*\n");

    ASSERT_EQ(run(), 0) << err.str();
    EXPECT_TRUE(err.str().empty()) << err.str();
    EXPECT_EQ(out.str(),
        "Created " + cfg.output + ":\n"
        "  Client-Named:     2 devices\n"
        "  Non-Client-Named: 1 devices\n"
        "  Unknown Devices:  1 devices\n");

    std::string bytes;
    ASSERT_TRUE(Utils::FileUtils::ReadAllBytes(cfg.output, bytes));
    const auto entries = ReadStoredZip(bytes);
    ASSERT_EQ(entries.count("xl/worksheets/sheet3.xml"), 1u);

    std::vector<std::string> clientTexts;
    EXPECT_EQ(countRows(entries.at("xl/worksheets/sheet1.xml"), &clientTexts), 3u);
    EXPECT_NE(std::find(clientTexts.begin(), clientTexts.end(), "Acme-Guest"), clientTexts.end());
    EXPECT_NE(std::find(clientTexts.begin(), clientTexts.end(), "AcmeCorp"), clientTexts.end());

    std::vector<std::string> otherTexts;
    EXPECT_EQ(countRows(entries.at("xl/worksheets/sheet2.xml"), &otherTexts), 2u);
    EXPECT_NE(std::find(otherTexts.begin(), otherTexts.end(), "CoffeeShop"), otherTexts.end());
    EXPECT_EQ(std::find(otherTexts.begin(), otherTexts.end(), "xfinitywifi"), otherTexts.end());

    EXPECT_EQ(countRows(entries.at("xl/worksheets/sheet3.xml")), 2u);
}

TEST_F(SortCommand, VerboseReportsProgress) {
    CreateCapture(cfg.input, { wifi("00:00:00:00:00:01", std::string("Acme-Guest")) });
    cfg.verbose = true;

    ASSERT_EQ(run(), 0) << err.str();
    const std::string text = out.str();
    EXPECT_NE(text.find("Loading Kismet database: " + cfg.input + "\n"), std::string::npos);
    EXPECT_NE(text.find("Extracted 1 WiFi devices\n"), std::string::npos);
    EXPECT_NE(text.find("Using 1 client patterns\n"), std::string::npos);
    EXPECT_NE(text.find("Client-Named SSIDs:"), std::string::npos);
}

TEST_F(SortCommand, EmptyClientFileFails) {
    CreateCapture(cfg.input, { wifi("00:00:00:00:00:01", std::string("Acme-Guest")) });
    WriteTextFile(cfg.client, "# nothing but comments\n\n");

    EXPECT_EQ(run(), 1);
    EXPECT_EQ(err.str(), "Error: Client pattern file is empty\n");
    EXPECT_FALSE(std::filesystem::exists(cfg.output));
}

TEST_F(SortCommand, CaptureWithoutWifiDevicesFails) {
    CreateCapture(cfg.input, { bluetooth("00:00:00:00:00:BB") });

    EXPECT_EQ(run(), 1);
    EXPECT_EQ(err.str(), "Error: No WiFi devices found in database\n");
    EXPECT_FALSE(std::filesystem::exists(cfg.output));
}

TEST_F(SortCommand, MissingFilesAreReported) {
    EXPECT_EQ(run(), 1);
    EXPECT_EQ(err.str(), "Error: Input file '" + cfg.input + "' not found\n");

    CreateCapture(cfg.input, { wifi("00:00:00:00:00:01", std::string("Acme-Guest")) });
    cfg.exclude = dir.File("exclude.txt").string();
    EXPECT_EQ(run(), 1);
    EXPECT_EQ(err.str(), "Error: Exclude file '" + cfg.exclude + "' not found\n");
    EXPECT_TRUE(out.str().empty());
}

TEST_F(SortCommand, UnreadableCaptureFails) {
    WriteTextFile(cfg.input, "this is not a database");

    EXPECT_EQ(run(), 1);
    EXPECT_EQ(err.str().rfind("Error: ", 0), 0u) << err.str();
    EXPECT_FALSE(std::filesystem::exists(cfg.output));
}

// ============================================================================
// kismet-merge
// ============================================================================

TEST(MergeCommand, MergesAndReportsMissingInputs) {
    TempDir dir;
    const auto first = dir.File("first.kismet");
    const auto second = dir.File("second.kismet");
    CreateCapture(first, { wifi("00:00:00:00:00:01", std::string("Acme")) });
    CreateCapture(second, { wifi("00:00:00:00:00:01", std::string("Acme")),
                            wifi("00:00:00:00:00:02", std::string("Cafe")) });

    Config::MergeConfig cfg;
    cfg.inputs = { first.string(), second.string(), dir.File("absent.kismet").string() };
    cfg.output = dir.File("merged.kismet").string();

    std::ostringstream out;
    std::ostringstream err;
    ASSERT_EQ(App::RunMerge(cfg, out, err), 0) << err.str();
    EXPECT_EQ(err.str(), "Warning: '" + dir.File("absent.kismet").string() + "' not found, skipping\n");
    EXPECT_EQ(out.str(), "\nSuccessfully created: " + cfg.output + "\n");

    Capture::DeviceList devices;
    Capture::CaptureError cerr;
    ASSERT_TRUE(Capture::CaptureReader::ReadDevices(cfg.output, nullptr, devices, &cerr)) << cerr.message;
    EXPECT_EQ(devices.size(), 2u);
}

TEST(MergeCommand, NoUsableInputsFails) {
    TempDir dir;
    Config::MergeConfig cfg;
    cfg.inputs = { dir.File("absent.kismet").string() };
    cfg.output = dir.File("merged.kismet").string();

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(App::RunMerge(cfg, out, err), 1);
    EXPECT_NE(err.str().find("Error: Need at least 1 input file\n"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(cfg.output));
}
