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

#include "Merge/CaptureMerger.hpp"
#include "Capture/CaptureDatabase.hpp"
#include "Capture/CaptureReader.hpp"
#include "TestHelpers.hpp"

#include <algorithm>

using namespace WifiSort::Merge;
using namespace WifiSort::Testing;
using WifiSort::Utils::JSON::Json;

namespace {

    constexpr const char* kSignal = "kismet.device.base.signal";
    constexpr const char* kLocation = "kismet.device.base.location";

    int64_t intField(const Json& j, const char* key) {
        return j.at(key).get<int64_t>();
    }

    int signalField(const Json& j, const char* key) {
        return j.at(kSignal).at(key).get<int>();
    }

}

// ============================================================================
// Device merge rules
// ============================================================================

TEST(MergeDeviceJson, SumsCountersAndWidensTimeRange) {
    FakeDevice a;
    a.firstTime = 1000;
    a.lastTime = 2000;
    FakeDevice b;
    b.firstTime = 500;
    b.lastTime = 3000;
    b.packetsTotal = 5;
    b.packetsData = 1;
    b.dataSize = 24;

    Json existing = MakeDeviceJson(a);
    MergeDeviceJson(existing, MakeDeviceJson(b));

    EXPECT_EQ(intField(existing, "kismet.device.base.packets.total"), 15);
    EXPECT_EQ(intField(existing, "kismet.device.base.packets.data"), 5);
    EXPECT_EQ(intField(existing, "kismet.device.base.datasize"), 1024);
    EXPECT_EQ(intField(existing, "kismet.device.base.first_time"), 500);
    EXPECT_EQ(intField(existing, "kismet.device.base.last_time"), 3000);
}

TEST(MergeDeviceJson, ZeroFirstTimeIsIgnored) {
    FakeDevice a;
    a.firstTime = 0;
    FakeDevice b;
    b.firstTime = 1500;

    Json existing = MakeDeviceJson(a);
    MergeDeviceJson(existing, MakeDeviceJson(b));
    EXPECT_EQ(intField(existing, "kismet.device.base.first_time"), 1500);

    FakeDevice c;
    c.firstTime = 0;
    MergeDeviceJson(existing, MakeDeviceJson(c));
    EXPECT_EQ(intField(existing, "kismet.device.base.first_time"), 1500);
}

TEST(MergeDeviceJson, SignalExtremesAndLatestLastSignal) {
    FakeDevice older;
    older.lastTime = 1000;
    older.lastSignal = -60;
    older.minSignal = -80;
    older.maxSignal = -45;

    FakeDevice newer;
    newer.lastTime = 2000;
    newer.lastSignal = -55;
    newer.minSignal = -75;
    newer.maxSignal = -30;

    Json existing = MakeDeviceJson(older);
    MergeDeviceJson(existing, MakeDeviceJson(newer));
    EXPECT_EQ(signalField(existing, "kismet.common.signal.max_signal"), -30);
    EXPECT_EQ(signalField(existing, "kismet.common.signal.min_signal"), -80);
    EXPECT_EQ(signalField(existing, "kismet.common.signal.last_signal"), -55);

    // An older copy does not override last_signal
    FakeDevice stale;
    stale.lastTime = 1500;
    stale.lastSignal = -90;
    stale.minSignal = -95;
    stale.maxSignal = -90;
    MergeDeviceJson(existing, MakeDeviceJson(stale));
    EXPECT_EQ(signalField(existing, "kismet.common.signal.last_signal"), -55);
    EXPECT_EQ(signalField(existing, "kismet.common.signal.min_signal"), -95);
    EXPECT_EQ(signalField(existing, "kismet.common.signal.max_signal"), -30);
}

TEST(MergeDeviceJson, SignalIsCopiedWhenMissing) {
    FakeDevice none;
    none.lastSignal.reset();
    none.minSignal.reset();
    none.maxSignal.reset();

    Json existing = MakeDeviceJson(none);
    MergeDeviceJson(existing, MakeDeviceJson(FakeDevice{}));
    EXPECT_EQ(signalField(existing, "kismet.common.signal.last_signal"), -50);
    EXPECT_EQ(signalField(existing, "kismet.common.signal.max_signal"), -40);
}

TEST(MergeDeviceJson, LocationOnlyFillsGaps) {
    FakeDevice located;
    located.latitude = 51.5;
    located.longitude = -0.125;

    Json existing = MakeDeviceJson(FakeDevice{});
    EXPECT_FALSE(existing.contains(kLocation));
    MergeDeviceJson(existing, MakeDeviceJson(located));
    ASSERT_TRUE(existing.contains(kLocation));

    FakeDevice elsewhere;
    elsewhere.latitude = 40.0;
    elsewhere.longitude = -74.0;
    MergeDeviceJson(existing, MakeDeviceJson(elsewhere));

    const auto& geo = existing[kLocation]["kismet.common.location.avg_loc"]["kismet.common.location.geopoint"];
    EXPECT_DOUBLE_EQ(geo[1].get<double>(), 51.5);
    EXPECT_DOUBLE_EQ(geo[0].get<double>(), -0.125);
}

// ============================================================================
// CaptureMerger
// ============================================================================

TEST(CaptureMerger, DevicesWithoutMacAreSkipped) {
    CaptureMerger merger;
    Json noMac = MakeDeviceJson(FakeDevice{});
    noMac.erase("kismet.device.base.macaddr");

    EXPECT_FALSE(merger.AddDevice(noMac));
    EXPECT_FALSE(merger.AddDevice(Json::array()));
    EXPECT_TRUE(merger.AddDevice(MakeDeviceJson(FakeDevice{})));
    EXPECT_EQ(merger.UniqueDevices(), 1u);
    EXPECT_EQ(merger.Statistics().skippedNoMac, 2u);
    EXPECT_EQ(merger.Statistics().rawEntries, 1u);
}

TEST(CaptureMerger, WriteWithoutDevicesFails) {
    TempDir dir;
    CaptureMerger merger;
    WifiSort::Capture::CaptureError err;
    EXPECT_FALSE(merger.WriteCapture(dir.File("merged.kismet"), &err));
    EXPECT_TRUE(err.hasError());
    EXPECT_FALSE(std::filesystem::exists(dir.File("merged.kismet")));
}

TEST(CaptureMerger, MergesCapturesIntoReadableDatabase) {
    TempDir dir;

    FakeDevice shared;
    shared.mac = "00:00:00:00:00:01";
    shared.advertisedSsid = "Office";
    shared.packetsTotal = 10;
    FakeDevice onlyFirst;
    onlyFirst.mac = "00:00:00:00:00:02";
    onlyFirst.advertisedSsid = "Cafe";
    FakeDevice onlySecond;
    onlySecond.mac = "00:00:00:00:00:03";
    onlySecond.latitude = 10.5;
    onlySecond.longitude = 20.25;

    FakeDevice sharedAgain = shared;
    sharedAgain.packetsTotal = 7;

    const auto first = dir.File("first.kismet");
    const auto second = dir.File("second.kismet");
    CreateCapture(first, { MakeDeviceJson(shared).dump(), MakeDeviceJson(onlyFirst).dump(), std::string("{oops") });
    CreateCapture(second, { MakeDeviceJson(sharedAgain).dump(), MakeDeviceJson(onlySecond).dump() });

    CaptureMerger merger;
    WifiSort::Capture::CaptureError err;
    ASSERT_TRUE(merger.AddCapture(first, &err)) << err.message;
    ASSERT_TRUE(merger.AddCapture(second, &err)) << err.message;
    EXPECT_FALSE(merger.AddCapture(dir.File("missing.kismet"), &err));

    EXPECT_EQ(merger.UniqueDevices(), 3u);
    EXPECT_EQ(merger.Statistics().rawEntries, 4u);
    EXPECT_EQ(merger.Statistics().filesRead, 2u);
    EXPECT_EQ(merger.Statistics().filesFailed, 1u);
    EXPECT_EQ(merger.Statistics().malformed, 1u);

    const auto output = dir.File("merged.kismet");
    WifiSort::Testing::WriteTextFile(output, "stale contents");
    ASSERT_TRUE(merger.WriteCapture(output, &err)) << err.message;
    EXPECT_FALSE(std::filesystem::exists(output.string() + ".partial"));

    WifiSort::Capture::CaptureDatabase db;
    ASSERT_TRUE(db.Open(output, &err)) << err.message;
    EXPECT_EQ(db.DatabaseVersion(), kMergedDbVersion);
    int64_t count = 0;
    ASSERT_TRUE(db.CountDevices(count));
    EXPECT_EQ(count, 3);
    db.Close();

    {
        SQLite::Database raw(output.string(), SQLite::OPEN_READONLY);
        SQLite::Statement meta(raw, "SELECT kismet_version, build_uuid FROM KISMET");
        ASSERT_TRUE(meta.executeStep());
        EXPECT_EQ(meta.getColumn(0).getString(), "merged");
        EXPECT_EQ(meta.getColumn(1).getString(), "wifi-sort-merge");

        SQLite::Statement indexes(raw, "SELECT COUNT(*) FROM sqlite_master WHERE type = 'index' AND tbl_name = 'devices'");
        ASSERT_TRUE(indexes.executeStep());
        EXPECT_EQ(indexes.getColumn(0).getInt(), 6);

        SQLite::Statement row(raw, "SELECT avg_lat, avg_lon, devmac FROM devices WHERE devmac = '00:00:00:00:00:03'");
        ASSERT_TRUE(row.executeStep());
        EXPECT_DOUBLE_EQ(row.getColumn(0).getDouble(), 10.5);
        EXPECT_DOUBLE_EQ(row.getColumn(1).getDouble(), 20.25);
    }

    // The merged capture feeds straight back into the reader
    WifiSort::Capture::DeviceList devices;
    ASSERT_TRUE(WifiSort::Capture::CaptureReader::ReadDevices(output, nullptr, devices, &err)) << err.message;
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].mac, "00:00:00:00:00:01");
    EXPECT_EQ(devices[0].ssid, "Office");
    EXPECT_EQ(devices[0].packetsTotal, 17);
    EXPECT_EQ(devices[1].ssid, "Cafe");
    EXPECT_EQ(devices[2].mac, "00:00:00:00:00:03");
}

TEST(CaptureMerger, ResolveInputsExpandsAndFilters) {
    TempDir dir;
    WriteTextFile(dir.File("a.kismet"), "");
    WriteTextFile(dir.File("b.kismet"), "");
    WriteTextFile(dir.File("out.kismet"), "");

    const std::string a = dir.File("a.kismet").string();
    const std::string b = dir.File("b.kismet").string();
    const std::string glob = (dir.Path() / "*.kismet").string();
    const std::string absent = dir.File("absent.kismet").string();

    std::vector<std::string> missing;
    const auto inputs = CaptureMerger::ResolveInputs({ a, glob, absent }, dir.File("out.kismet"), missing);

    EXPECT_EQ(inputs, (std::vector<std::string>{ a, b }));
    EXPECT_EQ(missing, (std::vector<std::string>{ absent }));
}
