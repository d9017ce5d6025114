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
#include "DeviceParser.hpp"
#include "../Utils/StringUtils.hpp"

#include <ctime>

namespace WifiSort {
    namespace Capture {

        using Utils::JSON::Json;
        namespace JSON = Utils::JSON;

        namespace {

            // ========================================================================
            // Kismet field paths (JSON Pointers; Kismet keys contain dots)
            // ========================================================================

            constexpr const char* kPhyName = "/kismet.device.base.phyname";
            constexpr const char* kMac = "/kismet.device.base.macaddr";
            constexpr const char* kType = "/kismet.device.base.type";
            constexpr const char* kManuf = "/kismet.device.base.manuf";
            constexpr const char* kFrequency = "/kismet.device.base.frequency";
            constexpr const char* kChannel = "/kismet.device.base.channel";
            constexpr const char* kFirstTime = "/kismet.device.base.first_time";
            constexpr const char* kLastTime = "/kismet.device.base.last_time";
            constexpr const char* kPacketsTotal = "/kismet.device.base.packets.total";
            constexpr const char* kPacketsData = "/kismet.device.base.packets.data";
            constexpr const char* kDataSize = "/kismet.device.base.datasize";

            constexpr const char* kLastSignal = "/kismet.device.base.signal/kismet.common.signal.last_signal";
            constexpr const char* kMinSignal = "/kismet.device.base.signal/kismet.common.signal.min_signal";
            constexpr const char* kMaxSignal = "/kismet.device.base.signal/kismet.common.signal.max_signal";

            constexpr const char* kAvgLon = "/kismet.device.base.location/kismet.common.location.avg_loc/kismet.common.location.geopoint/0";
            constexpr const char* kAvgLat = "/kismet.device.base.location/kismet.common.location.avg_loc/kismet.common.location.geopoint/1";
            constexpr const char* kAvgAlt = "/kismet.device.base.location/kismet.common.location.avg_loc/kismet.common.location.alt";

            constexpr const char* kAdvertisedMap = "/dot11.device/dot11.device.advertised_ssid_map";
            constexpr const char* kProbedMap = "/dot11.device/dot11.device.probed_ssid_map";
            constexpr const char* kAdvertisedSsid = "/dot11.advertisedssid.ssid";
            constexpr const char* kAdvertisedCrypt = "/dot11.advertisedssid.crypt_set";
            constexpr const char* kProbedSsid = "/dot11.probedssid.ssid";

            // crypt_set bits reported in the Encryption column
            struct CryptBit {
                uint64_t mask;
                const char* name;
            };

            constexpr CryptBit kCryptBits[] = {
                { 0x002, "WEP" },
                { 0x004, "WPA" },
                { 0x008, "WPA2" },
                { 0x010, "WPA3" },
                { 0x200, "PSK" },
                { 0x400, "Enterprise" },
            };

            /// SSID maps are arrays in current Kismet, objects keyed by checksum in older releases
            std::vector<const Json*> ssidEntries(const Json& device, const char* mapPath) {
                std::vector<const Json*> entries;
                const Json* map = JSON::Find(device, mapPath);
                if (!map) return entries;

                if (map->is_array() || map->is_object()) {
                    for (const auto& entry : *map) {
                        if (entry.is_object()) {
                            entries.push_back(&entry);
                        }
                    }
                }
                return entries;
            }

            std::string firstNonEmptySsid(const std::vector<const Json*>& entries, const char* ssidPath) {
                for (const Json* entry : entries) {
                    std::string ssid = JSON::GetOr<std::string>(*entry, ssidPath, std::string());
                    if (!ssid.empty()) {
                        return ssid;
                    }
                }
                return std::string();
            }

        } // anonymous namespace

        // ============================================================================
        // Field Helpers
        // ============================================================================

        std::optional<int> DeviceParser::FrequencyToChannel(double frequency) noexcept {
            const double mhz = frequency > 10000.0 ? frequency / 1000.0 : frequency;

            if (mhz >= 2412.0 && mhz <= 2484.0) {
                if (mhz == 2484.0) {
                    return 14;
                }
                return static_cast<int>((mhz - 2407.0) / 5.0);
            }
            if (mhz >= 5170.0 && mhz <= 5825.0) {
                return static_cast<int>((mhz - 5000.0) / 5.0);
            }
            if (mhz >= 5955.0 && mhz <= 7115.0) {
                return static_cast<int>((mhz - 5950.0) / 5.0);
            }
            return std::nullopt;
        }

        std::optional<int> DeviceParser::ParseChannelString(std::string_view channel) noexcept {
            std::string_view head = channel.substr(0, channel.find('-'));
            head = head.substr(0, head.find('W'));
            head = head.substr(0, 3);

            int value = 0;
            bool any = false;
            for (const char c : head) {
                if (c >= '0' && c <= '9') {
                    value = value * 10 + (c - '0');
                    any = true;
                }
            }
            if (!any) {
                return std::nullopt;
            }
            return value;
        }

        std::string DeviceParser::CryptSetToString(uint64_t cryptSet) {
            std::vector<std::string> parts;
            for (const auto& bit : kCryptBits) {
                if (cryptSet & bit.mask) {
                    parts.emplace_back(bit.name);
                }
            }
            if (parts.empty()) {
                return "Open";
            }
            return Utils::StringUtils::Join(parts, "/");
        }

        std::string DeviceParser::FormatTimestamp(int64_t epochSeconds) {
            if (epochSeconds == 0) {
                return std::string();
            }

            const std::time_t t = static_cast<std::time_t>(epochSeconds);
            std::tm tmv{};
            if (!::localtime_r(&t, &tmv)) {
                return std::string();
            }

            char buf[32];
            const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
            return std::string(buf, n);
        }

        // ============================================================================
        // Document Conversion
        // ============================================================================

        ParseStatus DeviceParser::Parse(const Json& device, DeviceRecord& out) {
            if (!device.is_object()) {
                return ParseStatus::Malformed;
            }
            if (JSON::GetOr<std::string>(device, kPhyName, std::string()) != kPhy80211) {
                return ParseStatus::NotWifi;
            }

            DeviceRecord rec;
            rec.mac = JSON::GetOr<std::string>(device, kMac, std::string());
            rec.type = JSON::GetOr<std::string>(device, kType, std::string("Unknown"));
            rec.manufacturer = JSON::GetOr<std::string>(device, kManuf, std::string());

            // SSID: advertised first, then probed
            const auto advertised = ssidEntries(device, kAdvertisedMap);
            rec.ssid = firstNonEmptySsid(advertised, kAdvertisedSsid);
            if (rec.ssid.empty()) {
                rec.ssid = firstNonEmptySsid(ssidEntries(device, kProbedMap), kProbedSsid);
            }

            // Channel from the channel string, falling back to the frequency
            const double frequency = JSON::GetOr<double>(device, kFrequency, 0.0);
            const std::string channelText = JSON::GetOr<std::string>(device, kChannel, std::string());
            if (!channelText.empty()) {
                rec.channel = ParseChannelString(channelText);
            }
            if ((!rec.channel || *rec.channel == 0) && frequency != 0.0) {
                rec.channel = FrequencyToChannel(frequency);
            }
            rec.frequencyMHz = frequency > 10000.0 ? frequency / 1000.0 : frequency;

            rec.rssiLast = JSON::GetOptional<int>(device, kLastSignal);
            rec.rssiMin = JSON::GetOptional<int>(device, kMinSignal);
            rec.rssiMax = JSON::GetOptional<int>(device, kMaxSignal);

            rec.latitude = JSON::GetOptional<double>(device, kAvgLat);
            rec.longitude = JSON::GetOptional<double>(device, kAvgLon);
            rec.altitudeM = JSON::GetOptional<double>(device, kAvgAlt);

            rec.packetsTotal = JSON::GetOr<int64_t>(device, kPacketsTotal, 0);
            rec.packetsData = JSON::GetOr<int64_t>(device, kPacketsData, 0);
            rec.dataSizeBytes = JSON::GetOr<int64_t>(device, kDataSize, 0);

            rec.firstSeen = FormatTimestamp(JSON::GetOr<int64_t>(device, kFirstTime, 0));
            rec.lastSeen = FormatTimestamp(JSON::GetOr<int64_t>(device, kLastTime, 0));

            // Encryption describes the first advertised SSID only
            if (!advertised.empty()) {
                rec.encryption = CryptSetToString(JSON::GetOr<uint64_t>(*advertised.front(), kAdvertisedCrypt, 0));
            }

            out = std::move(rec);
            return ParseStatus::Ok;
        }

        ParseStatus DeviceParser::ParseText(std::string_view deviceJson, DeviceRecord& out, Utils::JSON::Error* err) {
            Json doc;
            if (!JSON::Parse(deviceJson, doc, err)) {
                return ParseStatus::Malformed;
            }
            const ParseStatus status = Parse(doc, out);
            if (status == ParseStatus::Malformed && err && !err->hasError()) {
                err->message = "Device document is not a JSON object";
            }
            return status;
        }

    }  // namespace Capture
}  // namespace WifiSort
