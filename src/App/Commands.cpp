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
#include "Commands.hpp"

#include "../Capture/CaptureReader.hpp"
#include "../Capture/ManufacturerLookup.hpp"
#include "../Classification/Classifier.hpp"
#include "../Classification/PatternSet.hpp"
#include "../Merge/CaptureMerger.hpp"
#include "../Report/ReportBuilder.hpp"
#include "../Report/XlsxWriter.hpp"
#include "../Utils/Logger.hpp"

namespace WifiSort {
    namespace App {

        // ============================================================================
        // wifi-sort
        // ============================================================================

        int RunSort(const Config::SortConfig& cfg, std::ostream& out, std::ostream& err) {
            Config::ConfigError cerr;
            if (!Config::AppConfig::Validate(cfg, &cerr)) {
                err << "Error: " << cerr.message << "\n";
                return 1;
            }

            Classification::PatternFileError perr;
            Classification::PatternSet client;
            if (!Classification::PatternSet::LoadFromFile(cfg.client, client, &perr)) {
                err << "Error: " << perr.message << "\n";
                return 1;
            }

            Classification::PatternSet exclude;
            const bool haveExclude = !cfg.exclude.empty();
            if (haveExclude && !Classification::PatternSet::LoadFromFile(cfg.exclude, exclude, &perr)) {
                err << "Error: " << perr.message << "\n";
                return 1;
            }

            if (client.empty()) {
                err << "Error: Client pattern file is empty\n";
                return 1;
            }

            Capture::ManufacturerLookup manuf;
            if (!cfg.manuf.empty()) {
                Capture::ManufError merr;
                if (!manuf.LoadFromFile(cfg.manuf, &merr)) {
                    err << "Error: " << merr.message << "\n";
                    return 1;
                }
            }

            if (cfg.verbose) {
                out << "Loading Kismet database: " << cfg.input << "\n";
            }

            Capture::DeviceList devices;
            Capture::CaptureError capErr;
            Capture::ReadStatistics stats;
            if (!Capture::CaptureReader::ReadDevices(cfg.input, manuf.empty() ? nullptr : &manuf,
                    devices, &capErr, &stats)) {
                err << "Error: " << capErr.message << "\n";
                return 1;
            }

            if (cfg.verbose) {
                out << "Extracted " << devices.size() << " WiFi devices\n";
            }

            if (devices.empty()) {
                err << "Error: No WiFi devices found in database\n";
                return 1;
            }

            if (cfg.verbose) {
                out << "Using " << client.size() << " client patterns\n";
                if (!exclude.empty()) {
                    out << "Using " << exclude.size() << " exclude patterns\n";
                }
            }

            const auto result = Classification::Classifier::Partition(devices, client,
                haveExclude ? &exclude : nullptr);

            const auto workbook = Report::ReportBuilder::BuildWorkbook(result);
            Report::ReportError rerr;
            if (!Report::XlsxWriter::Write(workbook, cfg.output, &rerr)) {
                err << "Error: Cannot write " << cfg.output << ": " << rerr.message << "\n";
                return 1;
            }
            WS_LOG_INFO("Sort", "Wrote %s", cfg.output.c_str());

            Report::ReportBuilder::PrintSummary(out, result, cfg.output, cfg.verbose);
            return 0;
        }

        // ============================================================================
        // kismet-merge
        // ============================================================================

        int RunMerge(const Config::MergeConfig& cfg, std::ostream& out, std::ostream& err) {
            std::vector<std::string> missing;
            const auto inputs = Merge::CaptureMerger::ResolveInputs(cfg.inputs, cfg.output, missing);
            for (const auto& m : missing) {
                err << "Warning: '" << m << "' not found, skipping\n";
            }

            if (inputs.empty()) {
                err << "Error: Need at least 1 input file\n";
                return 1;
            }

            if (cfg.verbose) {
                out << "Merging " << inputs.size() << " files -> " << cfg.output << "\n\n";
            }

            Merge::CaptureMerger merger;
            for (const auto& input : inputs) {
                if (cfg.verbose) {
                    out << "Reading: " << input << "\n";
                }
                const size_t before = merger.Statistics().rawEntries;

                Capture::CaptureError cerr;
                if (!merger.AddCapture(input, &cerr)) {
                    err << "Error reading " << input << ": " << cerr.message << "\n";
                    continue;
                }
                if (cfg.verbose) {
                    out << "  -> " << (merger.Statistics().rawEntries - before) << " devices\n";
                }
            }

            if (merger.UniqueDevices() == 0) {
                err << "Error: No devices found in input files\n";
                return 1;
            }

            if (cfg.verbose) {
                out << "\nMerging " << merger.Statistics().rawEntries << " total entries -> "
                    << merger.UniqueDevices() << " unique devices\n";
            }

            Capture::CaptureError werr;
            if (!merger.WriteCapture(cfg.output, &werr)) {
                err << "Error writing " << cfg.output << ": " << werr.message << "\n";
                return 1;
            }

            if (cfg.verbose) {
                out << "\nCreated: " << cfg.output << "\n"
                    << "  " << merger.UniqueDevices() << " devices from "
                    << merger.Statistics().filesRead << " files\n";
            }
            out << "\nSuccessfully created: " << cfg.output << "\n";
            return 0;
        }

    }  // namespace App
}  // namespace WifiSort
