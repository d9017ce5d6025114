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
 * kismet-merge: combine several Kismet captures into one, de-duplicating
 * devices by MAC address.
 */
#include "pch.h"

#include "Commands.hpp"
#include "../Config/AppConfig.hpp"
#include "../Utils/Logger.hpp"

using namespace WifiSort;

int main(int argc, char* argv[]) {
    const char* program = argc > 0 ? argv[0] : "kismet-merge";

    Config::MergeConfig cfg;
    Config::ConfigError err;
    if (!Config::AppConfig::ParseMergeCommandLine(argc, argv, cfg, &err)) {
        std::cerr << "Error: " << err.message << "\n";
        if (err.showUsage) {
            std::cerr << "\n" << Config::AppConfig::MergeUsage(program);
        }
        return 1;
    }
    if (cfg.showHelp) {
        std::cout << Config::AppConfig::MergeUsage(program);
        return 0;
    }

    Utils::LoggerConfig lc{};
    lc.toConsole = true;
    lc.minimalLevel = cfg.verbose ? Utils::LogLevel::Debug : Utils::LogLevel::Warn;
    try {
        Utils::Logger::Instance().Initialize(lc);
    }
    catch (const std::exception& ex) {
        std::cerr << "[FATAL] Logger exception: " << ex.what() << "\n";
        return 1;
    }

    int rc = 1;
    try {
        rc = App::RunMerge(cfg, std::cout, std::cerr);
    }
    catch (const std::bad_alloc&) {
        std::cerr << "Error: out of memory\n";
    }
    catch (const std::exception& ex) {
        WS_LOG_FATAL("Main", "Unhandled exception: %s", ex.what());
        std::cerr << "Error: " << ex.what() << "\n";
    }

    Utils::Logger::Instance().ShutDown();
    return rc;
}
