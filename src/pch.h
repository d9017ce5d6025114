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
 * ============================================================================
 * WifiSort - PRECOMPILED HEADER
 * ============================================================================
 * Includes: Stable STL and the third-party headers every module pulls in.
 * ============================================================================
 */

#ifndef PCH_H
#define PCH_H

#pragma once

// C++20 Standard Library - Core & Containers
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <optional>
#include <cstdint>
#include <algorithm>
#include <iterator>
#include <type_traits>
#include <filesystem>
#include <fstream>
#include <sstream>

// C++20 - Concurrency & Time
#include <atomic>
#include <mutex>
#include <thread>
#include <chrono>

#include <limits>

// Third-party
#include <nlohmann/json.hpp>
#include <SQLiteCpp/SQLiteCpp.h>

#endif // PCH_H
