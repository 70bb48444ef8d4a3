/**
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

// SYSTEM
#include <string>
#include <string_view>

#include <format>

#include <filesystem>

#include <span>

#include <array>
#include <deque>
#include <tuple>
#include <vector>

#include <optional>

#include <algorithm>
#include <ranges>

#include <map>
#include <unordered_map>

#include <memory>

#include <fstream>

#include <chrono>

#include <thread>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stop_token>

#include <exception>

// FMT
#include <fmt/format.h>

// SIGNALS
#include <sigc++/sigc++.h>

// GLIBMM
#include <glibmm.h>

// TOML
#include <toml.hpp>

// CLI11
#include <CLI/CLI.hpp>

// JSON
#include <nlohmann/json.hpp>

// MAGIC ENUM
#include <magic_enum.hpp>

// ZTD
#include <ztd/ztd.hxx>
#include <ztd/ztd_logger.hxx>
