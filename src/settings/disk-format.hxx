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

#pragma once

#include <string>

#include <ztd/ztd.hxx>

// Config file macros for on disk names

// toml11 does not work with std::string_view

/**
 * TOML
 */

// TOML config file
inline constexpr u64 CONFIG_FILE_VERSION{1};
const std::string CONFIG_FILE_FILENAME{"taskfm.toml"};

// TOML config on disk names - TOML sections
const std::string TOML_SECTION_VERSION{"Version"};
const std::string TOML_SECTION_SCHEDULER{"Scheduler"};
// [Pool.<kind>], kind is the lowercase task type name
const std::string TOML_SECTION_POOL{"Pool"};

// TOML config on disk names - TOML section keys
const std::string TOML_KEY_VERSION{"version"};

const std::string TOML_KEY_GRACE_PERIOD{"grace_period_ms"};
const std::string TOML_KEY_RETAIN_FINISHED{"retain_finished"};
const std::string TOML_KEY_RETAIN_SECONDS{"retain_seconds"};
const std::string TOML_KEY_CHUNK_SIZE{"chunk_size"};

const std::string TOML_KEY_CONCURRENCY{"concurrency"};
const std::string TOML_KEY_RETRY_BUDGET{"retry_budget"};
const std::string TOML_KEY_RETRY_DELAY{"retry_delay_ms"};
