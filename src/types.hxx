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

#include <ztd/ztd.hxx>

// clang-format off

// better type names, provided by ztd
// using i8    = int8_t;
// using i16   = int16_t;
// using i32   = int32_t;
// using i64   = int64_t;
//
// using u8    = uint8_t;
// using u16   = uint16_t;
// using u32   = uint32_t;
// using u64   = uint64_t;
//
// using f32   = float;
// using f64   = double;
//
// using usize = size_t;
// using isize = ssize_t;

// ids are handed out from 1 and never reused for the lifetime of the process
using task_id_t = u64;

inline constexpr task_id_t INVALID_TASK = 0; // 0 is unused for sanity reasons

inline constexpr u64 KiB = 1024;
inline constexpr u64 MiB = 1024 * KiB;

bool is_valid_task_id(task_id_t id);

// clang-format on
