/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * tftpkit is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * tftpkit is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with tftpkit.  If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file endian.hpp
 * @brief This file defines constexpr byte-order helpers for wire fields.
 */
#pragma once
#ifndef TFTPKIT_ENDIAN_HPP
#define TFTPKIT_ENDIAN_HPP
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
/** @brief Defines internal tftpkit implementation details. */
namespace tftpkit::detail {
// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)

/**
 * @brief Reads a big-endian 16-bit field.
 * @param buf At least two bytes, the field starts at buf[0].
 * @returns The field value in host byte order.
 */
constexpr auto load_u16(std::span<const std::byte> buf) noexcept
    -> std::uint16_t
{
  return static_cast<std::uint16_t>(
      (std::to_integer<std::uint16_t>(buf[0]) << 8) |
      std::to_integer<std::uint16_t>(buf[1]));
}

/** @brief Appends a 16-bit field to buf in network byte order. */
inline auto store_u16(std::vector<char> &buf, std::uint16_t value) -> void
{
  buf.push_back(static_cast<char>(value >> 8));
  buf.push_back(static_cast<char>(value & 0xFF));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
} // namespace tftpkit::detail
#endif // TFTPKIT_ENDIAN_HPP
