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
 * @file error.hpp
 * @brief This file declares the tftpkit error codes.
 */
#pragma once
#ifndef TFTPKIT_ERROR_HPP
#define TFTPKIT_ERROR_HPP
#include <system_error>
#include <type_traits>
/** @brief For top-level tftpkit services. */
namespace tftpkit {
/**
 * @brief Failures that terminate a session or prevent a server from starting.
 * @details Every value except invalid_configuration is contained in the
 * session that raised it.
 */
enum class errc : int {
  /** @brief Framing or parsing failure in the packet codec. */
  malformed_packet = 1,
  /** @brief WRQ, or any operation other than RRQ on a new session. */
  unsupported_operation,
  /** @brief The handler factory could not open a data source. */
  data_source_unavailable,
  /** @brief The data source failed while a transfer was in progress. */
  data_source_read_failure,
  /** @brief The client did not answer within the retry budget. */
  retry_exhausted,
  /** @brief The client aborted the transfer with an ERROR packet. */
  client_error,
  /** @brief The server configuration failed validation. */
  invalid_configuration
};

/** @brief The tftpkit error category. */
auto category() noexcept -> const std::error_category &;

/** @brief Makes errc usable as a std::error_code. */
inline auto make_error_code(errc err) noexcept -> std::error_code
{
  return {static_cast<int>(err), category()};
}
} // namespace tftpkit

template <> struct std::is_error_code_enum<tftpkit::errc> : std::true_type {};

#endif // TFTPKIT_ERROR_HPP
