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
 * @file options.hpp
 * @brief This file declares RFC 2347 option negotiation.
 */
#pragma once
#ifndef TFTPKIT_OPTIONS_HPP
#define TFTPKIT_OPTIONS_HPP
#include "tftp_protocol.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>
/** @brief For top-level tftpkit services. */
namespace tftpkit {
class data_source;

/** @brief The ranges the server accepts for negotiable options. */
struct option_policy {
  /** @brief Smallest block size the server will use. */
  std::size_t blksize_min = messages::BLKSIZE_MIN;
  /** @brief Largest block size the server will use. */
  std::size_t blksize_max = messages::BLKSIZE_MAX;
  /** @brief Shortest retransmission timeout the server will use. */
  std::chrono::seconds timeout_min{1};
  /** @brief Longest retransmission timeout the server will use. */
  std::chrono::seconds timeout_max{255};

  /** @returns true if the ranges are non-empty and inside the RFC limits. */
  [[nodiscard]] auto valid() const noexcept -> bool;
};

/** @brief The options a session runs with. Fixed after negotiation. */
struct negotiated_options {
  /** @brief Maximum DATA payload. */
  std::size_t block_size = messages::DATALEN;
  /** @brief How long to wait for each reply. */
  std::chrono::seconds timeout{2};
  /** @brief The advertised transfer size, if tsize was negotiated. */
  std::optional<std::uint64_t> transfer_size;
};

/** @brief The outcome of negotiate(). */
struct negotiation {
  /** @brief The options the session will run with. */
  negotiated_options options;
  /** @brief The options to send in the OACK, in request order. */
  std::vector<messages::option> acknowledged;
  /** @brief True if an OACK must be sent before the first DATA block. */
  bool ack_required = false;
};

/**
 * @brief Applies the server policy to the options requested in an RRQ.
 *
 * @details blksize and timeout are clamped into the policy ranges. tsize is
 * answered with the size of the data source, and left out when the size is
 * unknown. Unrecognized options and values that are not decimal numbers are
 * ignored. Option names are matched case-insensitively.
 *
 * @param requested The options from the RRQ.
 * @param default_timeout The timeout to use if none is negotiated.
 * @param policy The server policy.
 * @param source The data source, queried only if tsize was requested.
 * @returns The negotiated options. ack_required is false if nothing was
 * acknowledged, in which case RFC 1350 defaults apply.
 */
auto negotiate(const std::vector<messages::option> &requested,
               std::chrono::seconds default_timeout,
               const option_policy &policy,
               data_source &source) -> negotiation;

} // namespace tftpkit
#endif // TFTPKIT_OPTIONS_HPP
