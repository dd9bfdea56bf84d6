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
 * @file tftp_session.hpp
 * @brief This file declares the TFTP read session.
 */
#pragma once
#ifndef TFTPKIT_SESSION_HPP
#define TFTPKIT_SESSION_HPP
#include "options.hpp"
#include "tftp_protocol.hpp"
#include "tftpkit/data_source.hpp"
#include "tftpkit/statistics.hpp"
#include "tftpkit/transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
/** @brief For top-level tftpkit services. */
namespace tftpkit {

/** @brief What a handler factory knows about a new request. */
struct request_context {
  /** @brief The address the request was received on. */
  endpoint server_addr;
  /** @brief The client. */
  endpoint peer;
  /** @brief The decoded RRQ. */
  const messages::request &request;
};

/**
 * @brief Opens the data source for a request.
 *
 * @details Runs on the session's thread. Returns nullptr and sets the error
 * code if the request can't be served. std::errc::no_such_file_or_directory
 * is reported as "File not found." and std::errc::permission_denied as
 * "Access violation."; anything else is reported with the error message.
 */
using handler_factory = std::function<std::unique_ptr<data_source>(
    const request_context &, std::error_code &)>;

// NOLINTNEXTLINE(performance-enum-size)
/** @brief Session states. The last three are terminal. */
enum class session_state : std::uint8_t {
  AWAIT_REQUEST,
  NEGOTIATING,
  TRANSFERRING,
  COMPLETE,
  ERROR,
  TIMED_OUT
};

/** @returns The name of the state. */
auto to_string(session_state state) noexcept -> std::string_view;

/** @brief The record handed to the session stats callback. */
struct session_stats {
  /** @brief The clock used for the session duration. */
  using clock = std::chrono::steady_clock;

  /** @brief The address the request was received on. */
  endpoint server_addr;
  /** @brief The client. */
  endpoint peer;
  /** @brief The requested file. */
  std::string file_path;
  /** @brief The requested mode as sent by the client. */
  std::string mode;
  /** @brief The options in the RRQ. */
  std::vector<messages::option> options_in;
  /** @brief The options in the OACK. */
  std::vector<messages::option> options_acked;
  /** @brief The negotiated block size. */
  std::size_t blksize = messages::DATALEN;
  /** @brief When the session started. */
  clock::time_point start_time{clock::now()};
  /** @brief When the session reached a terminal state. */
  clock::time_point end_time{start_time};
  /** @brief OACK and DATA packets sent, retransmissions included. */
  std::uint64_t packets_sent = 0;
  /** @brief Expected ACKs received. */
  std::uint64_t packets_acked = 0;
  /** @brief DATA payload bytes sent, retransmissions included. */
  std::uint64_t bytes_sent = 0;
  /** @brief Retransmitted packets. */
  std::uint64_t retransmits = 0;
  /** @brief The terminal state. */
  session_state outcome = session_state::AWAIT_REQUEST;
  /** @brief The TFTP error code sent or received. */
  std::uint16_t error_code = messages::NOT_DEFINED;
  /** @brief The TFTP error message sent or received, empty on success. */
  std::string error_message;
  /** @brief Why the session failed. */
  std::error_code reason;

  /** @returns The session duration. */
  [[nodiscard]] auto duration() const noexcept -> std::chrono::milliseconds;
};

/** @brief Receives one record per terminated session. */
using session_stats_callback = std::function<void(const session_stats &)>;

/** @brief The per-session settings. */
struct session_config {
  /** @brief Retransmissions of one packet before giving up. */
  std::uint32_t retries = 5;
  /** @brief The timeout used unless the client negotiates one. */
  std::chrono::seconds timeout{2};
  /** @brief The option ranges. */
  option_policy policy;
  /** @brief Opens data sources. */
  handler_factory factory;
  /** @brief Invoked once per session, may be empty. */
  session_stats_callback stats_callback;
};

/**
 * @brief Serves one read request.
 *
 * @details A session is driven to completion by a single call to run(), on
 * the thread of the caller. All of its I/O goes through the transport it was
 * constructed with, and every wait has a deadline. The session owns its data
 * source and closes it before run() returns.
 */
class session {
public:
  /** @brief The session clock. */
  using clock = transport::clock;

  /**
   * @brief Constructs a session.
   * @param sock The transport connected to nothing, bound to a fresh port.
   * @param server_addr The address the request was received on.
   * @param peer The client.
   * @param config The session settings. Must outlive the session.
   */
  session(transport &sock, const endpoint &server_addr, const endpoint &peer,
          const session_config &config);

  session(const session &) = delete;
  session(session &&) = delete;
  auto operator=(const session &) -> session & = delete;
  auto operator=(session &&) -> session & = delete;
  ~session();

  /**
   * @brief Runs the session to a terminal state.
   * @param request The datagram that started the session.
   * @param truncated true if the datagram didn't fit the receive buffer.
   * @returns The terminal state.
   */
  auto run(std::span<const std::byte> request,
           bool truncated = false) -> session_state;

  /** @returns The current state. */
  [[nodiscard]] auto state() const noexcept -> session_state;

  /** @returns The session statistics. */
  [[nodiscard]] auto stats() const noexcept -> const session_stats &;

  /** @returns The session counters, to be merged into the server counters. */
  [[nodiscard]] auto counters() const -> statistics::counters_t;

private:
  /** @brief Validates the request and opens the data source. */
  auto open(const messages::request &req) -> bool;
  /** @brief Negotiates options and waits for ACK(0) if an OACK is due. */
  auto negotiate_options(const messages::request &req) -> bool;
  /** @brief Streams DATA blocks until the final block is acknowledged. */
  auto transfer() -> bool;
  /** @brief Sends datagram, then waits for ACK(block), retransmitting. */
  auto exchange(std::uint16_t block, std::span<const char> datagram) -> bool;
  /** @brief Sends a counted OACK or DATA datagram. */
  auto transmit(std::span<const char> datagram) -> bool;
  /** @brief Sends an ERROR and moves to the ERROR state. */
  auto fail(std::uint16_t code, std::string_view message,
            std::error_code reason) -> void;
  /** @brief Records a failure without telling the client. */
  auto record(std::uint16_t code, std::string_view message,
              std::error_code reason) -> void;
  /** @brief Closes the source and reports the session stats. */
  auto finish() -> session_state;

  transport &socket_;
  const session_config &config_;
  std::string addrstr_;
  std::unique_ptr<data_source> source_;
  negotiated_options options_;
  std::vector<char> buffer_;
  session_stats stats_;
  session_state state_ = session_state::AWAIT_REQUEST;
};

} // namespace tftpkit
#endif // TFTPKIT_SESSION_HPP
