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
 * @file transport.hpp
 * @brief This file declares the datagram transport used by session workers.
 */
#pragma once
#ifndef TFTPKIT_TRANSPORT_HPP
#define TFTPKIT_TRANSPORT_HPP
#include <net/cppnet.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <netinet/in.h>
/** @brief For top-level tftpkit services. */
namespace tftpkit {
/** @brief A UDP endpoint. IPv4 addresses keep the AF_INET family. */
using endpoint = io::socket::socket_address<sockaddr_in6>;

/**
 * @brief Parses an IPv4 or IPv6 literal.
 * @param address The address literal.
 * @param port The port in host byte order.
 * @param[out] err Set to std::errc::invalid_argument if address is invalid.
 * @returns The endpoint.
 */
auto make_endpoint(std::string_view address, std::uint16_t port,
                   std::error_code &err) -> endpoint;

/** @brief Rewraps AF_INET addresses stored in a sockaddr_in6. */
auto normalize(endpoint addr) noexcept -> endpoint;

/** @brief Compares the family, address and port of two endpoints. */
auto same_endpoint(const endpoint &lhs, const endpoint &rhs) noexcept -> bool;

/** @returns The port of addr in host byte order. */
auto port_of(const endpoint &addr) noexcept -> std::uint16_t;

/** @brief Formats addr as `a.b.c.d:port` or `[v6]:port`. */
auto to_string(const endpoint &addr) -> std::string;

/**
 * @brief A blocking datagram socket with per-call deadlines.
 * @details Sessions talk to their client only through this interface.
 */
class transport {
public:
  /** @brief The clock deadlines are measured on. */
  using clock = std::chrono::steady_clock;

  transport() = default;
  transport(const transport &) = delete;
  transport(transport &&) = delete;
  auto operator=(const transport &) -> transport & = delete;
  auto operator=(transport &&) -> transport & = delete;
  virtual ~transport() = default;

  /**
   * @brief Sends one datagram.
   * @returns An empty error code on success.
   */
  virtual auto send(std::span<const char> buf,
                    const endpoint &peer) -> std::error_code = 0;

  /**
   * @brief Waits for one datagram until deadline.
   * @param buf The receive buffer.
   * @param deadline When to give up.
   * @param[out] from The sender.
   * @param[out] err std::errc::timed_out if the deadline passed.
   * @returns The datagram length.
   */
  virtual auto receive(std::span<char> buf, clock::time_point deadline,
                       endpoint &from, std::error_code &err)
      -> std::size_t = 0;
};

/** @brief A transport over a UDP socket bound to an ephemeral port. */
class udp_transport final : public transport {
public:
  /** @brief The socket handle type. */
  using socket_handle = io::socket::socket_handle;

  /**
   * @brief Opens a UDP socket bound to local.
   * @param local The bind address, usually with port 0.
   * @param[out] err Set if the socket couldn't be created or bound.
   * @returns The transport, or nullptr on error.
   */
  static auto bind(const endpoint &local, std::error_code &err)
      -> std::unique_ptr<udp_transport>;

  /** @returns The bound address. */
  [[nodiscard]] auto local() const noexcept -> const endpoint &;

  auto send(std::span<const char> buf,
            const endpoint &peer) -> std::error_code override;
  auto receive(std::span<char> buf, clock::time_point deadline,
               endpoint &from, std::error_code &err) -> std::size_t override;

  /** @brief Use bind(). */
  udp_transport(socket_handle socket, endpoint local) noexcept;

private:
  socket_handle socket_;
  endpoint local_;
};

} // namespace tftpkit
#endif // TFTPKIT_TRANSPORT_HPP
