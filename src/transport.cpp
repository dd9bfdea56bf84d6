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
 * @file transport.cpp
 * @brief This file defines the UDP transport used by session workers.
 */
#include "tftpkit/transport.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <utility>

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
namespace tftpkit {
/** @brief Additional buffer length for <PORT>,[],: and null.  */
static constexpr auto ADDR_BUFLEN = 9UL;
/** @brief The socket message type. */
using socket_message = io::socket::socket_message<sockaddr_in6>;

/** @brief Views the storage of addr as a sockaddr. */
static inline auto as_sockaddr(endpoint &addr) noexcept -> sockaddr *
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return reinterpret_cast<sockaddr *>(std::ranges::data(addr));
}

/** @brief The length of the sockaddr for family. */
static constexpr auto sockaddr_len(sa_family_t family) noexcept -> socklen_t
{
  return family == AF_INET ? sizeof(sockaddr_in) : sizeof(sockaddr_in6);
}

/** @brief Wraps errno. */
static inline auto last_error() noexcept -> std::error_code
{
  return {errno, std::system_category()};
}

auto make_endpoint(std::string_view address, std::uint16_t port,
                   std::error_code &err) -> endpoint
{
  err.clear();
  const auto str = std::string(address);

  auto addr_v6 = sockaddr_in6{};
  if (inet_pton(AF_INET6, str.c_str(), &addr_v6.sin6_addr) == 1)
  {
    addr_v6.sin6_family = AF_INET6;
    addr_v6.sin6_port = htons(port);
    return endpoint(addr_v6);
  }

  auto addr = endpoint();
  auto addr_v4 = sockaddr_in{};
  if (inet_pton(AF_INET, str.c_str(), &addr_v4.sin_addr) == 1)
  {
    addr_v4.sin_family = AF_INET;
    addr_v4.sin_port = htons(port);
    addr = io::socket::socket_address(&addr_v4);
    return addr;
  }

  err = std::make_error_code(std::errc::invalid_argument);
  return addr;
}

auto normalize(endpoint addr) noexcept -> endpoint
{
  if (addr->sin6_family == AF_INET)
  {
    addr = io::socket::socket_address(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<sockaddr_in *>(std::ranges::data(addr)));
  }
  return addr;
}

auto same_endpoint(const endpoint &lhs, const endpoint &rhs) noexcept -> bool
{
  auto left = lhs;
  auto right = rhs;
  if (left->sin6_family != right->sin6_family)
    return false;

  if (left->sin6_family == AF_INET)
  {
    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *lhs_v4 = reinterpret_cast<sockaddr_in *>(as_sockaddr(left));
    const auto *rhs_v4 = reinterpret_cast<sockaddr_in *>(as_sockaddr(right));
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
    return lhs_v4->sin_port == rhs_v4->sin_port &&
           lhs_v4->sin_addr.s_addr == rhs_v4->sin_addr.s_addr;
  }

  return left->sin6_port == right->sin6_port &&
         std::memcmp(&left->sin6_addr, &right->sin6_addr,
                     sizeof(in6_addr)) == 0;
}

auto port_of(const endpoint &addr) noexcept -> std::uint16_t
{
  auto copy = addr;
  if (copy->sin6_family == AF_INET)
  {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return ntohs(reinterpret_cast<sockaddr_in *>(as_sockaddr(copy))->sin_port);
  }
  return ntohs(copy->sin6_port);
}

auto to_string(const endpoint &addr) -> std::string
{
  auto copy = addr;
  auto buf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};
  auto len = 0UL;

  if (copy->sin6_family == AF_INET)
  {
    const auto *addr_v4 =
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<sockaddr_in *>(as_sockaddr(copy));
    inet_ntop(AF_INET, &addr_v4->sin_addr, buf.data(), buf.size());
    len = std::strlen(buf.data());
  }
  else
  {
    buf[0] = '[';
    inet_ntop(AF_INET6, &copy->sin6_addr, buf.data() + 1, buf.size() - 1);
    len = std::strlen(buf.data());
    buf[len++] = ']';
  }

  buf[len++] = ':';
  auto [ptr, err] =
      std::to_chars(buf.data() + len, buf.data() + buf.size(), port_of(copy));
  return {buf.data(), ptr};
}

udp_transport::udp_transport(socket_handle socket, endpoint local) noexcept
    : socket_(std::move(socket)), local_(local)
{}

auto udp_transport::bind(const endpoint &local, std::error_code &err)
    -> std::unique_ptr<udp_transport>
{
  using namespace io::socket;
  err.clear();

  auto addr = local;
  const auto family = addr->sin6_family;
  try
  {
    auto sock = socket_handle(family, SOCK_DGRAM, 0);
    const auto native = static_cast<native_socket_type>(sock);
    if (native == INVALID_SOCKET)
    {
      err = last_error();
      return {};
    }

    auto len = sockaddr_len(family);
    if (::bind(native, as_sockaddr(addr), len) ||
        ::getsockname(native, as_sockaddr(addr), &len))
    {
      err = last_error();
      return {};
    }

    return std::make_unique<udp_transport>(std::move(sock), normalize(addr));
  }
  catch (const std::system_error &error)
  {
    err = error.code();
    return {};
  }
}

auto udp_transport::local() const noexcept -> const endpoint &
{
  return local_;
}

auto udp_transport::send(std::span<const char> buf,
                         const endpoint &peer) -> std::error_code
{
  auto len = io::sendmsg(socket_,
                         socket_message{.address = {peer}, .buffers = buf}, 0);
  if (len < 0)
    return last_error();

  return {};
}

auto udp_transport::receive(std::span<char> buf, clock::time_point deadline,
                            endpoint &from,
                            std::error_code &err) -> std::size_t
{
  using namespace std::chrono;
  using io::socket::native_socket_type;
  err.clear();

  auto pfd = pollfd{.fd = static_cast<native_socket_type>(socket_),
                    .events = POLLIN,
                    .revents = 0};
  while (true)
  {
    auto remaining = ceil<milliseconds>(deadline - clock::now());
    auto ready = ::poll(&pfd, 1,
                        static_cast<int>(std::max(remaining.count(), 0L)));
    if (ready > 0)
      break;

    if (ready < 0 && errno != EINTR)
    {
      err = last_error();
      return 0;
    }

    if (ready == 0 && clock::now() >= deadline)
    {
      err = std::make_error_code(std::errc::timed_out);
      return 0;
    }
  }

  auto msg = socket_message{.address = {endpoint()}, .buffers = buf};
  auto len = io::recvmsg(socket_, msg, 0);
  if (len < 0)
  {
    err = last_error();
    return 0;
  }

  from = normalize(*msg.address);
  return static_cast<std::size_t>(len);
}

} // namespace tftpkit
