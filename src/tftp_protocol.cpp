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
 * @file tftp_protocol.cpp
 * @brief This file defines the TFTP packet codec.
 */
#include "tftpkit/protocol/tftp_protocol.hpp"
#include "tftpkit/detail/endian.hpp"
#include "tftpkit/detail/generator.hpp"
#include "tftpkit/error.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <cctype>
namespace tftpkit {

/** @brief Views the bytes of a datagram as characters. */
static inline auto as_chars(std::span<const std::byte> buf) noexcept
    -> std::string_view
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return {reinterpret_cast<const char *>(buf.data()), buf.size()};
}

/**
 * @brief Yields each null-terminated string in buf.
 * @details A trailing fragment without a null byte is not yielded, so
 * callers detect it by comparing the bytes consumed to the buffer size.
 */
static auto strings(std::string_view buf) -> detail::generator<std::string_view>
{
  while (!buf.empty())
  {
    auto end = buf.find('\0');
    if (end == std::string_view::npos)
      co_return;

    co_yield buf.substr(0, end);
    buf.remove_prefix(end + 1);
  }
}

/** @brief Splits buf into null-terminated strings. */
static inline auto split(std::string_view buf, std::vector<std::string_view> &out)
    -> bool
{
  auto consumed = 0UL;
  for (auto str : strings(buf))
  {
    consumed += str.size() + 1;
    out.push_back(str);
  }
  return consumed == buf.size();
}

/** @brief Parses alternating name/value strings into options. */
static inline auto
parse_options(std::span<const std::string_view> tokens,
              std::vector<messages::option> &options) -> bool
{
  if (tokens.size() % 2 != 0)
    return false;

  for (auto it = tokens.begin(); it != tokens.end(); it += 2)
  {
    if (it->empty())
      return false;

    options.push_back({.name = std::string(*it), .value = std::string(it[1])});
  }
  return true;
}

auto to_mode(std::string_view mode) noexcept -> std::uint8_t
{
  using enum messages::mode_t;
  auto iequals = [&](std::string_view name) {
    return std::ranges::equal(mode, name, [](unsigned char lhs, char rhs) {
      return std::tolower(lhs) == rhs;
    });
  };

  if (iequals("netascii"))
    return NETASCII;

  if (iequals("octet"))
    return OCTET;

  if (iequals("mail"))
    return MAIL;

  return 0;
}

static inline auto decode_request(std::uint16_t opc, std::string_view body,
                                  std::error_code &err) -> packet
{
  auto tokens = std::vector<std::string_view>();
  if (!split(body, tokens) || tokens.size() < 2 || tokens[0].empty() ||
      tokens[1].empty())
  {
    err = errc::malformed_packet;
    return {};
  }

  auto req = messages::request{.opc = opc,
                               .filename = std::string(tokens[0]),
                               .mode_name = std::string(tokens[1]),
                               .mode = to_mode(tokens[1])};
  if (!parse_options(std::span(tokens).subspan(2), req.options))
    err = errc::malformed_packet;

  return req;
}

static inline auto decode_oack(std::string_view body,
                               std::error_code &err) -> packet
{
  auto tokens = std::vector<std::string_view>();
  auto msg = messages::oack{};
  if (!split(body, tokens) || !parse_options(tokens, msg.options))
    err = errc::malformed_packet;

  return msg;
}

auto decode(std::span<const std::byte> buf, std::error_code &err) -> packet
{
  using enum messages::opcode_t;
  using detail::load_u16;

  err.clear();
  if (buf.size() < sizeof(std::uint16_t))
  {
    err = errc::malformed_packet;
    return {};
  }

  const auto opc = load_u16(buf);
  const auto body = buf.subspan(sizeof(std::uint16_t));
  switch (opc)
  {
    case RRQ:
    case WRQ:
      return decode_request(opc, as_chars(body), err);

    case OACK:
      return decode_oack(as_chars(body), err);

    default:
      break;
  }

  if (buf.size() < messages::HEADER_LEN)
  {
    err = errc::malformed_packet;
    return {};
  }

  const auto field = load_u16(body);
  const auto rest = as_chars(buf.subspan(messages::HEADER_LEN));
  switch (opc)
  {
    case DATA:
      if (rest.size() > messages::BLKSIZE_MAX)
        break;

      return messages::data{.block_num = field,
                            .payload = {rest.begin(), rest.end()}};

    case ACK:
      return messages::ack{.block_num = field};

    case ERROR:
      // Some clients leave out the terminating null.
      return messages::error{.code = field,
                             .message = std::string(rest.substr(
                                 0, std::min(rest.find('\0'), rest.size())))};

    default:
      break;
  }

  err = errc::malformed_packet;
  return {};
}

static inline auto put_string(std::vector<char> &buf,
                              std::string_view str) -> void
{
  buf.insert(buf.end(), str.begin(), str.end());
  buf.push_back('\0');
}

static inline auto put_options(std::vector<char> &buf,
                               const std::vector<messages::option> &options)
    -> void
{
  for (const auto &[name, value] : options)
  {
    put_string(buf, name);
    put_string(buf, value);
  }
}

auto encode(const messages::data &msg, std::size_t blksize,
            std::vector<char> &buf) -> void
{
  using enum messages::opcode_t;
  assert(msg.payload.size() <= blksize &&
         "DATA payload must not exceed the negotiated block size.");

  buf.clear();
  buf.reserve(messages::HEADER_LEN + msg.payload.size());
  detail::store_u16(buf, DATA);
  detail::store_u16(buf, msg.block_num);
  buf.insert(buf.end(), msg.payload.begin(), msg.payload.end());
}

auto encode(const packet &pkt, std::vector<char> &buf) -> void
{
  using detail::store_u16;

  struct encoder {
    std::vector<char> &buf;

    auto operator()(const messages::request &msg) const -> void
    {
      store_u16(buf, msg.opc);
      put_string(buf, msg.filename);
      put_string(buf, msg.mode_name);
      put_options(buf, msg.options);
    }

    auto operator()(const messages::data &msg) const -> void
    {
      encode(msg, messages::BLKSIZE_MAX, buf);
    }

    auto operator()(const messages::ack &msg) const -> void
    {
      store_u16(buf, messages::ACK);
      store_u16(buf, msg.block_num);
    }

    auto operator()(const messages::error &msg) const -> void
    {
      store_u16(buf, messages::ERROR);
      store_u16(buf, msg.code);
      put_string(buf, msg.message);
    }

    auto operator()(const messages::oack &msg) const -> void
    {
      store_u16(buf, messages::OACK);
      put_options(buf, msg.options);
    }
  };

  buf.clear();
  std::visit(encoder{buf}, pkt);
}

auto errors::msg(std::uint16_t error,
                 std::string_view message) -> std::vector<char>
{
  auto buf = std::vector<char>();
  encode(messages::error{.code = error,
                         .message = std::string(message.empty()
                                                    ? errstr(error)
                                                    : message)},
         buf);
  return buf;
}

} // namespace tftpkit
