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
 * @file tftp_protocol.hpp
 * @brief This file declares the TFTP packet codec.
 */
#pragma once
#ifndef TFTPKIT_PROTOCOL_HPP
#define TFTPKIT_PROTOCOL_HPP
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>
/** @brief For top-level tftpkit services. */
namespace tftpkit {
// NOLINTBEGIN(performance-enum-size)
/** @brief TFTP message layouts and protocol definitions. */
struct messages {
  /**
   * @brief Protocol defined operations (opcodes).
   * RFC 1350 defines 1 through 5, RFC 2347 adds OACK.
   */
  enum opcode_t : std::uint16_t { RRQ = 1, WRQ, DATA, ACK, ERROR, OACK };

  /** @brief Protocol defined transfer modes. */
  enum mode_t : std::uint8_t { NETASCII = 1, OCTET, MAIL };

  /** @brief Protocol defined error codes (RFC 1350 and RFC 2347). */
  enum error_t : std::uint16_t {
    NOT_DEFINED = 0,
    FILE_NOT_FOUND,
    ACCESS_VIOLATION,
    DISK_FULL,
    ILLEGAL_OPERATION,
    UNKNOWN_TID,
    FILE_ALREADY_EXISTS,
    NO_SUCH_USER,
    INVALID_OPTIONS
  };

  /** @brief An RFC 2347 option name/value pair. */
  struct option {
    /** @brief The option name as it appeared on the wire. */
    std::string name;
    /** @brief The option value as it appeared on the wire. */
    std::string value;

    auto operator==(const option &) const -> bool = default;
  };

  /** @brief RRQ and WRQ packets. */
  struct request {
    /** @brief RRQ or WRQ. */
    std::uint16_t opc = RRQ;
    /** @brief The requested file. */
    std::string filename;
    /** @brief The transfer mode as sent by the client. */
    std::string mode_name;
    /** @brief The parsed mode_t, 0 if the mode is not recognized. */
    std::uint8_t mode = 0;
    /** @brief The requested options in wire order. */
    std::vector<option> options;
  };

  /** @brief DATA packets. */
  struct data {
    /** @brief Block number (starts at 1, wraps modulo 65536). */
    std::uint16_t block_num = 0;
    /** @brief At most one negotiated block of payload. */
    std::vector<char> payload;
  };

  /** @brief ACK packets. */
  struct ack {
    /** @brief The acknowledged block number. */
    std::uint16_t block_num = 0;
  };

  /** @brief ERROR packets. */
  struct error {
    /** @brief Error code from error_t. */
    std::uint16_t code = NOT_DEFINED;
    /** @brief Human readable message. */
    std::string message;
  };

  /** @brief OACK packets. */
  struct oack {
    /** @brief The options the server accepted, in request order. */
    std::vector<option> options;
  };

  /** @brief Opcode plus block number or error code. */
  static constexpr auto HEADER_LEN = 4UL;
  /** @brief The RFC 1350 block size. */
  static constexpr auto DATALEN = 512UL;
  /** @brief The smallest block size allowed by RFC 2348. */
  static constexpr auto BLKSIZE_MIN = 8UL;
  /** @brief The largest block size allowed by RFC 2348. */
  static constexpr auto BLKSIZE_MAX = 65464UL;
  /** @brief The largest datagram the codec ever produces or expects. */
  static constexpr auto DATAGRAM_MAXLEN = HEADER_LEN + BLKSIZE_MAX;
};
// NOLINTEND(performance-enum-size)

/** @brief A decoded TFTP packet. */
using packet = std::variant<messages::request, messages::data, messages::ack,
                            messages::error, messages::oack>;

/**
 * @brief Converts a transfer mode string to a mode_t (case-insensitive).
 * @returns The mode, or 0 if the mode is not recognized.
 */
auto to_mode(std::string_view mode) noexcept -> std::uint8_t;

/**
 * @brief Decodes a datagram.
 * @details Validates the minimum length for the opcode and the
 * null-terminated string fields. Option values are not interpreted.
 * @param buf The datagram.
 * @param[out] err Cleared on success, errc::malformed_packet on failure.
 * @returns The decoded packet, unspecified if err is set.
 */
[[nodiscard]] auto decode(std::span<const std::byte> buf,
                          std::error_code &err) -> packet;

/**
 * @brief Encodes a packet, replacing the contents of buf.
 * @param pkt The packet to encode.
 * @param[out] buf The encoded datagram.
 */
auto encode(const packet &pkt, std::vector<char> &buf) -> void;

/**
 * @brief Encodes a DATA packet for a session.
 * @param msg The DATA packet. Its payload must not exceed blksize.
 * @param blksize The session's negotiated block size.
 * @param[out] buf The encoded datagram.
 */
auto encode(const messages::data &msg, std::size_t blksize,
            std::vector<char> &buf) -> void;

/** @brief Error messages. */
struct errors {
  /**
   * @brief Converts a TFTP error to a string.
   * @param error The TFTP error.
   * @returns A string_view containing the relevant error message.
   */
  static constexpr auto errstr(std::uint16_t error) noexcept -> std::string_view
  {
    using enum messages::error_t;
    switch (error)
    {
      case ACCESS_VIOLATION:
        return "Access violation.";

      case FILE_NOT_FOUND:
        return "File not found.";

      case DISK_FULL:
        return "Disk full.";

      case NO_SUCH_USER:
        return "No such user.";

      case FILE_ALREADY_EXISTS:
        return "File already exists.";

      case UNKNOWN_TID:
        return "Unknown transfer ID.";

      case ILLEGAL_OPERATION:
        return "Illegal TFTP operation.";

      case INVALID_OPTIONS:
        return "Option negotiation refused.";

      default:
        return "Not defined.";
    }
  }

  /**
   * @brief Builds an ERROR packet.
   * @param error The error code.
   * @param message The message, errstr(error) if empty.
   * @returns The encoded datagram.
   */
  static auto msg(std::uint16_t error,
                  std::string_view message = {}) -> std::vector<char>;
};

} // namespace tftpkit
#endif // TFTPKIT_PROTOCOL_HPP
