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
 * @file data_source.hpp
 * @brief This file declares the data source contract used by sessions.
 */
#pragma once
#ifndef TFTPKIT_DATA_SOURCE_HPP
#define TFTPKIT_DATA_SOURCE_HPP
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>
/** @brief For top-level tftpkit services. */
namespace tftpkit {
/**
 * @brief Supplies the bytes of one transfer.
 *
 * @details A data source is owned by exactly one session. The session calls
 * close() once on every exit path. Implementations may throw from read() and
 * size(); the session treats an exception like an error code.
 */
class data_source {
public:
  data_source() = default;
  data_source(const data_source &) = delete;
  data_source(data_source &&) = delete;
  auto operator=(const data_source &) -> data_source & = delete;
  auto operator=(data_source &&) -> data_source & = delete;
  virtual ~data_source() = default;

  /**
   * @brief Reads up to buf.size() bytes.
   * @param buf The destination buffer.
   * @param[out] err Set if the read failed.
   * @returns The number of bytes read, fewer than requested only at
   * end-of-stream (or on a short read that the caller retries).
   */
  virtual auto read(std::span<char> buf, std::error_code &err)
      -> std::size_t = 0;

  /** @returns The total number of bytes, or std::nullopt if unknown. */
  virtual auto size() -> std::optional<std::uint64_t> = 0;

  /** @brief Releases the source. Must be idempotent. */
  virtual auto close() noexcept -> void = 0;
};

/**
 * @brief Fills buf from source until it is full or the source is exhausted.
 * @returns The number of bytes read.
 */
auto read_full(data_source &source, std::span<char> buf,
               std::error_code &err) -> std::size_t;

/** @brief Serves an in-memory payload. */
class string_source final : public data_source {
public:
  /** @brief Constructs a source that yields the bytes of str. */
  explicit string_source(std::string str) noexcept;

  auto read(std::span<char> buf, std::error_code &err) -> std::size_t override;
  auto size() -> std::optional<std::uint64_t> override;
  auto close() noexcept -> void override;

private:
  std::string data_;
  std::size_t offset_ = 0;
};

/**
 * @brief Converts an octet stream to netascii on the fly.
 *
 * @details LF is sent as CR LF and a bare CR as CR NUL. Conversion output
 * that doesn't fit in the caller's buffer is carried over to the next read.
 * The converted size can only be known by converting the whole stream, so
 * size() buffers it in memory; call it before the first read().
 */
class netascii_source final : public data_source {
public:
  /** @brief Wraps source. */
  explicit netascii_source(std::unique_ptr<data_source> source) noexcept;

  auto read(std::span<char> buf, std::error_code &err) -> std::size_t override;
  auto size() -> std::optional<std::uint64_t> override;
  auto close() noexcept -> void override;

private:
  /** @brief Converts from the underlying source into buf. */
  auto convert(std::span<char> buf, std::error_code &err) -> std::size_t;

  std::unique_ptr<data_source> source_;
  std::vector<char> overflow_;
  std::optional<std::string> converted_;
  std::size_t offset_ = 0;
  std::error_code error_;
};

} // namespace tftpkit
#endif // TFTPKIT_DATA_SOURCE_HPP
