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
 * @file data_source.cpp
 * @brief This file defines the built-in data sources.
 */
#include "tftpkit/data_source.hpp"

#include <algorithm>
#include <array>
namespace tftpkit {

auto read_full(data_source &source, std::span<char> buf,
               std::error_code &err) -> std::size_t
{
  auto total = 0UL;
  while (total < buf.size())
  {
    auto len = source.read(buf.subspan(total), err);
    if (err || len == 0)
      break;

    total += len;
  }
  return total;
}

string_source::string_source(std::string str) noexcept : data_(std::move(str))
{}

auto string_source::read(std::span<char> buf,
                         std::error_code &err) -> std::size_t
{
  err.clear();
  auto len = std::min(buf.size(), data_.size() - offset_);
  std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), len,
              buf.begin());
  offset_ += len;
  return len;
}

auto string_source::size() -> std::optional<std::uint64_t>
{
  return data_.size();
}

auto string_source::close() noexcept -> void {}

netascii_source::netascii_source(std::unique_ptr<data_source> source) noexcept
    : source_(std::move(source))
{}

auto netascii_source::convert(std::span<char> buf,
                              std::error_code &err) -> std::size_t
{
  auto len = std::min(overflow_.size(), buf.size());
  std::copy_n(overflow_.begin(), len, buf.begin());
  overflow_.erase(overflow_.begin(),
                  overflow_.begin() + static_cast<std::ptrdiff_t>(len));

  auto put = [&](char chr) {
    if (len < buf.size())
    {
      buf[len++] = chr;
      return;
    }
    overflow_.push_back(chr);
  };

  auto raw = std::array<char, 512>();
  while (len < buf.size())
  {
    // Every input byte produces at least one output byte.
    auto want = std::min(raw.size(), buf.size() - len);
    auto got = source_->read(std::span(raw).first(want), err);
    if (err || got == 0)
      break;

    for (auto chr : std::span(raw).first(got))
    {
      switch (chr)
      {
        case '\n':
          put('\r');
          put('\n');
          break;

        case '\r':
          put('\r');
          put('\0');
          break;

        default:
          put(chr);
          break;
      }
    }
  }

  return len;
}

auto netascii_source::read(std::span<char> buf,
                           std::error_code &err) -> std::size_t
{
  err = error_;
  if (err)
    return 0;

  if (!converted_)
    return convert(buf, err);

  auto len = std::min(buf.size(), converted_->size() - offset_);
  std::copy_n(converted_->begin() + static_cast<std::ptrdiff_t>(offset_), len,
              buf.begin());
  offset_ += len;
  return len;
}

auto netascii_source::size() -> std::optional<std::uint64_t>
{
  if (converted_)
    return converted_->size();

  auto converted = std::string();
  auto chunk = std::array<char, 512>();
  while (true)
  {
    auto len = convert(chunk, error_);
    if (error_)
      return std::nullopt;

    if (len == 0)
      break;

    converted.append(chunk.data(), len);
  }

  converted_ = std::move(converted);
  offset_ = 0;
  return converted_->size();
}

auto netascii_source::close() noexcept -> void { source_->close(); }

} // namespace tftpkit
