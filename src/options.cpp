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
 * @file options.cpp
 * @brief This file defines RFC 2347 option negotiation.
 */
#include "tftpkit/protocol/options.hpp"
#include "tftpkit/data_source.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <string>
namespace tftpkit {

/** @brief Parses a decimal option value, saturating values too large. */
static inline auto to_number(std::string_view value) noexcept
    -> std::optional<std::uint64_t>
{
  auto number = std::uint64_t{};
  const auto *end = value.data() + value.size();
  auto [ptr, err] = std::from_chars(value.data(), end, number);
  if (value.empty() || ptr != end)
    return std::nullopt;

  if (err == std::errc::result_out_of_range)
    return std::numeric_limits<std::uint64_t>::max();

  if (err != std::errc{})
    return std::nullopt;

  return number;
}

static inline auto lowercase(std::string_view str) -> std::string
{
  auto lower = std::string(str);
  std::ranges::transform(lower, lower.begin(), [](unsigned char chr) {
    return static_cast<char>(std::tolower(chr));
  });
  return lower;
}

auto option_policy::valid() const noexcept -> bool
{
  return messages::BLKSIZE_MIN <= blksize_min && blksize_min <= blksize_max &&
         blksize_max <= messages::BLKSIZE_MAX &&
         std::chrono::seconds(1) <= timeout_min &&
         timeout_min <= timeout_max &&
         timeout_max <= std::chrono::seconds(255);
}

auto negotiate(const std::vector<messages::option> &requested,
               std::chrono::seconds default_timeout,
               const option_policy &policy,
               data_source &source) -> negotiation
{
  auto result = negotiation{};
  auto &options = result.options;
  options.timeout = default_timeout;

  // A repeated option replaces the earlier one.
  auto acknowledge = [&](std::string key, std::string value) {
    std::erase_if(result.acknowledged,
                  [&](const auto &option) { return option.name == key; });
    result.acknowledged.push_back(
        {.name = std::move(key), .value = std::move(value)});
  };

  for (const auto &[name, value] : requested)
  {
    auto key = lowercase(name);
    auto number = to_number(value);
    if (!number)
    {
      spdlog::debug("Ignoring option {}={}.", name, value);
      continue;
    }

    if (key == "blksize")
    {
      options.block_size = static_cast<std::size_t>(std::clamp<std::uint64_t>(
          *number, policy.blksize_min, policy.blksize_max));
      acknowledge(std::move(key), std::to_string(options.block_size));
    }
    else if (key == "timeout")
    {
      auto seconds = std::clamp<std::uint64_t>(
          *number, static_cast<std::uint64_t>(policy.timeout_min.count()),
          static_cast<std::uint64_t>(policy.timeout_max.count()));
      options.timeout = std::chrono::seconds(seconds);
      acknowledge(std::move(key), std::to_string(seconds));
    }
    else if (key == "tsize")
    {
      options.transfer_size = source.size();
      if (options.transfer_size)
        acknowledge(std::move(key), std::to_string(*options.transfer_size));
    }
  }

  result.ack_required = !result.acknowledged.empty();
  return result;
}

} // namespace tftpkit
