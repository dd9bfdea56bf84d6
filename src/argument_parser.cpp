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
 * @file argument_parser.cpp
 * @brief This file implements the command-line parser.
 */
#include "tftpkit/detail/argument_parser.hpp"

#include <algorithm>
#include <utility>
namespace tftpkit::detail {

/** @brief True for flags like `-` or `--` that never take a value. */
static constexpr auto only_dashes(std::string_view flag) noexcept -> bool
{
  return !flag.empty() &&
         std::ranges::all_of(flag, [](char chr) { return chr == '-'; });
}

auto argument_parser::parse(std::span<char const *const> args)
    -> generator<option>
{
  auto opt = option{};
  auto pending = false;

  for (const auto *arg : args.subspan(args.empty() ? 0 : 1))
  {
    auto token = std::string_view(arg);
    if (!token.empty() && token.front() == '-')
    {
      if (pending)
        co_yield std::exchange(opt, option{});

      opt.flag = token;
      pending = true;
      if (token.size() > 2 && token[1] == '-')
      {
        if (auto delim = token.find('='); delim != std::string_view::npos)
        {
          opt.flag = token.substr(0, delim);
          opt.value = token.substr(delim + 1);
        }
      }
      continue;
    }

    if (pending && (only_dashes(opt.flag) || !opt.value.empty()))
      co_yield std::exchange(opt, option{});

    opt.value = token;
    pending = true;
  }

  if (pending)
    co_yield std::exchange(opt, option{});
}
} // namespace tftpkit::detail
