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
 * @file argument_parser.hpp
 * @brief This file declares the command-line parser of the example daemon.
 */
#pragma once
#ifndef TFTPKIT_ARGUMENT_PARSER_HPP
#define TFTPKIT_ARGUMENT_PARSER_HPP
#include "generator.hpp"

#include <span>
#include <string_view>
/** @brief For internal tftpkit implementation details. */
namespace tftpkit::detail {
/** @brief Splits argv into (flag, value) options. */
struct argument_parser {
  /** @brief A flag and the value that follows it (either may be empty). */
  struct option {
    /** @brief The flag, e.g. `-p` or `--port`. */
    std::string_view flag;
    /** @brief The flag's value, or a positional argument if flag is empty. */
    std::string_view value;
  };

  /**
   * @brief Parses command-line arguments, skipping the program name.
   * @details `--flag=value`, `--flag value` and `-f value` are all accepted.
   * A flag made only of dashes never takes a value.
   * @param args The command-line arguments to parse.
   * @returns A generator of options.
   */
  static auto parse(std::span<char const *const> args) -> generator<option>;

  /** @brief Overload for main()'s arguments. */
  static auto parse(int argc, char const *const *argv) -> generator<option>
  {
    return parse({argv, static_cast<std::size_t>(argc)});
  }
};
} // namespace tftpkit::detail
#endif // TFTPKIT_ARGUMENT_PARSER_HPP
