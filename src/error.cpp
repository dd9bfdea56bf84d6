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
 * @file error.cpp
 * @brief This file defines the tftpkit error category.
 */
#include "tftpkit/error.hpp"

#include <string>
namespace tftpkit {
namespace {
class error_category_impl final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override
  {
    return "tftpkit";
  }

  [[nodiscard]] auto message(int value) const -> std::string override
  {
    switch (static_cast<errc>(value))
    {
      case errc::malformed_packet:
        return "malformed packet";

      case errc::unsupported_operation:
        return "unsupported operation";

      case errc::data_source_unavailable:
        return "data source unavailable";

      case errc::data_source_read_failure:
        return "data source read failure";

      case errc::retry_exhausted:
        return "retries exhausted";

      case errc::client_error:
        return "aborted by client";

      case errc::invalid_configuration:
        return "invalid configuration";

      default:
        return "unknown error";
    }
  }
};
} // namespace

auto category() noexcept -> const std::error_category &
{
  static const auto instance = error_category_impl{};
  return instance;
}
} // namespace tftpkit
