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
 * @file filesystem.cpp
 * @brief This file implements the filesystem data source.
 */
#include "tftpkit/filesystem.hpp"

#include <utility>
namespace tftpkit::filesystem {

file_source::file_source(std::ifstream file, std::uint64_t size) noexcept
    : file_{std::move(file)}, size_{size}
{}

auto file_source::read(std::span<char> buf,
                       std::error_code &err) -> std::size_t
{
  err.clear();
  if (!file_.is_open() || buf.empty())
    return 0;

  file_.read(buf.data(), static_cast<std::streamsize>(buf.size()));
  if (file_.bad())
  {
    err = std::make_error_code(std::errc::io_error);
    return 0;
  }
  return static_cast<std::size_t>(file_.gcount());
}

auto file_source::size() -> std::optional<std::uint64_t> { return size_; }

auto file_source::close() noexcept -> void
{
  if (file_.is_open())
    file_.close();
}

auto resolve(const std::filesystem::path &root, std::string_view filename,
             std::error_code &err) -> std::filesystem::path
{
  err.clear();
  auto relative =
      std::filesystem::path(filename).relative_path().lexically_normal();
  if (relative.empty() || *relative.begin() == "..")
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  return root / relative;
}

auto open_read(const std::filesystem::path &file,
               std::error_code &err) -> std::unique_ptr<data_source>
{
  err.clear();
  auto status = std::filesystem::status(file, err);
  if (err || !std::filesystem::exists(status))
  {
    err = std::make_error_code(std::errc::no_such_file_or_directory);
    return {};
  }

  if (!std::filesystem::is_regular_file(status))
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  auto size = std::filesystem::file_size(file, err);
  if (err)
    return {};

  auto fstream = std::ifstream(file, std::ios::in | std::ios::binary);
  if (!fstream.is_open())
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  return std::make_unique<file_source>(std::move(fstream), size);
}

auto static_handler(std::filesystem::path root) -> handler_factory
{
  return [root = std::move(root)](const request_context &ctx,
                                  std::error_code &err)
             -> std::unique_ptr<data_source> {
    auto file = resolve(root, ctx.request.filename, err);
    if (err)
      return {};

    return open_read(file, err);
  };
}

} // namespace tftpkit::filesystem
