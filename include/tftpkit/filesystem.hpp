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
 * @file filesystem.hpp
 * @brief This file declares a data source that serves files from a directory.
 */
#pragma once
#ifndef TFTPKIT_FILESYSTEM_HPP
#define TFTPKIT_FILESYSTEM_HPP
#include "tftpkit/data_source.hpp"
#include "tftpkit/protocol/tftp_session.hpp"

#include <filesystem>
#include <fstream>
#include <string_view>
/** @brief For serving files from the local filesystem. */
namespace tftpkit::filesystem {
/** @brief Reads a regular file. */
class file_source final : public data_source {
public:
  /**
   * @brief Wraps an open file.
   * @param file The open file.
   * @param size The file size.
   */
  file_source(std::ifstream file, std::uint64_t size) noexcept;

  auto read(std::span<char> buf, std::error_code &err) -> std::size_t override;
  auto size() -> std::optional<std::uint64_t> override;
  auto close() noexcept -> void override;

private:
  std::ifstream file_;
  std::uint64_t size_;
};

/**
 * @brief Maps a requested filename into root.
 * @details Leading slashes are ignored, so `/a/b` and `a/b` both name
 * `root/a/b`. Names that climb out of root are refused.
 * @param root The served directory.
 * @param filename The filename from the RRQ.
 * @param[out] err std::errc::permission_denied if filename escapes root.
 * @returns The path of the file.
 */
auto resolve(const std::filesystem::path &root, std::string_view filename,
             std::error_code &err) -> std::filesystem::path;

/**
 * @brief Opens a file for reading.
 * @param file The file to open.
 * @param[out] err An error code that is cleared on success and set on error.
 * @returns The data source, or nullptr on error.
 */
auto open_read(const std::filesystem::path &file,
               std::error_code &err) -> std::unique_ptr<data_source>;

/**
 * @brief Makes a handler factory that serves the files under root.
 * @param root The served directory.
 * @returns The handler factory.
 */
auto static_handler(std::filesystem::path root) -> handler_factory;

} // namespace tftpkit::filesystem
#endif // TFTPKIT_FILESYSTEM_HPP
