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
 * @file statistics.cpp
 * @brief This file defines the statistics registry.
 */
#include "tftpkit/statistics.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>
namespace tftpkit {

auto statistics::get_all_counters() const -> counters_t
{
  auto lock = std::lock_guard{mtx_};
  return counters_;
}

auto statistics::get_and_reset_all_counters() -> counters_t
{
  auto lock = std::lock_guard{mtx_};
  return std::exchange(counters_, {});
}

auto statistics::get_counter(std::string_view name) const -> std::int64_t
{
  auto lock = std::lock_guard{mtx_};
  auto it = counters_.find(name);
  return it == counters_.end() ? 0 : it->second;
}

auto statistics::set_counter(std::string_view name, std::int64_t value) -> void
{
  auto lock = std::lock_guard{mtx_};
  counters_.insert_or_assign(std::string(name), value);
}

auto statistics::increment_counter(std::string_view name,
                                   std::int64_t increment) -> void
{
  auto lock = std::lock_guard{mtx_};
  auto it = counters_.find(name);
  if (it == counters_.end())
  {
    counters_.emplace(std::string(name), increment);
    return;
  }
  it->second += increment;
}

auto statistics::reset_counter(std::string_view name) -> void
{
  set_counter(name, 0);
}

auto statistics::get_and_reset_counter(std::string_view name) -> std::int64_t
{
  auto lock = std::lock_guard{mtx_};
  auto it = counters_.find(name);
  if (it == counters_.end())
    return 0;

  return std::exchange(it->second, 0);
}

auto statistics::reset_all_counters() -> void
{
  auto lock = std::lock_guard{mtx_};
  counters_.clear();
}

auto statistics::merge(const counters_t &deltas) -> void
{
  auto lock = std::lock_guard{mtx_};
  for (const auto &[name, value] : deltas)
    counters_[name] += value;
}

server_stats::server_stats(std::string server_addr,
                           std::chrono::milliseconds interval) noexcept
    : server_addr_(std::move(server_addr)), interval_(interval)
{}

auto server_stats::server_addr() const noexcept -> const std::string &
{
  return server_addr_;
}

auto server_stats::interval() const noexcept -> std::chrono::milliseconds
{
  return interval_;
}

auto server_stats::duration() const noexcept -> std::chrono::milliseconds
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() -
                                                               start_time_);
}

stats_exporter::stats_exporter(server_stats_callback callback,
                               server_stats &stats)
    : callback_{std::move(callback)}, stats_{stats},
      thread_{[this](const std::stop_token &token) noexcept { run(token); }}
{}

auto stats_exporter::post() -> bool
{
  {
    auto lock = std::lock_guard{mtx_};
    if (pending_ || busy_)
      return false;

    pending_ = true;
  }
  cvar_.notify_one();
  return true;
}

auto stats_exporter::run(const std::stop_token &token) noexcept -> void
{
  while (true)
  {
    {
      auto lock = std::unique_lock{mtx_};
      if (!cvar_.wait(lock, token, [&] { return pending_; }))
        return;

      pending_ = false;
      busy_ = true;
    }

    try
    {
      if (callback_)
        callback_(stats_);
    }
    catch (const std::exception &exc)
    {
      spdlog::error("Server stats callback failed: {}", exc.what());
    }
    catch (...)
    {
      spdlog::error("Server stats callback failed.");
    }

    auto lock = std::lock_guard{mtx_};
    busy_ = false;
  }
}

} // namespace tftpkit
