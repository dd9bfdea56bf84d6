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
 * @file statistics.hpp
 * @brief This file declares the statistics registry.
 */
#pragma once
#ifndef TFTPKIT_STATISTICS_HPP
#define TFTPKIT_STATISTICS_HPP
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
/** @brief For top-level tftpkit services. */
namespace tftpkit {
/**
 * @brief A set of named counters.
 *
 * @details Every operation is atomic with respect to the others. A counter
 * that was never written reads as zero.
 */
class statistics {
public:
  /** @brief A snapshot of the counters. */
  using counters_t = std::map<std::string, std::int64_t, std::less<>>;

  statistics() = default;
  statistics(const statistics &) = delete;
  statistics(statistics &&) = delete;
  auto operator=(const statistics &) -> statistics & = delete;
  auto operator=(statistics &&) -> statistics & = delete;
  ~statistics() = default;

  /** @returns A copy of all the counters. */
  [[nodiscard]] auto get_all_counters() const -> counters_t;

  /** @returns All the counters, then zeroes them. */
  auto get_and_reset_all_counters() -> counters_t;

  /** @returns The value of the counter. */
  [[nodiscard]] auto get_counter(std::string_view name) const -> std::int64_t;

  /** @brief Sets a counter. */
  auto set_counter(std::string_view name, std::int64_t value) -> void;

  /** @brief Adds increment (which may be negative) to a counter. */
  auto increment_counter(std::string_view name,
                         std::int64_t increment = 1) -> void;

  /** @brief Zeroes a counter. */
  auto reset_counter(std::string_view name) -> void;

  /** @returns The value of the counter, then zeroes it. */
  auto get_and_reset_counter(std::string_view name) -> std::int64_t;

  /** @brief Zeroes every counter. */
  auto reset_all_counters() -> void;

  /** @brief Adds every counter in deltas to this set. */
  auto merge(const counters_t &deltas) -> void;

private:
  mutable std::mutex mtx_;
  counters_t counters_;
};

/**
 * @brief The server-wide counters handed to the periodic stats callback.
 *
 * @details Only the supervisor writes these counters: once per spawned
 * session and once per reaped session. The callback is expected to read them
 * with get_and_reset_all_counters().
 */
class server_stats : public statistics {
public:
  /** @brief The clock used for the server uptime. */
  using clock = std::chrono::steady_clock;

  /**
   * @brief Constructs the server-wide statistics.
   * @param server_addr The address the server is bound to.
   * @param interval How often the stats callback runs.
   */
  server_stats(std::string server_addr,
               std::chrono::milliseconds interval) noexcept;

  /** @returns The address the server is bound to. */
  [[nodiscard]] auto server_addr() const noexcept -> const std::string &;

  /** @returns How often the stats callback runs. */
  [[nodiscard]] auto interval() const noexcept -> std::chrono::milliseconds;

  /** @returns The server uptime. */
  [[nodiscard]] auto duration() const noexcept -> std::chrono::milliseconds;

private:
  std::string server_addr_;
  std::chrono::milliseconds interval_;
  clock::time_point start_time_{clock::now()};
};

/** @brief Receives the server statistics once per stats interval. */
using server_stats_callback = std::function<void(server_stats &)>;

/**
 * @brief Runs the server stats callback on a dedicated thread.
 *
 * @details At most one export is pending or running at any time, so the
 * callback is never invoked concurrently with itself.
 */
class stats_exporter {
public:
  /**
   * @brief Starts the exporter thread.
   * @param callback The server stats callback.
   * @param stats The statistics passed to the callback. Must outlive the
   * exporter.
   */
  stats_exporter(server_stats_callback callback, server_stats &stats);

  stats_exporter(const stats_exporter &) = delete;
  stats_exporter(stats_exporter &&) = delete;
  auto operator=(const stats_exporter &) -> stats_exporter & = delete;
  auto operator=(stats_exporter &&) -> stats_exporter & = delete;
  ~stats_exporter() = default;

  /**
   * @brief Schedules an export.
   * @returns false if the previous export hasn't finished, in which case
   * nothing is scheduled.
   */
  auto post() -> bool;

private:
  /** @brief The exporter thread. */
  auto run(const std::stop_token &token) noexcept -> void;

  server_stats_callback callback_;
  server_stats &stats_;
  std::mutex mtx_;
  std::condition_variable_any cvar_;
  bool pending_ = false;
  bool busy_ = false;
  std::jthread thread_;
};

} // namespace tftpkit
#endif // TFTPKIT_STATISTICS_HPP
