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
 * @file tftp_server.hpp
 * @brief This file declares the TFTP server.
 */
#pragma once
#ifndef TFTPKIT_SERVER_HPP
#define TFTPKIT_SERVER_HPP
#include "protocol/tftp_session.hpp"
#include "statistics.hpp"
#include "transport.hpp"

#include <net/cppnet.hpp>
#include <net/timers/timers.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
/** @brief For top-level tftpkit services. */
namespace tftpkit {
/** @brief The well-known TFTP port. */
static constexpr auto PORT = 69;

/** @brief The server configuration. */
struct server_config {
  /** @brief The address to listen on, an IPv4 or IPv6 literal. */
  std::string address = "::";
  /** @brief The port to listen on. */
  int port = PORT;
  /** @brief Retransmissions of one packet before a session gives up. */
  int retries = 5;
  /** @brief The session timeout unless the client negotiates one. */
  std::chrono::seconds timeout{2};
  /** @brief Opens the data source of each request. */
  handler_factory factory;
  /** @brief Invoked once per terminated session. Optional. */
  session_stats_callback session_stats;
  /** @brief Invoked once per stats_interval. Optional. */
  server_stats_callback server_stats;
  /** @brief How often server_stats is invoked. */
  std::chrono::milliseconds stats_interval{std::chrono::seconds(60)};
  /** @brief The option ranges. */
  option_policy policy;

  /**
   * @brief Checks every field.
   * @throws std::system_error with errc::invalid_configuration, naming the
   * first invalid field.
   */
  auto validate() const -> void;
};

namespace detail {
/** @brief The state shared by the supervisor and its server. */
struct server_state {
  /**
   * @brief Builds the shared state from a validated configuration.
   * @param conf The configuration.
   * @param addr The parsed listen address.
   */
  server_state(server_config conf, const endpoint &addr);

  /** @brief The configuration. */
  server_config config;
  /** @brief The listen address. */
  endpoint address;
  /** @brief The settings handed to every session. */
  session_config session_conf;
  /** @brief The server-wide counters. */
  server_stats stats;
  /** @brief Runs config.server_stats. */
  stats_exporter exporter;
};
} // namespace detail

/** @brief TFTP max buffer allocation. */
static constexpr auto BUFSIZE = messages::DATALEN + messages::HEADER_LEN;
/** @brief The service type to use. */
template <typename UDPStreamHandler>
using udp_base = net::service::async_udp_service<UDPStreamHandler, BUFSIZE>;

/**
 * @brief Listens for requests and runs each one on its own worker thread.
 *
 * @details The server runs on the cppnet context thread. Only that thread
 * touches the worker table and the server-wide counters, apart from the
 * stats callback which reads and resets them on the exporter thread.
 */
class server : public udp_base<server> {
public:
  /** @brief The base class. */
  using Base = udp_base<server>;
  /** @brief How often finished workers are reaped. */
  static constexpr auto REAP_INTERVAL = std::chrono::milliseconds(250);

  /**
   * @brief Constructs a TFTP server on the socket address.
   * @tparam T The type of the socket_address.
   * @param address The local IP address to bind to.
   * @param state The shared server state.
   */
  template <typename T>
  server(socket_address<T> address,
         std::shared_ptr<detail::server_state> state) noexcept
      : Base(address), state_{std::move(state)}
  {}

  /**
   * @brief Arms the reap and stats timers, then starts the service.
   * @param ctx The asynchronous context.
   * @returns An error code if the service couldn't start.
   */
  auto start(async_context &ctx) noexcept -> std::error_code;

  /**
   * @brief Accepts a datagram on the listening socket.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param rctx The read context that manages the read buffer lifetime.
   * @param buf The bytes that were read from the socket.
   */
  auto operator()(async_context &ctx, const socket_dialog &socket,
                  const std::shared_ptr<read_context> &rctx,
                  std::span<const std::byte> buf) -> void;

private:
  /** @brief What a worker reports back to the server. */
  struct worker_state {
    /** @brief Set by the worker once it has finished. */
    std::atomic<bool> done{false};
    /** @brief The worker's session counters. */
    statistics::counters_t counters;
  };

  /**
   * @brief A session worker.
   *
   * @details Destroying a worker joins its thread and merges its counters
   * into the server-wide counters, so every session is counted exactly
   * once whether it is reaped or still running when the server stops.
   */
  struct worker {
    /** @brief Shared with the worker thread. */
    std::shared_ptr<worker_state> state;
    /** @brief Receives the worker's counters. */
    std::shared_ptr<detail::server_state> shared;
    /** @brief The worker thread. */
    std::jthread thread;

    worker(std::shared_ptr<worker_state> state,
           std::shared_ptr<detail::server_state> shared,
           std::jthread thread) noexcept;
    worker(const worker &) = delete;
    worker(worker &&) noexcept = default;
    auto operator=(const worker &) -> worker & = delete;
    auto operator=(worker &&) -> worker & = delete;
    /** @brief Joins the thread, then merges the counters. */
    ~worker();
  };

  /** @brief The workers, keyed by peer. */
  using workers_t = std::multimap<endpoint, worker>;

  /**
   * @brief Starts a worker for a new request.
   * @param peer The client.
   * @param buf The request datagram.
   * @param truncated true if the datagram was truncated.
   */
  auto spawn(const endpoint &peer, std::span<const std::byte> buf,
             bool truncated) -> void;

  /** @brief Destroys finished workers. */
  auto reap() -> void;

  /** @brief Hands the server stats to the exporter. */
  auto export_stats() -> void;

  std::shared_ptr<detail::server_state> state_;
  workers_t workers_;
  net::timers::timer_id reap_timer_{net::timers::INVALID_TIMER};
  net::timers::timer_id stats_timer_{net::timers::INVALID_TIMER};
};

/**
 * @brief Owns a server and the thread it runs on.
 *
 * @details The configuration is validated on construction. Closing the
 * supervisor stops the accept loop; sessions already in progress run to
 * completion before the server is destroyed. A stopped supervisor can't
 * be restarted.
 */
class supervisor {
public:
  /** @brief The thread the server runs on. */
  using server_thread = net::service::context_thread<server>;

  /**
   * @brief Validates the configuration.
   * @param config The server configuration.
   * @throws std::system_error with errc::invalid_configuration.
   */
  explicit supervisor(server_config config);

  supervisor(const supervisor &) = delete;
  supervisor(supervisor &&) = delete;
  auto operator=(const supervisor &) -> supervisor & = delete;
  auto operator=(supervisor &&) -> supervisor & = delete;

  /** @brief Closes the server and waits for it to stop. */
  ~supervisor();

  /**
   * @brief Starts the server.
   * @returns true if the server is listening.
   */
  auto start() -> bool;

  /**
   * @brief Blocks until the server has stopped, then destroys it.
   *
   * @details Sessions still in progress are joined and counted before
   * wait() returns. Must not be called concurrently with itself.
   */
  auto wait() -> void;

  /**
   * @brief Starts the server and blocks until it is closed.
   * @returns false if the server couldn't start.
   */
  auto run() -> bool;

  /** @brief Requests an orderly shutdown. */
  auto close() noexcept -> void;

  /** @returns The server-wide statistics. */
  [[nodiscard]] auto stats() noexcept -> server_stats &;

  /** @returns The listen address. */
  [[nodiscard]] auto address() const noexcept -> const endpoint &;

private:
  std::shared_ptr<detail::server_state> state_;
  std::mutex mtx_;
  std::unique_ptr<server_thread> thread_;
  std::atomic<bool> started_{false};
};

} // namespace tftpkit
#endif // TFTPKIT_SERVER_HPP
