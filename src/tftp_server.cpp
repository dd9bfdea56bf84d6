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
 * @file tftp_server.cpp
 * @brief This file defines the TFTP server.
 */
#include "tftpkit/tftp_server.hpp"
#include "tftpkit/error.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <tuple>
#include <utility>
#include <vector>

#include <netinet/in.h>
#include <sys/socket.h>
namespace tftpkit {
/** @brief Throws errc::invalid_configuration. */
[[noreturn]] static auto invalid(const std::string &what) -> void
{
  throw std::system_error(make_error_code(errc::invalid_configuration), what);
}

auto server_config::validate() const -> void
{
  using namespace std::chrono_literals;
  static constexpr auto PORT_MAX = 65535;

  auto err = std::error_code();
  (void)make_endpoint(address, 0, err);
  if (err)
    invalid("Invalid address: " + address);

  if (port < 1 || port > PORT_MAX)
    invalid("Invalid port: " + std::to_string(port));

  if (retries < 0)
    invalid("Invalid retries: " + std::to_string(retries));

  if (timeout < policy.timeout_min || timeout > policy.timeout_max)
    invalid("Invalid timeout: " + std::to_string(timeout.count()));

  if (!factory)
    invalid("A handler factory is required.");

  if (stats_interval <= 0ms)
    invalid("Invalid stats interval: " +
            std::to_string(stats_interval.count()));

  if (!policy.valid())
    invalid("Invalid option policy.");
}

namespace detail {
server_state::server_state(server_config conf, const endpoint &addr)
    : config{std::move(conf)}, address{addr},
      session_conf{.retries = static_cast<std::uint32_t>(config.retries),
                   .timeout = config.timeout,
                   .policy = config.policy,
                   .factory = config.factory,
                   .stats_callback = config.session_stats},
      stats{to_string(addr), config.stats_interval},
      exporter{config.server_stats, stats}
{}
} // namespace detail

/** @brief Runs one session on the calling thread. */
static auto run_worker(const detail::server_state &shared,
                       const endpoint &peer,
                       std::span<const std::byte> request, bool truncated,
                       statistics::counters_t &counters) noexcept -> void
{
  try
  {
    auto err = std::error_code();
    auto local = make_endpoint(shared.config.address, 0, err);
    auto sock = std::unique_ptr<udp_transport>();
    if (!err)
      sock = udp_transport::bind(local, err);

    if (!sock)
    {
      spdlog::error("RRQ:{}:Unable to open a session socket: {}",
                    to_string(peer), err.message());
      counters = {{"sessions_error", 1}};
      return;
    }

    auto sess = session(*sock, shared.address, peer, shared.session_conf);
    sess.run(request, truncated);
    counters = sess.counters();
  }
  catch (const std::exception &exc)
  {
    spdlog::error("RRQ:{}:Session failed: {}", to_string(peer), exc.what());
    counters = {{"sessions_error", 1}};
  }
  catch (...)
  {
    spdlog::error("RRQ:{}:Session failed.", to_string(peer));
    counters = {{"sessions_error", 1}};
  }
}

auto server::start(async_context &ctx) noexcept -> std::error_code
{
  reap_timer_ =
      ctx.timers.add(REAP_INTERVAL, [this](auto) { reap(); }, REAP_INTERVAL);

  if (state_->config.server_stats)
  {
    const auto interval = state_->config.stats_interval;
    stats_timer_ =
        ctx.timers.add(interval, [this](auto) { export_stats(); }, interval);
  }
  else
  {
    spdlog::warn("No server stats callback, server stats won't be exported.");
  }

  return Base::start(ctx);
}

auto server::operator()(async_context &ctx, const socket_dialog &socket,
                        const std::shared_ptr<read_context> &rctx,
                        std::span<const std::byte> buf) -> void
{
  if (!rctx)
    return;

  auto peer = normalize(*rctx->msg.address);
  reap();

  if (buf.size() < sizeof(std::uint16_t))
  {
    spdlog::warn("TFTP:{}:Runt datagram ignored.", to_string(peer));
    return reader(ctx, socket, rctx);
  }

  if (workers_.contains(peer))
  {
    spdlog::debug("RRQ:{}:Session in progress, request ignored.",
                  to_string(peer));
    return reader(ctx, socket, rctx);
  }

  spawn(peer, buf, (rctx->msg.flags & MSG_TRUNC) != 0);
  reader(ctx, socket, rctx);
}

auto server::spawn(const endpoint &peer, std::span<const std::byte> buf,
                   bool truncated) -> void
{
  auto state = std::make_shared<worker_state>();
  state_->stats.increment_counter("session_count");
  try
  {
    auto thread = std::jthread(
        [shared = state_, state, peer, truncated,
         request = std::vector<std::byte>(buf.begin(), buf.end())]() noexcept {
          run_worker(*shared, peer, request, truncated, state->counters);
          state->done.store(true, std::memory_order_release);
        });
    workers_.emplace(std::piecewise_construct, std::forward_as_tuple(peer),
                     std::forward_as_tuple(state, state_, std::move(thread)));
  }
  catch (const std::system_error &exc)
  {
    spdlog::error("RRQ:{}:Unable to start a session: {}", to_string(peer),
                  exc.what());
    state_->stats.increment_counter("sessions_error");
  }
}

server::worker::worker(std::shared_ptr<worker_state> state,
                       std::shared_ptr<detail::server_state> shared,
                       std::jthread thread) noexcept
    : state{std::move(state)}, shared{std::move(shared)},
      thread{std::move(thread)}
{}

server::worker::~worker()
{
  if (thread.joinable())
    thread.join();

  if (state && shared)
    shared->stats.merge(state->counters);
}

auto server::reap() -> void
{
  for (auto it = workers_.begin(); it != workers_.end();)
  {
    auto &[peer, worker] = *it;
    if (!worker.state->done.load(std::memory_order_acquire))
    {
      ++it;
      continue;
    }

    spdlog::debug("RRQ:{}:Session reaped.", to_string(peer));
    it = workers_.erase(it);
  }
}

auto server::export_stats() -> void
{
  if (!state_->exporter.post())
  {
    spdlog::warn("Server stats callback is still running, skipping export.");
    return;
  }
  spdlog::debug("Exporting server stats.");
}

/** @brief Validates config and builds the shared server state. */
static auto make_state(server_config config)
    -> std::shared_ptr<detail::server_state>
{
  config.validate();

  auto err = std::error_code();
  auto addr =
      make_endpoint(config.address, static_cast<std::uint16_t>(config.port), err);
  if (err)
    invalid("Invalid address: " + config.address);

  return std::make_shared<detail::server_state>(std::move(config), addr);
}

supervisor::supervisor(server_config config)
    : state_{make_state(std::move(config))},
      thread_{std::make_unique<server_thread>()}
{}

supervisor::~supervisor()
{
  close();
  wait();
}

auto supervisor::start() -> bool
{
  using enum net::service::async_context::context_states;
  auto lock = std::lock_guard(mtx_);
  if (started_.exchange(true))
    return thread_ && thread_->state == STARTED;

  auto address = state_->address;
  if (address->sin6_family == AF_INET)
  {
    auto addr_v4 = io::socket::socket_address<sockaddr_in>{};
    const auto *sin =
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<const sockaddr_in *>(std::ranges::data(address));
    addr_v4->sin_family = AF_INET;
    addr_v4->sin_port = sin->sin_port;
    addr_v4->sin_addr = sin->sin_addr;
    thread_->start(addr_v4, state_);
  }
  else
  {
    thread_->start(address, state_);
  }

  thread_->state.wait(PENDING);
  if (thread_->state != STARTED)
  {
    spdlog::error("TFTP server failed to start on {}.",
                  to_string(state_->address));
    return false;
  }

  spdlog::info("TFTP server listening on {}.", to_string(state_->address));
  return true;
}

auto supervisor::wait() -> void
{
  using enum net::service::async_context::context_states;
  auto *thread = [&]() -> server_thread * {
    auto lock = std::lock_guard(mtx_);
    return started_ ? thread_.get() : nullptr;
  }();
  if (!thread)
    return;

  thread->state.wait(STARTED);

  // Destroying the server joins the workers still in flight.
  auto lock = std::lock_guard(mtx_);
  thread_.reset();
}

auto supervisor::run() -> bool
{
  if (!start())
    return false;

  wait();
  spdlog::info("TFTP server stopped.");
  return true;
}

auto supervisor::close() noexcept -> void
{
  auto lock = std::lock_guard(mtx_);
  if (started_ && thread_)
    thread_->signal(thread_->terminate);
}

auto supervisor::stats() noexcept -> server_stats & { return state_->stats; }

auto supervisor::address() const noexcept -> const endpoint &
{
  return state_->address;
}

} // namespace tftpkit
