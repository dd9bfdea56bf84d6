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
 * @file tftp_session.cpp
 * @brief This file defines the TFTP read session.
 */
#include "tftpkit/protocol/tftp_session.hpp"
#include "tftpkit/detail/endian.hpp"
#include "tftpkit/error.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>
#include <variant>
namespace tftpkit {

auto to_string(session_state state) noexcept -> std::string_view
{
  using enum session_state;
  switch (state)
  {
    case AWAIT_REQUEST:
      return "AWAIT_REQUEST";

    case NEGOTIATING:
      return "NEGOTIATING";

    case TRANSFERRING:
      return "TRANSFERRING";

    case COMPLETE:
      return "COMPLETE";

    case ERROR:
      return "ERROR";

    case TIMED_OUT:
      return "TIMED_OUT";
  }
  return "UNKNOWN"; // GCOVR_EXCL_LINE
}

auto session_stats::duration() const noexcept -> std::chrono::milliseconds
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(end_time -
                                                               start_time);
}

session::session(transport &sock, const endpoint &server_addr,
                 const endpoint &peer, const session_config &config)
    : socket_{sock}, config_{config}, addrstr_{to_string(peer)},
      buffer_(messages::DATAGRAM_MAXLEN)
{
  stats_.server_addr = server_addr;
  stats_.peer = peer;
  options_.timeout = config_.timeout;
}

session::~session()
{
  if (source_)
    source_->close();
}

auto session::state() const noexcept -> session_state { return state_; }

auto session::stats() const noexcept -> const session_stats &
{
  return stats_;
}

auto session::counters() const -> statistics::counters_t
{
  auto counters = statistics::counters_t{
      {"packets_sent", static_cast<std::int64_t>(stats_.packets_sent)},
      {"packets_acked", static_cast<std::int64_t>(stats_.packets_acked)},
      {"bytes_sent", static_cast<std::int64_t>(stats_.bytes_sent)},
      {"retransmits", static_cast<std::int64_t>(stats_.retransmits)}};

  using enum session_state;
  switch (state_)
  {
    case COMPLETE:
      counters["sessions_complete"] = 1;
      break;

    case ERROR:
      counters["sessions_error"] = 1;
      break;

    case TIMED_OUT:
      counters["sessions_timed_out"] = 1;
      break;

    default:
      break;
  }
  return counters;
}

auto session::run(std::span<const std::byte> request,
                  bool truncated) -> session_state
{
  using enum messages::error_t;
  auto err = std::error_code();
  auto pkt = decode(request, err);
  if (truncated)
    err = make_error_code(errc::malformed_packet);

  if (err)
  {
    spdlog::error("RRQ:{}:Malformed request.", addrstr_);
    fail(NOT_DEFINED, "Malformed packet.", err);
    return finish();
  }

  const auto *req = std::get_if<messages::request>(&pkt);
  if (req == nullptr || req->opc != messages::RRQ)
  {
    spdlog::error("{}:{}:{}", req != nullptr ? "WRQ" : "TFTP", addrstr_,
                  errors::errstr(ILLEGAL_OPERATION));
    fail(ILLEGAL_OPERATION, {}, errc::unsupported_operation);
    return finish();
  }

  spdlog::info("RRQ:{}:New RRQ.", addrstr_);
  if (open(*req) && negotiate_options(*req) && transfer())
  {
    state_ = session_state::COMPLETE;
    spdlog::info("RRQ:{}:Completed {}.", addrstr_, stats_.file_path);
  }
  return finish();
}

auto session::open(const messages::request &req) -> bool
{
  using enum messages::error_t;
  stats_.file_path = req.filename;
  stats_.mode = req.mode_name;
  stats_.options_in = req.options;

  if (req.mode != messages::NETASCII && req.mode != messages::OCTET)
  {
    auto message = "Unknown mode: '" + req.mode_name + "'";
    spdlog::error("RRQ:{}:{}", addrstr_, message);
    fail(ILLEGAL_OPERATION, message, errc::unsupported_operation);
    return false;
  }

  auto err = std::error_code();
  try
  {
    if (config_.factory)
      source_ = config_.factory(
          request_context{.server_addr = stats_.server_addr,
                          .peer = stats_.peer,
                          .request = req},
          err);
  }
  catch (const std::exception &exc)
  {
    spdlog::error("RRQ:{}:{}", addrstr_, exc.what());
    fail(NOT_DEFINED, exc.what(), errc::data_source_unavailable);
    return false;
  }
  catch (...)
  {
    spdlog::error("RRQ:{}:Unknown exception from the handler factory.",
                  addrstr_);
    fail(NOT_DEFINED, {}, errc::data_source_unavailable);
    return false;
  }

  if (err || !source_)
  {
    auto code = std::uint16_t{NOT_DEFINED};
    auto message = err ? err.message() : std::string("No data source.");
    if (err == std::errc::no_such_file_or_directory)
    {
      code = FILE_NOT_FOUND;
      message.clear();
    }
    else if (err == std::errc::permission_denied)
    {
      code = ACCESS_VIOLATION;
      message.clear();
    }
    spdlog::error("RRQ:{}:{}: {}", addrstr_, req.filename,
                  message.empty() ? errors::errstr(code) : message);
    fail(code, message, errc::data_source_unavailable);
    return false;
  }

  if (req.mode == messages::NETASCII)
    source_ = std::make_unique<netascii_source>(std::move(source_));

  return true;
}

auto session::negotiate_options(const messages::request &req) -> bool
{
  state_ = session_state::NEGOTIATING;
  auto result = negotiation{};
  try
  {
    result = negotiate(req.options, config_.timeout, config_.policy, *source_);
  }
  catch (const std::exception &exc)
  {
    spdlog::error("RRQ:{}:Error while reading from source: {}", addrstr_,
                  exc.what());
    fail(messages::NOT_DEFINED, "Error while reading from source",
         errc::data_source_read_failure);
    return false;
  }
  catch (...)
  {
    spdlog::error("RRQ:{}:Unknown exception while sizing the source.",
                  addrstr_);
    fail(messages::NOT_DEFINED, "Error while reading from source",
         errc::data_source_read_failure);
    return false;
  }

  options_ = result.options;
  stats_.blksize = options_.block_size;
  stats_.options_acked = result.acknowledged;
  if (!result.ack_required)
    return true;

  auto datagram = std::vector<char>();
  encode(messages::oack{.options = std::move(result.acknowledged)}, datagram);
  return exchange(0, datagram);
}

auto session::transfer() -> bool
{
  state_ = session_state::TRANSFERRING;
  auto msg = messages::data{.block_num = 1, .payload = {}};
  auto datagram = std::vector<char>();
  while (true)
  {
    auto err = std::error_code();
    msg.payload.resize(options_.block_size);
    try
    {
      msg.payload.resize(read_full(*source_, msg.payload, err));
    }
    catch (const std::exception &exc)
    {
      spdlog::error("RRQ:{}:{}", addrstr_, exc.what());
      err = make_error_code(errc::data_source_read_failure);
    }
    catch (...)
    {
      spdlog::error("RRQ:{}:Unknown exception while reading.", addrstr_);
      err = make_error_code(errc::data_source_read_failure);
    }

    if (err)
    {
      spdlog::error("RRQ:{}:Error while reading from source: {}", addrstr_,
                    err.message());
      fail(messages::NOT_DEFINED, "Error while reading from source",
           errc::data_source_read_failure);
      return false;
    }

    encode(msg, options_.block_size, datagram);
    if (!exchange(msg.block_num, datagram))
      return false;

    if (msg.payload.size() < options_.block_size)
      return true;

    ++msg.block_num;
  }
}

auto session::exchange(std::uint16_t block,
                       std::span<const char> datagram) -> bool
{
  if (!transmit(datagram))
    return false;

  auto retransmits = std::uint32_t{0};
  auto deadline = clock::now() + options_.timeout;
  while (true)
  {
    auto from = endpoint{};
    auto err = std::error_code();
    auto len = socket_.receive(buffer_, deadline, from, err);
    if (err == std::errc::timed_out)
    {
      if (retransmits >= config_.retries)
      {
        state_ = session_state::TIMED_OUT;
        stats_.error_code = messages::NOT_DEFINED;
        stats_.error_message =
            "timeout after " + std::to_string(retransmits) + " retransmits.";
        stats_.reason = make_error_code(errc::retry_exhausted);
        spdlog::error("RRQ:{}:Block {}: {}", addrstr_, block,
                      stats_.error_message);
        return false;
      }

      ++retransmits;
      ++stats_.retransmits;
      spdlog::debug("RRQ:{}:Retransmitting block {}.", addrstr_, block);
      if (!transmit(datagram))
        return false;

      deadline = clock::now() + options_.timeout;
      continue;
    }

    if (err)
    {
      spdlog::error("RRQ:{}:{}", addrstr_, err.message());
      record(messages::NOT_DEFINED, err.message(), err);
      return false;
    }

    if (!same_endpoint(from, stats_.peer))
    {
      spdlog::warn("RRQ:{}:Unexpected peer {}.", addrstr_, to_string(from));
      if (auto ec = socket_.send(errors::msg(messages::UNKNOWN_TID), from))
        spdlog::warn("RRQ:{}:{}", addrstr_, ec.message());
      continue;
    }

    auto pkt = decode(std::as_bytes(std::span(buffer_.data(), len)), err);
    if (err)
    {
      spdlog::error("RRQ:{}:Malformed packet.", addrstr_);
      fail(messages::NOT_DEFINED, "Malformed packet.", err);
      return false;
    }

    if (const auto *ack = std::get_if<messages::ack>(&pkt))
    {
      // Stale ACKs don't move the deadline.
      if (ack->block_num != block)
        continue;

      ++stats_.packets_acked;
      return true;
    }

    if (const auto *error = std::get_if<messages::error>(&pkt))
    {
      spdlog::error("RRQ:{}:Error reported from client: {}", addrstr_,
                    error->message);
      record(error->code, error->message, errc::client_error);
      return false;
    }

    spdlog::error("RRQ:{}:Expected an ACK.", addrstr_);
    fail(messages::ILLEGAL_OPERATION, {}, errc::unsupported_operation);
    return false;
  }
}

auto session::transmit(std::span<const char> datagram) -> bool
{
  if (auto err = socket_.send(datagram, stats_.peer))
  {
    spdlog::error("RRQ:{}:{}", addrstr_, err.message());
    record(messages::NOT_DEFINED, err.message(), err);
    return false;
  }

  ++stats_.packets_sent;
  if (detail::load_u16(std::as_bytes(datagram)) == messages::DATA)
    stats_.bytes_sent += datagram.size() - messages::HEADER_LEN;

  return true;
}

auto session::fail(std::uint16_t code, std::string_view message,
                   std::error_code reason) -> void
{
  record(code, message, reason);
  if (auto err = socket_.send(errors::msg(code, stats_.error_message),
                              stats_.peer))
  {
    spdlog::warn("RRQ:{}:{}", addrstr_, err.message());
  }
}

auto session::record(std::uint16_t code, std::string_view message,
                     std::error_code reason) -> void
{
  state_ = session_state::ERROR;
  stats_.error_code = code;
  stats_.error_message = message.empty() ? errors::errstr(code) : message;
  stats_.reason = reason;
}

auto session::finish() -> session_state
{
  if (source_)
  {
    source_->close();
    source_.reset();
  }

  stats_.outcome = state_;
  stats_.end_time = session_stats::clock::now();
  if (config_.stats_callback)
  {
    try
    {
      config_.stats_callback(stats_);
    }
    catch (const std::exception &exc)
    {
      spdlog::error("RRQ:{}:Session stats callback failed: {}", addrstr_,
                    exc.what());
    }
    catch (...)
    {
      spdlog::error("RRQ:{}:Session stats callback failed.", addrstr_);
    }
  }
  return state_;
}

} // namespace tftpkit
