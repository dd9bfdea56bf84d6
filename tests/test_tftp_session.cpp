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
// NOLINTBEGIN
#include "tftpkit/error.hpp"
#include "tftpkit/protocol/tftp_session.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <deque>
#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using namespace tftpkit;
using namespace std::chrono_literals;

/** @brief An in-memory transport driven by a scripted client. */
class mock_transport final : public transport {
public:
  struct datagram {
    std::vector<char> data;
    endpoint peer;
  };

  using responder = std::function<void(mock_transport &, std::span<const char>)>;

  auto send(std::span<const char> buf,
            const endpoint &peer) -> std::error_code override
  {
    sent.push_back({{buf.begin(), buf.end()}, peer});
    if (on_send)
      on_send(*this, buf);
    return {};
  }

  auto receive(std::span<char> buf, clock::time_point deadline, endpoint &from,
               std::error_code &err) -> std::size_t override
  {
    deadlines.push_back(deadline);
    if (inbox.empty())
    {
      ++timeouts;
      err = std::make_error_code(std::errc::timed_out);
      return 0;
    }

    auto msg = std::move(inbox.front());
    inbox.pop_front();
    err.clear();
    from = msg.peer;
    auto len = std::min(buf.size(), msg.data.size());
    std::copy_n(msg.data.begin(), len, buf.begin());
    return len;
  }

  auto push(std::vector<char> data, const endpoint &from) -> void
  {
    inbox.push_back({std::move(data), from});
  }

  std::deque<datagram> inbox;
  std::vector<datagram> sent;
  std::vector<clock::time_point> deadlines;
  responder on_send;
  int timeouts = 0;
};

/** @brief Serves a string and counts how often it is closed. */
class tracked_source final : public data_source {
public:
  tracked_source(std::string data, int &closes,
                 std::size_t fail_at = std::string::npos, bool throws = false)
      : data_{std::move(data)}, closes_{closes}, fail_at_{fail_at},
        throws_{throws}
  {}

  auto read(std::span<char> buf, std::error_code &err) -> std::size_t override
  {
    err.clear();
    if (offset_ >= fail_at_)
    {
      if (throws_)
        throw std::runtime_error("disk on fire");

      err = std::make_error_code(std::errc::io_error);
      return 0;
    }

    auto len = std::min({buf.size(), data_.size() - offset_, fail_at_ - offset_});
    std::copy_n(data_.data() + offset_, len, buf.data());
    offset_ += len;
    return len;
  }

  auto size() -> std::optional<std::uint64_t> override { return data_.size(); }

  auto close() noexcept -> void override { ++closes_; }

private:
  std::string data_;
  int &closes_;
  std::size_t fail_at_;
  bool throws_;
  std::size_t offset_ = 0;
};

/** @brief Throws a non-standard exception from read() or size(). */
class int_throwing_source final : public data_source {
public:
  int_throwing_source(int &closes, bool throw_on_size)
      : closes_{closes}, throw_on_size_{throw_on_size}
  {}

  auto read(std::span<char>, std::error_code &) -> std::size_t override
  {
    throw 42;
  }

  auto size() -> std::optional<std::uint64_t> override
  {
    if (throw_on_size_)
      throw 42;
    return 100;
  }

  auto close() noexcept -> void override { ++closes_; }

private:
  int &closes_;
  bool throw_on_size_;
};

static auto ack(std::uint16_t block) -> std::vector<char>
{
  auto buf = std::vector<char>();
  encode(messages::ack{.block_num = block}, buf);
  return buf;
}

static auto rrq(std::vector<messages::option> options = {},
                std::string mode = "octet") -> messages::request
{
  return {.opc = messages::RRQ,
          .filename = "boot/pxelinux.0",
          .mode_name = mode,
          .mode = to_mode(mode),
          .options = std::move(options)};
}

static auto decode_sent(const mock_transport::datagram &msg) -> packet
{
  auto err = std::error_code();
  auto pkt = decode(std::as_bytes(std::span(msg.data)), err);
  EXPECT_FALSE(err);
  return pkt;
}

class SessionTest : public ::testing::Test {
protected:
  auto SetUp() -> void override
  {
    auto err = std::error_code();
    client = make_endpoint("127.0.0.1", 50000, err);
    ASSERT_FALSE(err);
    stranger = make_endpoint("127.0.0.1", 50001, err);
    ASSERT_FALSE(err);
    server = make_endpoint("127.0.0.1", 69, err);
    ASSERT_FALSE(err);

    config.retries = 3;
    config.timeout = 1s;
    config.factory = [this](const request_context &ctx,
                            std::error_code &err)
        -> std::unique_ptr<data_source> {
      ++factory_calls;
      requested = ctx.request.filename;
      if (factory_error)
      {
        err = factory_error;
        return nullptr;
      }
      return std::make_unique<tracked_source>(content, closes, fail_at,
                                              read_throws);
    };
    config.stats_callback = [this](const session_stats &stats) {
      ++stats_calls;
      last_stats = stats;
    };
  }

  /** @brief ACKs every DATA block and the OACK unless drop says otherwise. */
  auto ack_everything(std::function<bool(std::uint16_t)> drop = {}) -> void
  {
    sock.on_send = [this, drop](mock_transport &transport,
                                std::span<const char> buf) {
      auto err = std::error_code();
      auto pkt = decode(std::as_bytes(buf), err);
      if (err)
        return;

      if (const auto *data = std::get_if<messages::data>(&pkt))
      {
        if (!drop || !drop(data->block_num))
          transport.push(ack(data->block_num), client);
      }
      else if (std::holds_alternative<messages::oack>(pkt))
      {
        if (!drop || !drop(0))
          transport.push(ack(0), client);
      }
    };
  }

  auto run(const messages::request &req) -> session_state
  {
    auto buf = std::vector<char>();
    encode(req, buf);
    return run_bytes(buf);
  }

  auto run_bytes(const std::vector<char> &buf,
                 bool truncated = false) -> session_state
  {
    auto sess = session(sock, server, client, config);
    auto state = sess.run(std::as_bytes(std::span(buf)), truncated);
    EXPECT_EQ(sess.state(), state);
    counters = sess.counters();
    return state;
  }

  /** @returns The payload sizes of every DATA packet sent, in order. */
  auto data_sizes() -> std::vector<std::size_t>
  {
    auto sizes = std::vector<std::size_t>();
    for (const auto &msg : sock.sent)
    {
      auto pkt = decode_sent(msg);
      if (const auto *data = std::get_if<messages::data>(&pkt))
        sizes.push_back(data->payload.size());
    }
    return sizes;
  }

  /** @returns The single ERROR packet sent, failing if there isn't one. */
  auto sent_error() -> messages::error
  {
    auto errors = std::vector<messages::error>();
    for (const auto &msg : sock.sent)
    {
      auto pkt = decode_sent(msg);
      if (const auto *error = std::get_if<messages::error>(&pkt))
        errors.push_back(*error);
    }
    EXPECT_EQ(errors.size(), 1);
    return errors.empty() ? messages::error{} : errors.front();
  }

  endpoint client;
  endpoint stranger;
  endpoint server;
  mock_transport sock;
  session_config config;
  std::string content;
  std::string requested;
  std::error_code factory_error;
  std::size_t fail_at = std::string::npos;
  bool read_throws = false;
  int factory_calls = 0;
  int closes = 0;
  int stats_calls = 0;
  session_stats last_stats;
  statistics::counters_t counters;
};

TEST_F(SessionTest, StaticFileInDefaultBlocks)
{
  content = std::string(1500, 'x');
  ack_everything();

  EXPECT_EQ(run(rrq()), session_state::COMPLETE);
  EXPECT_EQ(data_sizes(), (std::vector<std::size_t>{512, 512, 476}));
  EXPECT_EQ(requested, "boot/pxelinux.0");
  EXPECT_EQ(closes, 1);
  EXPECT_EQ(sock.timeouts, 0);

  // Each DATA block follows exactly one ACK of its predecessor.
  auto block = std::uint16_t{1};
  for (const auto &msg : sock.sent)
  {
    auto pkt = decode_sent(msg);
    ASSERT_TRUE(std::holds_alternative<messages::data>(pkt));
    EXPECT_EQ(std::get<messages::data>(pkt).block_num, block++);
    EXPECT_TRUE(same_endpoint(msg.peer, client));
  }
}

TEST_F(SessionTest, ExactMultipleEndsWithEmptyBlock)
{
  content = std::string(1536, 'x');
  ack_everything();

  EXPECT_EQ(run(rrq()), session_state::COMPLETE);
  EXPECT_EQ(data_sizes(), (std::vector<std::size_t>{512, 512, 512, 0}));
}

TEST_F(SessionTest, EmptyFileSendsOneEmptyBlock)
{
  ack_everything();

  EXPECT_EQ(run(rrq()), session_state::COMPLETE);
  EXPECT_EQ(data_sizes(), (std::vector<std::size_t>{0}));
}

TEST_F(SessionTest, WriteRequestIsRejected)
{
  ack_everything();
  auto req = rrq();
  req.opc = messages::WRQ;

  EXPECT_EQ(run(req), session_state::ERROR);
  ASSERT_EQ(sock.sent.size(), 1);

  auto error = sent_error();
  EXPECT_EQ(error.code, messages::ILLEGAL_OPERATION);
  EXPECT_EQ(error.message, "Illegal TFTP operation.");
  EXPECT_EQ(factory_calls, 0);
  EXPECT_EQ(last_stats.reason, errc::unsupported_operation);
}

TEST_F(SessionTest, OtherOpcodesAreRejected)
{
  auto buf = std::vector<char>();
  encode(messages::ack{.block_num = 1}, buf);

  EXPECT_EQ(run_bytes(buf), session_state::ERROR);
  EXPECT_EQ(sent_error().code, messages::ILLEGAL_OPERATION);
  EXPECT_EQ(factory_calls, 0);
}

TEST_F(SessionTest, MalformedRequestIsRejected)
{
  auto buf = std::vector<char>{0, 1, 'f', 'i', 'l', 'e'};

  EXPECT_EQ(run_bytes(buf), session_state::ERROR);
  auto error = sent_error();
  EXPECT_EQ(error.code, messages::NOT_DEFINED);
  EXPECT_EQ(error.message, "Malformed packet.");
  EXPECT_EQ(last_stats.reason, errc::malformed_packet);
}

TEST_F(SessionTest, TruncatedRequestIsMalformed)
{
  auto buf = std::vector<char>();
  encode(rrq(), buf);

  EXPECT_EQ(run_bytes(buf, true), session_state::ERROR);
  EXPECT_EQ(sent_error().message, "Malformed packet.");
  EXPECT_EQ(factory_calls, 0);
}

TEST_F(SessionTest, UnknownModeIsRejected)
{
  EXPECT_EQ(run(rrq({}, "mail")), session_state::ERROR);
  auto error = sent_error();
  EXPECT_EQ(error.code, messages::ILLEGAL_OPERATION);
  EXPECT_EQ(error.message, "Unknown mode: 'mail'");
  EXPECT_EQ(factory_calls, 0);
}

TEST_F(SessionTest, MissingFile)
{
  factory_error = std::make_error_code(std::errc::no_such_file_or_directory);

  EXPECT_EQ(run(rrq()), session_state::ERROR);
  auto error = sent_error();
  EXPECT_EQ(error.code, messages::FILE_NOT_FOUND);
  EXPECT_EQ(error.message, "File not found.");
  EXPECT_EQ(last_stats.reason, errc::data_source_unavailable);
  EXPECT_EQ(closes, 0);
}

TEST_F(SessionTest, PermissionDenied)
{
  factory_error = std::make_error_code(std::errc::permission_denied);

  EXPECT_EQ(run(rrq()), session_state::ERROR);
  EXPECT_EQ(sent_error().code, messages::ACCESS_VIOLATION);
}

TEST_F(SessionTest, OtherFactoryErrorsUseTheirMessage)
{
  factory_error = std::make_error_code(std::errc::io_error);

  EXPECT_EQ(run(rrq()), session_state::ERROR);
  auto error = sent_error();
  EXPECT_EQ(error.code, messages::NOT_DEFINED);
  EXPECT_EQ(error.message, factory_error.message());
}

TEST_F(SessionTest, FactoryExceptionsAreContained)
{
  config.factory = [](const request_context &,
                      std::error_code &) -> std::unique_ptr<data_source> {
    throw std::runtime_error("handler exploded");
  };

  EXPECT_EQ(run(rrq()), session_state::ERROR);
  auto error = sent_error();
  EXPECT_EQ(error.code, messages::NOT_DEFINED);
  EXPECT_EQ(error.message, "handler exploded");
}

TEST_F(SessionTest, NonStandardFactoryExceptionsAreContained)
{
  config.factory = [](const request_context &,
                      std::error_code &) -> std::unique_ptr<data_source> {
    throw 42;
  };

  EXPECT_EQ(run(rrq()), session_state::ERROR);
  auto error = sent_error();
  EXPECT_EQ(error.code, messages::NOT_DEFINED);
  EXPECT_EQ(error.message, "Not defined.");
  EXPECT_EQ(last_stats.reason, errc::data_source_unavailable);
  EXPECT_EQ(stats_calls, 1);
  EXPECT_EQ(counters["sessions_error"], 1);
}

TEST_F(SessionTest, NonStandardReadExceptionsAreContained)
{
  config.factory = [this](const request_context &,
                          std::error_code &) -> std::unique_ptr<data_source> {
    return std::make_unique<int_throwing_source>(closes, false);
  };
  ack_everything();

  EXPECT_EQ(run(rrq()), session_state::ERROR);
  EXPECT_EQ(sent_error().message, "Error while reading from source");
  EXPECT_EQ(last_stats.reason, errc::data_source_read_failure);
  EXPECT_EQ(closes, 1);
  EXPECT_EQ(stats_calls, 1);
}

TEST_F(SessionTest, NonStandardSizeExceptionsAreContained)
{
  config.factory = [this](const request_context &,
                          std::error_code &) -> std::unique_ptr<data_source> {
    return std::make_unique<int_throwing_source>(closes, true);
  };
  ack_everything();

  EXPECT_EQ(run(rrq({{"tsize", "0"}})), session_state::ERROR);
  EXPECT_EQ(sent_error().message, "Error while reading from source");
  EXPECT_TRUE(data_sizes().empty());
  EXPECT_EQ(closes, 1);
}

TEST_F(SessionTest, NonStandardStatsCallbackExceptionsAreContained)
{
  config.stats_callback = [](const session_stats &) { throw 42; };
  ack_everything();

  EXPECT_EQ(run(rrq()), session_state::COMPLETE);
  EXPECT_EQ(closes, 1);
}

TEST_F(SessionTest, NoOptionFallback)
{
  content = std::string(600, 'y');
  ack_everything();

  EXPECT_EQ(run(rrq({{"windowsize", "4"}})), session_state::COMPLETE);
  ASSERT_FALSE(sock.sent.empty());

  auto first = decode_sent(sock.sent.front());
  ASSERT_TRUE(std::holds_alternative<messages::data>(first));
  EXPECT_EQ(std::get<messages::data>(first).block_num, 1);
  EXPECT_EQ(data_sizes(), (std::vector<std::size_t>{512, 88}));
}

TEST_F(SessionTest, OackIsAcknowledgedWithBlockZero)
{
  content = std::string(3000, 'z');
  ack_everything();

  EXPECT_EQ(run(rrq({{"blksize", "1024"}, {"tsize", "0"}})),
            session_state::COMPLETE);

  auto first = decode_sent(sock.sent.front());
  ASSERT_TRUE(std::holds_alternative<messages::oack>(first));
  EXPECT_EQ(std::get<messages::oack>(first).options,
            (std::vector<messages::option>{{"blksize", "1024"},
                                           {"tsize", "3000"}}));
  EXPECT_EQ(data_sizes(), (std::vector<std::size_t>{1024, 1024, 952}));
  EXPECT_EQ(last_stats.blksize, 1024);
  EXPECT_EQ(last_stats.options_acked.size(), 2);
}

TEST_F(SessionTest, OptionClamp)
{
  content = std::string(70000, 'c');
  ack_everything();

  EXPECT_EQ(run(rrq({{"blksize", "100000"}})), session_state::COMPLETE);
  auto first = decode_sent(sock.sent.front());
  EXPECT_EQ(std::get<messages::oack>(first).options,
            (std::vector<messages::option>{{"blksize", "65464"}}));
  EXPECT_EQ(data_sizes(), (std::vector<std::size_t>{65464, 4536}));
}

TEST_F(SessionTest, IdempotentDuplicateAck)
{
  content = std::string(1500, 'd');
  sock.on_send = [this](mock_transport &transport, std::span<const char> buf) {
    auto err = std::error_code();
    auto pkt = decode(std::as_bytes(buf), err);
    const auto &data = std::get<messages::data>(pkt);
    // Redeliver every already satisfied ACK before the real one.
    if (data.block_num > 1)
      transport.push(ack(data.block_num - 1), client);
    transport.push(ack(data.block_num), client);
  };

  EXPECT_EQ(run(rrq()), session_state::COMPLETE);
  EXPECT_EQ(data_sizes(), (std::vector<std::size_t>{512, 512, 476}));
  EXPECT_EQ(sock.sent.size(), 3);
  EXPECT_EQ(last_stats.retransmits, 0);
  EXPECT_EQ(last_stats.packets_acked, 3);
}

TEST_F(SessionTest, StaleAckDoesNotMoveTheDeadline)
{
  content = std::string(100, 's');
  sock.on_send = [this](mock_transport &transport, std::span<const char>) {
    transport.push(ack(7), client);
    transport.push(ack(1), client);
  };

  EXPECT_EQ(run(rrq()), session_state::COMPLETE);
  ASSERT_EQ(sock.deadlines.size(), 2);
  EXPECT_EQ(sock.deadlines[0], sock.deadlines[1]);
}

TEST_F(SessionTest, DroppedFinalAck)
{
  content = std::string(1024, 'f');
  ack_everything([](std::uint16_t block) { return block == 3; });

  EXPECT_EQ(run(rrq()), session_state::TIMED_OUT);
  EXPECT_EQ(data_sizes(),
            (std::vector<std::size_t>{512, 512, 0, 0, 0, 0}));
  EXPECT_EQ(last_stats.retransmits, config.retries);
  EXPECT_EQ(last_stats.outcome, session_state::TIMED_OUT);
  EXPECT_EQ(closes, 1);

  // The client is presumed gone: no ERROR is sent.
  for (const auto &msg : sock.sent)
    EXPECT_FALSE(std::holds_alternative<messages::error>(decode_sent(msg)));
}

TEST_F(SessionTest, RetryBound)
{
  content = std::string(100, 'r');
  config.retries = 5;

  EXPECT_EQ(run(rrq()), session_state::TIMED_OUT);
  ASSERT_EQ(sock.sent.size(), 6);
  for (const auto &msg : sock.sent)
    EXPECT_EQ(msg.data, sock.sent.front().data);

  EXPECT_EQ(sock.timeouts, 6);
  EXPECT_EQ(last_stats.retransmits, 5);
  EXPECT_EQ(last_stats.reason, errc::retry_exhausted);
  EXPECT_EQ(last_stats.error_message, "timeout after 5 retransmits.");
  EXPECT_EQ(counters["sessions_timed_out"], 1);
  EXPECT_EQ(counters["retransmits"], 5);
}

TEST_F(SessionTest, RetryBoundWithoutRetries)
{
  config.retries = 0;

  EXPECT_EQ(run(rrq()), session_state::TIMED_OUT);
  EXPECT_EQ(sock.sent.size(), 1);
  EXPECT_EQ(sock.timeouts, 1);
}

TEST_F(SessionTest, UnacknowledgedOackTimesOut)
{
  content = std::string(100, 'o');

  EXPECT_EQ(run(rrq({{"tsize", "0"}})), session_state::TIMED_OUT);
  ASSERT_EQ(sock.sent.size(), 4);
  for (const auto &msg : sock.sent)
    EXPECT_TRUE(std::holds_alternative<messages::oack>(decode_sent(msg)));
  EXPECT_TRUE(data_sizes().empty());
  EXPECT_EQ(closes, 1);
}

TEST_F(SessionTest, RetransmissionRecoversTheTransfer)
{
  content = std::string(700, 'q');
  auto dropped = false;
  ack_everything([&](std::uint16_t block) {
    if (block == 2 && !dropped)
    {
      dropped = true;
      return true;
    }
    return false;
  });

  EXPECT_EQ(run(rrq()), session_state::COMPLETE);
  EXPECT_EQ(data_sizes(), (std::vector<std::size_t>{512, 188, 188}));
  EXPECT_EQ(last_stats.retransmits, 1);
  EXPECT_EQ(last_stats.packets_sent, 3);
  EXPECT_EQ(last_stats.bytes_sent, 888);
}

TEST_F(SessionTest, ReadFailure)
{
  content = std::string(2000, 'e');
  fail_at = 600;
  ack_everything();

  EXPECT_EQ(run(rrq()), session_state::ERROR);
  EXPECT_EQ(data_sizes(), (std::vector<std::size_t>{512}));
  auto error = sent_error();
  EXPECT_EQ(error.code, messages::NOT_DEFINED);
  EXPECT_EQ(error.message, "Error while reading from source");
  EXPECT_EQ(last_stats.reason, errc::data_source_read_failure);
  EXPECT_EQ(closes, 1);
}

TEST_F(SessionTest, ReadExceptionIsContained)
{
  content = std::string(2000, 'e');
  fail_at = 0;
  read_throws = true;
  ack_everything();

  EXPECT_EQ(run(rrq()), session_state::ERROR);
  EXPECT_EQ(sent_error().message, "Error while reading from source");
  EXPECT_EQ(closes, 1);
}

TEST_F(SessionTest, ClientErrorEndsTheSession)
{
  content = std::string(2000, 'e');
  sock.on_send = [this](mock_transport &transport, std::span<const char>) {
    auto buf = std::vector<char>();
    encode(messages::error{.code = messages::DISK_FULL, .message = "full"},
           buf);
    transport.push(buf, client);
  };

  EXPECT_EQ(run(rrq()), session_state::ERROR);
  EXPECT_EQ(sock.sent.size(), 1);
  EXPECT_EQ(last_stats.error_code, messages::DISK_FULL);
  EXPECT_EQ(last_stats.error_message, "full");
  EXPECT_EQ(last_stats.reason, errc::client_error);
  EXPECT_EQ(closes, 1);
}

TEST_F(SessionTest, UnterminatedClientErrorGetsNoReply)
{
  content = std::string(2000, 'e');
  sock.on_send = [this](mock_transport &transport, std::span<const char>) {
    transport.push({0, 5, 0, 3, 'f', 'u', 'l', 'l'}, client);
  };

  EXPECT_EQ(run(rrq()), session_state::ERROR);
  EXPECT_EQ(sock.sent.size(), 1);
  EXPECT_EQ(last_stats.error_code, messages::DISK_FULL);
  EXPECT_EQ(last_stats.error_message, "full");
  EXPECT_EQ(last_stats.reason, errc::client_error);
  EXPECT_EQ(closes, 1);
}

TEST_F(SessionTest, MalformedReplyEndsTheSession)
{
  content = std::string(2000, 'm');
  sock.on_send = [this](mock_transport &transport, std::span<const char>) {
    transport.push({0, 9, 0, 1}, client);
  };

  EXPECT_EQ(run(rrq()), session_state::ERROR);
  EXPECT_EQ(sent_error().message, "Malformed packet.");
  EXPECT_EQ(closes, 1);
}

TEST_F(SessionTest, UnknownTransferId)
{
  content = std::string(600, 'u');
  auto intruded = false;
  sock.on_send = [&](mock_transport &transport, std::span<const char> buf) {
    auto err = std::error_code();
    auto pkt = decode(std::as_bytes(buf), err);
    if (const auto *data = std::get_if<messages::data>(&pkt))
    {
      if (!intruded)
      {
        intruded = true;
        transport.push(ack(data->block_num), stranger);
      }
      transport.push(ack(data->block_num), client);
    }
  };

  EXPECT_EQ(run(rrq()), session_state::COMPLETE);
  EXPECT_EQ(data_sizes(), (std::vector<std::size_t>{512, 88}));

  auto to_stranger = std::vector<messages::error>();
  for (const auto &msg : sock.sent)
  {
    if (!same_endpoint(msg.peer, stranger))
      continue;
    to_stranger.push_back(std::get<messages::error>(decode_sent(msg)));
  }
  ASSERT_EQ(to_stranger.size(), 1);
  EXPECT_EQ(to_stranger.front().code, messages::UNKNOWN_TID);
  EXPECT_EQ(to_stranger.front().message, "Unknown transfer ID.");
}

TEST_F(SessionTest, BlockNumberWraps)
{
  content = std::string(8 * 65536 + 3, 'w');
  ack_everything();

  EXPECT_EQ(run(rrq({{"blksize", "8"}})), session_state::COMPLETE);

  auto blocks = std::vector<std::uint16_t>();
  for (const auto &msg : sock.sent)
  {
    auto pkt = decode_sent(msg);
    if (const auto *data = std::get_if<messages::data>(&pkt))
      blocks.push_back(data->block_num);
  }
  ASSERT_EQ(blocks.size(), 65537);
  EXPECT_EQ(blocks.front(), 1);
  EXPECT_EQ(blocks[65534], 65535);
  EXPECT_EQ(blocks[65535], 0);
  EXPECT_EQ(blocks[65536], 1);
}

TEST_F(SessionTest, NetasciiMode)
{
  content = "a\nb\r";
  ack_everything();

  EXPECT_EQ(run(rrq({{"tsize", "0"}}, "netascii")), session_state::COMPLETE);
  auto first = decode_sent(sock.sent.front());
  EXPECT_EQ(std::get<messages::oack>(first).options,
            (std::vector<messages::option>{{"tsize", "6"}}));

  auto data = decode_sent(sock.sent.at(1));
  const auto &payload = std::get<messages::data>(data).payload;
  EXPECT_EQ(std::string(payload.begin(), payload.end()),
            std::string("a\r\nb\r\0", 6));
  EXPECT_EQ(closes, 1);
}

TEST_F(SessionTest, SessionStatsRecord)
{
  content = std::string(1000, 'k');
  ack_everything();

  EXPECT_EQ(run(rrq({{"blksize", "600"}})), session_state::COMPLETE);
  EXPECT_EQ(stats_calls, 1);
  EXPECT_TRUE(same_endpoint(last_stats.peer, client));
  EXPECT_TRUE(same_endpoint(last_stats.server_addr, server));
  EXPECT_EQ(last_stats.file_path, "boot/pxelinux.0");
  EXPECT_EQ(last_stats.mode, "octet");
  EXPECT_EQ(last_stats.options_in,
            (std::vector<messages::option>{{"blksize", "600"}}));
  EXPECT_EQ(last_stats.blksize, 600);
  EXPECT_EQ(last_stats.outcome, session_state::COMPLETE);
  EXPECT_EQ(last_stats.packets_sent, 3);
  EXPECT_EQ(last_stats.packets_acked, 3);
  EXPECT_EQ(last_stats.bytes_sent, 1000);
  EXPECT_TRUE(last_stats.error_message.empty());
  EXPECT_FALSE(last_stats.reason);
  EXPECT_GE(last_stats.duration(), 0ms);

  EXPECT_EQ(counters, (statistics::counters_t{{"bytes_sent", 1000},
                                              {"packets_acked", 3},
                                              {"packets_sent", 3},
                                              {"retransmits", 0},
                                              {"sessions_complete", 1}}));
}

TEST_F(SessionTest, StatsCallbackExceptionsAreContained)
{
  config.stats_callback = [](const session_stats &) {
    throw std::runtime_error("stats sink offline");
  };
  ack_everything();

  EXPECT_EQ(run(rrq()), session_state::COMPLETE);
  EXPECT_EQ(closes, 1);
}

class BlockSizeInvariantTest
    : public SessionTest,
      public ::testing::WithParamInterface<
          std::pair<std::size_t, std::size_t>> {};

TEST_P(BlockSizeInvariantTest, BlockCountAndLastBlock)
{
  const auto [blksize, length] = GetParam();
  content = std::string(length, 'b');
  ack_everything();

  EXPECT_EQ(run(rrq({{"blksize", std::to_string(blksize)}})),
            session_state::COMPLETE);

  auto sizes = data_sizes();
  auto expected_count = length / blksize + 1;
  ASSERT_EQ(sizes.size(), expected_count);
  EXPECT_EQ(sizes.back(), length % blksize);
  for (auto it = sizes.begin(); it + 1 != sizes.end(); ++it)
    EXPECT_EQ(*it, blksize);
}

INSTANTIATE_TEST_SUITE_P(
    BlockSizeInvariantCases, BlockSizeInvariantTest,
    ::testing::Values(std::make_pair(8UL, 0UL), std::make_pair(8UL, 8UL),
                      std::make_pair(8UL, 20UL), std::make_pair(512UL, 1024UL),
                      std::make_pair(1428UL, 5000UL),
                      std::make_pair(65464UL, 65464UL * 2 + 1)));
// NOLINTEND
