#include "tftpkit/detail/argument_parser.hpp"
#include "tftpkit/filesystem.hpp"
#include "tftpkit/tftp_server.hpp"

#include <spdlog/cfg/helpers.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

using namespace tftpkit;

static constexpr char const *const usage =
    "usage: {} [-a <ADDRESS>] [-p <PORT>] [-r <RETRIES>] [-t <TIMEOUT>]\n"
    "          [-R <ROOT>] [-s <INTERVAL>] [-l <LEVEL>]\n"
    "\n"
    "Options:\n"
    "-h, --help                         print this help.\n"
    "-a, --address=<ADDRESS>            set the address to listen on "
    "(default: ::).\n"
    "-p, --port=<PORT>                  set the port to listen on (default: "
    "69).\n"
    "-r, --retries=<RETRIES>            set the per-packet retries (default: "
    "5).\n"
    "-t, --timeout=<TIMEOUT>            set the retransmission timeout in "
    "seconds (default: 2).\n"
    "-R, --root=<ROOT>                  set the directory to serve (default: "
    "/var/tftproot).\n"
    "-s, --stats-interval=<INTERVAL>    set the server stats interval in "
    "seconds (default: 60).\n"
    "-l, --log-level=<LEVEL>            set the log-level (critical, error, "
    "warn, info, debug)\n";

static auto signal_mask() -> sigset_t *
{
  static auto set = sigset_t{};
  static sigset_t *setp = nullptr;
  static auto mtx = std::mutex{};

  if (auto lock = std::lock_guard{mtx}; !setp)
  {
    sigemptyset(&set);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGINT);
    setp = &set;
  }
  return setp;
}

static auto signal_handler(supervisor &server) -> std::jthread
{
  static const sigset_t *sigmask = nullptr;
  static auto mtx = std::mutex();

  if (auto lock = std::lock_guard{mtx}; !sigmask)
  {
    sigmask = signal_mask();
    pthread_sigmask(SIG_BLOCK, sigmask, nullptr);

    return std::jthread([&](const std::stop_token &token) noexcept {
      static const auto timeout = timespec{.tv_sec = 0, .tv_nsec = 50000000};

      while (!token.stop_requested())
      {
        switch (sigtimedwait(sigmask, nullptr, &timeout))
        {
          case SIGTERM:
          case SIGHUP:
          case SIGINT:
            server.close();
            break;

          default:
            break;
        }
      }
    });
  }

  return {};
}

struct config {
  server_config server;
  std::filesystem::path root = "/var/tftproot";
};

static auto set_loglevel(std::string_view value) -> int
{
  using std::tolower;
  auto level = std::string(value);
  std::ranges::transform(level, level.begin(),
                         [](unsigned char chr) { return tolower(chr); });

  auto spdlog_level = spdlog::level::from_str(level);
  if (spdlog_level != spdlog::level::off || level == "off")
  {
    spdlog::set_level(spdlog_level);
    return 0;
  }

  std::cerr << std::format("Unrecognized log level: {}\n", value)
            << "Valid log levels are: ";

  int count = 0;
  for (const auto &level_str : spdlog::level::level_string_views)
  {
    if (count++ > 0)
      std::cerr << ", ";

    std::cerr << std::string(level_str.begin(), level_str.end());
  }
  std::cerr << "\n";
  return -1;
}

/** @brief Parses a decimal flag value. */
template <typename T>
static auto to_number(std::string_view value, T &out) -> bool
{
  auto [ptr, err] = std::from_chars(value.cbegin(), value.cend(), out);
  return err == std::errc{} && ptr == value.cend();
}

static auto print_session_stats(const session_stats &stats) -> void
{
  spdlog::info("RRQ:{}:{} {} {}: {} bytes in {} packets, {} retransmits, "
               "blksize {}, {}ms.",
               to_string(stats.peer), to_string(stats.outcome),
               stats.file_path, stats.mode, stats.bytes_sent,
               stats.packets_sent, stats.retransmits, stats.blksize,
               stats.duration().count());
  if (!stats.error_message.empty())
    spdlog::info("RRQ:{}:Error {}: {}", to_string(stats.peer),
                 stats.error_code, stats.error_message);
}

static auto print_server_stats(server_stats &stats) -> void
{
  auto counters = stats.get_and_reset_all_counters();
  spdlog::info("TFTP server {} up {}s, stats for the last {}s:",
               stats.server_addr(),
               std::chrono::duration_cast<std::chrono::seconds>(
                   stats.duration())
                   .count(),
               std::chrono::duration_cast<std::chrono::seconds>(
                   stats.interval())
                   .count());
  for (const auto &[name, value] : counters)
    spdlog::info("  {}: {}", name, value);
}

// NOLINTNEXTLINE
auto parse_args(int argc, char const *const *argv) -> std::optional<config>
{
  using namespace tftpkit::detail;

  auto conf = config();
  auto progname = std::filesystem::path(*argv).stem();

  auto error = [&]() -> std::optional<config> {
    std::cerr << std::format(usage, progname.c_str());
    return std::nullopt;
  };

  for (const auto &option : argument_parser::parse(argc, argv))
  {
    const auto &[flag, value] = option;
    if (flag.empty())
    {
      std::cerr << std::format("Unexpected argument: {}\n", value);
      return error();
    }

    if (flag == "-h" || flag == "--help")
    {
      std::cout << std::format(usage, progname.c_str());
      return std::nullopt;
    }

    if (flag == "-a" || flag == "--address")
    {
      conf.server.address = value;
    }
    else if (flag == "-p" || flag == "--port")
    {
      if (!to_number(value, conf.server.port))
      {
        std::cerr << std::format("Invalid port number: {}\n", value);
        return error();
      }
    }
    else if (flag == "-r" || flag == "--retries")
    {
      if (!to_number(value, conf.server.retries))
      {
        std::cerr << std::format("Invalid retries: {}\n", value);
        return error();
      }
    }
    else if (flag == "-t" || flag == "--timeout")
    {
      auto seconds = std::chrono::seconds::rep{};
      if (!to_number(value, seconds))
      {
        std::cerr << std::format("Invalid timeout: {}\n", value);
        return error();
      }
      conf.server.timeout = std::chrono::seconds(seconds);
    }
    else if (flag == "-R" || flag == "--root")
    {
      conf.root = value;
    }
    else if (flag == "-s" || flag == "--stats-interval")
    {
      auto seconds = std::chrono::seconds::rep{};
      if (!to_number(value, seconds))
      {
        std::cerr << std::format("Invalid stats interval: {}\n", value);
        return error();
      }
      conf.server.stats_interval = std::chrono::seconds(seconds);
    }
    else if (flag == "-l" || flag == "--log-level")
    {
      if (set_loglevel(value))
        return error();
    }
    else
    {
      std::cerr << std::format("Unknown flag: {}\n", flag);
      return error();
    }
  }

  return {conf};
}

auto main(int argc, char *argv[]) -> int
{
  if (const char *levels = std::getenv("SPDLOG_LEVEL"))
    spdlog::cfg::helpers::load_levels(levels);

  auto conf = parse_args(argc, argv);
  if (!conf)
    return 0;

  conf->server.factory = filesystem::static_handler(conf->root);
  conf->server.session_stats = print_session_stats;
  conf->server.server_stats = print_server_stats;

  try
  {
    auto server = supervisor(std::move(conf->server));
    auto sighandler = signal_handler(server);

    spdlog::info("TFTP server starting on UDP port {}, serving {}.",
                 port_of(server.address()), conf->root.c_str());
    if (!server.run())
      return 1;
  }
  catch (const std::system_error &exc)
  {
    std::cerr << std::format("{}\n", exc.what());
    return 1;
  }
  return 0;
}
