/**
 * @file test_serial_channel.cpp
 * @brief SerialChannel tests over a pseudo terminal pair
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <dirent.h>
#include <poll.h>
#include <pty.h>
#include <unistd.h>

#include <chrono>
#include <vector>

#include "xm1k/logging.hpp"
#include "xm1k/serial_channel.hpp"

using namespace xm1k;

namespace
{

/**
 * Pseudo terminal whose slave side stands in for the device node
 */
struct PtyPair
{
  int master = -1;
  int slave = -1;
  char name[128] = {0};

  PtyPair()
  {
    REQUIRE(openpty(&master, &slave, name, nullptr, nullptr) == 0);
  }

  ~PtyPair()
  {
    ::close(slave);
    ::close(master);
  }

  void send(const std::vector<uint8_t>& bytes)
  {
    REQUIRE(::write(master, bytes.data(), bytes.size()) == static_cast<ssize_t>(bytes.size()));
  }

  // Read what the channel wrote, waiting up to timeout_ms for each byte
  std::vector<uint8_t> receive(size_t count, int timeout_ms = 1000)
  {
    std::vector<uint8_t> out;
    while (out.size() < count)
    {
      pollfd pfd = {master, POLLIN, 0};
      if (::poll(&pfd, 1, timeout_ms) <= 0)
      {
        break;
      }
      uint8_t buf[64];
      const ssize_t n = ::read(master, buf, sizeof(buf));
      if (n <= 0)
      {
        break;
      }
      out.insert(out.end(), buf, buf + n);
    }
    return out;
  }
};

SerialConfig config_for(const PtyPair& pty)
{
  SerialConfig config;
  config.device = pty.name;
  config.settle_delay = std::chrono::milliseconds(0);
  config.drain_window = std::chrono::milliseconds(50);
  return config;
}

size_t open_fd_count()
{
  size_t count = 0;
  DIR* dir = ::opendir("/proc/self/fd");
  REQUIRE(dir != nullptr);
  while (::readdir(dir) != nullptr)
  {
    ++count;
  }
  ::closedir(dir);
  return count;
}

}  // namespace

TEST_CASE("SerialChannel over a pseudo terminal")
{
  Logger::instance().set_level(LogLevel::OFF);

  PtyPair pty;
  SerialChannel channel;
  REQUIRE_FALSE(channel.open(config_for(pty)));
  REQUIRE(channel.is_open());

  SUBCASE("Read times out when nothing arrives")
  {
    uint8_t byte = 0;
    const auto start = std::chrono::steady_clock::now();
    CHECK(channel.read_byte(byte, std::chrono::milliseconds(100)) == IoStatus::TIMEOUT);
    CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(90));
  }

  SUBCASE("Read returns a pending byte")
  {
    pty.send({to_byte(Marker::READY)});
    uint8_t byte = 0;
    CHECK(channel.read_byte(byte, std::chrono::milliseconds(1000)) == IoStatus::OK);
    CHECK(byte == to_byte(Marker::READY));
  }

  SUBCASE("Channel stays usable after a timeout")
  {
    uint8_t byte = 0;
    REQUIRE(channel.read_byte(byte, std::chrono::milliseconds(20)) == IoStatus::TIMEOUT);
    pty.send({to_byte(Marker::ACK)});
    CHECK(channel.read_byte(byte, std::chrono::milliseconds(1000)) == IoStatus::OK);
    CHECK(byte == to_byte(Marker::ACK));
  }

  SUBCASE("Drain collects everything pending")
  {
    const std::vector<uint8_t> chatter = {'b', 'o', 'o', 't', '\r', '\n', to_byte(Marker::READY)};
    pty.send(chatter);

    std::vector<uint8_t> out;
    CHECK(channel.drain(out) == IoStatus::OK);
    CHECK(out == chatter);

    // Nothing left afterwards
    out.clear();
    CHECK(channel.drain(out) == IoStatus::OK);
    CHECK(out.empty());
  }

  SUBCASE("Write reaches the other end")
  {
    const std::vector<uint8_t> frame = {to_byte(Marker::SOH), 0x01, 0xFE, 0x00, 0x10};
    REQUIRE(channel.write(frame.data(), frame.size()) == IoStatus::OK);
    CHECK(pty.receive(frame.size()) == frame);
  }

  SUBCASE("Every operation faults after close")
  {
    channel.close();
    CHECK_FALSE(channel.is_open());

    uint8_t byte = 0x55;
    std::vector<uint8_t> out;
    CHECK(channel.read_byte(byte, std::chrono::milliseconds(10)) == IoStatus::FAULT);
    CHECK(channel.write(&byte, 1) == IoStatus::FAULT);
    CHECK(channel.drain(out) == IoStatus::FAULT);

    // Closing twice is harmless
    channel.close();
    CHECK_FALSE(channel.is_open());
  }

  Logger::instance().set_level(LogLevel::INFO);
}

TEST_CASE("SerialChannel closes the port on destruction")
{
  PtyPair pty;
  const size_t before = open_fd_count();
  {
    SerialChannel channel;
    REQUIRE_FALSE(channel.open(config_for(pty)));
    CHECK(open_fd_count() > before);
  }
  CHECK(open_fd_count() == before);
}

TEST_CASE("SerialChannel open failure")
{
  SerialChannel channel;
  SerialConfig config;
  config.device = "/dev/xm1k-no-such-device";
  config.settle_delay = std::chrono::milliseconds(0);

  const std::error_code ec = channel.open(config);
  CHECK(static_cast<bool>(ec));
  CHECK_FALSE(channel.is_open());
}
