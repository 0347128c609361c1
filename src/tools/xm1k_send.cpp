/**
 * @file xm1k_send.cpp
 * @brief Host tool sending a firmware image to a device over UART
 *
 * Usage:
 *   xm1k-send --file zephyr.bin --uart-device /dev/ttyUSB0 [--flash-offset 0x80000]
 *             [--no-verify] [--baud 115200] [--settle-ms 3000] [--retries 0]
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "xm1k/logging.hpp"
#include "xm1k/sender.hpp"
#include "xm1k/serial_channel.hpp"
#include "xm1k/transfer_plan.hpp"

using namespace xm1k;

namespace
{

void usage(const char* prog)
{
  std::cerr << "usage: " << prog
            << " --file PATH [--uart-device DEV] [--flash-offset N] [--no-verify]\n"
               "       [--baud N] [--settle-ms N] [--ready-timeout-ms N] [--ack-timeout-ms N]\n"
               "       [--retries N] [--verbose]\n";
}

bool parse_uint(const std::string& s, unsigned long& value)
{
  try
  {
    size_t used = 0;
    value = std::stoul(s, &used, 0);
    return used == s.size();
  }
  catch (const std::exception&)
  {
    return false;
  }
}

bool read_file(const std::string& path, std::vector<uint8_t>& out)
{
  std::ifstream in(path, std::ios::binary);
  if (!in)
  {
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

}  // namespace

int main(int argc, char** argv)
{
  std::string file;
  std::string device;
  bool have_offset = false;
  unsigned long flash_offset = 0;
  bool no_verify = false;
  SerialConfig serial;
  SessionConfig session;

  for (int i = 1; i < argc; i++)
  {
    const std::string a = argv[i];
    auto next = [&](int& i) -> std::string
    {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    auto next_uint = [&](int& i) -> unsigned long
    {
      unsigned long v = 0;
      const std::string s = next(i);
      if (!parse_uint(s, v))
      {
        std::cerr << "bad number for " << a << ": " << s << "\n";
        std::exit(1);
      }
      return v;
    };

    if (a == "--file")
      file = next(i);
    else if (a == "--uart-device")
      device = next(i);
    else if (a == "--flash-offset")
    {
      flash_offset = next_uint(i);
      have_offset = true;
    }
    else if (a == "--no-verify")
      no_verify = true;
    else if (a == "--baud")
      serial.baud_rate = static_cast<unsigned>(next_uint(i));
    else if (a == "--settle-ms")
      serial.settle_delay = std::chrono::milliseconds(next_uint(i));
    else if (a == "--ready-timeout-ms")
      session.ready_timeout = std::chrono::milliseconds(next_uint(i));
    else if (a == "--ack-timeout-ms")
      session.ack_timeout = std::chrono::milliseconds(next_uint(i));
    else if (a == "--retries")
      session.max_retries = static_cast<unsigned>(next_uint(i));
    else if (a == "--verbose")
      Logger::instance().set_level(LogLevel::DEBUG);
    else if (a == "--help" || a == "-h")
    {
      usage(argv[0]);
      return 0;
    }
    else
    {
      std::cerr << "unknown argument " << a << "\n";
      usage(argv[0]);
      return 1;
    }
  }

  Logger& log = Logger::instance();

  if (file.empty())
  {
    usage(argv[0]);
    return 1;
  }

  if (have_offset && flash_offset > 0xFFFFFFFFul)
  {
    log.log(LogLevel::ERROR, "flash offset 0x%lx does not fit in 32 bits", flash_offset);
    return 1;
  }

  if (device.empty())
  {
    device = serial.device;
    log.log(LogLevel::WARN, "no UART device given, defaulting to %s", device.c_str());
  }
  serial.device = device;

  std::vector<uint8_t> image;
  if (!read_file(file, image))
  {
    log.log(LogLevel::ERROR, "cannot read %s", file.c_str());
    return 1;
  }
  if (image.empty())
  {
    log.log(LogLevel::ERROR, "%s is empty", file.c_str());
    return 1;
  }
  if (image.size() > 0xFFFFFFFFul)
  {
    log.log(LogLevel::ERROR, "%s is too large for a flash header", file.c_str());
    return 1;
  }

  FlashHeader header;
  if (have_offset)
  {
    header.offset = static_cast<uint32_t>(flash_offset);
    header.size = static_cast<uint32_t>(image.size());
    header.flags = no_verify ? FLAG_NO_VERIFY : 0;
  }
  else
  {
    if (no_verify)
    {
      log.log(LogLevel::WARN, "--no-verify has no effect without --flash-offset");
    }
    log.log(LogLevel::WARN,
            "sending without flash header; most boot ROMs load the image into SRAM "
            "and execute it instead of writing it to flash");
  }

  TransferPlan plan;
  ErrorCode err = plan_transfer(image.data(), image.size(), have_offset ? &header : nullptr, plan);
  if (err != ErrorCode::OK)
  {
    log.log(LogLevel::ERROR, "cannot prepare transfer: %s", xm1k::strerror(err));
    return 1;
  }

  SerialChannel channel;
  const std::error_code ec = channel.open(serial);
  if (ec)
  {
    log.log(LogLevel::ERROR, "cannot open %s: %s", serial.device.c_str(), ec.message().c_str());
    return 1;
  }

  Sender sender(channel, session);
  sender.set_progress(
      [&log](size_t done, size_t total)
      {
        log.log(LogLevel::INFO, "sent chunk %zu / %zu (~%.2f%%)", done, total,
                100.0 * static_cast<double>(done) / static_cast<double>(total));
      });

  const SessionResult result = sender.run(plan);
  if (!result.ok())
  {
    switch (result.code)
    {
      case ErrorCode::NO_READY_MARKER:
        log.log(LogLevel::ERROR,
                "no 'C' received; make sure the SoC is in UART boot mode and waiting for "
                "an image");
        break;

      case ErrorCode::NO_FINAL_ACK:
        log.log(LogLevel::ERROR, "all chunks sent but end of transmission was not acknowledged");
        break;

      default:
        if (result.has_index)
        {
          log.log(LogLevel::ERROR, "stopped at chunk %zu / %zu: %s", result.index + 1,
                  plan.size(), xm1k::strerror(result.code));
        }
        else
        {
          log.log(LogLevel::ERROR, "transfer failed: %s", xm1k::strerror(result.code));
        }
        break;
    }
    return 1;
  }

  log.log(LogLevel::INFO, "finished sending all chunks successfully");
  return 0;
}
