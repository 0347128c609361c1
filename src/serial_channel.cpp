/**
 * @file serial_channel.cpp
 * @brief Serial Channel implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xm1k/serial_channel.hpp"

#include <thread>

#include "xm1k/logging.hpp"

namespace xm1k
{

namespace
{

// Upper bound for a single drain() so a chattering device cannot stall it
constexpr size_t MAX_DRAIN_BYTES = 64 * 1024;

}  // namespace

SerialChannel::SerialChannel() : io_(), port_(io_)
{
}

SerialChannel::~SerialChannel()
{
  close();
}

std::error_code SerialChannel::open(const SerialConfig& config)
{
  close();

  std::error_code ec;
  port_.open(config.device, ec);
  if (ec)
  {
    return ec;
  }

  using sp = asio::serial_port;
  port_.set_option(sp::baud_rate(config.baud_rate), ec);
  if (!ec)
  {
    port_.set_option(sp::character_size(8), ec);
  }
  if (!ec)
  {
    port_.set_option(sp::parity(sp::parity::none), ec);
  }
  if (!ec)
  {
    port_.set_option(sp::stop_bits(sp::stop_bits::one), ec);
  }
  if (!ec)
  {
    port_.set_option(sp::flow_control(sp::flow_control::none), ec);
  }
  if (ec)
  {
    close();
    return ec;
  }

  drain_window_ = config.drain_window;

  Logger::instance().log(LogLevel::DEBUG, "opened %s at %u baud", config.device.c_str(),
                         config.baud_rate);

  if (config.settle_delay.count() > 0)
  {
    std::this_thread::sleep_for(config.settle_delay);
  }

  return ec;
}

void SerialChannel::close()
{
  if (!port_.is_open())
  {
    return;
  }

  std::error_code ec;
  port_.close(ec);
  if (ec)
  {
    Logger::instance().log(LogLevel::WARN, "serial close failed: %s", ec.message().c_str());
  }
}

IoStatus SerialChannel::write(const uint8_t* data, size_t len)
{
  if (!port_.is_open())
  {
    return IoStatus::FAULT;
  }

  std::error_code ec;
  asio::write(port_, asio::buffer(data, len), ec);
  if (ec)
  {
    Logger::instance().log(LogLevel::WARN, "serial write error: %s", ec.message().c_str());
    return IoStatus::FAULT;
  }

  return IoStatus::OK;
}

IoStatus SerialChannel::read_byte(uint8_t& byte, std::chrono::milliseconds timeout)
{
  if (!port_.is_open())
  {
    return IoStatus::FAULT;
  }

  std::error_code result = asio::error::would_block;
  std::size_t got = 0;

  asio::async_read(port_, asio::buffer(&byte, 1),
                   [&result, &got](const std::error_code& ec, std::size_t n)
                   {
                     result = ec;
                     got = n;
                   });

  run_for(timeout);

  // The byte may still have arrived while the read was being cancelled
  if (!result && got == 1)
  {
    return IoStatus::OK;
  }

  if (result == asio::error::operation_aborted)
  {
    return IoStatus::TIMEOUT;
  }

  Logger::instance().log(LogLevel::WARN, "serial read error: %s", result.message().c_str());
  return IoStatus::FAULT;
}

IoStatus SerialChannel::drain(std::vector<uint8_t>& out)
{
  for (size_t n = 0; n < MAX_DRAIN_BYTES; ++n)
  {
    uint8_t byte = 0;
    const IoStatus status = read_byte(byte, drain_window_);
    if (status == IoStatus::TIMEOUT)
    {
      return IoStatus::OK;
    }
    if (status == IoStatus::FAULT)
    {
      return IoStatus::FAULT;
    }
    out.push_back(byte);
  }

  return IoStatus::OK;
}

void SerialChannel::run_for(std::chrono::milliseconds timeout)
{
  io_.restart();
  io_.run_for(timeout);

  if (!io_.stopped())
  {
    // Cancel the pending read and let its handler run
    std::error_code ec;
    port_.cancel(ec);
    if (ec)
    {
      Logger::instance().log(LogLevel::WARN, "serial cancel failed: %s", ec.message().c_str());
    }
    io_.run();
  }
}

}  // namespace xm1k
