/**
 * @file serial_channel.hpp
 * @brief Channel over a serial device (Asio)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <asio.hpp>
#include <chrono>
#include <string>
#include <system_error>
#include <vector>

#include "xm1k/channel.hpp"

namespace xm1k
{

/**
 * @brief Serial line settings
 */
struct SerialConfig
{
  std::string device = "/dev/ttyACM0";
  unsigned baud_rate = 115200;

  /// Delay after opening before the first read. Some USB serial bridges
  /// return no data for reads issued right after the port was opened.
  std::chrono::milliseconds settle_delay{3000};

  /// How long drain() keeps collecting after the last byte arrived
  std::chrono::milliseconds drain_window{20};
};

/**
 * @brief Blocking Channel on top of asio::serial_port
 *
 * Reads are bounded by running the private io_context for the timeout
 * and cancelling the pending operation if it did not complete. The port
 * is closed by close() or the destructor, whichever comes first.
 */
class SerialChannel : public Channel
{
 public:
  SerialChannel();
  ~SerialChannel() override;

  SerialChannel(const SerialChannel&) = delete;
  SerialChannel& operator=(const SerialChannel&) = delete;

  /**
   * @brief Open and configure the device (8N1, no flow control)
   *
   * @param config Device path, baud rate and timing
   * @return Error reported by the OS, empty on success
   */
  std::error_code open(const SerialConfig& config);

  void close();

  bool is_open() const
  {
    return port_.is_open();
  }

  IoStatus write(const uint8_t* data, size_t len) override;
  IoStatus read_byte(uint8_t& byte, std::chrono::milliseconds timeout) override;
  IoStatus drain(std::vector<uint8_t>& out) override;

 private:
  /**
   * @brief Run queued handlers for at most @p timeout
   *
   * Cancels whatever is still pending afterwards and waits for the
   * handlers to complete.
   */
  void run_for(std::chrono::milliseconds timeout);

  asio::io_context io_;
  asio::serial_port port_;
  std::chrono::milliseconds drain_window_{20};
};

}  // namespace xm1k
