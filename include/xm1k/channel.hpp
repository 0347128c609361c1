/**
 * @file channel.hpp
 * @brief Abstract duplex byte channel used by the sender
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace xm1k
{

/**
 * @brief Outcome of a single channel operation
 */
enum class IoStatus
{
  OK,       // Operation completed
  TIMEOUT,  // No data arrived within the timeout
  FAULT,    // Transport reported an error or was closed
};

/**
 * @brief Blocking byte channel
 *
 * Implementations own the underlying transport and release it in their
 * destructor. A channel is driven by at most one session at a time.
 */
class Channel
{
 public:
  virtual ~Channel() = default;

  /**
   * @brief Write all bytes
   *
   * @param data Data buffer
   * @param len  Number of bytes to write
   * @return IoStatus::OK once everything was written, IoStatus::FAULT otherwise
   */
  virtual IoStatus write(const uint8_t* data, size_t len) = 0;

  /**
   * @brief Read exactly one byte
   *
   * @param byte    Receives the byte on success
   * @param timeout Upper bound for the wait
   * @return IoStatus::OK, IoStatus::TIMEOUT or IoStatus::FAULT
   */
  virtual IoStatus read_byte(uint8_t& byte, std::chrono::milliseconds timeout) = 0;

  /**
   * @brief Collect bytes already buffered by the transport
   *
   * Appends whatever is pending to @p out without waiting for new data
   * beyond a short implementation-defined settle window.
   *
   * @param out Receives pending bytes
   * @return IoStatus::OK (possibly with nothing appended) or IoStatus::FAULT
   */
  virtual IoStatus drain(std::vector<uint8_t>& out) = 0;
};

}  // namespace xm1k
