/**
 * @file receiver.hpp
 * @brief xm1k-link receive side
 *
 * Byte-driven counterpart of the Sender, modelled on the flasher running
 * on the device: announces readiness, reassembles frames, checks them and
 * hands every block to a sink.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "xm1k/protocol.hpp"
#include "xm1k/transfer_plan.hpp"

namespace xm1k
{

/**
 * @brief Frame receiver and block dispatcher
 *
 * Example usage:
 * @code
 * Receiver rx(
 *     [](const uint8_t* data, size_t len) { uart_send(data, len); },
 *     [](uint32_t offset, const uint8_t* data, size_t len) {
 *       return flash_write(offset, data, len) == 0;
 *     },
 *     true);
 *
 * rx.start();  // sends 'C'
 * while (!rx.finished()) {
 *   if (uart_has_data()) {
 *     rx.feed_byte(uart_read_byte());
 *   }
 * }
 * @endcode
 */
class Receiver
{
 public:
  /**
   * @brief Reply write callback
   *
   * @param data Pointer to data buffer
   * @param len  Number of bytes to write
   */
  using WriteFn = std::function<void(const uint8_t* data, size_t len)>;

  /**
   * @brief Block sink
   *
   * Receives each block with its full padded length.
   *
   * @param offset Destination offset (flash header offset plus the blocks
   *               already delivered, or starting at 0 without header)
   * @param data   Block data
   * @param len    128 or 1024
   * @return false to abort the transfer with ErrorCode::WRITE_FAILED
   */
  using BlockSink = std::function<bool(uint32_t offset, const uint8_t* data, size_t len)>;

  /**
   * @brief Erase hook, called once with the decoded flash header
   *
   * @param offset Start of the region (FlashHeader::offset)
   * @param size   Bytes to erase (FlashHeader::size)
   * @return false to abort the transfer with ErrorCode::WRITE_FAILED
   */
  using EraseFn = std::function<bool(uint32_t offset, uint32_t size)>;

  /**
   * @brief Readback hook used to verify every written block
   *
   * Skipped when the flash header carries FLAG_NO_VERIFY.
   *
   * @param offset Offset the block was written to
   * @param out    Buffer receiving @p len bytes
   * @param len    Block length
   * @return false if the read failed
   */
  using ReadbackFn = std::function<bool(uint32_t offset, uint8_t* out, size_t len)>;

  /**
   * @brief Reception state
   */
  enum class State
  {
    WAIT_START,    // Waiting for SOH, STX or EOT
    WAIT_SEQ,      // Waiting for sequence number
    WAIT_SEQ_INV,  // Waiting for inverted sequence number
    WAIT_DATA,     // Receiving block
    WAIT_CRC_H,    // Waiting for CRC high byte
    WAIT_CRC_L,    // Waiting for CRC low byte
    DONE,          // EOT acknowledged
    FAILED,        // Transfer cancelled
  };

  /**
   * @brief Construct a receiver
   *
   * @param write         Callback for ACK / CAN / ready bytes
   * @param sink          Callback for received blocks
   * @param expect_header Treat the first frame as a flash header
   */
  Receiver(WriteFn write, BlockSink sink, bool expect_header = false);

  /**
   * @brief Install the erase hook (may be empty)
   */
  void set_erase(EraseFn erase)
  {
    erase_ = std::move(erase);
  }

  /**
   * @brief Install the readback hook (may be empty)
   *
   * When set, each block is read back after the sink accepted it and
   * compared with the received data. A failed read or a mismatch
   * cancels with ErrorCode::WRITE_FAILED.
   */
  void set_readback(ReadbackFn readback)
  {
    readback_ = std::move(readback);
  }

  /**
   * @brief Announce readiness by sending the ready marker
   *
   * The device repeats this until the first frame starts; calling it
   * again is harmless while no frame has arrived.
   */
  void start();

  /**
   * @brief Process one received byte
   *
   * Bytes arriving after DONE or FAILED are ignored.
   *
   * @param byte Received byte
   */
  void feed_byte(uint8_t byte);

  State state() const
  {
    return state_;
  }

  bool finished() const
  {
    return state_ == State::DONE || state_ == State::FAILED;
  }

  /**
   * @brief Error that moved the receiver to FAILED (OK otherwise)
   */
  ErrorCode last_error() const
  {
    return last_error_;
  }

  /**
   * @brief Whether a flash header was received
   */
  bool has_header() const
  {
    return header_received_;
  }

  const FlashHeader& header() const
  {
    return header_;
  }

  /**
   * @brief Number of blocks delivered to the sink
   */
  size_t blocks_received() const
  {
    return blocks_;
  }

 private:
  /**
   * @brief Handle complete frame
   *
   * Verifies sequence number and CRC, then dispatches the block.
   */
  void handle_frame();

  /**
   * @brief Write one block through the sink and verify it
   */
  bool store_block(const uint8_t* block);

  /**
   * @brief Send a single control byte
   */
  void reply(Marker marker);

  /**
   * @brief Cancel the transfer
   */
  void cancel(ErrorCode code);

  WriteFn write_;          ///< Reply callback
  BlockSink sink_;         ///< Block consumer
  EraseFn erase_;          ///< Optional erase hook
  ReadbackFn readback_;    ///< Optional verification hook
  bool expect_header_;     ///< First frame carries a FlashHeader

  State state_;                 ///< State machine state
  std::vector<uint8_t> frame_;  ///< Frame reception buffer
  std::vector<uint8_t> check_;  ///< Readback buffer
  size_t block_size_;           ///< Block size of the current frame
  uint8_t expected_seq_;        ///< Sequence number of the next frame
  ErrorCode last_error_;        ///< Reason for FAILED

  bool header_received_;  ///< Header frame was processed
  FlashHeader header_;    ///< Decoded flash header
  uint32_t offset_;       ///< Destination offset of the next block
  size_t blocks_;         ///< Blocks delivered to the sink
};

}  // namespace xm1k
