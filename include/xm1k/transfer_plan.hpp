/**
 * @file transfer_plan.hpp
 * @brief Splitting a payload into ready-to-send frames
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "xm1k/protocol.hpp"

namespace xm1k
{

/**
 * @brief Placement metadata sent ahead of the payload
 *
 * Used by receivers that write the image to flash instead of executing
 * it from RAM. Encoded big-endian as [OFFSET][SIZE][FLAGS].
 */
struct FlashHeader
{
  uint32_t offset = 0;  ///< Destination offset on flash
  uint32_t size = 0;    ///< Payload size in bytes (without padding)
  uint32_t flags = 0;   ///< FLAG_* bits
};

/**
 * @brief Serialize a flash header
 *
 * @param header Header to encode
 * @param out    Receives exactly FLASH_HEADER_SIZE bytes
 */
void encode_flash_header(const FlashHeader& header, uint8_t (&out)[FLASH_HEADER_SIZE]);

/**
 * @brief Parse a flash header from the start of a block
 *
 * @param data   Block data
 * @param len    Available bytes
 * @param header Decoded header
 * @return false if fewer than FLASH_HEADER_SIZE bytes are available
 */
bool decode_flash_header(const uint8_t* data, size_t len, FlashHeader& header);

/**
 * @brief Next sequence number after @p seq
 *
 * Wraps from 255 to 0, not back to 1.
 */
constexpr uint8_t next_sequence(uint8_t seq)
{
  return static_cast<uint8_t>(seq == 0xFF ? 0x00 : seq + 1);
}

/**
 * @brief Ordered list of encoded frames for one session
 *
 * Built once by plan_transfer() and read-only afterwards.
 */
class TransferPlan
{
 public:
  using Frame = std::vector<uint8_t>;

  /**
   * @brief Encoded frames in send order
   */
  const std::vector<Frame>& frames() const
  {
    return frames_;
  }

  size_t size() const
  {
    return frames_.size();
  }

  bool empty() const
  {
    return frames_.empty();
  }

  const Frame& operator[](size_t index) const
  {
    return frames_[index];
  }

  /**
   * @brief Number of bytes the frames occupy on the wire
   */
  size_t wire_size() const;

 private:
  friend ErrorCode plan_transfer(const uint8_t* data, size_t len, const FlashHeader* header,
                                 TransferPlan& plan);

  std::vector<Frame> frames_;  ///< Encoded frames
};

/**
 * @brief Build the frames for a payload
 *
 * Splits the payload into 1024-byte blocks (the last one holds the
 * remainder, padded by the frame encoder). If @p header is given, its
 * 12 bytes go out first as a short frame with sequence number 1 and the
 * payload frames continue from 2.
 *
 * An empty payload without header yields an empty plan.
 *
 * @param data   Payload (can be nullptr if len == 0)
 * @param len    Payload length in bytes
 * @param header Optional flash header (nullptr for none)
 * @param plan   Output plan, replaced on success
 * @return ErrorCode::OK on success
 */
ErrorCode plan_transfer(const uint8_t* data, size_t len, const FlashHeader* header,
                        TransferPlan& plan);

}  // namespace xm1k
