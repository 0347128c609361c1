/**
 * @file frame.cpp
 * @brief Frame encoding/decoding implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "frame.hpp"

#include "crc16.hpp"

namespace xm1k
{
namespace internal
{

ErrorCode encode_frame(const uint8_t* data, size_t len, uint8_t seq, std::vector<uint8_t>& out)
{
  // Callers must split payloads into blocks first
  if (len > LONG_BLOCK_SIZE)
  {
    return ErrorCode::INVALID_CHUNK_SIZE;
  }

  const bool long_block = len > SHORT_BLOCK_SIZE;
  const size_t block_size = long_block ? LONG_BLOCK_SIZE : SHORT_BLOCK_SIZE;

  out.clear();
  out.reserve(FRAME_OVERHEAD + block_size);

  // Frame header
  out.push_back(to_byte(long_block ? Marker::STX : Marker::SOH));
  out.push_back(seq);
  out.push_back(static_cast<uint8_t>(0xFF - seq));

  // Block, zero padded
  if (len > 0 && data != nullptr)
  {
    out.insert(out.end(), data, data + len);
  }
  out.resize(3 + block_size, 0x00);

  // CRC over the padded block only
  const uint16_t crc = calc_crc16(&out[3], block_size);
  out.push_back(static_cast<uint8_t>((crc >> 8) & 0xFF));  // CRC_H
  out.push_back(static_cast<uint8_t>(crc & 0xFF));         // CRC_L

  return ErrorCode::OK;
}

size_t block_size_for_marker(uint8_t marker)
{
  switch (static_cast<Marker>(marker))
  {
    case Marker::SOH:
      return SHORT_BLOCK_SIZE;

    case Marker::STX:
      return LONG_BLOCK_SIZE;

    default:
      return 0;
  }
}

bool verify_frame_crc(const uint8_t* frame, size_t len)
{
  if (frame == nullptr || len < FRAME_OVERHEAD)
  {
    return false;
  }

  const size_t block_size = block_size_for_marker(frame[0]);
  if (block_size == 0 || len != block_size + FRAME_OVERHEAD)
  {
    return false;
  }

  // Extract expected CRC (last two bytes, big-endian)
  const uint16_t expected_crc =
      static_cast<uint16_t>((frame[len - 2] << 8) | frame[len - 1]);

  const uint16_t calculated_crc = calc_crc16(&frame[3], block_size);

  return expected_crc == calculated_crc;
}

}  // namespace internal
}  // namespace xm1k
