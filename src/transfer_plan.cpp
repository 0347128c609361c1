/**
 * @file transfer_plan.cpp
 * @brief Transfer planning implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xm1k/transfer_plan.hpp"

#include <algorithm>
#include <utility>

#include "frame.hpp"

namespace xm1k
{

namespace
{

void put_u32_be(uint8_t* out, uint32_t value)
{
  out[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
  out[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
  out[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
  out[3] = static_cast<uint8_t>(value & 0xFF);
}

uint32_t get_u32_be(const uint8_t* in)
{
  return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
         (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

}  // namespace

void encode_flash_header(const FlashHeader& header, uint8_t (&out)[FLASH_HEADER_SIZE])
{
  put_u32_be(&out[0], header.offset);
  put_u32_be(&out[4], header.size);
  put_u32_be(&out[8], header.flags);
}

bool decode_flash_header(const uint8_t* data, size_t len, FlashHeader& header)
{
  if (data == nullptr || len < FLASH_HEADER_SIZE)
  {
    return false;
  }

  header.offset = get_u32_be(&data[0]);
  header.size = get_u32_be(&data[4]);
  header.flags = get_u32_be(&data[8]);
  return true;
}

size_t TransferPlan::wire_size() const
{
  size_t total = 0;
  for (const Frame& frame : frames_)
  {
    total += frame.size();
  }
  return total;
}

ErrorCode plan_transfer(const uint8_t* data, size_t len, const FlashHeader* header,
                        TransferPlan& plan)
{
  if (data == nullptr && len > 0)
  {
    return ErrorCode::INVALID_ARGUMENT;
  }

  const size_t block_count = (len + LONG_BLOCK_SIZE - 1) / LONG_BLOCK_SIZE;

  std::vector<TransferPlan::Frame> frames;
  frames.reserve(block_count + (header != nullptr ? 1 : 0));

  uint8_t seq = FIRST_SEQUENCE;

  if (header != nullptr)
  {
    uint8_t raw[FLASH_HEADER_SIZE];
    encode_flash_header(*header, raw);

    TransferPlan::Frame frame;
    const ErrorCode err = internal::encode_frame(raw, sizeof(raw), seq, frame);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    frames.push_back(std::move(frame));
    seq = next_sequence(seq);
  }

  for (size_t pos = 0; pos < len; pos += LONG_BLOCK_SIZE)
  {
    const size_t chunk = std::min(LONG_BLOCK_SIZE, len - pos);

    TransferPlan::Frame frame;
    const ErrorCode err = internal::encode_frame(data + pos, chunk, seq, frame);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    frames.push_back(std::move(frame));
    seq = next_sequence(seq);
  }

  plan.frames_ = std::move(frames);
  return ErrorCode::OK;
}

}  // namespace xm1k
