/**
 * @file receiver.cpp
 * @brief xm1k-link receive side implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xm1k/receiver.hpp"

#include <cstring>
#include <utility>

#include "frame.hpp"

namespace xm1k
{

Receiver::Receiver(WriteFn write, BlockSink sink, bool expect_header)
    : write_(std::move(write)),
      sink_(std::move(sink)),
      erase_(),
      readback_(),
      expect_header_(expect_header),
      state_(State::WAIT_START),
      frame_(),
      check_(),
      block_size_(0),
      expected_seq_(FIRST_SEQUENCE),
      last_error_(ErrorCode::OK),
      header_received_(false),
      header_(),
      offset_(0),
      blocks_(0)
{
  frame_.reserve(LONG_BLOCK_SIZE + FRAME_OVERHEAD);
}

void Receiver::start()
{
  if (state_ == State::WAIT_START && expected_seq_ == FIRST_SEQUENCE && !header_received_ &&
      blocks_ == 0)
  {
    reply(Marker::READY);
  }
}

void Receiver::feed_byte(uint8_t byte)
{
  switch (state_)
  {
    case State::WAIT_START:
      if (byte == to_byte(Marker::EOT))
      {
        reply(Marker::ACK);
        state_ = State::DONE;
        break;
      }

      block_size_ = internal::block_size_for_marker(byte);
      if (block_size_ == 0)
      {
        cancel(ErrorCode::UNKNOWN_MARKER);
        break;
      }

      frame_.clear();
      frame_.push_back(byte);
      state_ = State::WAIT_SEQ;
      break;

    case State::WAIT_SEQ:
      frame_.push_back(byte);
      state_ = State::WAIT_SEQ_INV;
      break;

    case State::WAIT_SEQ_INV:
      frame_.push_back(byte);
      state_ = State::WAIT_DATA;
      break;

    case State::WAIT_DATA:
      frame_.push_back(byte);

      // marker + seq + ~seq + block
      if (frame_.size() >= 3 + block_size_)
      {
        state_ = State::WAIT_CRC_H;
      }
      break;

    case State::WAIT_CRC_H:
      frame_.push_back(byte);
      state_ = State::WAIT_CRC_L;
      break;

    case State::WAIT_CRC_L:
      frame_.push_back(byte);
      state_ = State::WAIT_START;
      handle_frame();
      break;

    case State::DONE:
    case State::FAILED:
      break;
  }
}

void Receiver::handle_frame()
{
  const uint8_t seq = frame_[1];
  const uint8_t seq_inv = frame_[2];

  if (seq != expected_seq_ || seq_inv != static_cast<uint8_t>(0xFF - seq))
  {
    cancel(ErrorCode::BAD_SEQUENCE);
    return;
  }

  if (!internal::verify_frame_crc(frame_.data(), frame_.size()))
  {
    cancel(ErrorCode::CRC_MISMATCH);
    return;
  }

  const uint8_t* block = frame_.data() + 3;

  if (expect_header_ && !header_received_)
  {
    // Header is always a short frame
    if (block_size_ != SHORT_BLOCK_SIZE || !decode_flash_header(block, block_size_, header_))
    {
      cancel(ErrorCode::BAD_HEADER);
      return;
    }
    header_received_ = true;
    offset_ = header_.offset;

    if (erase_ && !erase_(header_.offset, header_.size))
    {
      cancel(ErrorCode::WRITE_FAILED);
      return;
    }
  }
  else
  {
    if (!store_block(block))
    {
      cancel(ErrorCode::WRITE_FAILED);
      return;
    }
    offset_ += static_cast<uint32_t>(block_size_);
    ++blocks_;
  }

  expected_seq_ = next_sequence(expected_seq_);
  reply(Marker::ACK);
}

bool Receiver::store_block(const uint8_t* block)
{
  if (sink_ && !sink_(offset_, block, block_size_))
  {
    return false;
  }

  if (!readback_ || (header_.flags & FLAG_NO_VERIFY) != 0)
  {
    return true;
  }

  check_.resize(block_size_);
  if (!readback_(offset_, check_.data(), block_size_))
  {
    return false;
  }

  return std::memcmp(check_.data(), block, block_size_) == 0;
}

void Receiver::reply(Marker marker)
{
  if (write_)
  {
    const uint8_t byte = to_byte(marker);
    write_(&byte, 1);
  }
}

void Receiver::cancel(ErrorCode code)
{
  last_error_ = code;
  state_ = State::FAILED;
  reply(Marker::CAN);
}

}  // namespace xm1k
