/**
 * @file sender.cpp
 * @brief xm1k-link send side implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xm1k/sender.hpp"

#include <vector>

#include "xm1k/logging.hpp"

namespace xm1k
{

Sender::Sender(Channel& channel, const SessionConfig& config)
    : channel_(channel), config_(config), progress_(), state_(State::IDLE), index_(0)
{
}

SessionResult Sender::run(const TransferPlan& plan)
{
  Logger& log = Logger::instance();

  index_ = 0;
  state_ = State::AWAIT_READY;

  ErrorCode err = await_ready();
  if (err != ErrorCode::OK)
  {
    return fail(err, false);
  }

  state_ = State::SENDING;
  const size_t total = plan.size();
  log.log(LogLevel::INFO, "receiver ready, sending %zu frames (%zu bytes)", total,
          plan.wire_size());

  for (index_ = 0; index_ < total; ++index_)
  {
    err = send_frame(plan[index_]);
    if (err != ErrorCode::OK)
    {
      return fail(err, true);
    }

    if (progress_)
    {
      progress_(index_ + 1, total);
    }
  }

  state_ = State::AWAIT_FINAL_ACK;
  err = finish();
  if (err != ErrorCode::OK)
  {
    return fail(err, false);
  }

  state_ = State::COMPLETED;
  log.log(LogLevel::INFO, "transfer complete");
  return SessionResult();
}

ErrorCode Sender::await_ready()
{
  // Receivers may print boot output before they start sending 'C'.
  // Take everything already buffered and only look at the last byte.
  std::vector<uint8_t> received;
  if (channel_.drain(received) == IoStatus::FAULT)
  {
    return ErrorCode::CHANNEL_FAULT;
  }

  if (received.empty())
  {
    uint8_t byte = 0;
    const IoStatus status = channel_.read_byte(byte, config_.ready_timeout);
    if (status == IoStatus::FAULT)
    {
      return ErrorCode::CHANNEL_FAULT;
    }
    if (status == IoStatus::OK)
    {
      received.push_back(byte);
    }
  }

  if (received.empty())
  {
    Logger::instance().log(LogLevel::DEBUG, "nothing received while waiting for ready marker");
    return ErrorCode::NO_READY_MARKER;
  }

  if (received.size() > 1)
  {
    Logger::instance().log(LogLevel::DEBUG, "discarded %zu buffered bytes before ready marker",
                           received.size() - 1);
  }

  if (received.back() != to_byte(Marker::READY))
  {
    Logger::instance().log(LogLevel::DEBUG, "last byte 0x%02X is not the ready marker",
                           received.back());
    return ErrorCode::NO_READY_MARKER;
  }

  return ErrorCode::OK;
}

ErrorCode Sender::send_frame(const TransferPlan::Frame& frame)
{
  Logger& log = Logger::instance();
  unsigned retries = 0;

  while (true)
  {
    log.log(LogLevel::DEBUG, "frame %zu: %zu bytes, seq %u", index_, frame.size(),
            frame.size() > 1 ? static_cast<unsigned>(frame[1]) : 0u);

    if (channel_.write(frame.data(), frame.size()) != IoStatus::OK)
    {
      return ErrorCode::CHANNEL_FAULT;
    }

    uint8_t reply = 0;
    const IoStatus status = channel_.read_byte(reply, config_.ack_timeout);
    if (status == IoStatus::FAULT)
    {
      return ErrorCode::CHANNEL_FAULT;
    }
    if (status == IoStatus::TIMEOUT)
    {
      log.log(LogLevel::DEBUG, "frame %zu: no reply", index_);
      return ErrorCode::UNEXPECTED_REPLY;
    }

    // A single ACK is the only valid answer; anything behind it is a
    // protocol violation.
    std::vector<uint8_t> stray;
    if (channel_.drain(stray) == IoStatus::FAULT)
    {
      return ErrorCode::CHANNEL_FAULT;
    }

    if (stray.empty())
    {
      if (reply == to_byte(Marker::ACK))
      {
        return ErrorCode::OK;
      }

      if (reply == to_byte(Marker::NAK) && config_.max_retries > 0)
      {
        if (retries >= config_.max_retries)
        {
          return ErrorCode::RETRIES_EXHAUSTED;
        }
        ++retries;
        log.log(LogLevel::WARN, "frame %zu rejected, resending (%u/%u)", index_, retries,
                config_.max_retries);
        continue;
      }
    }

    log.log(LogLevel::DEBUG, "frame %zu: reply 0x%02X with %zu stray bytes", index_, reply,
            stray.size());
    return ErrorCode::UNEXPECTED_REPLY;
  }
}

ErrorCode Sender::finish()
{
  const uint8_t eot = to_byte(Marker::EOT);
  if (channel_.write(&eot, 1) != IoStatus::OK)
  {
    return ErrorCode::CHANNEL_FAULT;
  }

  uint8_t reply = 0;
  const IoStatus status = channel_.read_byte(reply, config_.ack_timeout);
  if (status == IoStatus::FAULT)
  {
    return ErrorCode::CHANNEL_FAULT;
  }

  if (status != IoStatus::OK || reply != to_byte(Marker::ACK))
  {
    return ErrorCode::NO_FINAL_ACK;
  }

  return ErrorCode::OK;
}

SessionResult Sender::fail(ErrorCode code, bool with_index)
{
  state_ = State::FAILED;

  SessionResult result;
  result.code = code;
  result.has_index = with_index;
  result.index = with_index ? index_ : 0;

  if (with_index)
  {
    Logger::instance().log(LogLevel::ERROR, "transfer failed at frame %zu: %s", index_,
                           strerror(code));
  }
  else
  {
    Logger::instance().log(LogLevel::ERROR, "transfer failed: %s", strerror(code));
  }

  return result;
}

}  // namespace xm1k
