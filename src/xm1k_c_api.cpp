/**
 * @file xm1k_c_api.cpp
 * @brief xm1k-link C API implementation
 *
 * C wrappers for TransferPlan, Sender and Receiver.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <new>

#include "xm1k/receiver.hpp"
#include "xm1k/sender.hpp"
#include "xm1k/transfer_plan.hpp"
#include "xm1k/xm1k.h"

using namespace xm1k;

/* ========================================================================= */
/* Internal wrapper structures                                               */
/* ========================================================================= */

struct Xm1kPlan
{
  TransferPlan plan;
};

struct Xm1kReceiver
{
  Receiver* cpp_rx;
  void* user;
  xm1k_write_fn write;
  xm1k_block_fn sink;

  Xm1kReceiver(xm1k_write_fn write_fn, xm1k_block_fn sink_fn, void* user_ctx, bool expect_header)
      : cpp_rx(nullptr), user(user_ctx), write(write_fn), sink(sink_fn)
  {
    // Create C++ Receiver with lambdas that wrap the C callbacks
    cpp_rx = new (std::nothrow) Receiver(
        [this](const uint8_t* data, size_t len)
        {
          if (write)
          {
            write(user, data, len);
          }
        },
        [this](uint32_t offset, const uint8_t* data, size_t len)
        { return sink == nullptr || sink(user, offset, data, len) != 0; },
        expect_header);
  }

  ~Xm1kReceiver()
  {
    delete cpp_rx;
  }
};

namespace
{

IoStatus to_io_status(xm1k_io_status_t status)
{
  switch (status)
  {
    case XM1K_IO_OK:
      return IoStatus::OK;
    case XM1K_IO_TIMEOUT:
      return IoStatus::TIMEOUT;
    default:
      return IoStatus::FAULT;
  }
}

/**
 * Channel forwarding to C callbacks
 */
class CallbackChannel : public Channel
{
 public:
  explicit CallbackChannel(const xm1k_channel_t& cb) : cb_(cb)
  {
  }

  IoStatus write(const uint8_t* data, size_t len) override
  {
    return to_io_status(cb_.write(cb_.user, data, len));
  }

  IoStatus read_byte(uint8_t& byte, std::chrono::milliseconds timeout) override
  {
    return to_io_status(cb_.read_byte(cb_.user, &byte, static_cast<uint32_t>(timeout.count())));
  }

  IoStatus drain(std::vector<uint8_t>& out) override
  {
    if (cb_.drain == nullptr)
    {
      return IoStatus::OK;
    }

    uint8_t buf[256];
    while (true)
    {
      size_t n = 0;
      const IoStatus status = to_io_status(cb_.drain(cb_.user, buf, sizeof(buf), &n));
      if (status != IoStatus::OK)
      {
        return status == IoStatus::TIMEOUT ? IoStatus::OK : status;
      }
      if (n > sizeof(buf))
      {
        return IoStatus::FAULT;
      }
      out.insert(out.end(), buf, buf + n);
      if (n < sizeof(buf))
      {
        return IoStatus::OK;
      }
    }
  }

 private:
  xm1k_channel_t cb_;
};

}  // namespace

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* xm1k_strerror(xm1k_error_t err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case XM1K_ERR_##name:     \
    return msg;
#include "xm1k/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

/* ========================================================================= */
/* Transfer plan                                                             */
/* ========================================================================= */

xm1k_error_t xm1k_plan_create(const uint8_t* data, size_t len, const xm1k_flash_header_t* header,
                              Xm1kPlan** out)
{
  if (out == nullptr || (data == nullptr && len > 0))
  {
    return XM1K_ERR_INVALID_ARGUMENT;
  }
  *out = nullptr;

  Xm1kPlan* plan = new (std::nothrow) Xm1kPlan();
  if (plan == nullptr)
  {
    return XM1K_ERR_NO_MEMORY;
  }

  FlashHeader cpp_header;
  if (header != nullptr)
  {
    cpp_header.offset = header->offset;
    cpp_header.size = header->size;
    cpp_header.flags = header->flags;
  }

  const ErrorCode err =
      plan_transfer(data, len, header != nullptr ? &cpp_header : nullptr, plan->plan);
  if (err != ErrorCode::OK)
  {
    delete plan;
    return static_cast<xm1k_error_t>(err);
  }

  *out = plan;
  return XM1K_ERR_OK;
}

void xm1k_plan_destroy(Xm1kPlan* plan)
{
  delete plan;
}

size_t xm1k_plan_frame_count(const Xm1kPlan* plan)
{
  return plan ? plan->plan.size() : 0;
}

const uint8_t* xm1k_plan_frame(const Xm1kPlan* plan, size_t index, size_t* len)
{
  if (plan == nullptr || index >= plan->plan.size())
  {
    return nullptr;
  }

  const TransferPlan::Frame& frame = plan->plan[index];
  if (len)
  {
    *len = frame.size();
  }
  return frame.data();
}

/* ========================================================================= */
/* Sending                                                                   */
/* ========================================================================= */

void xm1k_session_config_init(xm1k_session_config_t* config)
{
  if (config == nullptr)
  {
    return;
  }

  const SessionConfig defaults;
  config->ready_timeout_ms = static_cast<uint32_t>(defaults.ready_timeout.count());
  config->ack_timeout_ms = static_cast<uint32_t>(defaults.ack_timeout.count());
  config->max_retries = defaults.max_retries;
}

xm1k_error_t xm1k_send(const Xm1kPlan* plan, const xm1k_channel_t* channel,
                       const xm1k_session_config_t* config, xm1k_progress_fn progress,
                       void* progress_user, size_t* failed_index)
{
  if (failed_index)
  {
    *failed_index = XM1K_NO_INDEX;
  }

  if (plan == nullptr || channel == nullptr || channel->write == nullptr ||
      channel->read_byte == nullptr)
  {
    return XM1K_ERR_INVALID_ARGUMENT;
  }

  SessionConfig cpp_config;
  if (config)
  {
    cpp_config.ready_timeout = std::chrono::milliseconds(config->ready_timeout_ms);
    cpp_config.ack_timeout = std::chrono::milliseconds(config->ack_timeout_ms);
    cpp_config.max_retries = config->max_retries;
  }

  CallbackChannel cpp_channel(*channel);
  Sender sender(cpp_channel, cpp_config);
  if (progress)
  {
    sender.set_progress([progress, progress_user](size_t done, size_t total)
                        { progress(progress_user, done, total); });
  }

  const SessionResult result = sender.run(plan->plan);
  if (failed_index && result.has_index)
  {
    *failed_index = result.index;
  }

  return static_cast<xm1k_error_t>(result.code);
}

/* ========================================================================= */
/* Receiving                                                                 */
/* ========================================================================= */

Xm1kReceiver* xm1k_receiver_create(xm1k_write_fn write, xm1k_block_fn sink, void* user,
                                   int expect_header)
{
  if (write == nullptr)
  {
    return nullptr;
  }

  Xm1kReceiver* rx = new (std::nothrow) Xm1kReceiver(write, sink, user, expect_header != 0);
  if (rx == nullptr || rx->cpp_rx == nullptr)
  {
    delete rx;
    return nullptr;
  }

  return rx;
}

void xm1k_receiver_destroy(Xm1kReceiver* rx)
{
  delete rx;
}

void xm1k_receiver_set_flash_ops(Xm1kReceiver* rx, xm1k_erase_fn erase,
                                 xm1k_readback_fn readback)
{
  if (rx == nullptr || rx->cpp_rx == nullptr)
  {
    return;
  }

  void* user = rx->user;

  Receiver::EraseFn erase_cb;
  if (erase)
  {
    erase_cb = [erase, user](uint32_t offset, uint32_t size)
    { return erase(user, offset, size) != 0; };
  }
  rx->cpp_rx->set_erase(erase_cb);

  Receiver::ReadbackFn readback_cb;
  if (readback)
  {
    readback_cb = [readback, user](uint32_t offset, uint8_t* out, size_t len)
    { return readback(user, offset, out, len) != 0; };
  }
  rx->cpp_rx->set_readback(readback_cb);
}

void xm1k_receiver_start(Xm1kReceiver* rx)
{
  if (rx && rx->cpp_rx)
  {
    rx->cpp_rx->start();
  }
}

void xm1k_receiver_feed_byte(Xm1kReceiver* rx, uint8_t byte)
{
  if (rx && rx->cpp_rx)
  {
    rx->cpp_rx->feed_byte(byte);
  }
}

int xm1k_receiver_finished(const Xm1kReceiver* rx)
{
  if (rx && rx->cpp_rx)
  {
    return rx->cpp_rx->finished() ? 1 : 0;
  }
  return 1;
}

xm1k_error_t xm1k_receiver_last_error(const Xm1kReceiver* rx)
{
  if (rx && rx->cpp_rx)
  {
    return static_cast<xm1k_error_t>(rx->cpp_rx->last_error());
  }
  return XM1K_ERR_INVALID_ARGUMENT;
}
