/**
 * @file sender.hpp
 * @brief xm1k-link send side session
 *
 * Drives one transfer over a Channel: waits for the receiver's ready
 * marker, sends every frame of a TransferPlan and waits for its ACK,
 * then finishes with EOT.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

#include "xm1k/channel.hpp"
#include "xm1k/protocol.hpp"
#include "xm1k/transfer_plan.hpp"

namespace xm1k
{

/**
 * @brief Session tuning
 */
struct SessionConfig
{
  /// Wait for the ready marker when nothing was buffered
  std::chrono::milliseconds ready_timeout{5000};

  /// Wait for the reply to each frame and to EOT
  std::chrono::milliseconds ack_timeout{5000};

  /**
   * Resends allowed per frame after a NAK. 0 keeps the strict behaviour
   * where any reply other than ACK ends the session.
   */
  unsigned max_retries = 0;
};

/**
 * @brief Terminal outcome of a session
 */
struct SessionResult
{
  ErrorCode code = ErrorCode::OK;
  bool has_index = false;  ///< index is meaningful
  size_t index = 0;        ///< Frame in flight when the session failed

  bool ok() const
  {
    return code == ErrorCode::OK;
  }
};

/**
 * @brief XMODEM-1K style sender
 *
 * Example usage:
 * @code
 * TransferPlan plan;
 * plan_transfer(image.data(), image.size(), nullptr, plan);
 *
 * Sender sender(channel);
 * sender.set_progress([](size_t done, size_t total) { ... });
 * SessionResult result = sender.run(plan);
 * if (!result.ok()) { ... strerror(result.code) ... }
 * @endcode
 *
 * The sender borrows the channel and the plan for the duration of run().
 */
class Sender
{
 public:
  /**
   * @brief Progress callback
   *
   * Called after every acknowledged frame with the number of frames done
   * and the total frame count.
   */
  using ProgressFn = std::function<void(size_t done, size_t total)>;

  /**
   * @brief Session state
   */
  enum class State
  {
    IDLE,             // run() not called yet
    AWAIT_READY,      // Waiting for 'C'
    SENDING,          // Sending frame current_index()
    AWAIT_FINAL_ACK,  // EOT sent, waiting for ACK
    COMPLETED,        // Transfer acknowledged
    FAILED,           // Terminated with an error
  };

  /**
   * @brief Construct a sender
   *
   * @param channel Channel to drive, must outlive the sender
   * @param config  Timeouts and retry policy
   */
  explicit Sender(Channel& channel, const SessionConfig& config = SessionConfig());

  /**
   * @brief Install a progress callback (may be empty)
   */
  void set_progress(ProgressFn progress)
  {
    progress_ = std::move(progress);
  }

  /**
   * @brief Run one complete session
   *
   * Blocks until the transfer completes or fails. Nothing is retried
   * beyond SessionConfig::max_retries; the caller decides whether to
   * start a new session.
   *
   * @param plan Frames to send
   * @return Result with the error kind and, for mid-transfer failures,
   *         the index of the frame in flight
   */
  SessionResult run(const TransferPlan& plan);

  State state() const
  {
    return state_;
  }

  size_t current_index() const
  {
    return index_;
  }

 private:
  /**
   * @brief Wait for the ready marker after discarding stale output
   */
  ErrorCode await_ready();

  /**
   * @brief Send frame index_ and wait for its ACK
   */
  ErrorCode send_frame(const TransferPlan::Frame& frame);

  /**
   * @brief Send EOT and wait for the final ACK
   */
  ErrorCode finish();

  /**
   * @brief Enter FAILED and build the result
   */
  SessionResult fail(ErrorCode code, bool with_index);

  Channel& channel_;      ///< Borrowed transport
  SessionConfig config_;  ///< Timeouts and retry policy
  ProgressFn progress_;   ///< Optional progress observer

  State state_;   ///< Session state
  size_t index_;  ///< Frame being sent
};

}  // namespace xm1k
