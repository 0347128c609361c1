/**
 * @file xm1k.h
 * @brief xm1k-link C API
 *
 * C-compatible interface for planning and sending transfers and for the
 * receive side state machine.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Protocol constants                                                        */
  /* ========================================================================= */

  /** @brief Block size of an SOH frame */
#define XM1K_SHORT_BLOCK_SIZE 128

  /** @brief Block size of an STX frame */
#define XM1K_LONG_BLOCK_SIZE 1024

  /** @brief Flash header flag: skip verification after writing */
#define XM1K_FLAG_NO_VERIFY 0x00000001u

  /** @brief Value of xm1k_send()'s failed_index when no frame was in flight */
#define XM1K_NO_INDEX ((size_t)-1)

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) XM1K_ERR_##name = val,
#include "xm1k/errors.def"
#undef ERR
  } xm1k_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* xm1k_strerror(xm1k_error_t err);

  /* ========================================================================= */
  /* Channel                                                                   */
  /* ========================================================================= */

  typedef enum
  {
    XM1K_IO_OK = 0,      /**< Operation completed */
    XM1K_IO_TIMEOUT = 1, /**< Nothing arrived in time */
    XM1K_IO_FAULT = 2,   /**< Transport error */
  } xm1k_io_status_t;

  /**
   * @brief Channel callbacks
   *
   * - write:     write all @p len bytes
   * - read_byte: read one byte, waiting at most @p timeout_ms
   * - drain:     copy up to @p cap already pending bytes into @p buf and
   *              store the count in @p out_len (0 when nothing is pending)
   */
  typedef struct
  {
    xm1k_io_status_t (*write)(void* user, const uint8_t* data, size_t len);
    xm1k_io_status_t (*read_byte)(void* user, uint8_t* byte, uint32_t timeout_ms);
    xm1k_io_status_t (*drain)(void* user, uint8_t* buf, size_t cap, size_t* out_len);
    void* user;
  } xm1k_channel_t;

  /* ========================================================================= */
  /* Transfer plan                                                             */
  /* ========================================================================= */

  typedef struct
  {
    uint32_t offset;
    uint32_t size;
    uint32_t flags;
  } xm1k_flash_header_t;

  /** @brief Opaque handle to a transfer plan */
  typedef struct Xm1kPlan Xm1kPlan;

  /**
   * @brief Split a payload into frames
   *
   * @param data   Payload (may be NULL if len == 0)
   * @param len    Payload length
   * @param header Optional flash header (NULL for none)
   * @param out    Receives the plan on success
   * @return XM1K_ERR_OK on success
   */
  xm1k_error_t xm1k_plan_create(const uint8_t* data, size_t len,
                                const xm1k_flash_header_t* header, Xm1kPlan** out);

  /**
   * @brief Destroy a plan
   * @param plan Plan (NULL-safe)
   */
  void xm1k_plan_destroy(Xm1kPlan* plan);

  /**
   * @brief Number of frames in a plan
   */
  size_t xm1k_plan_frame_count(const Xm1kPlan* plan);

  /**
   * @brief Access one encoded frame
   *
   * @param plan  Plan
   * @param index Frame index
   * @param len   Receives the frame length
   * @return Frame bytes owned by the plan, or NULL if index is out of range
   */
  const uint8_t* xm1k_plan_frame(const Xm1kPlan* plan, size_t index, size_t* len);

  /* ========================================================================= */
  /* Sending                                                                   */
  /* ========================================================================= */

  typedef struct
  {
    uint32_t ready_timeout_ms;
    uint32_t ack_timeout_ms;
    uint32_t max_retries; /**< NAK resends per frame, 0 = strict */
  } xm1k_session_config_t;

  /**
   * @brief Fill a session config with the defaults
   */
  void xm1k_session_config_init(xm1k_session_config_t* config);

  /** @brief Progress callback, called after each acknowledged frame */
  typedef void (*xm1k_progress_fn)(void* user, size_t done, size_t total);

  /**
   * @brief Run one session
   *
   * @param plan          Frames to send
   * @param channel       Channel callbacks
   * @param config        Session config (NULL for defaults)
   * @param progress      Progress callback (may be NULL)
   * @param progress_user User context for @p progress
   * @param failed_index  Receives the frame in flight on failure, or
   *                      XM1K_NO_INDEX (may be NULL)
   * @return XM1K_ERR_OK once the receiver acknowledged EOT
   */
  xm1k_error_t xm1k_send(const Xm1kPlan* plan, const xm1k_channel_t* channel,
                         const xm1k_session_config_t* config, xm1k_progress_fn progress,
                         void* progress_user, size_t* failed_index);

  /* ========================================================================= */
  /* Receiving                                                                 */
  /* ========================================================================= */

  /** @brief Opaque handle to a receiver */
  typedef struct Xm1kReceiver Xm1kReceiver;

  /** @brief Reply write callback */
  typedef void (*xm1k_write_fn)(void* user, const uint8_t* data, size_t len);

  /** @brief Block sink, return non-zero on success */
  typedef int (*xm1k_block_fn)(void* user, uint32_t offset, const uint8_t* data, size_t len);

  /** @brief Erase hook, return non-zero on success */
  typedef int (*xm1k_erase_fn)(void* user, uint32_t offset, uint32_t size);

  /** @brief Readback hook filling out with len bytes, return non-zero on success */
  typedef int (*xm1k_readback_fn)(void* user, uint32_t offset, uint8_t* out, size_t len);

  /**
   * @brief Create a receiver
   *
   * @param write         Reply callback
   * @param sink          Block callback (may be NULL)
   * @param user          User context passed to both callbacks
   * @param expect_header Non-zero if the first frame is a flash header
   * @return Receiver, or NULL on allocation failure or missing write callback
   */
  Xm1kReceiver* xm1k_receiver_create(xm1k_write_fn write, xm1k_block_fn sink, void* user,
                                     int expect_header);

  /**
   * @brief Destroy a receiver
   * @param rx Receiver (NULL-safe)
   */
  void xm1k_receiver_destroy(Xm1kReceiver* rx);

  /**
   * @brief Install flash erase and readback hooks
   *
   * erase runs once with the flash header's offset and size. readback
   * verifies every block unless the header sets XM1K_FLAG_NO_VERIFY.
   * Either may be NULL. Both receive the user context given at creation.
   */
  void xm1k_receiver_set_flash_ops(Xm1kReceiver* rx, xm1k_erase_fn erase,
                                   xm1k_readback_fn readback);

  /** @brief Send the ready marker */
  void xm1k_receiver_start(Xm1kReceiver* rx);

  /** @brief Process one received byte */
  void xm1k_receiver_feed_byte(Xm1kReceiver* rx, uint8_t byte);

  /** @brief Non-zero once EOT was acknowledged or the transfer was cancelled */
  int xm1k_receiver_finished(const Xm1kReceiver* rx);

  /** @brief Reason for cancellation, XM1K_ERR_OK otherwise */
  xm1k_error_t xm1k_receiver_last_error(const Xm1kReceiver* rx);

#ifdef __cplusplus
} /* extern "C" */
#endif
