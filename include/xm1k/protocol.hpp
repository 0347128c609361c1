/**
 * @file protocol.hpp
 * @brief xm1k-link protocol definitions
 *
 * Minimal XMODEM-1K style transfer protocol used to push a firmware image
 * to a device waiting in its boot-time UART receive mode.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace xm1k
{

/* ========================================================================= */
/* Control bytes                                                             */
/* ========================================================================= */

/**
 * @brief Single-byte markers exchanged on the wire
 */
enum class Marker : uint8_t
{
  SOH = 0x01,    ///< Start of frame carrying a 128-byte block
  STX = 0x02,    ///< Start of frame carrying a 1024-byte block
  EOT = 0x04,    ///< End of transmission
  ACK = 0x06,    ///< Acknowledge
  NAK = 0x15,    ///< Negative acknowledge
  CAN = 0x18,    ///< Cancel
  READY = 0x43,  ///< Receiver ready ('C')
};

/**
 * @brief Raw byte value of a marker
 */
constexpr uint8_t to_byte(Marker m)
{
  return static_cast<uint8_t>(m);
}

/* ========================================================================= */
/* Frame format constants                                                    */
/* ========================================================================= */

/**
 * @brief Block size of an SOH frame
 */
constexpr size_t SHORT_BLOCK_SIZE = 128;

/**
 * @brief Block size of an STX frame
 *
 * Also the largest chunk of payload a single frame can carry.
 */
constexpr size_t LONG_BLOCK_SIZE = 1024;

/**
 * @brief Bytes a frame adds around its block
 *
 * marker, seq, ~seq in front and two CRC bytes behind.
 */
constexpr size_t FRAME_OVERHEAD = 5;

/**
 * @brief CRC-16 generator polynomial
 *
 * Uses polynomial 0x1021 (x^16 + x^12 + x^5 + 1), CCITT / XMODEM
 */
constexpr uint16_t CRC16_POLY = 0x1021;

/**
 * @brief First sequence number of a transfer
 */
constexpr uint8_t FIRST_SEQUENCE = 0x01;

/**
 * Frame format:
 *
 * [SOH|STX][SEQ][~SEQ][BLOCK...][CRC_H][CRC_L]
 *
 * - SOH/STX: 1 byte  (0x01 for 128-byte blocks, 0x02 for 1024-byte blocks)
 * - SEQ:     1 byte  (sequence number, starts at 1)
 * - ~SEQ:    1 byte  (0xFF - SEQ)
 * - BLOCK:   128 or 1024 bytes, zero padded
 * - CRC:     2 bytes (CRC-16 of BLOCK only, big-endian)
 *
 * Frame sizes: 133 bytes (SOH) and 1029 bytes (STX)
 */

/* ========================================================================= */
/* Flash header                                                              */
/* ========================================================================= */

/**
 * @brief Size of the optional flash header block in bytes
 *
 * [OFFSET (4)][SIZE (4)][FLAGS (4)], all big-endian. Sent as the first
 * frame, padded to a 128-byte block like any other short frame.
 */
constexpr size_t FLASH_HEADER_SIZE = 12;

/**
 * @brief Flash header flag: skip read-back verification after each write
 */
constexpr uint32_t FLAG_NO_VERIFY = 1u << 0;

/* ========================================================================= */
/* Error codes                                                               */
/* ========================================================================= */

/**
 * @brief Error codes shared by sender, receiver and the C API
 *
 * Defined via errors.def so the C enum and messages stay in sync.
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "xm1k/errors.def"
#undef ERR
};

/**
 * @brief Human readable message for an error code
 *
 * @param code Error code
 * @return Static string, never nullptr
 */
const char* strerror(ErrorCode code);

}  // namespace xm1k
