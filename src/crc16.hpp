/**
 * @file crc16.hpp
 * @brief CRC-16 checksum calculation (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "xm1k/protocol.hpp"

namespace xm1k
{
namespace internal
{

/**
 * @brief Calculate CRC-16 checksum
 *
 * Bitwise, MSB first, no reflection and no final XOR. With the default
 * polynomial and initial value this is CRC-16/XMODEM.
 *
 * Passing the result of a previous call as @p initial continues the
 * checksum over concatenated buffers.
 *
 * @param data       Pointer to data buffer (may be nullptr if len == 0)
 * @param len        Length of data in bytes
 * @param polynomial Generator polynomial
 * @param initial    Initial register value
 * @return CRC-16 checksum value
 */
uint16_t calc_crc16(const uint8_t* data, size_t len, uint16_t polynomial = CRC16_POLY,
                    uint16_t initial = 0x0000);

}  // namespace internal
}  // namespace xm1k
