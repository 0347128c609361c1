/**
 * @file crc16.cpp
 * @brief CRC-16 checksum implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "crc16.hpp"

namespace xm1k
{
namespace internal
{

uint16_t calc_crc16(const uint8_t* data, size_t len, uint16_t polynomial, uint16_t initial)
{
  uint16_t crc = initial;

  for (size_t i = 0; i < len; ++i)
  {
    // Upper 16 bits of the 24-bit register hold the running CRC,
    // the low 8 bits shift the message byte in.
    uint32_t combined = static_cast<uint32_t>(crc) ^ (static_cast<uint32_t>(data[i]) << 8);

    for (int bit = 0; bit < 16; ++bit)
    {
      if (combined & 0x800000)
      {
        combined = (combined << 1) ^ (static_cast<uint32_t>(polynomial) << 8);
      }
      else
      {
        combined <<= 1;
      }
      combined &= 0xFFFFFF;
    }

    crc = static_cast<uint16_t>((combined >> 8) & 0xFFFF);
  }

  return crc;
}

}  // namespace internal
}  // namespace xm1k
