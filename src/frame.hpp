/**
 * @file frame.hpp
 * @brief Frame encoding/decoding utilities (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "xm1k/protocol.hpp"

namespace xm1k
{
namespace internal
{

/**
 * @brief Encode one data frame
 *
 * Pads the content with zero bytes to a 128-byte block (len <= 128) or a
 * 1024-byte block and generates a complete frame:
 * [SOH|STX][SEQ][~SEQ][BLOCK...][CRC_H][CRC_L]
 *
 * @param data Content bytes (can be nullptr if len == 0)
 * @param len  Content length in bytes
 * @param seq  Sequence number
 * @param out  Output buffer for encoded frame
 * @return ErrorCode::OK, or ErrorCode::INVALID_CHUNK_SIZE if len exceeds
 *         LONG_BLOCK_SIZE (out is left untouched)
 */
ErrorCode encode_frame(const uint8_t* data, size_t len, uint8_t seq, std::vector<uint8_t>& out);

/**
 * @brief Block size announced by a start of frame byte
 *
 * @param marker First byte of a frame
 * @return SHORT_BLOCK_SIZE for SOH, LONG_BLOCK_SIZE for STX, 0 otherwise
 */
size_t block_size_for_marker(uint8_t marker);

/**
 * @brief Verify frame CRC
 *
 * The CRC is calculated over the block only; the marker and sequence
 * bytes are not covered.
 *
 * @param frame Complete frame buffer
 * @param len   Total frame length (133 or 1029)
 * @return true if the length matches the marker and the CRC is valid
 */
bool verify_frame_crc(const uint8_t* frame, size_t len);

}  // namespace internal
}  // namespace xm1k
