/**
 * @file errors.cpp
 * @brief Error message table
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xm1k/protocol.hpp"

namespace xm1k
{

const char* strerror(ErrorCode code)
{
  switch (code)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "xm1k/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

}  // namespace xm1k
