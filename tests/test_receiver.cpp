/**
 * @file test_receiver.cpp
 * @brief Receive side state machine tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <cstring>
#include <utility>
#include <vector>

#include "frame.hpp"
#include "xm1k/receiver.hpp"
#include "xm1k/transfer_plan.hpp"

using namespace xm1k;

namespace
{

struct Block
{
  uint32_t offset;
  std::vector<uint8_t> data;
};

void feed(Receiver& rx, const std::vector<uint8_t>& bytes)
{
  for (const uint8_t byte : bytes)
  {
    rx.feed_byte(byte);
  }
}

}  // namespace

TEST_CASE("Receiver basic functionality")
{
  // Track replies and delivered blocks
  std::vector<uint8_t> replies;
  std::vector<Block> blocks;
  auto write = [&replies](const uint8_t* data, size_t len)
  { replies.insert(replies.end(), data, data + len); };
  auto sink = [&blocks](uint32_t offset, const uint8_t* data, size_t len)
  {
    blocks.push_back(Block{offset, std::vector<uint8_t>(data, data + len)});
    return true;
  };

  Receiver rx(write, sink);

  SUBCASE("Start sends the ready marker")
  {
    rx.start();
    REQUIRE(replies.size() == 1);
    CHECK(replies[0] == to_byte(Marker::READY));
  }

  SUBCASE("Short frame")
  {
    const uint8_t content[] = {0x10, 0x20, 0x30};
    std::vector<uint8_t> frame;
    REQUIRE(internal::encode_frame(content, sizeof(content), 1, frame) == ErrorCode::OK);

    feed(rx, frame);

    REQUIRE(replies.size() == 1);
    CHECK(replies[0] == to_byte(Marker::ACK));
    REQUIRE(blocks.size() == 1);
    CHECK(blocks[0].offset == 0);
    REQUIRE(blocks[0].data.size() == 128);
    CHECK(blocks[0].data[0] == 0x10);
    CHECK(blocks[0].data[2] == 0x30);
    CHECK(blocks[0].data[3] == 0x00);
    CHECK(rx.state() == Receiver::State::WAIT_START);
  }

  SUBCASE("Offsets advance by block size")
  {
    const std::vector<uint8_t> payload(1024 + 100, 0x77);
    TransferPlan plan;
    REQUIRE(plan_transfer(payload.data(), payload.size(), nullptr, plan) == ErrorCode::OK);

    for (const TransferPlan::Frame& frame : plan.frames())
    {
      feed(rx, frame);
    }

    REQUIRE(blocks.size() == 2);
    CHECK(blocks[0].offset == 0);
    CHECK(blocks[1].offset == 1024);
    CHECK(blocks[1].data.size() == 128);
    CHECK(rx.blocks_received() == 2);
    const std::vector<uint8_t> expected(2, to_byte(Marker::ACK));
    CHECK(replies == expected);
  }

  SUBCASE("EOT is acknowledged")
  {
    rx.feed_byte(to_byte(Marker::EOT));
    REQUIRE(replies.size() == 1);
    CHECK(replies[0] == to_byte(Marker::ACK));
    CHECK(rx.state() == Receiver::State::DONE);
    CHECK(rx.finished());
    CHECK(rx.last_error() == ErrorCode::OK);

    // Ignored once done
    rx.feed_byte(to_byte(Marker::SOH));
    CHECK(replies.size() == 1);
  }
}

TEST_CASE("Receiver errors")
{
  std::vector<uint8_t> replies;
  auto write = [&replies](const uint8_t* data, size_t len)
  { replies.insert(replies.end(), data, data + len); };

  bool sink_ok = true;
  auto sink = [&sink_ok](uint32_t, const uint8_t*, size_t) { return sink_ok; };

  Receiver rx(write, sink);

  std::vector<uint8_t> frame;
  const uint8_t content[] = {0xAB, 0xCD};
  REQUIRE(internal::encode_frame(content, sizeof(content), 1, frame) == ErrorCode::OK);

  SUBCASE("Unknown start byte")
  {
    rx.feed_byte(0x7E);
    CHECK(rx.state() == Receiver::State::FAILED);
    CHECK(rx.last_error() == ErrorCode::UNKNOWN_MARKER);
    REQUIRE(replies.size() == 1);
    CHECK(replies[0] == to_byte(Marker::CAN));
  }

  SUBCASE("Corrupted block")
  {
    frame[10] ^= 0x40;
    feed(rx, frame);
    CHECK(rx.last_error() == ErrorCode::CRC_MISMATCH);
    CHECK(replies.back() == to_byte(Marker::CAN));
  }

  SUBCASE("Wrong sequence number")
  {
    REQUIRE(internal::encode_frame(content, sizeof(content), 2, frame) == ErrorCode::OK);
    feed(rx, frame);
    CHECK(rx.last_error() == ErrorCode::BAD_SEQUENCE);
  }

  SUBCASE("Broken sequence complement")
  {
    frame[2] = 0x00;
    feed(rx, frame);
    CHECK(rx.last_error() == ErrorCode::BAD_SEQUENCE);
  }

  SUBCASE("Sink failure")
  {
    sink_ok = false;
    feed(rx, frame);
    CHECK(rx.last_error() == ErrorCode::WRITE_FAILED);
    CHECK(rx.blocks_received() == 0);
  }

  SUBCASE("Bytes after cancel are ignored")
  {
    rx.feed_byte(0x7E);
    feed(rx, frame);
    CHECK(replies.size() == 1);
    CHECK(rx.blocks_received() == 0);
  }
}

TEST_CASE("Receiver flash header")
{
  std::vector<uint8_t> replies;
  std::vector<Block> blocks;
  auto write = [&replies](const uint8_t* data, size_t len)
  { replies.insert(replies.end(), data, data + len); };
  auto sink = [&blocks](uint32_t offset, const uint8_t* data, size_t len)
  {
    blocks.push_back(Block{offset, std::vector<uint8_t>(data, data + len)});
    return true;
  };

  Receiver rx(write, sink, true);

  SUBCASE("Header sets the destination offset")
  {
    const std::vector<uint8_t> payload(300, 0x42);
    FlashHeader header;
    header.offset = 0x00020000;
    header.size = 300;
    header.flags = FLAG_NO_VERIFY;

    TransferPlan plan;
    REQUIRE(plan_transfer(payload.data(), payload.size(), &header, plan) == ErrorCode::OK);
    for (const TransferPlan::Frame& frame : plan.frames())
    {
      feed(rx, frame);
    }
    rx.feed_byte(to_byte(Marker::EOT));

    CHECK(rx.state() == Receiver::State::DONE);
    REQUIRE(rx.has_header());
    CHECK(rx.header().offset == 0x00020000);
    CHECK(rx.header().size == 300);
    CHECK(rx.header().flags == FLAG_NO_VERIFY);

    REQUIRE(blocks.size() == 1);
    CHECK(blocks[0].offset == 0x00020000);
    CHECK(blocks[0].data.size() == 1024);
    CHECK(replies.size() == 3);
  }

  SUBCASE("Header in a long frame")
  {
    const std::vector<uint8_t> content(200, 0x00);
    std::vector<uint8_t> frame;
    REQUIRE(internal::encode_frame(content.data(), content.size(), 1, frame) == ErrorCode::OK);
    feed(rx, frame);
    CHECK(rx.last_error() == ErrorCode::BAD_HEADER);
    CHECK(blocks.empty());
  }
}

TEST_CASE("Receiver sequence wrap")
{
  size_t acks = 0;
  auto write = [&acks](const uint8_t* data, size_t len)
  {
    for (size_t i = 0; i < len; ++i)
    {
      if (data[i] == to_byte(Marker::ACK))
      {
        ++acks;
      }
    }
  };

  Receiver rx(write, nullptr);

  const std::vector<uint8_t> payload(260 * 1024, 0x01);
  TransferPlan plan;
  REQUIRE(plan_transfer(payload.data(), payload.size(), nullptr, plan) == ErrorCode::OK);
  for (const TransferPlan::Frame& frame : plan.frames())
  {
    feed(rx, frame);
  }

  CHECK(rx.last_error() == ErrorCode::OK);
  CHECK(acks == 260);
  CHECK(rx.blocks_received() == 260);
}

TEST_CASE("Receiver flash erase and verify")
{
  std::vector<uint8_t> replies;
  auto write = [&replies](const uint8_t* data, size_t len)
  { replies.insert(replies.end(), data, data + len); };

  // Flash image with a write path that can be told to corrupt data
  std::vector<uint8_t> flash(0x2000, 0xFF);
  bool corrupt_writes = false;
  auto sink = [&flash, &corrupt_writes](uint32_t offset, const uint8_t* data, size_t len)
  {
    if (offset + len > flash.size())
    {
      return false;
    }
    std::memcpy(&flash[offset], data, len);
    if (corrupt_writes)
    {
      flash[offset] ^= 0x01;
    }
    return true;
  };

  Receiver rx(write, sink, true);

  std::vector<std::pair<uint32_t, uint32_t>> erased;
  bool erase_ok = true;
  rx.set_erase(
      [&erased, &erase_ok](uint32_t offset, uint32_t size)
      {
        erased.push_back(std::make_pair(offset, size));
        return erase_ok;
      });

  size_t readbacks = 0;
  bool readback_ok = true;
  rx.set_readback(
      [&flash, &readbacks, &readback_ok](uint32_t offset, uint8_t* out, size_t len)
      {
        ++readbacks;
        std::memcpy(out, &flash[offset], len);
        return readback_ok;
      });

  const std::vector<uint8_t> payload(1500, 0x5A);
  FlashHeader header;
  header.offset = 0x0400;
  header.size = 1500;

  auto send_all = [&rx, &payload, &header]()
  {
    TransferPlan plan;
    REQUIRE(plan_transfer(payload.data(), payload.size(), &header, plan) == ErrorCode::OK);
    for (const TransferPlan::Frame& frame : plan.frames())
    {
      feed(rx, frame);
    }
  };

  SUBCASE("Header erases the target region")
  {
    send_all();
    rx.feed_byte(to_byte(Marker::EOT));

    CHECK(rx.state() == Receiver::State::DONE);
    REQUIRE(erased.size() == 1);
    CHECK(erased[0].first == 0x0400);
    CHECK(erased[0].second == 1500);
    CHECK(readbacks == 2);
    CHECK(flash[0x0400] == 0x5A);
    CHECK(flash[0x0400 + 1499] == 0x5A);
  }

  SUBCASE("Erase failure cancels before any block")
  {
    erase_ok = false;
    send_all();
    CHECK(rx.last_error() == ErrorCode::WRITE_FAILED);
    CHECK(rx.blocks_received() == 0);
    CHECK(replies.back() == to_byte(Marker::CAN));
  }

  SUBCASE("Readback mismatch cancels")
  {
    corrupt_writes = true;
    send_all();
    CHECK(rx.last_error() == ErrorCode::WRITE_FAILED);
    CHECK(readbacks == 1);
    CHECK(rx.blocks_received() == 0);
  }

  SUBCASE("Failed readback cancels")
  {
    readback_ok = false;
    send_all();
    CHECK(rx.last_error() == ErrorCode::WRITE_FAILED);
  }

  SUBCASE("No-verify flag skips the readback")
  {
    header.flags = FLAG_NO_VERIFY;
    corrupt_writes = true;
    send_all();
    rx.feed_byte(to_byte(Marker::EOT));

    CHECK(rx.state() == Receiver::State::DONE);
    CHECK(rx.last_error() == ErrorCode::OK);
    CHECK(readbacks == 0);
    CHECK(rx.blocks_received() == 2);
    CHECK(erased.size() == 1);
  }
}
