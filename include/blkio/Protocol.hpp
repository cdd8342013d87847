#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "blkio/DataBuffer.hpp"

namespace blkio {

/*
 * Data server wire format. Every frame is
 *   u32 body length | u8 message type | body
 * with all integers big-endian.
 *
 * ReadRequest body:  u64 blockId | u64 offset | u64 length | u64 packetSize | u8 flags
 * ReadResponse body: u16 status | u16 message length | message | packet data
 *
 * A successful response carrying no data marks the end of the requested range.
 */

enum class RpcType : uint8_t { ReadRequest = 1, ReadResponse = 2 };

enum class RpcStatus : uint16_t { Ok = 0, NotFound = 1, InvalidArgument = 2, Cancelled = 3, Internal = 4 };
const char* getStatusString(RpcStatus status);

constexpr uint32_t MaxFrameLength = 16 * 1024 * 1024;
constexpr size_t FrameHeaderSize = 5;
constexpr size_t ReadRequestBodySize = 33;
constexpr size_t ReadResponseHeaderSize = 4;

struct ReadRequest {
  enum Flags : uint8_t { Cancel = 1 << 0, Promote = 1 << 1 };

  uint64_t blockId = 0;
  uint64_t offset = 0;
  uint64_t length = 0;
  uint64_t packetSize = 0;
  bool cancel = false;
  bool promote = false;
};

struct ReadResponse {
  RpcStatus status = RpcStatus::Ok;
  std::string message;
  /* Null when the response carries no data */
  DataBufferPtr data;
};

/* Whole frame, header included */
std::vector<uint8_t> EncodeReadRequest(const ReadRequest& req);
std::vector<uint8_t> EncodeReadResponse(RpcStatus status, const std::string& message, const void* data,
                                        uint64_t length);

/* Frame header helpers; DecodeFrameHeader returns false on an oversized or unknown frame */
bool DecodeFrameHeader(const uint8_t* hdr, uint32_t& bodyLength, RpcType& type);

/* Bodies only; these throw TransportError on malformed input */
ReadRequest DecodeReadRequest(const uint8_t* body, size_t length);
ReadResponse DecodeReadResponse(const uint8_t* body, size_t length);

} // namespace blkio
