#include "blkio/Protocol.hpp"

#include <cstring>

#include <fmt/format.h>

#include "blkio/Errors.hpp"
#include "blkio/Util.hpp"

namespace blkio {

namespace {

template <typename T>
void put(std::vector<uint8_t>& out, T val) {
  val = SBig(val);
  const uint8_t* p = reinterpret_cast<const uint8_t*>(&val);
  out.insert(out.end(), p, p + sizeof(T));
}

template <typename T>
T get(const uint8_t* in) {
  T val;
  memcpy(&val, in, sizeof(T));
  return SBig(val);
}

void putHeader(std::vector<uint8_t>& out, RpcType type, uint32_t bodyLength) {
  put(out, bodyLength);
  out.push_back(uint8_t(type));
}

} // namespace

const char* getStatusString(RpcStatus status) {
  switch (status) {
  case RpcStatus::Ok:
    return "OK";
  case RpcStatus::NotFound:
    return "NOT_FOUND";
  case RpcStatus::InvalidArgument:
    return "INVALID_ARGUMENT";
  case RpcStatus::Cancelled:
    return "CANCELLED";
  case RpcStatus::Internal:
    return "INTERNAL";
  default:
    return "UNKNOWN";
  }
}

std::vector<uint8_t> EncodeReadRequest(const ReadRequest& req) {
  std::vector<uint8_t> out;
  out.reserve(FrameHeaderSize + ReadRequestBodySize);
  putHeader(out, RpcType::ReadRequest, ReadRequestBodySize);
  put(out, req.blockId);
  put(out, req.offset);
  put(out, req.length);
  put(out, req.packetSize);
  uint8_t flags = 0;
  if (req.cancel)
    flags |= ReadRequest::Cancel;
  if (req.promote)
    flags |= ReadRequest::Promote;
  out.push_back(flags);
  return out;
}

std::vector<uint8_t> EncodeReadResponse(RpcStatus status, const std::string& message, const void* data,
                                        uint64_t length) {
  if (message.size() > UINT16_MAX)
    throw PreconditionViolation("response message too long");
  uint64_t bodyLength = ReadResponseHeaderSize + message.size() + length;
  if (bodyLength > MaxFrameLength)
    throw PreconditionViolation(fmt::format("response of {} bytes exceeds the frame limit", bodyLength));

  std::vector<uint8_t> out;
  out.reserve(FrameHeaderSize + bodyLength);
  putHeader(out, RpcType::ReadResponse, uint32_t(bodyLength));
  put(out, uint16_t(status));
  put(out, uint16_t(message.size()));
  out.insert(out.end(), message.begin(), message.end());
  if (length) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    out.insert(out.end(), p, p + length);
  }
  return out;
}

bool DecodeFrameHeader(const uint8_t* hdr, uint32_t& bodyLength, RpcType& type) {
  bodyLength = get<uint32_t>(hdr);
  uint8_t rawType = hdr[4];
  if (bodyLength > MaxFrameLength)
    return false;
  if (rawType != uint8_t(RpcType::ReadRequest) && rawType != uint8_t(RpcType::ReadResponse))
    return false;
  type = RpcType(rawType);
  return true;
}

ReadRequest DecodeReadRequest(const uint8_t* body, size_t length) {
  if (length != ReadRequestBodySize)
    throw TransportError(fmt::format("malformed read request: {} byte body", length));
  ReadRequest req;
  req.blockId = get<uint64_t>(body);
  req.offset = get<uint64_t>(body + 8);
  req.length = get<uint64_t>(body + 16);
  req.packetSize = get<uint64_t>(body + 24);
  uint8_t flags = body[32];
  req.cancel = flags & ReadRequest::Cancel;
  req.promote = flags & ReadRequest::Promote;
  return req;
}

ReadResponse DecodeReadResponse(const uint8_t* body, size_t length) {
  if (length < ReadResponseHeaderSize)
    throw TransportError(fmt::format("malformed read response: {} byte body", length));
  ReadResponse resp;
  resp.status = RpcStatus(get<uint16_t>(body));
  uint16_t messageLength = get<uint16_t>(body + 2);
  if (ReadResponseHeaderSize + messageLength > length)
    throw TransportError(fmt::format("malformed read response: message of {} bytes in a {} byte body",
                                     messageLength, length));
  resp.message.assign(reinterpret_cast<const char*>(body + ReadResponseHeaderSize), messageLength);
  size_t dataOffset = ReadResponseHeaderSize + messageLength;
  if (dataOffset < length)
    resp.data = NewDataByteBuffer(body + dataOffset, length - dataOffset);
  return resp;
}

} // namespace blkio
