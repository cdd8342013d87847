#pragma once

#include <stdexcept>
#include <string>

namespace blkio {

/* Caller bug: closed stream, bad destination buffer, out-of-range seek */
class PreconditionViolation : public std::logic_error {
public:
  explicit PreconditionViolation(const std::string& msg) : std::logic_error(msg) {}
};

/* Failure raised while creating a reader or fetching a packet */
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

/* Precondition messages, formatted with fmt where they take arguments */
namespace PreconditionMessage {
constexpr const char* ErrClosedStream = "Cannot do operations on a closed PacketInStream";
constexpr const char* ErrReadBufferNull = "Read buffer cannot be null";
constexpr const char* ErrBufferState = "Buffer length: {}, offset: {}, len: {}";
constexpr const char* ErrSeekNegative = "Seek position is negative: {}";
constexpr const char* ErrSeekPastEndOfRegion = "Seek position {} is past the end of block {} ({} bytes)";
constexpr const char* ErrBufferUnderflow = "Cannot read {} bytes from a buffer with {} readable";
} // namespace PreconditionMessage

} // namespace blkio
