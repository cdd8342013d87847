#include "blkio/DataBuffer.hpp"

#include <cstring>

#include <fmt/format.h>

#include "blkio/Errors.hpp"

namespace blkio {

void DataByteBuffer::readBytes(void* dst, uint64_t length) {
  if (length > readableBytes())
    throw PreconditionViolation(fmt::format(PreconditionMessage::ErrBufferUnderflow, length, readableBytes()));
  memcpy(dst, m_buf.get() + m_readIdx, length);
  m_readIdx += length;
}

void DataByteBuffer::release() noexcept {
  m_buf.reset();
  m_length = 0;
  m_readIdx = 0;
}

DataBufferPtr NewDataByteBuffer(std::unique_ptr<uint8_t[]>&& buf, uint64_t length) {
  return DataBufferPtr(new DataByteBuffer(std::move(buf), length));
}

DataBufferPtr NewDataByteBuffer(const void* src, uint64_t length) {
  std::unique_ptr<uint8_t[]> buf(new uint8_t[length]);
  if (length)
    memcpy(buf.get(), src, length);
  return NewDataByteBuffer(std::move(buf), length);
}

} // namespace blkio
