#pragma once

#include <cstdint>
#include <memory>

namespace blkio {

/*
 * A packet of bytes handed out by a PacketReader. The bytes are consumed front to back by
 * readBytes(); release() gives the backing storage back to whatever produced it and must
 * happen exactly once, which DataBufferPtr takes care of.
 */
class DataBuffer {
public:
  virtual ~DataBuffer() = default;
  virtual uint64_t readableBytes() const = 0;
  /* Copies length bytes into dst and advances past them */
  virtual void readBytes(void* dst, uint64_t length) = 0;
  virtual void release() noexcept = 0;
};

struct DataBufferDeleter {
  void operator()(DataBuffer* buf) const noexcept {
    buf->release();
    delete buf;
  }
};

using DataBufferPtr = std::unique_ptr<DataBuffer, DataBufferDeleter>;

/* Heap-backed buffer; release() frees the storage */
class DataByteBuffer : public DataBuffer {
  std::unique_ptr<uint8_t[]> m_buf;
  uint64_t m_length;
  uint64_t m_readIdx = 0;

public:
  DataByteBuffer(std::unique_ptr<uint8_t[]>&& buf, uint64_t length) : m_buf(std::move(buf)), m_length(length) {}
  uint64_t readableBytes() const override { return m_buf ? m_length - m_readIdx : 0; }
  void readBytes(void* dst, uint64_t length) override;
  void release() noexcept override;
};

DataBufferPtr NewDataByteBuffer(std::unique_ptr<uint8_t[]>&& buf, uint64_t length);
DataBufferPtr NewDataByteBuffer(const void* src, uint64_t length);

} // namespace blkio
