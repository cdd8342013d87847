#pragma once

#include <cstdint>
#include <memory>

#include "blkio/DataBuffer.hpp"

namespace blkio {

/*
 * Produces the packets covering one byte range of a block. A reader is single-use: it cannot
 * be repositioned, and once readPacket() has returned null it keeps returning null.
 *
 * close() releases the transport resources and may report failures. It is idempotent, and a
 * reader destroyed without close() still releases what it holds.
 */
class PacketReader {
public:
  virtual ~PacketReader() = default;

  /* Next non-empty packet, or null once the range is exhausted */
  virtual DataBufferPtr readPacket() = 0;
  /* Block offset of the next byte this reader would return */
  virtual uint64_t pos() const = 0;
  virtual void close() = 0;

  class Factory {
  public:
    virtual ~Factory() = default;
    /* Reader over [offset, offset + len), clamped to the end of the block */
    virtual std::unique_ptr<PacketReader> create(uint64_t offset, uint64_t len) const = 0;
    virtual bool isShortCircuit() const = 0;
    virtual void close() = 0;
  };
};

} // namespace blkio
