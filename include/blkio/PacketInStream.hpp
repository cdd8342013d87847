#pragma once

#include <cstdint>
#include <memory>

#include "blkio/DataBuffer.hpp"
#include "blkio/PacketReader.hpp"

namespace blkio {

struct BoundedStream {
  virtual ~BoundedStream() = default;
  /* Bytes left before the end of the stream */
  virtual int64_t remaining() const = 0;
};

struct Seekable {
  virtual ~Seekable() = default;
  virtual void seek(int64_t pos) = 0;
  virtual uint64_t position() const = 0;
};

struct PositionedReadable {
  virtual ~PositionedReadable() = default;
  /* Reads up to len bytes at pos without moving the stream; -1 if nothing could be read */
  virtual int64_t positionedRead(int64_t pos, uint8_t* b, uint64_t bLen, uint64_t off, uint64_t len) = 0;
};

/*
 * Input stream over one block, fed packet by packet from PacketReaders.
 *
 * Sequential reads share one lazily created reader that lives until the next seek, skip,
 * end of block or close. Positioned reads create and close a reader of their own per call and
 * never touch the sequential session.
 *
 * Not thread-safe.
 */
class PacketInStream : public BoundedStream, public Seekable, public PositionedReadable {
public:
  /* Consecutive empty packets tolerated before the reader is considered broken */
  static constexpr unsigned MaxEmptyPackets = 16;

private:
  /* Declared first so it is destroyed last */
  std::unique_ptr<PacketReader::Factory> m_packetReaderFactory;
  std::unique_ptr<PacketReader> m_packetReader;
  DataBufferPtr m_currentPacket;

  /* Block or file id this stream reads */
  uint64_t m_id;
  uint64_t m_length;
  uint64_t m_pos = 0;

  bool m_closed = false;
  bool m_eof = false;

  void readPacket();
  void closePacketReader();
  void checkIfClosed() const;

public:
  PacketInStream(std::unique_ptr<PacketReader::Factory>&& packetReaderFactory, uint64_t id, uint64_t length);
  PacketInStream(const PacketInStream&) = delete;
  PacketInStream& operator=(const PacketInStream&) = delete;

  /* Next byte as 0-255, or -1 at the end of the stream */
  int read();
  int64_t read(void* b, uint64_t len);
  /*
   * Copies at most len bytes to b + off, never more than the current packet holds.
   * Returns the count copied or -1 at the end of the stream.
   */
  int64_t read(uint8_t* b, uint64_t bLen, uint64_t off, uint64_t len);

  int64_t positionedRead(int64_t pos, uint8_t* b, uint64_t bLen, uint64_t off, uint64_t len) override;
  int64_t remaining() const override;
  void seek(int64_t pos) override;
  uint64_t position() const override { return m_pos; }
  int64_t skip(int64_t n);
  void close();

  /* Whether packets come straight from a local file */
  bool isShortCircuit() const;

  uint64_t id() const { return m_id; }
  uint64_t length() const { return m_length; }
  bool isClosed() const { return m_closed; }
};

} // namespace blkio
