#include "blkio/PacketInStream.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "blkio/Errors.hpp"
#include "blkio/Util.hpp"

namespace blkio {

PacketInStream::PacketInStream(std::unique_ptr<PacketReader::Factory>&& packetReaderFactory, uint64_t id,
                               uint64_t length)
: m_packetReaderFactory(std::move(packetReaderFactory)), m_id(id), m_length(length) {}

int PacketInStream::read() {
  uint8_t singleByte;
  int64_t bytesRead = read(&singleByte, 1, 0, 1);
  if (bytesRead == -1)
    return -1;
  return singleByte;
}

int64_t PacketInStream::read(void* b, uint64_t len) { return read(static_cast<uint8_t*>(b), len, 0, len); }

int64_t PacketInStream::read(uint8_t* b, uint64_t bLen, uint64_t off, uint64_t len) {
  checkIfClosed();
  if (!b)
    throw PreconditionViolation(PreconditionMessage::ErrReadBufferNull);
  if (off > bLen || len > bLen - off)
    throw PreconditionViolation(fmt::format(PreconditionMessage::ErrBufferState, bLen, off, len));
  if (len == 0)
    return 0;

  readPacket();
  if (!m_currentPacket)
    m_eof = true;
  if (m_eof) {
    closePacketReader();
    return -1;
  }
  uint64_t toRead = blkio::min(len, m_currentPacket->readableBytes());
  m_currentPacket->readBytes(b + off, toRead);
  m_pos += toRead;
  return int64_t(toRead);
}

int64_t PacketInStream::positionedRead(int64_t pos, uint8_t* b, uint64_t bLen, uint64_t off, uint64_t len) {
  checkIfClosed();
  if (!b)
    throw PreconditionViolation(PreconditionMessage::ErrReadBufferNull);
  if (off > bLen || len > bLen - off)
    throw PreconditionViolation(fmt::format(PreconditionMessage::ErrBufferState, bLen, off, len));
  if (len == 0)
    return 0;
  if (pos < 0 || uint64_t(pos) >= m_length)
    return -1;

  uint64_t lenCopy = len;
  std::unique_ptr<PacketReader> reader = m_packetReaderFactory->create(uint64_t(pos), len);
  try {
    /* Readers are not free to create, so keep pulling until len is satisfied */
    unsigned emptyPackets = 0;
    while (len > 0) {
      DataBufferPtr dataBuffer = reader->readPacket();
      if (!dataBuffer)
        break;
      uint64_t toRead = dataBuffer->readableBytes();
      if (toRead == 0) {
        spdlog::warn("empty packet at offset {} of block {}", reader->pos(), m_id);
        if (++emptyPackets >= MaxEmptyPackets)
          throw TransportError(fmt::format("reader for block {} keeps returning empty packets", m_id));
        continue;
      }
      emptyPackets = 0;
      if (toRead > len)
        throw TransportError(
            fmt::format("packet of {} bytes overruns the {} bytes left in a positioned read", toRead, len));
      dataBuffer->readBytes(b + off, toRead);
      len -= toRead;
      off += toRead;
    }
  } catch (...) {
    /* The read failure is what the caller sees, not a failure closing the reader */
    try {
      reader->close();
    } catch (const std::exception& e) {
      spdlog::warn("closing reader for block {} after a failed positioned read: {}", m_id, e.what());
    }
    throw;
  }
  reader->close();

  if (lenCopy == len)
    return -1;
  return int64_t(lenCopy - len);
}

int64_t PacketInStream::remaining() const {
  checkIfClosed();
  return m_eof ? 0 : int64_t(m_length - m_pos);
}

void PacketInStream::seek(int64_t pos) {
  checkIfClosed();
  if (pos < 0)
    throw PreconditionViolation(fmt::format(PreconditionMessage::ErrSeekNegative, pos));
  if (uint64_t(pos) > m_length)
    throw PreconditionViolation(fmt::format(PreconditionMessage::ErrSeekPastEndOfRegion, pos, m_id, m_length));
  if (uint64_t(pos) == m_pos)
    return;
  if (uint64_t(pos) < m_pos)
    m_eof = false;

  closePacketReader();
  m_pos = uint64_t(pos);
}

int64_t PacketInStream::skip(int64_t n) {
  checkIfClosed();
  if (n <= 0)
    return 0;

  int64_t toSkip = blkio::min(remaining(), n);
  m_pos += uint64_t(toSkip);

  closePacketReader();
  return toSkip;
}

void PacketInStream::close() {
  if (m_closed)
    return;
  m_closed = true;
  try {
    closePacketReader();
  } catch (...) {
    m_packetReaderFactory->close();
    throw;
  }
  m_packetReaderFactory->close();
}

bool PacketInStream::isShortCircuit() const { return m_packetReaderFactory->isShortCircuit(); }

/* Makes sure a packet with unread bytes is current, unless the reader is exhausted */
void PacketInStream::readPacket() {
  if (!m_packetReader) {
    spdlog::debug("creating packet reader for block {} at {} ({} bytes)", m_id, m_pos, m_length - m_pos);
    m_packetReader = m_packetReaderFactory->create(m_pos, m_length - m_pos);
  }

  if (m_currentPacket && m_currentPacket->readableBytes() == 0)
    m_currentPacket.reset();

  unsigned emptyPackets = 0;
  while (!m_currentPacket) {
    m_currentPacket = m_packetReader->readPacket();
    if (!m_currentPacket)
      return;
    if (m_currentPacket->readableBytes() == 0) {
      spdlog::warn("empty packet at offset {} of block {}", m_packetReader->pos(), m_id);
      m_currentPacket.reset();
      if (++emptyPackets >= MaxEmptyPackets)
        throw TransportError(fmt::format("reader for block {} keeps returning empty packets", m_id));
    }
  }
}

void PacketInStream::closePacketReader() {
  m_currentPacket.reset();
  if (m_packetReader) {
    /* Detach first so a failing close still leaves no reader behind */
    std::unique_ptr<PacketReader> reader = std::move(m_packetReader);
    reader->close();
  }
}

void PacketInStream::checkIfClosed() const {
  if (m_closed)
    throw PreconditionViolation(PreconditionMessage::ErrClosedStream);
}

} // namespace blkio
