#include "blkio/LocalFilePacketReader.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "blkio/Errors.hpp"
#include "blkio/Util.hpp"

namespace blkio {

LocalFilePacketReader::LocalFilePacketReader(std::unique_ptr<IFileIO::IReadStream>&& rs, uint64_t offset,
                                             uint64_t end, uint64_t packetSize)
: m_rs(std::move(rs)), m_pos(offset), m_end(end), m_packetSize(packetSize) {}

DataBufferPtr LocalFilePacketReader::readPacket() {
  if (!m_rs || m_pos >= m_end)
    return {};

  uint64_t len = blkio::min(m_packetSize, m_end - m_pos);
  std::unique_ptr<uint8_t[]> buf(new uint8_t[len]);
  uint64_t rd = m_rs->read(buf.get(), len);
  if (rd != len) {
    spdlog::error("short read from block file at {}: {} of {} bytes", m_pos, rd, len);
    throw TransportError(fmt::format("unable to read {} bytes at offset {} of local block file", len, m_pos));
  }
  m_pos += len;
  return NewDataByteBuffer(std::move(buf), len);
}

LocalFilePacketReader::Factory::Factory(const WorkerNetAddress& address, uint64_t blockId, uint64_t packetSize,
                                        std::string_view blockPath)
: m_address(address), m_blockId(blockId), m_packetSize(packetSize), m_path(blockPath), m_fio(NewFileIO(blockPath)) {
  if (!m_packetSize)
    throw PreconditionViolation("packet size must be positive");
  if (!m_fio->exists()) {
    spdlog::error("block {} not found at '{}' on {}", m_blockId, m_path, m_address.toString());
    throw TransportError(fmt::format("block {} is not stored locally at '{}'", m_blockId, m_path));
  }
  m_lockFp = Fopen(m_path.c_str(), "rb", FileLockType::Read);
  if (!m_lockFp)
    throw TransportError(fmt::format("unable to pin block {} at '{}'", m_blockId, m_path));
  m_fileLength = m_fio->size();
}

LocalFilePacketReader::Factory::~Factory() { close(); }

std::unique_ptr<PacketReader> LocalFilePacketReader::Factory::create(uint64_t offset, uint64_t len) const {
  uint64_t end = offset + blkio::min(len, m_fileLength - blkio::min(offset, m_fileLength));
  auto rs = m_fio->beginReadStream(offset);
  if (!rs)
    throw TransportError(fmt::format("unable to open block {} at '{}'", m_blockId, m_path));
  return std::make_unique<LocalFilePacketReader>(std::move(rs), offset, end, m_packetSize);
}

void LocalFilePacketReader::Factory::close() {
  if (m_lockFp) {
    spdlog::debug("unpinning block {} at '{}'", m_blockId, m_path);
    fclose(m_lockFp);
    m_lockFp = nullptr;
  }
}

} // namespace blkio
