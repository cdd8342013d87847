#pragma once

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>

#include "blkio/IFileIO.hpp"
#include "blkio/PacketReader.hpp"
#include "blkio/WorkerNetAddress.hpp"

namespace blkio {

/* Short-circuit reader pulling packets straight out of a worker's local block file */
class LocalFilePacketReader : public PacketReader {
  std::unique_ptr<IFileIO::IReadStream> m_rs;
  uint64_t m_pos;
  uint64_t m_end;
  uint64_t m_packetSize;

public:
  LocalFilePacketReader(std::unique_ptr<IFileIO::IReadStream>&& rs, uint64_t offset, uint64_t end,
                        uint64_t packetSize);

  DataBufferPtr readPacket() override;
  uint64_t pos() const override { return m_pos; }
  void close() override { m_rs.reset(); }

  class Factory : public PacketReader::Factory {
    WorkerNetAddress m_address;
    uint64_t m_blockId;
    uint64_t m_packetSize;
    std::string m_path;
    std::unique_ptr<IFileIO> m_fio;
    uint64_t m_fileLength;
    /* Shared lock pinning the block file while this factory is open */
    FILE* m_lockFp = nullptr;

  public:
    /* Throws TransportError if the block file is missing */
    Factory(const WorkerNetAddress& address, uint64_t blockId, uint64_t packetSize, std::string_view blockPath);
    ~Factory() override;
    Factory(const Factory&) = delete;
    Factory& operator=(const Factory&) = delete;

    std::unique_ptr<PacketReader> create(uint64_t offset, uint64_t len) const override;
    bool isShortCircuit() const override { return true; }
    void close() override;

    uint64_t fileLength() const { return m_fileLength; }
  };
};

} // namespace blkio
