#pragma once

#include <cstdint>
#include <memory>

#include "blkio/DataChannel.hpp"
#include "blkio/PacketReader.hpp"
#include "blkio/Protocol.hpp"
#include "blkio/WorkerNetAddress.hpp"

namespace blkio {

/* Streams packets of a remote block over a DataChannel */
class NetPacketReader : public PacketReader {
  std::unique_ptr<DataChannel> m_channel;
  ReadRequest m_request;
  uint64_t m_pos;
  bool m_done = false;

public:
  /* Sends the request immediately */
  NetPacketReader(std::unique_ptr<DataChannel>&& channel, const ReadRequest& request);
  ~NetPacketReader() override = default;

  DataBufferPtr readPacket() override;
  uint64_t pos() const override { return m_pos; }
  void close() override;

  class Factory : public PacketReader::Factory {
    WorkerNetAddress m_address;
    ReadRequest m_readRequestPartial;
    ChannelProvider m_channelProvider;

  public:
    /* readRequestPartial carries the block id and packet size; offset and length are per reader */
    Factory(const WorkerNetAddress& address, const ReadRequest& readRequestPartial,
            ChannelProvider channelProvider);

    std::unique_ptr<PacketReader> create(uint64_t offset, uint64_t len) const override;
    bool isShortCircuit() const override { return false; }
    void close() override;
  };
};

} // namespace blkio
