#include "blkio/NetPacketReader.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "blkio/Errors.hpp"

namespace blkio {

NetPacketReader::NetPacketReader(std::unique_ptr<DataChannel>&& channel, const ReadRequest& request)
: m_channel(std::move(channel)), m_request(request), m_pos(request.offset) {
  if (!m_channel)
    throw TransportError(fmt::format("no data channel for block {}", m_request.blockId));
  m_channel->send(m_request);
}

DataBufferPtr NetPacketReader::readPacket() {
  if (m_done || !m_channel)
    return {};

  ReadResponse resp = m_channel->receive();
  if (resp.status != RpcStatus::Ok) {
    /* The server ends the stream after an error response */
    m_done = true;
    spdlog::error("read of block {} at {} failed: {} {}", m_request.blockId, m_pos, getStatusString(resp.status),
                  resp.message);
    throw TransportError(fmt::format("read of block {} at {} failed with {}: {}", m_request.blockId, m_pos,
                                     getStatusString(resp.status), resp.message));
  }
  if (!resp.data) {
    m_done = true;
    return {};
  }
  uint64_t len = resp.data->readableBytes();
  if (len > m_request.packetSize)
    throw TransportError(fmt::format("packet of {} bytes exceeds the negotiated {} byte packet size", len,
                                     m_request.packetSize));
  m_pos += len;
  return std::move(resp.data);
}

void NetPacketReader::close() {
  if (!m_channel)
    return;
  /* Detach first so the channel goes away even if cancelling fails */
  std::unique_ptr<DataChannel> channel = std::move(m_channel);
  if (!m_done) {
    ReadRequest cancel = m_request;
    cancel.cancel = true;
    channel->send(cancel);
    /* Drain whatever was in flight up to the end marker */
    for (;;) {
      ReadResponse resp = channel->receive();
      if (resp.status == RpcStatus::Cancelled || (resp.status == RpcStatus::Ok && !resp.data))
        break;
      if (resp.status != RpcStatus::Ok) {
        spdlog::warn("cancelling read of block {} failed: {} {}", m_request.blockId, getStatusString(resp.status),
                     resp.message);
        break;
      }
    }
    m_done = true;
  }
  channel->close();
}

NetPacketReader::Factory::Factory(const WorkerNetAddress& address, const ReadRequest& readRequestPartial,
                                  ChannelProvider channelProvider)
: m_address(address), m_readRequestPartial(readRequestPartial), m_channelProvider(std::move(channelProvider)) {
  if (!m_readRequestPartial.packetSize)
    throw PreconditionViolation("packet size must be positive");
  if (!m_channelProvider)
    throw PreconditionViolation("no channel provider");
}

std::unique_ptr<PacketReader> NetPacketReader::Factory::create(uint64_t offset, uint64_t len) const {
  ReadRequest req = m_readRequestPartial;
  req.offset = offset;
  req.length = len;
  req.cancel = false;
  return std::make_unique<NetPacketReader>(m_channelProvider(m_address), req);
}

void NetPacketReader::Factory::close() {
  spdlog::debug("closing reader factory for block {} on {}", m_readRequestPartial.blockId, m_address.toString());
}

} // namespace blkio
