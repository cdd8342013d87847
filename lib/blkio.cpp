#include "blkio/blkio.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "blkio/DataChannel.hpp"
#include "blkio/Errors.hpp"
#include "blkio/LocalFilePacketReader.hpp"
#include "blkio/NetPacketReader.hpp"

namespace blkio {

namespace {

uint64_t packetSizeOf(const MountConfiguration& conf, PropertyKey key) {
  uint64_t packetSize = conf.getBytes(key);
  if (!packetSize)
    throw ConfigurationError(fmt::format("{} must be positive", getKeyString(key)));
  return packetSize;
}

} // namespace

std::string LocalBlockPath(const MountConfiguration& conf, uint64_t blockId) {
  std::string dir = conf.getValue(PropertyKey::WorkerTieredStoreLevel0DirsPath);
  while (dir.size() > 1 && dir.back() == '/')
    dir.pop_back();
  return fmt::format("{}/{}/{}", dir, conf.getValue(PropertyKey::WorkerDataFolder), blockId);
}

std::string LocalBlockPath(const Configuration& conf, uint64_t blockId) {
  return LocalBlockPath(MountConfiguration::Defaults(conf), blockId);
}

std::unique_ptr<PacketInStream> NewLocalPacketInStream(const MountConfiguration& conf,
                                                       const WorkerNetAddress& address, uint64_t blockId,
                                                       uint64_t length) {
  uint64_t packetSize = packetSizeOf(conf, PropertyKey::UserLocalReaderPacketSizeBytes);
  const std::string path = LocalBlockPath(conf, blockId);
  spdlog::debug("short-circuit read of block {} from '{}'", blockId, path);
  return std::make_unique<PacketInStream>(
      std::make_unique<LocalFilePacketReader::Factory>(address, blockId, packetSize, path), blockId, length);
}

std::unique_ptr<PacketInStream> NewLocalPacketInStream(const Configuration& conf, const WorkerNetAddress& address,
                                                       uint64_t blockId, uint64_t length) {
  return NewLocalPacketInStream(MountConfiguration::Defaults(conf), address, blockId, length);
}

std::unique_ptr<PacketInStream> NewNetPacketInStream(const MountConfiguration& conf, const WorkerNetAddress& address,
                                                     const ReadRequest& readRequestPartial, uint64_t blockSize) {
  ReadRequest partial = readRequestPartial;
  partial.packetSize = packetSizeOf(conf, PropertyKey::UserNetworkReaderPacketSizeBytes);
  int32_t timeoutMs = int32_t(conf.getInt(PropertyKey::UserNetworkConnectTimeoutMs));
  auto factory = std::make_unique<NetPacketReader::Factory>(
      address, partial,
      [timeoutMs](const WorkerNetAddress& addr) { return ConnectTcpChannel(addr, timeoutMs); });
  return std::make_unique<PacketInStream>(std::move(factory), readRequestPartial.blockId, blockSize);
}

std::unique_ptr<PacketInStream> NewNetPacketInStream(const Configuration& conf, const WorkerNetAddress& address,
                                                     const ReadRequest& readRequestPartial, uint64_t blockSize) {
  return NewNetPacketInStream(MountConfiguration::Defaults(conf), address, readRequestPartial, blockSize);
}

} // namespace blkio
