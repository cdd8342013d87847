#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "blkio/Configuration.hpp"
#include "blkio/PacketInStream.hpp"
#include "blkio/Protocol.hpp"
#include "blkio/WorkerNetAddress.hpp"

namespace blkio {

/* Where a worker on this host keeps the file of blockId */
std::string LocalBlockPath(const MountConfiguration& conf, uint64_t blockId);
std::string LocalBlockPath(const Configuration& conf, uint64_t blockId);

/*
 * Short-circuit stream over a block stored on this host.
 * Throws ConfigurationError if the packet size is missing, malformed or zero.
 */
std::unique_ptr<PacketInStream> NewLocalPacketInStream(const MountConfiguration& conf,
                                                       const WorkerNetAddress& address, uint64_t blockId,
                                                       uint64_t length);
std::unique_ptr<PacketInStream> NewLocalPacketInStream(const Configuration& conf, const WorkerNetAddress& address,
                                                       uint64_t blockId, uint64_t length);

/* Stream over a block served by a remote worker's data server */
std::unique_ptr<PacketInStream> NewNetPacketInStream(const MountConfiguration& conf, const WorkerNetAddress& address,
                                                     const ReadRequest& readRequestPartial, uint64_t blockSize);
std::unique_ptr<PacketInStream> NewNetPacketInStream(const Configuration& conf, const WorkerNetAddress& address,
                                                     const ReadRequest& readRequestPartial, uint64_t blockSize);

} // namespace blkio
