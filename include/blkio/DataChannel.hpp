#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "blkio/Protocol.hpp"
#include "blkio/WorkerNetAddress.hpp"

namespace blkio {

/* An established connection to a worker's data server */
class DataChannel {
public:
  virtual ~DataChannel() = default;
  virtual void send(const ReadRequest& req) = 0;
  /* Blocks for the next response frame */
  virtual ReadResponse receive() = 0;
  virtual void close() = 0;
};

using ChannelProvider = std::function<std::unique_ptr<DataChannel>(const WorkerNetAddress&)>;

/* Throws TransportError when the connection cannot be made */
std::unique_ptr<DataChannel> ConnectTcpChannel(const WorkerNetAddress& address, int32_t timeoutMs);

/* Takes ownership of an already connected stream socket */
std::unique_ptr<DataChannel> NewSocketChannel(int fd);

} // namespace blkio
