#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace blkio {

struct WorkerNetAddress {
  std::string host;
  uint16_t rpcPort = 0;
  uint16_t dataPort = 0;
  std::string domainSocketPath;

  bool operator==(const WorkerNetAddress& other) const {
    return host == other.host && rpcPort == other.rpcPort && dataPort == other.dataPort &&
           domainSocketPath == other.domainSocketPath;
  }
  bool operator!=(const WorkerNetAddress& other) const { return !operator==(other); }

  std::string toString() const;
};

/* Parses "host:dataPort"; returns false on malformed input */
bool ParseWorkerNetAddress(std::string_view str, WorkerNetAddress& out);

/* Address of this host's own worker */
WorkerNetAddress LocalWorkerNetAddress();

} // namespace blkio
