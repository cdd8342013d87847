#include "blkio/WorkerNetAddress.hpp"

#include <climits>
#include <cstdlib>
#include <string>

#include <unistd.h>

#include <fmt/format.h>

#ifndef HOST_NAME_MAX
#define HOST_NAME_MAX 255
#endif

namespace blkio {

std::string WorkerNetAddress::toString() const {
  if (domainSocketPath.empty())
    return fmt::format("{}:{}", host, dataPort);
  return fmt::format("{}:{} ({})", host, dataPort, domainSocketPath);
}

bool ParseWorkerNetAddress(std::string_view str, WorkerNetAddress& out) {
  const auto colonPos = str.rfind(':');
  if (colonPos == std::string_view::npos || colonPos == 0 || colonPos + 1 == str.size())
    return false;

  const std::string portStr(str.substr(colonPos + 1));
  char* end;
  long port = std::strtol(portStr.c_str(), &end, 10);
  if (*end != '\0' || port < 1 || port > 65535)
    return false;

  std::string_view host = str.substr(0, colonPos);
  /* [v6-literal]:port */
  if (host.size() > 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);

  out = WorkerNetAddress();
  out.host = std::string(host);
  out.dataPort = uint16_t(port);
  return true;
}

WorkerNetAddress LocalWorkerNetAddress() {
  char name[HOST_NAME_MAX + 1] = {};
  WorkerNetAddress ret;
  if (gethostname(name, sizeof(name) - 1) == 0 && name[0])
    ret.host = name;
  else
    ret.host = "localhost";
  return ret;
}

} // namespace blkio
