#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "blkio/DataChannel.hpp"
#include "blkio/Errors.hpp"

namespace blkio {

namespace {

std::string lastSocketError() { return std::string(strerror(errno)); }

class TcpDataChannel : public DataChannel {
  int m_fd;

  void writeFully(const uint8_t* buf, size_t length) {
    while (length) {
      ssize_t wr = ::send(m_fd, buf, length, MSG_NOSIGNAL);
      if (wr < 0) {
        if (errno == EINTR)
          continue;
        spdlog::error("send() failed: {}", lastSocketError());
        throw TransportError("unable to write to data channel: " + lastSocketError());
      }
      buf += wr;
      length -= size_t(wr);
    }
  }

  void readFully(uint8_t* buf, size_t length) {
    while (length) {
      ssize_t rd = ::recv(m_fd, buf, length, 0);
      if (rd < 0) {
        if (errno == EINTR)
          continue;
        spdlog::error("recv() failed: {}", lastSocketError());
        throw TransportError("unable to read from data channel: " + lastSocketError());
      }
      if (rd == 0)
        throw TransportError("data channel closed by peer");
      buf += rd;
      length -= size_t(rd);
    }
  }

public:
  explicit TcpDataChannel(int fd) : m_fd(fd) {}
  ~TcpDataChannel() override { close(); }
  TcpDataChannel(const TcpDataChannel&) = delete;
  TcpDataChannel& operator=(const TcpDataChannel&) = delete;

  void send(const ReadRequest& req) override {
    if (m_fd < 0)
      throw TransportError("data channel is closed");
    std::vector<uint8_t> frame = EncodeReadRequest(req);
    writeFully(frame.data(), frame.size());
  }

  ReadResponse receive() override {
    if (m_fd < 0)
      throw TransportError("data channel is closed");
    uint8_t hdr[FrameHeaderSize];
    readFully(hdr, FrameHeaderSize);
    uint32_t bodyLength;
    RpcType type;
    if (!DecodeFrameHeader(hdr, bodyLength, type)) {
      spdlog::error("bad frame header from data channel");
      throw TransportError("malformed frame on data channel");
    }
    if (type != RpcType::ReadResponse)
      throw TransportError(fmt::format("unexpected message type {} on data channel", int(type)));
    std::vector<uint8_t> body(bodyLength);
    readFully(body.data(), bodyLength);
    return DecodeReadResponse(body.data(), body.size());
  }

  void close() override {
    if (m_fd >= 0) {
      ::close(m_fd);
      m_fd = -1;
    }
  }
};

} // namespace

std::unique_ptr<DataChannel> ConnectTcpChannel(const WorkerNetAddress& address, int32_t timeoutMs) {
  struct addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* res = nullptr;
  const std::string port = std::to_string(address.dataPort);
  int gai = getaddrinfo(address.host.c_str(), port.c_str(), &hints, &res);
  if (gai) {
    spdlog::error("unable to resolve {}: {}", address.toString(), gai_strerror(gai));
    throw TransportError(fmt::format("unable to resolve {}: {}", address.toString(), gai_strerror(gai)));
  }

  int fd = -1;
  std::string lastError = "no usable address";
  for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      lastError = lastSocketError();
      continue;
    }
    if (timeoutMs > 0) {
      /* connect() honors the send timeout on Linux */
      struct timeval tv;
      tv.tv_sec = timeoutMs / 1000;
      tv.tv_usec = (timeoutMs % 1000) * 1000;
      setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
    if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
      break;
    lastError = lastSocketError();
    ::close(fd);
    fd = -1;
  }
  freeaddrinfo(res);

  if (fd < 0) {
    spdlog::error("unable to connect to {}: {}", address.toString(), lastError);
    throw TransportError(fmt::format("unable to connect to {}: {}", address.toString(), lastError));
  }

  int one = 1;
  setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  spdlog::debug("connected data channel to {}", address.toString());
  return std::make_unique<TcpDataChannel>(fd);
}

std::unique_ptr<DataChannel> NewSocketChannel(int fd) {
  if (fd < 0)
    throw PreconditionViolation("invalid socket descriptor");
  return std::make_unique<TcpDataChannel>(fd);
}

} // namespace blkio
