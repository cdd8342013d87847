#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <blkio/Errors.hpp>
#include <blkio/Util.hpp>
#include <blkio/blkio.hpp>

static void printHelp() {
  fmt::print(stderr,
    "Usage:\n"
    "  blkiotool local [options] <block-id> <length> [<file-out>]\n"
    "  blkiotool remote [options] <host:port> <block-id> <length> [<file-out>]\n"
    "Options:\n"
    "  -c <file>        Load client properties from <file>\n"
    "  -p <off>:<len>   Positioned read of <len> bytes at <off> instead of the whole block\n"
    "  -v               Verbose details.\n");
}

static bool parseU64(const char* str, uint64_t& out) {
  char* end;
  errno = 0;
  unsigned long long val = std::strtoull(str, &end, 10);
  if (!*str || *end != '\0' || errno == ERANGE || str[0] == '-')
    return false;
  out = val;
  return true;
}

static bool parseRange(const std::string& str, uint64_t& off, uint64_t& len) {
  const auto colonPos = str.find(':');
  if (colonPos == std::string::npos)
    return false;
  return parseU64(str.substr(0, colonPos).c_str(), off) && parseU64(str.substr(colonPos + 1).c_str(), len);
}

static int copyOut(blkio::PacketInStream& stream, FILE* out, bool positioned, uint64_t off, uint64_t len) {
  if (positioned) {
    std::unique_ptr<uint8_t[]> buf(new uint8_t[len ? len : 1]);
    int64_t rd = stream.positionedRead(int64_t(off), buf.get(), len, 0, len);
    if (rd < 0) {
      spdlog::error("nothing to read at offset {} of block {}", off, stream.id());
      return 1;
    }
    if (fwrite(buf.get(), 1, size_t(rd), out) != size_t(rd)) {
      spdlog::error("unable to write output: {}", strerror(errno));
      return 1;
    }
    spdlog::info("read {} of {} requested bytes at offset {}", rd, len, off);
    return 0;
  }

  uint8_t buf[0x10000];
  uint64_t total = 0;
  int64_t rd;
  while ((rd = stream.read(buf, sizeof(buf), 0, sizeof(buf))) != -1) {
    if (fwrite(buf, 1, size_t(rd), out) != size_t(rd)) {
      spdlog::error("unable to write output: {}", strerror(errno));
      return 1;
    }
    total += uint64_t(rd);
  }
  spdlog::info("read {} bytes of block {} ({})", total, stream.id(),
               stream.isShortCircuit() ? "short-circuit" : "remote");
  return 0;
}

int main(int argc, char* argv[]) {
  int argidx = 1;
  std::string errand;
  std::string propsPath;
  bool verbose = false;
  bool positioned = false;
  uint64_t rangeOff = 0;
  uint64_t rangeLen = 0;
  while (argidx < argc) {
    if (!blkio::StrCaseCmp(argv[argidx], "-v")) {
      verbose = true;
      ++argidx;
      continue;
    } else if (!blkio::StrCaseCmp(argv[argidx], "-c") && argidx + 1 < argc) {
      propsPath = argv[argidx + 1];
      argidx += 2;
      continue;
    } else if (!blkio::StrCaseCmp(argv[argidx], "-p") && argidx + 1 < argc) {
      if (!parseRange(argv[argidx + 1], rangeOff, rangeLen)) {
        printHelp();
        return 1;
      }
      positioned = true;
      argidx += 2;
      continue;
    } else if (errand.empty()) {
      errand = argv[argidx];
      ++argidx;
      continue;
    } else {
      break;
    }
  }

  if (errand.empty()) {
    printHelp();
    return 1;
  }

  /* Block data may go to stdout */
  spdlog::set_default_logger(spdlog::stderr_color_mt("blkiotool"));
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

  blkio::Configuration conf;
  if (!propsPath.empty() && !conf.loadProperties(propsPath))
    return 1;

  blkio::WorkerNetAddress address;
  if (errand == "remote") {
    if (argidx >= argc || !blkio::ParseWorkerNetAddress(argv[argidx], address)) {
      printHelp();
      return 1;
    }
    ++argidx;
  } else if (errand == "local") {
    address = blkio::LocalWorkerNetAddress();
  } else {
    printHelp();
    return 1;
  }

  uint64_t blockId;
  uint64_t length;
  if (argc - argidx < 2 || argc - argidx > 3 || !parseU64(argv[argidx], blockId) ||
      !parseU64(argv[argidx + 1], length)) {
    printHelp();
    return 1;
  }
  std::string fileOut = argc - argidx == 3 ? argv[argidx + 2] : "";

  FILE* out = stdout;
  if (!fileOut.empty()) {
    out = blkio::Fopen(fileOut.c_str(), "wb");
    if (!out) {
      spdlog::error("unable to open '{}' for writing: {}", fileOut, strerror(errno));
      return 1;
    }
  }

  int ret;
  try {
    std::unique_ptr<blkio::PacketInStream> stream;
    if (errand == "local") {
      stream = blkio::NewLocalPacketInStream(conf, address, blockId, length);
    } else {
      blkio::ReadRequest partial;
      partial.blockId = blockId;
      stream = blkio::NewNetPacketInStream(conf, address, partial, length);
    }
    ret = copyOut(*stream, out, positioned, rangeOff, rangeLen);
    stream->close();
  } catch (const blkio::TransportError& e) {
    spdlog::error("transport failure: {}", e.what());
    ret = 1;
  } catch (const blkio::ConfigurationError& e) {
    spdlog::error("bad configuration: {}", e.what());
    ret = 1;
  } catch (const blkio::PreconditionViolation& e) {
    spdlog::error("invalid request: {}", e.what());
    ret = 1;
  }

  if (out != stdout)
    fclose(out);
  return ret;
}
