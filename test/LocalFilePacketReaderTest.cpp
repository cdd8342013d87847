#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

#include <blkio/Errors.hpp>
#include <blkio/LocalFilePacketReader.hpp>
#include <blkio/Util.hpp>
#include <blkio/blkio.hpp>

#include "TestUtil.hpp"

using namespace blkio;
using namespace blkio::test;

namespace {

constexpr uint64_t BlockId = 1001;
constexpr uint64_t BlockLength = 50;

/* Lays out <tmp>/blkioworker/<BlockId> the way a worker stores it */
struct WorkerDir {
  std::string root;
  std::string blockPath;
  std::vector<uint8_t> contents = MakeSource(BlockLength);
  Configuration conf;

  WorkerDir() {
    char tmpl[] = "/tmp/blkio-worker-XXXXXX";
    if (!mkdtemp(tmpl))
      throw std::runtime_error("mkdtemp failed");
    root = tmpl;
    conf.set(PropertyKey::WorkerTieredStoreLevel0DirsPath, root);
    conf.set(PropertyKey::UserLocalReaderPacketSizeBytes, "32");
    mkdir((root + "/blkioworker").c_str(), 0755);
    blockPath = LocalBlockPath(conf, BlockId);
    FILE* fp = fopen(blockPath.c_str(), "wb");
    if (!fp)
      throw std::runtime_error("unable to create block file");
    fwrite(contents.data(), 1, contents.size(), fp);
    fclose(fp);
  }

  ~WorkerDir() {
    unlink(blockPath.c_str());
    rmdir((root + "/blkioworker").c_str());
    rmdir(root.c_str());
  }
};

std::vector<uint8_t> drain(PacketReader& reader, std::vector<uint64_t>* sizes = nullptr) {
  std::vector<uint8_t> ret;
  while (DataBufferPtr packet = reader.readPacket()) {
    uint64_t len = packet->readableBytes();
    if (sizes)
      sizes->push_back(len);
    std::vector<uint8_t> chunk(len);
    packet->readBytes(chunk.data(), len);
    ret.insert(ret.end(), chunk.begin(), chunk.end());
  }
  return ret;
}

void testPacketsFollowPacketSize() {
  WorkerDir dir;
  LocalFilePacketReader::Factory factory(LocalWorkerNetAddress(), BlockId, 32, dir.blockPath);
  BLKIO_EXPECT(factory.isShortCircuit());
  BLKIO_EXPECT(factory.fileLength() == BlockLength);

  auto reader = factory.create(0, BlockLength);
  std::vector<uint64_t> sizes;
  BLKIO_EXPECT(drain(*reader, &sizes) == dir.contents);
  BLKIO_EXPECT(sizes == (std::vector<uint64_t>{32, 18}));
  BLKIO_EXPECT(reader->pos() == BlockLength);
  reader->close();
  BLKIO_EXPECT(!reader->readPacket());
  factory.close();
}

void testRangeIsClampedToFile() {
  WorkerDir dir;
  LocalFilePacketReader::Factory factory(LocalWorkerNetAddress(), BlockId, 32, dir.blockPath);

  auto reader = factory.create(40, 100);
  std::vector<uint8_t> got = drain(*reader);
  BLKIO_EXPECT(got == std::vector<uint8_t>(dir.contents.begin() + 40, dir.contents.end()));
  reader->close();

  auto past = factory.create(BlockLength + 5, 10);
  BLKIO_EXPECT(!past->readPacket());
  past->close();
}

void testMissingBlock() {
  WorkerDir dir;
  BLKIO_EXPECT(throws<TransportError>([&] {
    LocalFilePacketReader::Factory factory(LocalWorkerNetAddress(), BlockId + 1, 32, LocalBlockPath(dir.conf, BlockId + 1));
  }));
  BLKIO_EXPECT(throws<TransportError>([&] { NewLocalPacketInStream(dir.conf, LocalWorkerNetAddress(), 7, 10); }));
}

void testZeroPacketSize() {
  WorkerDir dir;
  BLKIO_EXPECT(throws<PreconditionViolation>(
      [&] { LocalFilePacketReader::Factory factory(LocalWorkerNetAddress(), BlockId, 0, dir.blockPath); }));

  /* A configured size of zero is a configuration mistake, not a caller bug */
  dir.conf.set(PropertyKey::UserLocalReaderPacketSizeBytes, "0");
  BLKIO_EXPECT(throws<ConfigurationError>(
      [&] { NewLocalPacketInStream(dir.conf, LocalWorkerNetAddress(), BlockId, BlockLength); }));
  dir.conf.set(PropertyKey::UserNetworkReaderPacketSizeBytes, "0B");
  ReadRequest partial;
  partial.blockId = BlockId;
  BLKIO_EXPECT(throws<ConfigurationError>(
      [&] { NewNetPacketInStream(dir.conf, LocalWorkerNetAddress(), partial, BlockLength); }));
}

void testMountOverridesGlobalConfiguration() {
  WorkerDir dir;
  MountConfiguration mount(dir.conf, true, false, {{"blkio.user.local.reader.packet.size.bytes", "8"}});
  auto stream = NewLocalPacketInStream(mount, LocalWorkerNetAddress(), BlockId, BlockLength);

  std::vector<int64_t> sizes;
  std::vector<uint8_t> got;
  uint8_t buf[64];
  int64_t rd;
  while ((rd = stream->read(buf, sizeof(buf))) != -1) {
    sizes.push_back(rd);
    got.insert(got.end(), buf, buf + rd);
  }
  BLKIO_EXPECT(got == dir.contents);
  BLKIO_EXPECT(sizes == (std::vector<int64_t>{8, 8, 8, 8, 8, 8, 2}));
  stream->close();

  MountConfiguration elsewhere(dir.conf, false, false, {{"blkio.worker.data.folder", "other"}});
  BLKIO_EXPECT(LocalBlockPath(elsewhere, BlockId) == fmt::format("{}/other/{}", dir.root, BlockId));
  BLKIO_EXPECT(throws<TransportError>(
      [&] { NewLocalPacketInStream(elsewhere, LocalWorkerNetAddress(), BlockId, BlockLength); }));
}

void testFactoryPinsBlockFile() {
  WorkerDir dir;
  {
    LocalFilePacketReader::Factory factory(LocalWorkerNetAddress(), BlockId, 32, dir.blockPath);
    /* A writer wanting the file exclusively is held off while the block is being read */
    FILE* writer = Fopen(dir.blockPath.c_str(), "rb", FileLockType::Write);
    BLKIO_EXPECT(!writer);
    if (writer)
      fclose(writer);

    /* Other readers are fine */
    FILE* reader = Fopen(dir.blockPath.c_str(), "rb", FileLockType::Read);
    BLKIO_EXPECT(reader);
    if (reader)
      fclose(reader);

    factory.close();
    writer = Fopen(dir.blockPath.c_str(), "rb", FileLockType::Write);
    BLKIO_EXPECT(writer);
    if (writer)
      fclose(writer);
    /* Closing twice is harmless */
    factory.close();
  }

  {
    LocalFilePacketReader::Factory factory(LocalWorkerNetAddress(), BlockId, 32, dir.blockPath);
  }
  FILE* writer = Fopen(dir.blockPath.c_str(), "rb", FileLockType::Write);
  BLKIO_EXPECT(writer);
  if (writer)
    fclose(writer);
}

void testLockedBlockIsRejected() {
  WorkerDir dir;
  FILE* writer = Fopen(dir.blockPath.c_str(), "rb", FileLockType::Write);
  BLKIO_EXPECT(writer);
  BLKIO_EXPECT(throws<TransportError>(
      [&] { LocalFilePacketReader::Factory factory(LocalWorkerNetAddress(), BlockId, 32, dir.blockPath); }));
  if (writer)
    fclose(writer);
}

void testShortCircuitStream() {
  WorkerDir dir;
  auto stream = NewLocalPacketInStream(dir.conf, LocalWorkerNetAddress(), BlockId, BlockLength);
  BLKIO_EXPECT(stream->isShortCircuit());
  BLKIO_EXPECT(stream->id() == BlockId);

  std::vector<uint8_t> got;
  uint8_t buf[64];
  int64_t rd;
  while ((rd = stream->read(buf, sizeof(buf))) != -1)
    got.insert(got.end(), buf, buf + rd);
  BLKIO_EXPECT(got == dir.contents);

  uint8_t pbuf[40] = {};
  BLKIO_EXPECT(stream->positionedRead(5, pbuf, sizeof(pbuf), 0, 40) == 40);
  BLKIO_EXPECT(std::vector<uint8_t>(pbuf, pbuf + 40) ==
               std::vector<uint8_t>(dir.contents.begin() + 5, dir.contents.begin() + 45));
  BLKIO_EXPECT(stream->positionedRead(45, pbuf, sizeof(pbuf), 0, 40) == 5);
  BLKIO_EXPECT(stream->positionedRead(int64_t(BlockLength), pbuf, sizeof(pbuf), 0, 1) == -1);

  stream->seek(20);
  BLKIO_EXPECT(stream->read() == dir.contents[20]);
  stream->close();

  FILE* writer = Fopen(dir.blockPath.c_str(), "rb", FileLockType::Write);
  BLKIO_EXPECT(writer);
  if (writer)
    fclose(writer);
}

} // namespace

int main() {
  runTest("PacketsFollowPacketSize", testPacketsFollowPacketSize);
  runTest("RangeIsClampedToFile", testRangeIsClampedToFile);
  runTest("MissingBlock", testMissingBlock);
  runTest("ZeroPacketSize", testZeroPacketSize);
  runTest("MountOverridesGlobalConfiguration", testMountOverridesGlobalConfiguration);
  runTest("FactoryPinsBlockFile", testFactoryPinsBlockFile);
  runTest("LockedBlockIsRejected", testLockedBlockIsRejected);
  runTest("ShortCircuitStream", testShortCircuitStream);
  return finish();
}
