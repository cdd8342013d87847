#include <istream>
#include <iterator>
#include <memory>
#include <vector>

#include <blkio/PacketInStream.hpp>
#include <blkio/PacketStreamBuf.hpp>

#include "MockPacketReader.hpp"
#include "TestUtil.hpp"

using namespace blkio;
using namespace blkio::test;

namespace {

std::unique_ptr<PacketInStream> newStream(const std::vector<uint8_t>& source, std::shared_ptr<MockStats> stats) {
  MockOptions opts;
  opts.packetSizes = {5};
  return std::make_unique<PacketInStream>(NewMockFactory(source, opts, std::move(stats)), 3, source.size());
}

void testReadAll() {
  const auto source = MakeSource(37);
  auto stats = std::make_shared<MockStats>();
  auto stream = newStream(source, stats);
  PacketStreamBuf buf(*stream, 8);
  std::istream is(&buf);

  std::vector<char> got((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
  BLKIO_EXPECT(got.size() == source.size());
  BLKIO_EXPECT(std::vector<uint8_t>(got.begin(), got.end()) == source);
  stream->close();
}

void testSeekAndTell() {
  const auto source = MakeSource(37);
  auto stats = std::make_shared<MockStats>();
  auto stream = newStream(source, stats);
  PacketStreamBuf buf(*stream, 8);
  std::istream is(&buf);

  char c;
  BLKIO_EXPECT(is.get(c) && uint8_t(c) == source[0]);
  BLKIO_EXPECT(is.tellg() == 1);
  /* Asking for the current position must not drop the session */
  BLKIO_EXPECT(stats->readerCloses == 0);

  is.seekg(20);
  BLKIO_EXPECT(is.tellg() == 20);
  BLKIO_EXPECT(is.get(c) && uint8_t(c) == source[20]);
  BLKIO_EXPECT(stream->position() >= 21);

  is.seekg(-2, std::ios_base::cur);
  BLKIO_EXPECT(is.get(c) && uint8_t(c) == source[19]);

  is.seekg(-4, std::ios_base::end);
  char tail[4];
  BLKIO_EXPECT(is.read(tail, 4));
  BLKIO_EXPECT(uint8_t(tail[0]) == source[33] && uint8_t(tail[3]) == source[36]);
  BLKIO_EXPECT(is.get(c).eof());
  stream->close();
}

void testSeekOutOfRangeFails() {
  const auto source = MakeSource(10);
  auto stats = std::make_shared<MockStats>();
  auto stream = newStream(source, stats);
  PacketStreamBuf buf(*stream);
  std::istream is(&buf);

  is.seekg(11);
  BLKIO_EXPECT(is.fail());
  is.clear();
  is.seekg(-1, std::ios_base::beg);
  BLKIO_EXPECT(is.fail());
  is.clear();
  BLKIO_EXPECT(stream->position() == 0);

  is.seekg(10);
  BLKIO_EXPECT(!is.fail());
  char c;
  BLKIO_EXPECT(!is.get(c));
  stream->close();
}

void testAvailable() {
  const auto source = MakeSource(10);
  auto stats = std::make_shared<MockStats>();
  auto stream = newStream(source, stats);
  PacketStreamBuf buf(*stream, 4);

  BLKIO_EXPECT(buf.in_avail() == 10);
  BLKIO_EXPECT(buf.sbumpc() == source[0]);
  /* Three bytes buffered locally */
  BLKIO_EXPECT(buf.in_avail() == 3);
  buf.pubseekpos(10);
  BLKIO_EXPECT(buf.in_avail() == -1);
  stream->close();
}

void testClosedStreamHasNothingAvailable() {
  const auto source = MakeSource(10);
  auto stats = std::make_shared<MockStats>();
  auto stream = newStream(source, stats);
  PacketStreamBuf buf(*stream, 4);
  std::istream is(&buf);
  stream->close();

  BLKIO_EXPECT(buf.in_avail() == -1);
  char tmp[4];
  BLKIO_EXPECT(is.readsome(tmp, sizeof(tmp)) == 0);
  BLKIO_EXPECT(is.eof());
}

} // namespace

int main() {
  runTest("ReadAll", testReadAll);
  runTest("SeekAndTell", testSeekAndTell);
  runTest("SeekOutOfRangeFails", testSeekOutOfRangeFails);
  runTest("Available", testAvailable);
  runTest("ClosedStreamHasNothingAvailable", testClosedStreamHasNothingAvailable);
  return finish();
}
