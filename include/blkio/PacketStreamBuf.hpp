#pragma once

#include <cstdint>
#include <memory>
#include <streambuf>

#include "blkio/PacketInStream.hpp"

namespace blkio {

/*
 * Lets a PacketInStream back a std::istream. The stream stays owned by the caller and must
 * outlive this buffer.
 */
class PacketStreamBuf : public std::streambuf {
  PacketInStream& m_stream;
  std::unique_ptr<char[]> m_buf;
  uint64_t m_bufSize;

protected:
  int_type underflow() override;
  std::streamsize showmanyc() override;
  pos_type seekoff(off_type off, std::ios_base::seekdir dir, std::ios_base::openmode which) override;
  pos_type seekpos(pos_type pos, std::ios_base::openmode which) override;

public:
  explicit PacketStreamBuf(PacketInStream& stream, uint64_t bufSize = 0x8000);
};

} // namespace blkio
