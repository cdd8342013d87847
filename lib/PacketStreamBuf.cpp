#include "blkio/PacketStreamBuf.hpp"

namespace blkio {

PacketStreamBuf::PacketStreamBuf(PacketInStream& stream, uint64_t bufSize)
: m_stream(stream), m_buf(new char[bufSize ? bufSize : 1]), m_bufSize(bufSize ? bufSize : 1) {
  setg(m_buf.get(), m_buf.get(), m_buf.get());
}

PacketStreamBuf::int_type PacketStreamBuf::underflow() {
  if (gptr() < egptr())
    return traits_type::to_int_type(*gptr());

  int64_t rd = m_stream.read(reinterpret_cast<uint8_t*>(m_buf.get()), m_bufSize, 0, m_bufSize);
  if (rd <= 0)
    return traits_type::eof();
  setg(m_buf.get(), m_buf.get(), m_buf.get() + rd);
  return traits_type::to_int_type(*gptr());
}

std::streamsize PacketStreamBuf::showmanyc() {
  if (m_stream.isClosed())
    return -1;
  int64_t rem = m_stream.remaining();
  return rem > 0 ? std::streamsize(rem) : -1;
}

PacketStreamBuf::pos_type PacketStreamBuf::seekoff(off_type off, std::ios_base::seekdir dir,
                                                   std::ios_base::openmode which) {
  if (!(which & std::ios_base::in))
    return pos_type(off_type(-1));

  /* Bytes buffered here are already consumed from the packet stream */
  const int64_t cur = int64_t(m_stream.position()) - int64_t(egptr() - gptr());
  int64_t target;
  if (dir == std::ios_base::beg)
    target = off;
  else if (dir == std::ios_base::cur)
    target = cur + off;
  else if (dir == std::ios_base::end)
    target = int64_t(m_stream.length()) + off;
  else
    return pos_type(off_type(-1));

  if (target < 0 || uint64_t(target) > m_stream.length())
    return pos_type(off_type(-1));
  if (target == cur)
    return pos_type(target);

  m_stream.seek(target);
  setg(m_buf.get(), m_buf.get(), m_buf.get());
  return pos_type(target);
}

PacketStreamBuf::pos_type PacketStreamBuf::seekpos(pos_type pos, std::ios_base::openmode which) {
  return seekoff(off_type(pos), std::ios_base::beg, which);
}

} // namespace blkio
