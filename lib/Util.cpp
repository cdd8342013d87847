#include "blkio/Util.hpp"

#include <spdlog/spdlog.h>

namespace blkio {
FILE* Fopen(const char* path, const char* mode, FileLockType lock) {
  FILE* fp = fopen(path, mode);
  if (!fp)
    return nullptr;

  /* A lock that cannot be taken right away means someone is rewriting or removing the file */
  if (lock != FileLockType::None) {
    if (flock(fileno(fp), ((lock == FileLockType::Write) ? LOCK_EX : LOCK_SH) | LOCK_NB)) {
      spdlog::error("flock {}: {}", path, strerror(errno));
      fclose(fp);
      return nullptr;
    }
  }

  return fp;
}
} // namespace blkio
