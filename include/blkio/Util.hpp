#pragma once

#include <cerrno>
#include <sys/file.h>
#include <strings.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>

namespace blkio {
/* own min so mixed call sites pick one explicit type */
template <typename T>
constexpr T min(T a, T b) {
  return a < b ? a : b;
}

typedef struct stat Sstat;
static inline int Stat(const char* path, Sstat* statout) { return stat(path, statout); }

static inline int StrCaseCmp(const char* str1, const char* str2) { return strcasecmp(str1, str2); }

#undef bswap16
#undef bswap32
#undef bswap64
/* Type-sensitive byte swappers */
template <typename T>
static inline T bswap16(T val) {
#if __GNUC__
  return __builtin_bswap16(val);
#else
  return (val = (val << 8) | ((val >> 8) & 0xFF));
#endif
}

template <typename T>
static inline T bswap32(T val) {
#if __GNUC__
  return __builtin_bswap32(val);
#else
  val = (val & 0x0000FFFF) << 16 | (val & 0xFFFF0000) >> 16;
  val = (val & 0x00FF00FF) << 8 | (val & 0xFF00FF00) >> 8;
  return val;
#endif
}

template <typename T>
static inline T bswap64(T val) {
#if __GNUC__
  return __builtin_bswap64(val);
#else
  return ((val & 0xFF00000000000000ULL) >> 56) | ((val & 0x00FF000000000000ULL) >> 40) |
         ((val & 0x0000FF0000000000ULL) >> 24) | ((val & 0x000000FF00000000ULL) >> 8) |
         ((val & 0x00000000FF000000ULL) << 8) | ((val & 0x0000000000FF0000ULL) << 24) |
         ((val & 0x000000000000FF00ULL) << 40) | ((val & 0x00000000000000FFULL) << 56);
#endif
}

/* Wire values are big-endian */
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
static inline uint16_t SBig(uint16_t val) { return bswap16(val); }
static inline uint32_t SBig(uint32_t val) { return bswap32(val); }
static inline uint64_t SBig(uint64_t val) { return bswap64(val); }
#else
static inline uint16_t SBig(uint16_t val) { return val; }
static inline uint32_t SBig(uint32_t val) { return val; }
static inline uint64_t SBig(uint64_t val) { return val; }
#endif

enum class FileLockType { None = 0, Read, Write };
/* Returns null if the file cannot be opened or the lock is held elsewhere */
FILE* Fopen(const char* path, const char* mode, FileLockType lock = FileLockType::None);

static inline int FSeek(FILE* fp, int64_t offset, int whence) {
#if __APPLE__ || __FreeBSD__
  return fseeko(fp, offset, whence);
#else
  return fseeko64(fp, offset, whence);
#endif
}

} // namespace blkio
