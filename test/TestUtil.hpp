#pragma once

#include <cstdint>
#include <cstdio>
#include <exception>
#include <vector>

#include <fmt/format.h>

namespace blkio::test {

inline int Failures = 0;

inline void reportFailure(const char* file, int line, const char* what) {
  ++Failures;
  fmt::print(stderr, "{}:{}: check failed: {}\n", file, line, what);
}

template <typename E, typename F>
bool throws(F&& f) {
  try {
    f();
  } catch (const E&) {
    return true;
  }
  return false;
}

template <typename F>
void runTest(const char* name, F&& f) {
  int before = Failures;
  try {
    f();
  } catch (const std::exception& e) {
    ++Failures;
    fmt::print(stderr, "{}: unexpected exception: {}\n", name, e.what());
  }
  fmt::print("{} {}\n", Failures == before ? "PASS" : "FAIL", name);
}

inline int finish() {
  if (Failures)
    fmt::print(stderr, "{} check(s) failed\n", Failures);
  return Failures ? 1 : 0;
}

/* Deterministic, non-repeating-at-small-sizes byte pattern */
inline std::vector<uint8_t> MakeSource(size_t n) {
  std::vector<uint8_t> ret(n);
  for (size_t i = 0; i < n; ++i)
    ret[i] = uint8_t(i * 7 + 3);
  return ret;
}

} // namespace blkio::test

#define BLKIO_EXPECT(cond)                                                                                          \
  do {                                                                                                              \
    if (!(cond))                                                                                                    \
      ::blkio::test::reportFailure(__FILE__, __LINE__, #cond);                                                      \
  } while (0)
