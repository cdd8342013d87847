#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace blkio {

class IFileIO {
public:
  virtual ~IFileIO() = default;
  virtual bool exists() = 0;
  virtual uint64_t size() = 0;

  struct IReadStream {
    virtual ~IReadStream() = default;
    virtual uint64_t read(void* buf, uint64_t length) = 0;
  };
  /* Returns null (after logging) when the file cannot be opened */
  virtual std::unique_ptr<IReadStream> beginReadStream() const = 0;
  virtual std::unique_ptr<IReadStream> beginReadStream(uint64_t offset) const = 0;
};

std::unique_ptr<IFileIO> NewFileIO(std::string_view path);

} // namespace blkio
