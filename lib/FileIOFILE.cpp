#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "blkio/IFileIO.hpp"
#include "blkio/Util.hpp"

#include <spdlog/spdlog.h>

namespace blkio {

class FileIOFILE : public IFileIO {
  std::string m_path;

public:
  explicit FileIOFILE(std::string_view path) : m_path(path) {}

  bool exists() override {
    Sstat theStat;
    return !Stat(m_path.c_str(), &theStat) && S_ISREG(theStat.st_mode);
  }

  uint64_t size() override {
    Sstat theStat;
    if (Stat(m_path.c_str(), &theStat) || !S_ISREG(theStat.st_mode))
      return 0;
    return uint64_t(theStat.st_size);
  }

  struct ReadStream : public IFileIO::IReadStream {
    FILE* fp;
    ReadStream(std::string_view path, bool& err) {
      fp = Fopen(path.data(), "rb");
      if (!fp) {
        err = true;
        spdlog::error("unable to open '{}' for reading: {}", path, strerror(errno));
      }
    }
    ReadStream(std::string_view path, uint64_t offset, bool& err) : ReadStream(path, err) {
      if (err)
        return;
      if (FSeek(fp, offset, SEEK_SET)) {
        err = true;
        spdlog::error("unable to seek '{}' to {}: {}", path, offset, strerror(errno));
      }
    }
    ~ReadStream() override {
      if (fp)
        fclose(fp);
    }
    uint64_t read(void* buf, uint64_t length) override {
      uint64_t rd = fread(buf, 1, length, fp);
      if (rd < length && ferror(fp))
        spdlog::error("read error: {}", strerror(errno));
      return rd;
    }
  };

  std::unique_ptr<IReadStream> beginReadStream() const override {
    bool err = false;
    auto ret = std::make_unique<ReadStream>(m_path, err);

    if (err)
      return {};

    return ret;
  }

  std::unique_ptr<IReadStream> beginReadStream(uint64_t offset) const override {
    bool err = false;
    auto ret = std::make_unique<ReadStream>(m_path, offset, err);

    if (err)
      return {};

    return ret;
  }
};

std::unique_ptr<IFileIO> NewFileIO(std::string_view path) { return std::make_unique<FileIOFILE>(path); }

} // namespace blkio
