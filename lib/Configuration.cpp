#include "blkio/Configuration.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <memory>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "blkio/Errors.hpp"
#include "blkio/IFileIO.hpp"
#include "blkio/Util.hpp"

namespace blkio {

namespace {

struct PropertyDefault {
  PropertyKey key;
  const char* name;
  const char* defaultValue;
};

constexpr PropertyDefault PropertyDefaults[] = {
    {PropertyKey::UserLocalReaderPacketSizeBytes, "blkio.user.local.reader.packet.size.bytes", "8MB"},
    {PropertyKey::UserNetworkReaderPacketSizeBytes, "blkio.user.network.reader.packet.size.bytes", "64KB"},
    {PropertyKey::UserNetworkConnectTimeoutMs, "blkio.user.network.connect.timeout.ms", "30000"},
    {PropertyKey::WorkerDataFolder, "blkio.worker.data.folder", "blkioworker"},
    {PropertyKey::WorkerTieredStoreLevel0DirsPath, "blkio.worker.tieredstore.level0.dirs.path", "/mnt/ramdisk"},
};

std::string_view trim(std::string_view str) {
  while (!str.empty() && std::isspace(uint8_t(str.front())))
    str.remove_prefix(1);
  while (!str.empty() && std::isspace(uint8_t(str.back())))
    str.remove_suffix(1);
  return str;
}

uint64_t bytesValue(PropertyKey key, const std::string& val) {
  try {
    return ParseBytes(val);
  } catch (const ConfigurationError& e) {
    throw ConfigurationError(fmt::format("{}: {}", getKeyString(key), e.what()));
  }
}

int64_t intValue(PropertyKey key, const std::string& val) {
  char* end;
  errno = 0;
  long long ret = std::strtoll(val.c_str(), &end, 10);
  if (val.empty() || *end != '\0' || errno == ERANGE)
    throw ConfigurationError(fmt::format("{}: '{}' is not an integer", getKeyString(key), val));
  return ret;
}

} // namespace

const char* getKeyString(PropertyKey key) {
  for (const auto& prop : PropertyDefaults)
    if (prop.key == key)
      return prop.name;
  return nullptr;
}

bool LookupPropertyKey(std::string_view name, PropertyKey& key) {
  for (const auto& prop : PropertyDefaults) {
    if (name == prop.name) {
      key = prop.key;
      return true;
    }
  }
  return false;
}

uint64_t ParseBytes(std::string_view str) {
  std::string_view val = trim(str);
  size_t digits = 0;
  while (digits < val.size() && std::isdigit(uint8_t(val[digits])))
    ++digits;
  if (!digits)
    throw ConfigurationError(fmt::format("'{}' is not a byte count", str));

  const std::string number(val.substr(0, digits));
  errno = 0;
  unsigned long long count = std::strtoull(number.c_str(), nullptr, 10);
  if (errno == ERANGE)
    throw ConfigurationError(fmt::format("'{}' is out of range", str));

  std::string suffix(trim(val.substr(digits)));
  for (char& c : suffix)
    c = char(std::toupper(uint8_t(c)));
  if (suffix.size() > 1 && suffix.back() == 'B')
    suffix.pop_back();

  unsigned shift;
  if (suffix.empty() || suffix == "B")
    shift = 0;
  else if (suffix == "K")
    shift = 10;
  else if (suffix == "M")
    shift = 20;
  else if (suffix == "G")
    shift = 30;
  else if (suffix == "T")
    shift = 40;
  else
    throw ConfigurationError(fmt::format("unknown unit in byte count '{}'", str));

  if (shift && count > (UINT64_MAX >> shift))
    throw ConfigurationError(fmt::format("'{}' is out of range", str));
  return uint64_t(count) << shift;
}

Configuration::Configuration() {
  for (const auto& prop : PropertyDefaults)
    m_props[prop.name] = prop.defaultValue;
}

bool Configuration::containsKey(PropertyKey key) const { return m_props.count(getKeyString(key)) != 0; }

const std::string& Configuration::get(PropertyKey key) const {
  auto search = m_props.find(getKeyString(key));
  if (search == m_props.end())
    throw ConfigurationError(fmt::format("key {} not found", getKeyString(key)));
  return search->second;
}

void Configuration::set(PropertyKey key, std::string_view value) { m_props[getKeyString(key)] = std::string(value); }

void Configuration::unset(PropertyKey key) { m_props.erase(getKeyString(key)); }

uint64_t Configuration::getBytes(PropertyKey key) const { return bytesValue(key, get(key)); }

int64_t Configuration::getInt(PropertyKey key) const { return intValue(key, get(key)); }

bool Configuration::loadProperties(std::string_view path) {
  std::unique_ptr<IFileIO> fio = NewFileIO(path);
  if (!fio->exists()) {
    spdlog::error("properties file '{}' does not exist", path);
    return false;
  }
  auto rs = fio->beginReadStream();
  if (!rs)
    return false;
  uint64_t sz = fio->size();
  std::string contents(sz, '\0');
  if (rs->read(contents.data(), sz) != sz) {
    spdlog::error("unable to read properties file '{}'", path);
    return false;
  }

  std::string_view rem(contents);
  unsigned lineNo = 0;
  while (!rem.empty()) {
    size_t eol = rem.find('\n');
    std::string_view line = trim(rem.substr(0, eol));
    rem = eol == std::string_view::npos ? std::string_view() : rem.substr(eol + 1);
    ++lineNo;
    if (line.empty() || line.front() == '#' || line.front() == '!')
      continue;

    size_t eq = line.find('=');
    if (eq == std::string_view::npos) {
      spdlog::warn("{}:{}: expected key=value", path, lineNo);
      continue;
    }
    std::string_view name = trim(line.substr(0, eq));
    PropertyKey key;
    if (!LookupPropertyKey(name, key)) {
      spdlog::warn("{}:{}: unknown property '{}'", path, lineNo, name);
      continue;
    }
    set(key, trim(line.substr(eq + 1)));
  }
  spdlog::debug("loaded properties from '{}'", path);
  return true;
}

MountConfiguration::MountConfiguration(const Configuration& global, bool readOnly, bool shared,
                                       std::unordered_map<std::string, std::string> mountConf)
: m_global(global), m_readOnly(readOnly), m_shared(shared), m_mountConf(std::move(mountConf)) {}

MountConfiguration MountConfiguration::Defaults(const Configuration& global) {
  return MountConfiguration(global, false, false, {});
}

bool MountConfiguration::containsKey(PropertyKey key) const {
  return m_mountConf.count(getKeyString(key)) != 0 || m_global.containsKey(key);
}

const std::string& MountConfiguration::getValue(PropertyKey key) const {
  auto search = m_mountConf.find(getKeyString(key));
  if (search != m_mountConf.end())
    return search->second;
  if (m_global.containsKey(key))
    return m_global.get(key);
  throw ConfigurationError(fmt::format("key {} not found", getKeyString(key)));
}

uint64_t MountConfiguration::getBytes(PropertyKey key) const { return bytesValue(key, getValue(key)); }

int64_t MountConfiguration::getInt(PropertyKey key) const { return intValue(key, getValue(key)); }

} // namespace blkio
