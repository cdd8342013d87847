#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace blkio {

enum class PropertyKey {
  UserLocalReaderPacketSizeBytes,
  UserNetworkReaderPacketSizeBytes,
  UserNetworkConnectTimeoutMs,
  WorkerDataFolder,
  WorkerTieredStoreLevel0DirsPath,
};
const char* getKeyString(PropertyKey key);
/* False if name is not a known key */
bool LookupPropertyKey(std::string_view name, PropertyKey& key);

/* Parses byte counts like "512", "64KB", "8mb" or "1G"; throws ConfigurationError */
uint64_t ParseBytes(std::string_view str);

/*
 * Client configuration. Starts out with every key at its default value; later set() calls and
 * properties files override them.
 */
class Configuration {
  std::unordered_map<std::string, std::string> m_props;

public:
  Configuration();

  bool containsKey(PropertyKey key) const;
  /* Throws ConfigurationError if the key has no value */
  const std::string& get(PropertyKey key) const;
  void set(PropertyKey key, std::string_view value);
  void unset(PropertyKey key);

  uint64_t getBytes(PropertyKey key) const;
  int64_t getInt(PropertyKey key) const;

  /*
   * Loads key=value lines; '#' and '!' start comments. Unknown keys are skipped with a warning.
   * Returns false (after logging) if the file cannot be read.
   */
  bool loadProperties(std::string_view path);
};

/*
 * Configuration of one mount point: a few mount-specific overrides on top of the global
 * configuration, plus the read-only and shared flags of the mount.
 */
class MountConfiguration {
  const Configuration& m_global;
  bool m_readOnly;
  bool m_shared;
  std::unordered_map<std::string, std::string> m_mountConf;

public:
  MountConfiguration(const Configuration& global, bool readOnly, bool shared,
                     std::unordered_map<std::string, std::string> mountConf);

  /* Writable, private, no overrides */
  static MountConfiguration Defaults(const Configuration& global);

  bool containsKey(PropertyKey key) const;
  /* Mount override first, then the global value; throws ConfigurationError if neither is set */
  const std::string& getValue(PropertyKey key) const;
  uint64_t getBytes(PropertyKey key) const;
  int64_t getInt(PropertyKey key) const;
  const std::unordered_map<std::string, std::string>& getUserSpecifiedConf() const { return m_mountConf; }

  bool isReadOnly() const { return m_readOnly; }
  bool isShared() const { return m_shared; }
};

} // namespace blkio
