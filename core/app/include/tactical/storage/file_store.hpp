#pragma once

#include "tactical/storage/i_key_value_store.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace tactical {

// -----------------------------------------------------------------------------
// FileStore — one JSON file per key under a state directory
// -----------------------------------------------------------------------------
//
// @details
// Key "tactical.circuit_breaker" lives in <dir>/tactical.circuit_breaker.json.
// put() writes to a ".tmp" sibling and renames it over the target, so a
// crash mid-write leaves the previous document intact.
//
// Thread model: a single mutex serializes all file access.
// -----------------------------------------------------------------------------
class FileStore : public IKeyValueStore {
 public:
  explicit FileStore(std::filesystem::path directory);

  std::optional<std::string> get(const std::string& key) override;
  void put(const std::string& key, const std::string& value) override;

  const std::filesystem::path& directory() const { return directory_; }

 private:
  std::filesystem::path pathFor(const std::string& key) const;

  std::filesystem::path directory_;
  std::mutex mutex_;
};

}  // namespace tactical
