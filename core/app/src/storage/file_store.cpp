#include "tactical/storage/file_store.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace tactical {

FileStore::FileStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw std::runtime_error("cannot create state directory " +
                             directory_.string() + ": " + ec.message());
  }
}

std::filesystem::path FileStore::pathFor(const std::string& key) const {
  return directory_ / (key + ".json");
}

std::optional<std::string> FileStore::get(const std::string& key) {
  std::lock_guard lock(mutex_);
  const auto path = pathFor(key);
  if (!std::filesystem::exists(path)) {
    return std::nullopt;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void FileStore::put(const std::string& key, const std::string& value) {
  std::lock_guard lock(mutex_);
  const auto path = pathFor(key);
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot write " + tmp.string());
    }
    out << value;
    out.flush();
    if (!out) {
      throw std::runtime_error("short write to " + tmp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    throw std::runtime_error("cannot replace " + path.string() + ": " +
                             ec.message());
  }
}

}  // namespace tactical
